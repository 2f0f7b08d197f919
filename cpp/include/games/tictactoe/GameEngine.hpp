#pragma once

#include "games/tictactoe/GameState.hpp"
#include "games/tictactoe/MoveResult.hpp"
#include "util/Exception.hpp"

namespace tictactoe {

// Thrown when a GameEngine is constructed with a board dimension outside of
// [kMinBoardDimension, kMaxBoardDimension].
class InvalidConfiguration : public util::CleanException {
 public:
  using util::CleanException::CleanException;
};

/*
 * Owns the state of a single game: board, active player, and phase.
 *
 * The state is only ever mutated through apply_move(). A rejected move leaves the state exactly as
 * it was. The engine performs no I/O and no logging; callers report outcomes as they see fit.
 *
 * Not thread-safe. Independent games are independent GameEngine instances.
 */
class GameEngine {
 public:
  explicit GameEngine(int board_dimension);

  // Throws InvalidConfiguration if dimension is out of range.
  static void validate_board_dimension(int dimension);

  const GameState& current_state() const { return state_; }
  int board_dimension() const { return state_.board.dimension(); }

  /*
   * Places the active player's mark at (row, col), then updates the phase. The active player is
   * flipped only if the game is still in progress afterwards.
   */
  MoveResult apply_move(int row, int col);
  MoveResult apply_move(const Move& move) { return apply_move(move.row, move.col); }

 private:
  static int checked_board_dimension(int dimension);

  GameState state_;
};

}  // namespace tictactoe
