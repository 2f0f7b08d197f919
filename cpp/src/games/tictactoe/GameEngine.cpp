#include "games/tictactoe/GameEngine.hpp"

#include "util/Asserts.hpp"

namespace tictactoe {

GameEngine::GameEngine(int board_dimension) : state_(checked_board_dimension(board_dimension)) {}

void GameEngine::validate_board_dimension(int dimension) {
  if (dimension < kMinBoardDimension || dimension > kMaxBoardDimension) {
    throw InvalidConfiguration("Board size must be between {} and {} (got {})", kMinBoardDimension,
                               kMaxBoardDimension, dimension);
  }
}

int GameEngine::checked_board_dimension(int dimension) {
  validate_board_dimension(dimension);
  return dimension;
}

MoveResult GameEngine::apply_move(int row, int col) {
  if (is_terminal(state_.phase)) {
    return MoveResult{MoveResult::kGameAlreadyOver, state_.phase};
  }

  Board& board = state_.board;
  if (!board.in_bounds(row, col)) {
    return MoveResult{MoveResult::kOutOfBounds, state_.phase};
  }
  if (board.get(row, col) != kEmpty) {
    return MoveResult{MoveResult::kCellOccupied, state_.phase};
  }

  core::seat_index_t mover = state_.active_player;
  board.set(row, col, mark_of(mover));

  if (board.completes_line(row, col)) {
    state_.phase = Won{mover};
  } else if (board.full()) {
    state_.phase = Draw{};
  } else {
    state_.active_player = other_player(mover);
  }

  DEBUG_ASSERT(board.count(kMarkX) - board.count(kMarkO) == (mover == kX ? 1 : 0),
               "Mark imbalance after move by {}", mover);
  return MoveResult{MoveResult::kMoveApplied, state_.phase};
}

}  // namespace tictactoe
