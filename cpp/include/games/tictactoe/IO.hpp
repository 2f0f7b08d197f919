#pragma once

#include "core/BasicTypes.hpp"
#include "games/tictactoe/GameState.hpp"
#include "games/tictactoe/MoveResult.hpp"
#include "games/tictactoe/Types.hpp"

#include <optional>
#include <ostream>
#include <string>

namespace tictactoe {

struct IO {
  static std::string player_to_str(core::seat_index_t player) {
    return (player == kX) ? "X" : "O";
  }
  static char cell_to_char(cell_t cell);
  static std::string phase_to_str(const Phase& phase);
  static std::string status_to_str(MoveResult::status_t status);

  /*
   * Prints the board as a box-drawn grid with 1-based row and column labels:
   *
   *     1   2   3
   *   ┌───┬───┬───┐
   * 1 │ X │ - │ - │
   *   ├───┼───┼───┤
   * 2 │ - │ O │ - │
   *   ├───┼───┼───┤
   * 3 │ - │ - │ - │
   *   └───┴───┴───┘
   *
   * In terminal rendering mode the marks are colored.
   */
  static void print_state(std::ostream&, const GameState&);

  // One line per row, '_' for empty cells, rows separated by '\n' with no trailing newline.
  static std::string compact_state_repr(const GameState&);

  /*
   * Parses a move typed as two digits, column first and row second, both 1-based. "12" means
   * column 1, row 2, which is Move{1, 0}. Surrounding whitespace is ignored.
   *
   * Returns std::nullopt if the input is not exactly two digits. The digits are not checked against
   * the board dimension; GameEngine::apply_move() reports kOutOfBounds for those.
   */
  static std::optional<Move> parse_move(const std::string& input);

  // Parses a decimal board size. Range checking is left to GameEngine.
  static std::optional<int> parse_board_size(const std::string& input);
};

}  // namespace tictactoe
