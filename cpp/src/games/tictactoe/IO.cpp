#include "games/tictactoe/IO.hpp"

#include "util/AnsiCodes.hpp"
#include "util/Exception.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>

#include <cctype>

namespace tictactoe {

namespace {

std::string horizontal_rule(int dimension, const char* left, const char* mid, const char* right) {
  std::string s = "  ";
  s += left;
  for (int col = 0; col < dimension; ++col) {
    s += "───";
    s += (col + 1 < dimension) ? mid : right;
  }
  return s;
}

std::string colored_cell(cell_t cell) {
  switch (cell) {
    case kMarkX:
      return std::string(ansi::kRed("")) + 'X' + ansi::kReset("");
    case kMarkO:
      return std::string(ansi::kBlue("")) + 'O' + ansi::kReset("");
    default:
      return std::string(1, IO::cell_to_char(cell));
  }
}

}  // namespace

char IO::cell_to_char(cell_t cell) {
  switch (cell) {
    case kEmpty:
      return '-';
    case kMarkX:
      return 'X';
    case kMarkO:
      return 'O';
    default:
      throw util::Exception("Unknown cell value: {}", int(cell));
  }
}

std::string IO::phase_to_str(const Phase& phase) {
  if (const Won* won = std::get_if<Won>(&phase)) {
    return player_to_str(won->player) + " wins";
  }
  if (std::holds_alternative<Draw>(phase)) {
    return "draw";
  }
  return "in progress";
}

std::string IO::status_to_str(MoveResult::status_t status) {
  switch (status) {
    case MoveResult::kMoveApplied:
      return "move applied";
    case MoveResult::kGameAlreadyOver:
      return "the game is already over";
    case MoveResult::kOutOfBounds:
      return "that cell is off the board";
    case MoveResult::kCellOccupied:
      return "that cell is already taken";
    default:
      throw util::Exception("Unknown move status: {}", int(status));
  }
}

void IO::print_state(std::ostream& ss, const GameState& state) {
  const Board& board = state.board;
  int n = board.dimension();

  std::string header = "  ";
  for (int col = 0; col < n; ++col) {
    header += "  ";
    header += char('1' + col);
    header += ' ';
  }
  boost::algorithm::trim_right(header);
  ss << header << '\n';

  ss << horizontal_rule(n, "┌", "┬", "┐") << '\n';
  for (int row = 0; row < n; ++row) {
    ss << char('1' + row) << " │";
    for (int col = 0; col < n; ++col) {
      ss << ' ' << colored_cell(board.get(row, col)) << " │";
    }
    ss << '\n';
    if (row + 1 < n) {
      ss << horizontal_rule(n, "├", "┼", "┤") << '\n';
    }
  }
  ss << horizontal_rule(n, "└", "┴", "┘") << std::endl;
}

std::string IO::compact_state_repr(const GameState& state) {
  const Board& board = state.board;
  int n = board.dimension();

  std::string repr;
  repr.reserve(n * (n + 1));
  for (int row = 0; row < n; ++row) {
    for (int col = 0; col < n; ++col) {
      cell_t cell = board.get(row, col);
      repr += (cell == kEmpty) ? '_' : cell_to_char(cell);
    }
    if (row + 1 < n) {
      repr += '\n';
    }
  }
  return repr;
}

std::optional<Move> IO::parse_move(const std::string& input) {
  std::string s = boost::algorithm::trim_copy(input);
  if (s.size() != 2) return std::nullopt;
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
  }

  int col = s[0] - '1';
  int row = s[1] - '1';
  return Move{row, col};
}

std::optional<int> IO::parse_board_size(const std::string& input) {
  std::string s = boost::algorithm::trim_copy(input);
  int size = 0;
  if (!boost::conversion::try_lexical_convert(s, size)) return std::nullopt;
  return size;
}

}  // namespace tictactoe
