#include "games/tictactoe/Board.hpp"

#include "util/Asserts.hpp"

namespace tictactoe {

inline Board::Board(int dimension) : dimension_(dimension) {
  RELEASE_ASSERT(dimension >= kMinBoardDimension && dimension <= kMaxBoardDimension,
                 "Bad board dimension {}", dimension);
  cells_.fill(kEmpty);
}

inline bool Board::in_bounds(int row, int col) const {
  return row >= 0 && row < dimension_ && col >= 0 && col < dimension_;
}

inline cell_t Board::get(int row, int col) const {
  DEBUG_ASSERT(in_bounds(row, col), "({}, {}) out of bounds", row, col);
  return cells_[index(row, col)];
}

inline void Board::set(int row, int col, cell_t mark) {
  DEBUG_ASSERT(in_bounds(row, col), "({}, {}) out of bounds", row, col);
  DEBUG_ASSERT(mark != kEmpty);

  cell_t& cell = cells_[index(row, col)];
  RELEASE_ASSERT(cell == kEmpty, "Cell ({}, {}) is already occupied", row, col);
  cell = mark;
  num_marks_++;
}

inline int Board::count(cell_t cell) const {
  int n = 0;
  for (int i = 0; i < num_cells(); ++i) {
    if (cells_[i] == cell) n++;
  }
  return n;
}

inline bool Board::completes_line(int row, int col) const {
  cell_t mark = get(row, col);
  if (mark == kEmpty) return false;

  int last = dimension_ - 1;
  if (line_filled(row, 0, 0, 1, mark)) return true;
  if (line_filled(0, col, 1, 0, mark)) return true;
  if (row == col && line_filled(0, 0, 1, 1, mark)) return true;
  if (row + col == last && line_filled(0, last, 1, -1, mark)) return true;
  return false;
}

inline bool Board::line_filled(int row, int col, int d_row, int d_col, cell_t mark) const {
  for (int i = 0; i < dimension_; ++i) {
    if (cells_[index(row + i * d_row, col + i * d_col)] != mark) return false;
  }
  return true;
}

}  // namespace tictactoe
