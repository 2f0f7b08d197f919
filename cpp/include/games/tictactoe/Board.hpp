#pragma once

#include "games/tictactoe/Constants.hpp"
#include "games/tictactoe/Types.hpp"

#include <array>

namespace tictactoe {

/*
 * An N x N grid of cells, N in [kMinBoardDimension, kMaxBoardDimension].
 *
 * Cells are stored row-major in a fixed-capacity array, at index row * N + col. Cells beyond N * N
 * are never touched and stay kEmpty, so defaulted comparison is well-defined.
 */
class Board {
 public:
  explicit Board(int dimension);

  bool operator==(const Board&) const = default;

  int dimension() const { return dimension_; }
  int num_cells() const { return dimension_ * dimension_; }
  int num_marks() const { return num_marks_; }
  bool full() const { return num_marks_ == num_cells(); }

  bool in_bounds(int row, int col) const;
  cell_t get(int row, int col) const;

  // Requires (row, col) to be in bounds and empty, and mark to be non-empty.
  void set(int row, int col, cell_t mark);

  int count(cell_t cell) const;

  /*
   * Returns true if some line through (row, col) is entirely occupied by the mark at (row, col).
   * The lines checked are the row, the column, the main diagonal (if row == col), and the
   * anti-diagonal (if row + col == N - 1).
   */
  bool completes_line(int row, int col) const;

 private:
  int index(int row, int col) const { return row * dimension_ + col; }
  bool line_filled(int row, int col, int d_row, int d_col, cell_t mark) const;

  std::array<cell_t, kMaxNumCells> cells_;
  int dimension_;
  int num_marks_ = 0;
};

}  // namespace tictactoe

#include "inline/games/tictactoe/Board.inl"
