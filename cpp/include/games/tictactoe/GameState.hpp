#pragma once

#include "core/BasicTypes.hpp"
#include "games/tictactoe/Board.hpp"
#include "games/tictactoe/Constants.hpp"
#include "games/tictactoe/Types.hpp"

namespace tictactoe {

struct GameState {
  explicit GameState(int dimension) : board(dimension) {}

  bool operator==(const GameState&) const = default;

  Board board;
  core::seat_index_t active_player = kX;
  Phase phase = InProgress{};
};

}  // namespace tictactoe
