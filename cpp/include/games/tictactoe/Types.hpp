#pragma once

#include "core/BasicTypes.hpp"
#include "games/tictactoe/Constants.hpp"

#include <cstdint>
#include <variant>

namespace tictactoe {

enum cell_t : int8_t { kEmpty, kMarkX, kMarkO };

inline cell_t mark_of(core::seat_index_t player) { return player == kX ? kMarkX : kMarkO; }

inline core::seat_index_t other_player(core::seat_index_t player) { return kNumPlayers - 1 - player; }

/*
 * The phase of a game. Exactly one alternative holds at any time. Won and Draw are terminal.
 */
struct InProgress {
  bool operator==(const InProgress&) const = default;
};

struct Won {
  bool operator==(const Won&) const = default;

  core::seat_index_t player;
};

struct Draw {
  bool operator==(const Draw&) const = default;
};

using Phase = std::variant<InProgress, Won, Draw>;

inline bool is_terminal(const Phase& phase) { return !std::holds_alternative<InProgress>(phase); }

// A zero-based (row, col) board coordinate.
struct Move {
  bool operator==(const Move&) const = default;

  int row;
  int col;
};

}  // namespace tictactoe
