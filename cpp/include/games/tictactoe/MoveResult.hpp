#pragma once

#include "games/tictactoe/Types.hpp"

#include <cstdint>

namespace tictactoe {

/*
 * The outcome of GameEngine::apply_move().
 *
 * - status: kMoveApplied on success, otherwise the first precondition that failed. Preconditions
 *     are checked in enum order: kGameAlreadyOver, then kOutOfBounds, then kCellOccupied.
 *
 * - phase: the phase of the game after the call. For a rejected move this is the unchanged phase.
 */
struct MoveResult {
  enum status_t : uint8_t {
    kMoveApplied,
    kGameAlreadyOver,
    kOutOfBounds,
    kCellOccupied
  };

  bool operator==(const MoveResult&) const = default;

  bool ok() const { return status == kMoveApplied; }

  status_t status;
  Phase phase;
};

}  // namespace tictactoe
