#pragma once

#include "core/BasicTypes.hpp"

namespace tictactoe {

const int kMinBoardDimension = 3;
const int kMaxBoardDimension = 9;
const int kMaxNumCells = kMaxBoardDimension * kMaxBoardDimension;
const int kNumPlayers = 2;

const core::seat_index_t kX = 0;
const core::seat_index_t kO = 1;

}  // namespace tictactoe
