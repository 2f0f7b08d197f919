#pragma once

#include <cstdint>

namespace core {

using seat_index_t = int8_t;

}  // namespace core
