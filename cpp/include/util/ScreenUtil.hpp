#pragma once

namespace util {

void clearscreen();

}  // namespace util

#include "inline/util/ScreenUtil.inl"
