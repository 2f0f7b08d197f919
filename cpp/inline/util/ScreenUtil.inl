#include "util/ScreenUtil.hpp"

#include "util/Exception.hpp"

#include <cstdlib>

namespace util {

/*
 * See: https://cplusplus.com/articles/4z18T05o/
 */
inline void clearscreen() {
  if (system("clear")) {
    throw util::Exception("Failed to clear screen: system() returned non-zero exit status");
  }
}

}  // namespace util
