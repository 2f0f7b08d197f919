#pragma once

#include <tuple>

#define CONCAT_HELPER(x, y) x##y
#define CONCAT(x, y) CONCAT_HELPER(x, y)

#define XSTR(a) STR(a)
#define STR(a) #a

/*
 * Useful macro for constexpr-detection of whether a macro is assigned to 1. This is useful given
 * the behavior of the -D option in CMakeLists.txt.
 *
 * #define FOO 1
 * // #define BAR
 *
 * static_assert(IS_MACRO_ENABLED(FOO))
 * static_assert(!IS_MACRO_ENABLED(BAR))
 */
#define IS_MACRO_ENABLED(macro) (XSTR(macro)[0] == '1')
#define IS_DEFINED(macro) IS_MACRO_ENABLED(macro)

/*
 * Marks the arguments as used without evaluating them. This keeps compiled-out logging statements
 * from triggering unused-variable warnings.
 */
#define USE_UNEVALUATED(...) static_cast<void>(sizeof(std::make_tuple(__VA_ARGS__)))
