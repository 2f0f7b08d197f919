#pragma once

#include "util/CppUtil.hpp"

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

#include <string>

// LOG_*() take an fmt format string and its arguments:
//
// LOG_INFO("Starting a {}x{} game", n, n);
//
// Output goes to stderr, plus the --log-filename file if one is given. Statements below
// SPDLOG_ACTIVE_LEVEL are compiled out; -DTICTACTOE_DEBUG_LOGGING=ON lowers it to trace. Their
// arguments are still type-checked.

#define TICTACTOE_LOG(SPDLOG_MACRO, ...) \
  do {                                   \
    USE_UNEVALUATED(__VA_ARGS__);        \
    SPDLOG_MACRO(__VA_ARGS__);           \
  } while (0)

#define LOG_TRACE(...) TICTACTOE_LOG(SPDLOG_TRACE, __VA_ARGS__)
#define LOG_DEBUG(...) TICTACTOE_LOG(SPDLOG_DEBUG, __VA_ARGS__)
#define LOG_INFO(...) TICTACTOE_LOG(SPDLOG_INFO, __VA_ARGS__)
#define LOG_WARN(...) TICTACTOE_LOG(SPDLOG_WARN, __VA_ARGS__)
#define LOG_ERROR(...) TICTACTOE_LOG(SPDLOG_ERROR, __VA_ARGS__)

namespace util {

struct Logging {
  struct Params {
    std::string log_filename;
    bool append_mode = false;
    bool omit_timestamps = false;

    boost::program_options::options_description make_options_description();
  };

  static void init(const Params&);
};

}  // namespace util

#include "inline/util/LoggingUtil.inl"
