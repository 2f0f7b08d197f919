#pragma once

#include <boost/program_options.hpp>

namespace boost_util {

namespace program_options {

/*
 * Adds both --foo and --no-foo options, both writing to *flag. The help text of whichever option
 * matches the current value of *flag is annotated with "(no-op)". This allows you to brainlessly
 * add both options without having to worry about what the default value is.
 *
 * Usage:
 *
 * namespace po2 = boost_util::program_options;
 * po2::add_flag(desc, "clear-screen", "no-clear-screen", &clear_screen, "clear the screen",
 *               "do not clear the screen");
 *
 * See: https://stackoverflow.com/a/33172979/543913
 */
void add_flag(boost::program_options::options_description& desc, const char* true_name,
              const char* false_name, bool* flag, const char* true_help, const char* false_help);

/*
 * Constructs a boost::program_options::command_line_parser out of ts, which is expected to be
 * a collection of strings from the command line. Uses this to store to the passed-in desc. Returns
 * the parsed variables_map.
 *
 * Any boost::program_options::error is rethrown as a util::CleanException.
 */
template <typename... Ts>
boost::program_options::variables_map parse_args(
  const boost::program_options::options_description& desc, Ts&&... ts);

}  // namespace program_options

}  // namespace boost_util

#include "inline/util/BoostUtil.inl"
