#include "util/BoostUtil.hpp"

#include "util/Exception.hpp"

#include <string>
#include <utility>

namespace boost_util {

namespace program_options {

inline void add_flag(boost::program_options::options_description& desc, const char* true_name,
                     const char* false_name, bool* flag, const char* true_help,
                     const char* false_help) {
  namespace po = boost::program_options;

  std::string full_true_help = true_help;
  std::string full_false_help = false_help;

  if (*flag) {
    full_true_help += " (no-op)";
  } else {
    full_false_help += " (no-op)";
  }

  desc.add_options()(true_name, po::value(flag)->implicit_value(true)->zero_tokens(),
                     full_true_help.c_str())(
    false_name, po::value(flag)->implicit_value(false)->zero_tokens(), full_false_help.c_str());
}

template <typename... Ts>
boost::program_options::variables_map parse_args(
  const boost::program_options::options_description& desc, Ts&&... ts) {
  namespace po = boost::program_options;
  po::variables_map vm;
  try {
    po::store(po::command_line_parser(std::forward<Ts>(ts)...).options(desc).run(), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    throw util::CleanException("{}", e.what());
  }
  return vm;
}

}  // namespace program_options

}  // namespace boost_util
