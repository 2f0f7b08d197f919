#include "util/LoggingUtil.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace util {

inline boost::program_options::options_description Logging::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po::options_description desc("Logging options");

  desc.add_options()("log-filename", po::value<std::string>(&log_filename),
                     "log filename. If specified, logs to the file in addition to stderr");
  po2::add_flag(desc, "log-append-mode", "log-write-mode", &append_mode, "write log in append mode",
                "write log in write mode");
  po2::add_flag(desc, "omit-timestamps", "include-timestamps", &omit_timestamps, "omit timestamps",
                "include timestamps");
  return desc;
}

}  // namespace util
