#include "util/GTestUtil.hpp"

#include "util/BoostUtil.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Rendering.hpp"

#include <boost/program_options.hpp>

#include <iostream>
#include <string>

// testing::InitGoogleTest() leaves "--help" in argv and prints only the gtest options. So we scan
// for "--help" ourselves and print our own options first. Our options_description declares "help"
// so that parsing the leftover argv does not fail on it.
//
// InitGoogleTest() strips the gtest options out of argv, and we parse what remains.
int launch_gtest(int argc, char** argv) {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;
  util::Logging::Params log_params;

  po::options_description desc("Options");
  desc.add_options()("help", "help");
  desc.add(log_params.make_options_description());

  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == "--help") {
      std::cout << desc << std::endl;
      break;
    }
  }

  testing::InitGoogleTest(&argc, argv);

  po2::parse_args(desc, argc, argv);
  util::Logging::init(log_params);
  util::Rendering::set(util::Rendering::kText);
  return RUN_ALL_TESTS();
}
