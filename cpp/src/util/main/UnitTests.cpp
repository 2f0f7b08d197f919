#include "util/AnsiCodes.hpp"
#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/GTestUtil.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Rendering.hpp"

#include <boost/program_options.hpp>
#include <gtest/gtest.h>

#include <string>
#include <vector>

TEST(Exception, format) {
  util::Exception e("x={} y={}", 3, "abc");
  EXPECT_EQ(std::string(e.what()), "x=3 y=abc");

  util::CleanException ce("bad value: {}", 1.5);
  EXPECT_EQ(std::string(ce.what()), "bad value: 1.5");
  EXPECT_EQ(std::string(util::Exception().what()), "");
}

TEST(Asserts, release_assert) {
  EXPECT_NO_THROW(RELEASE_ASSERT(1 + 1 == 2));
  EXPECT_THROW(RELEASE_ASSERT(1 + 1 == 3), util::ReleaseAssertionError);

  try {
    RELEASE_ASSERT(1 + 1 == 3, "math is broken: {}", 1 + 1);
    FAIL() << "expected ReleaseAssertionError";
  } catch (const util::ReleaseAssertionError& e) {
    std::string what = e.what();
    EXPECT_EQ(what.rfind("RELEASE_ASSERT failed: math is broken: 2 [", 0), 0u) << what;
  }

  try {
    RELEASE_ASSERT(1 + 1 == 3);
    FAIL() << "expected ReleaseAssertionError";
  } catch (const util::ReleaseAssertionError& e) {
    std::string what = e.what();
    EXPECT_EQ(what.rfind("RELEASE_ASSERT failed: 1 + 1 == 3 [", 0), 0u) << what;
  }
}

TEST(Asserts, clean_assert) {
  EXPECT_THROW(CLEAN_ASSERT(false, "user error"), util::CleanException);
  EXPECT_NO_THROW(CLEAN_ASSERT(true, "user error"));
}

TEST(Asserts, debug_assert) {
  if (IS_DEFINED(DEBUG_BUILD)) {
    EXPECT_THROW(DEBUG_ASSERT(false), util::DebugAssertionError);
  } else {
    EXPECT_NO_THROW(DEBUG_ASSERT(false));
  }
}

TEST(BoostUtil, parse_args) {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  int size = 0;
  bool verbose = false;
  po::options_description desc("Test options");
  desc.add_options()("size,n", po::value<int>(&size), "size");
  po2::add_flag(desc, "verbose", "quiet", &verbose, "be verbose", "be quiet");

  po::variables_map vm = po2::parse_args(desc, std::vector<std::string>{"-n", "7", "--verbose"});
  EXPECT_EQ(size, 7);
  EXPECT_TRUE(verbose);
  EXPECT_EQ(vm.count("size"), 1u);

  po2::parse_args(desc, std::vector<std::string>{"--quiet"});
  EXPECT_FALSE(verbose);
  EXPECT_EQ(size, 7);

  EXPECT_THROW(po2::parse_args(desc, std::vector<std::string>{"--bogus"}), util::CleanException);
  EXPECT_THROW(po2::parse_args(desc, std::vector<std::string>{"--size", "seven"}),
               util::CleanException);
}

TEST(BoostUtil, add_flag_marks_no_op) {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  bool flag = true;
  po::options_description desc("Test options");
  po2::add_flag(desc, "foo", "no-foo", &flag, "enable foo", "disable foo");

  EXPECT_EQ(desc.find("foo", false).description(), "enable foo (no-op)");
  EXPECT_EQ(desc.find("no-foo", false).description(), "disable foo");
}

TEST(Logging, params) {
  namespace po2 = boost_util::program_options;

  util::Logging::Params params;
  po2::parse_args(params.make_options_description(),
                  std::vector<std::string>{"--log-filename", "out.log", "--omit-timestamps"});

  EXPECT_EQ(params.log_filename, "out.log");
  EXPECT_TRUE(params.omit_timestamps);
  EXPECT_FALSE(params.append_mode);
}

TEST(Logging, console_sink_writes_to_stderr) {
  testing::internal::CaptureStdout();
  testing::internal::CaptureStderr();
  LOG_INFO("console sink check {}", 42);
  std::string out = testing::internal::GetCapturedStdout();
  std::string err = testing::internal::GetCapturedStderr();

  EXPECT_EQ(out.find("console sink check 42"), std::string::npos) << out;
  EXPECT_NE(err.find("console sink check 42"), std::string::npos) << err;
}

TEST(Rendering, guard) {
  util::Rendering::Mode base = util::Rendering::mode();
  {
    util::Rendering::Guard guard(util::Rendering::kTerminal);
    EXPECT_EQ(util::Rendering::mode(), util::Rendering::kTerminal);
    EXPECT_EQ(std::string(ansi::kRed("")), "\033[31m");
    {
      util::Rendering::Guard inner(util::Rendering::kText);
      EXPECT_EQ(std::string(ansi::kRed("")), "");
    }
    EXPECT_EQ(util::Rendering::mode(), util::Rendering::kTerminal);
  }
  EXPECT_EQ(util::Rendering::mode(), base);
  EXPECT_THROW(util::Rendering::pop(), util::Exception);
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
