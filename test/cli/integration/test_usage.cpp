/***
 * Name: test_usage
 * Purpose: Validate Usage() content exposes documented flags.
 */
#include <gtest/gtest.h>
#include "pyhost/cli/Usage.h"

using namespace pyhost::cli;

TEST(CLI_Usage, ContainsExpectedFlags) {
  auto u = Usage();
  EXPECT_NE(u.find("pyhost [options] <module> <function> [args...]"), std::string::npos);
  EXPECT_NE(u.find("-e <expr>"), std::string::npos);
  EXPECT_NE(u.find("--kw=<name>=<value>"), std::string::npos);
  EXPECT_NE(u.find("--path=<dir>"), std::string::npos);
  EXPECT_NE(u.find("--metrics"), std::string::npos);
  EXPECT_NE(u.find("--metrics-json"), std::string::npos);
  EXPECT_NE(u.find("--debug"), std::string::npos);
  EXPECT_NE(u.find("--color="), std::string::npos);
  EXPECT_NE(u.find("PYHOST_EXECUTABLE"), std::string::npos);
  EXPECT_NE(u.find("--                   End of options"), std::string::npos);
}
