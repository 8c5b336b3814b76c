/***
 * Name: test_usage
 * Purpose: Validate Usage() content exposes documented flags.
 */
#include <gtest/gtest.h>
#include "cli/Usage.h"

using namespace pyspect::cli;

TEST(CLI_Usage, ContainsExpectedFlags) {
  auto u = Usage();
  EXPECT_EQ(u.rfind("pyspect [options] <script>", 0), 0u);
  EXPECT_NE(u.find("--mode=<mode>"), std::string::npos);
  EXPECT_NE(u.find("safe|import"), std::string::npos);
  EXPECT_NE(u.find("-o <file>"), std::string::npos);
  EXPECT_NE(u.find("--output=<file>"), std::string::npos);
  EXPECT_NE(u.find("--quiet"), std::string::npos);
  EXPECT_NE(u.find("--metrics"), std::string::npos);
  EXPECT_NE(u.find("--metrics-json"), std::string::npos);
  EXPECT_NE(u.find("--log-path=<dir>"), std::string::npos);
  EXPECT_NE(u.find("--log-lexer"), std::string::npos);
  EXPECT_NE(u.find("--log-ast"), std::string::npos);
  EXPECT_NE(u.find("--color="), std::string::npos);
  EXPECT_NE(u.find("--version"), std::string::npos);
  EXPECT_NE(u.find("PYSPECT_COLOR"), std::string::npos);
  EXPECT_NE(u.find("--                   End of options"), std::string::npos);
}

TEST(CLI_Usage, EndsWithNewline) {
  const auto u = Usage();
  ASSERT_FALSE(u.empty());
  EXPECT_EQ(u.back(), '\n');
}
