/***
 * Name: test_parseargs_happy
 * Purpose: Accepted option spellings and their effect on Options.
 */
#include <gtest/gtest.h>
#include "cli/CLI.h"

using namespace pyspect::cli;
using pyspect::introspect::Mode;

TEST(ParseArgsHappy, DefaultsWithSingleScript) {
  const char* argv[] = {"pyspect", "tool.py"};
  Options o;
  ASSERT_TRUE(ParseArgs(2, const_cast<char**>(argv), o));
  ASSERT_EQ(o.inputs.size(), 1u);
  EXPECT_EQ(o.inputs[0], "tool.py");
  EXPECT_EQ(o.mode, Mode::Safe);
  EXPECT_FALSE(o.outputPath.has_value());
  EXPECT_EQ(o.color, ColorMode::Auto);
  EXPECT_EQ(o.logPath, ".");
  EXPECT_FALSE(o.quiet);
}

TEST(ParseArgsHappy, ModeBothSpellings) {
  const char* argv1[] = {"pyspect", "--mode=import", "a.py"};
  Options o1;
  ASSERT_TRUE(ParseArgs(3, const_cast<char**>(argv1), o1));
  EXPECT_EQ(o1.mode, Mode::Import);

  const char* argv2[] = {"pyspect", "--mode", "safe", "a.py"};
  Options o2;
  ASSERT_TRUE(ParseArgs(4, const_cast<char**>(argv2), o2));
  EXPECT_EQ(o2.mode, Mode::Safe);
}

TEST(ParseArgsHappy, OutputSpellings) {
  const char* argv1[] = {"pyspect", "-o", "out.json", "a.py"};
  Options o1;
  ASSERT_TRUE(ParseArgs(4, const_cast<char**>(argv1), o1));
  EXPECT_EQ(o1.outputPath.value_or(""), "out.json");

  const char* argv2[] = {"pyspect", "--output=r.json", "a.py"};
  Options o2;
  ASSERT_TRUE(ParseArgs(3, const_cast<char**>(argv2), o2));
  EXPECT_EQ(o2.outputPath.value_or(""), "r.json");

  const char* argv3[] = {"pyspect", "a.py", "--output", "s.json"};
  Options o3;
  ASSERT_TRUE(ParseArgs(4, const_cast<char**>(argv3), o3));
  EXPECT_EQ(o3.outputPath.value_or(""), "s.json");
  EXPECT_EQ(o3.inputs.size(), 1u);
}

TEST(ParseArgsHappy, LoggingAndColorFlags) {
  const char* argv[] = {"pyspect", "--log-path=logs", "--log-lexer", "--log-ast", "--color=never", "-q", "a.py"};
  Options o;
  ASSERT_TRUE(ParseArgs(7, const_cast<char**>(argv), o));
  EXPECT_EQ(o.logPath, "logs");
  EXPECT_TRUE(o.logLexer);
  EXPECT_TRUE(o.logAst);
  EXPECT_EQ(o.color, ColorMode::Never);
  EXPECT_TRUE(o.quiet);
}

TEST(ParseArgsHappy, UnknownColorFallsBackToAuto) {
  const char* argv[] = {"pyspect", "--color=sometimes", "a.py"};
  Options o;
  ASSERT_TRUE(ParseArgs(3, const_cast<char**>(argv), o));
  EXPECT_EQ(o.color, ColorMode::Auto);
}

TEST(ParseArgsHappy, MetricsFlags) {
  const char* argv[] = {"pyspect", "--metrics", "a.py"};
  Options o;
  ASSERT_TRUE(ParseArgs(3, const_cast<char**>(argv), o));
  EXPECT_TRUE(o.metrics);
  EXPECT_FALSE(o.metricsJson);
}

TEST(ParseArgsHappy, HelpAndVersionNeedNoScript) {
  const char* argv1[] = {"pyspect", "--help"};
  Options o1;
  ASSERT_TRUE(ParseArgs(2, const_cast<char**>(argv1), o1));
  EXPECT_TRUE(o1.showHelp);

  const char* argv2[] = {"pyspect", "--version"};
  Options o2;
  ASSERT_TRUE(ParseArgs(2, const_cast<char**>(argv2), o2));
  EXPECT_TRUE(o2.showVersion);
}

TEST(ParseArgsHappy, DoubleDashEndsOptions) {
  const char* argv[] = {"pyspect", "--quiet", "--", "-weird-name.py"};
  Options o;
  ASSERT_TRUE(ParseArgs(4, const_cast<char**>(argv), o));
  ASSERT_EQ(o.inputs.size(), 1u);
  EXPECT_EQ(o.inputs[0], "-weird-name.py");
}
