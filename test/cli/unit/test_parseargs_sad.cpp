/***
 * Name: test_parseargs_sad
 * Purpose: Rejected argument combinations.
 */
#include <gtest/gtest.h>
#include "cli/CLI.h"

using namespace pyspect::cli;

TEST(ParseArgsSad, UnknownOption) {
  const char* argv[] = {"pyspect", "--frobnicate", "a.py"};
  Options o;
  EXPECT_FALSE(ParseArgs(3, const_cast<char**>(argv), o));
}

TEST(ParseArgsSad, LoneDashIsNotAScript) {
  const char* argv[] = {"pyspect", "-"};
  Options o;
  EXPECT_FALSE(ParseArgs(2, const_cast<char**>(argv), o));
}

TEST(ParseArgsSad, InvalidMode) {
  const char* argv1[] = {"pyspect", "--mode=unsafe", "a.py"};
  Options o1;
  EXPECT_FALSE(ParseArgs(3, const_cast<char**>(argv1), o1));

  const char* argv2[] = {"pyspect", "--mode", "SAFE", "a.py"};
  Options o2;
  EXPECT_FALSE(ParseArgs(4, const_cast<char**>(argv2), o2));
}

TEST(ParseArgsSad, MissingValues) {
  const char* argv1[] = {"pyspect", "a.py", "-o"};
  Options o1;
  EXPECT_FALSE(ParseArgs(3, const_cast<char**>(argv1), o1));

  const char* argv2[] = {"pyspect", "a.py", "--mode"};
  Options o2;
  EXPECT_FALSE(ParseArgs(3, const_cast<char**>(argv2), o2));

  const char* argv3[] = {"pyspect", "--output=", "a.py"};
  Options o3;
  EXPECT_FALSE(ParseArgs(3, const_cast<char**>(argv3), o3));
}

TEST(ParseArgsSad, MetricsConflict) {
  const char* argv[] = {"pyspect", "--metrics", "--metrics-json", "a.py"};
  Options o;
  EXPECT_FALSE(ParseArgs(4, const_cast<char**>(argv), o));
}

TEST(ParseArgsSad, ScriptCount) {
  const char* argv1[] = {"pyspect"};
  Options o1;
  EXPECT_FALSE(ParseArgs(1, const_cast<char**>(argv1), o1));

  const char* argv2[] = {"pyspect", "a.py", "b.py"};
  Options o2;
  EXPECT_FALSE(ParseArgs(3, const_cast<char**>(argv2), o2));
}
