/***
 * Name: test_cli_framework
 * Purpose: Framework detection follows fixed priority over imported modules.
 */
#include <gtest/gtest.h>
#include "introspect/CliFrameworkDetector.h"

using namespace pyspect;

static std::vector<introspect::ImportInfo> modules(std::initializer_list<const char*> names) {
  std::vector<introspect::ImportInfo> out;
  for (const char* name : names) {
    introspect::ImportInfo info;
    info.module = name;
    out.push_back(info);
  }
  return out;
}

TEST(CliFramework, TyperBeatsClickBeatsArgparse) {
  EXPECT_EQ(introspect::DetectCliFramework(modules({"argparse", "click", "typer"}))->name, "typer");
  EXPECT_EQ(introspect::DetectCliFramework(modules({"argparse", "click"}))->name, "click");
  EXPECT_EQ(introspect::DetectCliFramework(modules({"argparse"}))->name, "argparse");
}

TEST(CliFramework, ReservedFieldsStayEmpty) {
  const auto info = introspect::DetectCliFramework(modules({"click"}));
  ASSERT_TRUE(info.has_value());
  EXPECT_FALSE(info->version.has_value());
  EXPECT_TRUE(info->detectedCommands.empty());
  EXPECT_FALSE(info->mainCallable.has_value());
}

TEST(CliFramework, SubmodulesDoNotCount) {
  EXPECT_FALSE(introspect::DetectCliFramework(modules({"click.testing", "os"})).has_value());
  EXPECT_FALSE(introspect::DetectCliFramework({}).has_value());
}
