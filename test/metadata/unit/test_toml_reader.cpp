/***
 * Name: test_toml_reader
 * Purpose: Exercise the restricted TOML reader used for inline metadata.
 */
#include <gtest/gtest.h>
#include <cmath>
#include <string>
#include "metadata/TomlReader.h"
#include "pyspect/exceptions/toml_error.h"

using namespace pyspect;
using metadata::ConfigValue;

static int tomlErrorLine(const char* doc) {
  try {
    (void)metadata::ParseToml(doc);
  } catch (const exceptions::TomlError& e) {
    return e.line();
  }
  return -1;
}

TEST(TomlReader, ScalarsAndKeyOrder) {
  const auto doc = metadata::ParseToml(
      "name = \"demo\"\n"
      "count = 1_000\n"
      "ratio = 0.5\n"
      "enabled = true\n"
      "mask = 0xff\n");
  const std::vector<std::string> keys{"name", "count", "ratio", "enabled", "mask"};
  EXPECT_EQ(doc.keys(), keys);
  EXPECT_EQ(doc.find("name")->asString(), "demo");
  EXPECT_EQ(doc.find("count")->asInteger(), 1000);
  EXPECT_DOUBLE_EQ(doc.find("ratio")->asFloat(), 0.5);
  EXPECT_TRUE(doc.find("enabled")->asBoolean());
  EXPECT_EQ(doc.find("mask")->asInteger(), 255);
}

TEST(TomlReader, StringsAndEscapes) {
  const auto doc = metadata::ParseToml(
      "basic = \"tab\\there \\u00e9\"\n"
      "literal = 'C:\\path'\n"
      "multi = \"\"\"\nfirst\nsecond\"\"\"\n");
  EXPECT_EQ(doc.find("basic")->asString(), "tab\there \xC3\xA9");
  EXPECT_EQ(doc.find("literal")->asString(), "C:\\path");
  EXPECT_EQ(doc.find("multi")->asString(), "first\nsecond");
}

TEST(TomlReader, ArraysSpanLinesWithTrailingComma) {
  const auto doc = metadata::ParseToml(
      "dependencies = [\n"
      "  \"requests>=2\",  # http\n"
      "  \"rich\",\n"
      "]\n");
  const auto* deps = doc.find("dependencies");
  ASSERT_NE(deps, nullptr);
  ASSERT_TRUE(deps->isArray());
  ASSERT_EQ(deps->items().size(), 2u);
  EXPECT_EQ(deps->items()[0].asString(), "requests>=2");
  EXPECT_EQ(deps->items()[1].asString(), "rich");
}

TEST(TomlReader, TablesDottedKeysAndInlineTables) {
  const auto doc = metadata::ParseToml(
      "[tool.ruff]\n"
      "line-length = 100\n"
      "lint.select = [\"E\"]\n"
      "[tool.demo]\n"
      "opts = { fast = true, level = 2 }\n");
  const auto* tool = doc.find("tool");
  ASSERT_NE(tool, nullptr);
  const std::vector<std::string> toolKeys{"ruff", "demo"};
  EXPECT_EQ(tool->keys(), toolKeys);
  const auto* ruff = tool->find("ruff");
  EXPECT_EQ(ruff->find("line-length")->asInteger(), 100);
  EXPECT_TRUE(ruff->find("lint")->isTable());
  EXPECT_EQ(ruff->find("lint")->find("select")->items()[0].asString(), "E");
  EXPECT_EQ(tool->find("demo")->find("opts")->find("level")->asInteger(), 2);
}

TEST(TomlReader, ArrayOfTablesAppendsItems) {
  const auto doc = metadata::ParseToml(
      "[[plugin]]\n"
      "name = \"a\"\n"
      "[[plugin]]\n"
      "name = \"b\"\n");
  const auto* plugins = doc.find("plugin");
  ASSERT_NE(plugins, nullptr);
  ASSERT_TRUE(plugins->isArray());
  ASSERT_EQ(plugins->items().size(), 2u);
  EXPECT_EQ(plugins->items()[1].find("name")->asString(), "b");
}

TEST(TomlReader, SpecialFloats) {
  const auto doc = metadata::ParseToml("a = inf\nb = -inf\nc = nan\n");
  EXPECT_TRUE(std::isinf(doc.find("a")->asFloat()));
  EXPECT_LT(doc.find("b")->asFloat(), 0.0);
  EXPECT_TRUE(std::isnan(doc.find("c")->asFloat()));
}

TEST(TomlReader, ErrorsCarryDocumentLine) {
  EXPECT_EQ(tomlErrorLine("a = 1\nb = 2\na = 3\n"), 3);
  EXPECT_EQ(tomlErrorLine("[t]\nx = 1\n[t]\n"), 3);
  EXPECT_EQ(tomlErrorLine("ok = 1\nbad = \n"), 2);
  EXPECT_EQ(tomlErrorLine("s = \"open\n"), 1);
}

TEST(TomlReader, RejectsUnsupportedAndMalformedValues) {
  EXPECT_THROW((void)metadata::ParseToml("when = 2024-01-01\n"), exceptions::TomlError);
  EXPECT_THROW((void)metadata::ParseToml("n = 007\n"), exceptions::TomlError);
  EXPECT_THROW((void)metadata::ParseToml("n = 1__0\n"), exceptions::TomlError);
  EXPECT_THROW((void)metadata::ParseToml("x = 1 y = 2\n"), exceptions::TomlError);
  EXPECT_THROW((void)metadata::ParseToml("t = { a = 1 }\nt.b = 2\n"), exceptions::TomlError);
}

TEST(TomlReader, DeepNestingIsAnErrorNotACrash) {
  const std::string arrays = "x = " + std::string(300000, '[') + std::string(300000, ']') + "\n";
  EXPECT_THROW((void)metadata::ParseToml(arrays), exceptions::TomlError);
  std::string tables = "x = ";
  for (int i = 0; i < 200; ++i) { tables += "{ a = "; }
  tables += "1";
  for (int i = 0; i < 200; ++i) { tables += " }"; }
  EXPECT_THROW((void)metadata::ParseToml(tables + "\n"), exceptions::TomlError);
  std::string dotted = "a";
  for (int i = 0; i < 200; ++i) { dotted += ".a"; }
  EXPECT_THROW((void)metadata::ParseToml(dotted + " = 1\n"), exceptions::TomlError);
}

TEST(TomlReader, ModerateNestingIsAccepted) {
  const std::string arrays = "x = " + std::string(50, '[') + std::string(50, ']') + "\n";
  const auto doc = metadata::ParseToml(arrays);
  ASSERT_NE(doc.find("x"), nullptr);
  EXPECT_TRUE(doc.find("x")->isArray());
}
