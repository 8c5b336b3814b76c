/***
 * Name: test_inline_metadata
 * Purpose: Block detection, un-prefixing and fallback extraction.
 */
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "metadata/InlineMetadata.h"

using namespace pyspect;

TEST(InlineMetadata, ReadsDependenciesRequiresAndTool) {
  const char* script =
      "#!/usr/bin/env python3\n"
      "# /// script\n"
      "# requires-python = \">=3.11\"\n"
      "# dependencies = [\n"
      "#   \"requests<3\",\n"
      "#   \"rich\",\n"
      "# ]\n"
      "# [tool.uv]\n"
      "# exclude-newer = \"2024-01-01T00:00:00Z\"\n"
      "# ///\n"
      "print('hi')\n";
  const auto block = metadata::ParseInlineMetadata(script);
  ASSERT_TRUE(block.has_value());
  const std::vector<std::string> deps{"requests<3", "rich"};
  EXPECT_EQ(block->dependencies, deps);
  ASSERT_TRUE(block->minInterpreter.has_value());
  EXPECT_EQ(*block->minInterpreter, ">=3.11");
  const auto* uv = block->toolConfig.find("uv");
  ASSERT_NE(uv, nullptr);
  EXPECT_EQ(uv->find("exclude-newer")->asString(), "2024-01-01T00:00:00Z");
}

TEST(InlineMetadata, BlockWithoutDependenciesIsStillABlock) {
  const auto block = metadata::ParseInlineMetadata("# /// script\n# requires-python = \">=3.8\"\n# ///\n");
  ASSERT_TRUE(block.has_value());
  EXPECT_TRUE(block->dependencies.empty());
  EXPECT_TRUE(block->toolConfig.keys().empty());
}

TEST(InlineMetadata, MissingClosingMarkerMeansNoBlock) {
  EXPECT_FALSE(metadata::ParseInlineMetadata("# /// script\n# dependencies = [\"a\"]\nx = 1\n").has_value());
}

TEST(InlineMetadata, NoMarkersMeansNoBlock) {
  EXPECT_FALSE(metadata::ParseInlineMetadata("import os\n").has_value());
}

TEST(InlineMetadata, BlankBodyMeansNoBlock) {
  EXPECT_FALSE(metadata::ParseInlineMetadata("# /// script\n#\n# ///\n").has_value());
}

TEST(InlineMetadata, MarkersToleratesSurroundingWhitespace) {
  const auto block = metadata::ParseInlineMetadata("  # /// script  \n# dependencies = [\"x\"]\n\t# ///\n");
  ASSERT_TRUE(block.has_value());
  ASSERT_EQ(block->dependencies.size(), 1u);
  EXPECT_EQ(block->dependencies[0], "x");
}

TEST(InlineMetadata, MalformedDocumentFallsBackToDependencyLine) {
  const auto block = metadata::ParseInlineMetadata(
      "# /// script\n"
      "# this is not toml\n"
      "# dependencies = [\"click\", 'rich']\n"
      "# ///\n");
  ASSERT_TRUE(block.has_value());
  const std::vector<std::string> deps{"click", "rich"};
  EXPECT_EQ(block->dependencies, deps);
  EXPECT_FALSE(block->minInterpreter.has_value());
}

TEST(InlineMetadata, MalformedDocumentWithoutListMeansNoBlock) {
  EXPECT_FALSE(metadata::ParseInlineMetadata("# /// script\n# = broken\n# ///\n").has_value());
}

TEST(InlineMetadata, NonStringDependencyRejectsBlock) {
  EXPECT_FALSE(metadata::ParseInlineMetadata("# /// script\n# dependencies = [1, 2]\n# ///\n").has_value());
}

TEST(InlineMetadata, ScanDependencyLineKeepsLastList) {
  const std::vector<std::string> body{"dependencies = [\"a\"]", "junk", "dependencies = [ \"b\" , \"c\" ]"};
  const std::vector<std::string> expected{"b", "c"};
  EXPECT_EQ(metadata::ScanDependencyLine(body), expected);
}

TEST(InlineMetadata, DeeplyNestedValueFallsBackToDependencyLine) {
  const std::string script =
      "# /// script\n"
      "# dependencies = [\"requests\"]\n"
      "# x = " + std::string(300000, '[') + std::string(300000, ']') + "\n"
      "# ///\n";
  const auto block = metadata::ParseInlineMetadata(script);
  ASSERT_TRUE(block.has_value());
  const std::vector<std::string> deps{"requests"};
  EXPECT_EQ(block->dependencies, deps);
}
