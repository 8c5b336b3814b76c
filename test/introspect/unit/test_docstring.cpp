/***
 * Name: test_docstring
 * Purpose: Docstring cleaning and description derivation.
 */
#include <gtest/gtest.h>
#include "introspect/Docstring.h"

using namespace pyspect;

TEST(CleanDoc, RemovesCommonIndentAfterFirstLine) {
  EXPECT_EQ(introspect::CleanDoc("Summary.\n\n    Body line.\n      Nested.\n    "), "Summary.\n\nBody line.\n  Nested.");
}

TEST(CleanDoc, StripsLeadingAndTrailingBlankLines) {
  EXPECT_EQ(introspect::CleanDoc("\n    Text.\n\n"), "Text.");
  EXPECT_EQ(introspect::CleanDoc("   padded first"), "padded first");
  EXPECT_EQ(introspect::CleanDoc(""), "");
}

TEST(CleanDoc, ExpandsTabsBeforeMeasuringIndent) {
  EXPECT_EQ(introspect::CleanDoc("T.\n\tone\n        two"), "T.\none\ntwo");
}

TEST(Description, FirstLineStripped) {
  EXPECT_EQ(introspect::DescriptionFrom(std::string("  Tool for X.  \nmore")).value_or(""), "Tool for X.");
}

TEST(Description, NullCases) {
  EXPECT_FALSE(introspect::DescriptionFrom(std::nullopt).has_value());
  EXPECT_FALSE(introspect::DescriptionFrom(std::string("")).has_value());
  EXPECT_FALSE(introspect::DescriptionFrom(std::string("\nsecond line")).has_value());
  EXPECT_FALSE(introspect::DescriptionFrom(std::string("\"\"\"quoted")).has_value());
  EXPECT_FALSE(introspect::DescriptionFrom(std::string("'''quoted")).has_value());
}
