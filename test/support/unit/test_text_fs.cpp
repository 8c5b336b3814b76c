/***
 * Name: test_text_fs
 * Purpose: Whitespace helpers, UTF-8 coding and file IO wrappers.
 */
#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include "pyspect/support/fs.h"
#include "pyspect/support/text.h"

using namespace pyspect;

TEST(Text, TrimAndSplit) {
  EXPECT_EQ(support::Trim("  a b \t\n"), "a b");
  EXPECT_EQ(support::TrimLeft("  a "), "a ");
  const auto lines = support::SplitLines("a\r\nb\n\nc");
  ASSERT_EQ(lines.size(), 4u);
  EXPECT_EQ(lines[0], "a");
  EXPECT_EQ(lines[2], "");
  EXPECT_EQ(lines[3], "c");
}

TEST(Text, Utf8RoundTripAndRejects) {
  std::string out;
  support::AppendUtf8(out, U'é');
  support::AppendUtf8(out, U'\U0001F389');
  std::size_t pos = 0;
  char32_t cp = 0;
  ASSERT_TRUE(support::DecodeUtf8(out, pos, cp));
  EXPECT_EQ(cp, U'é');
  ASSERT_TRUE(support::DecodeUtf8(out, pos, cp));
  EXPECT_EQ(cp, U'\U0001F389');
  EXPECT_EQ(pos, out.size());

  pos = 0;
  EXPECT_FALSE(support::DecodeUtf8("\xC3(", pos, cp));
  pos = 0;
  EXPECT_FALSE(support::DecodeUtf8("\xC0\xAF", pos, cp)); // overlong
}

TEST(Fs, WriteThenReadBinary) {
  const auto path = (std::filesystem::temp_directory_path() / "pyspect_fs_test.bin").string();
  std::string err;
  const std::string data("a\r\n\0z", 5);
  ASSERT_TRUE(support::WriteFile(path, data, err)) << err;
  std::string back;
  ASSERT_TRUE(support::ReadFile(path, back, err)) << err;
  EXPECT_EQ(back, data);
  std::filesystem::remove(path);
}

TEST(Fs, ReadMissingReportsError) {
  std::string out, err;
  EXPECT_FALSE(support::ReadFile("/nonexistent/pyspect/none.py", out, err));
  EXPECT_FALSE(err.empty());
}
