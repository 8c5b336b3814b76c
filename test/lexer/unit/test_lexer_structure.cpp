/***
 * Name: test_lexer_structure
 * Purpose: Logical lines, indentation, implicit joining and comments.
 */
#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include "lexer/Lexer.h"
#include "pyspect/exceptions/parse_error.h"

using namespace pyspect;

static std::vector<lex::Token> lexAll(const char* src) {
  lex::Lexer L; L.pushString(src, "lex.py");
  return L.tokens();
}

static std::vector<lex::TokenKind> kindsOf(const std::vector<lex::Token>& toks) {
  std::vector<lex::TokenKind> out;
  for (const auto& t : toks) out.push_back(t.kind);
  return out;
}

TEST(LexerStructure, CommentsAndBlankLinesProduceNoTokens) {
  auto toks = lexAll("# header\n\n   # indented comment\nx = 1\n");
  ASSERT_GE(toks.size(), 4u);
  EXPECT_EQ(toks[0].kind, lex::TokenKind::Ident);
  EXPECT_EQ(toks[0].line, 4);
  EXPECT_EQ(toks.back().kind, lex::TokenKind::End);
}

TEST(LexerStructure, IndentDedentBalanced) {
  auto toks = lexAll("def f():\n    if x:\n        pass\n    return 1\n");
  int depth = 0, maxDepth = 0;
  for (const auto& t : toks) {
    if (t.kind == lex::TokenKind::Indent) { ++depth; maxDepth = std::max(maxDepth, depth); }
    if (t.kind == lex::TokenKind::Dedent) { --depth; }
  }
  EXPECT_EQ(depth, 0);
  EXPECT_EQ(maxDepth, 2);
}

TEST(LexerStructure, BracketsJoinLines) {
  auto toks = lexAll("x = [\n  1,\n  2,\n]\ny = 2\n");
  int newlines = 0;
  for (const auto& t : toks) if (t.kind == lex::TokenKind::Newline) ++newlines;
  EXPECT_EQ(newlines, 2);
}

TEST(LexerStructure, BackslashContinuation) {
  auto toks = lexAll("x = 1 + \\\n    2\n");
  const std::vector<lex::TokenKind> expected{
      lex::TokenKind::Ident, lex::TokenKind::Equal, lex::TokenKind::Int, lex::TokenKind::Plus,
      lex::TokenKind::Int, lex::TokenKind::Newline, lex::TokenKind::End};
  EXPECT_EQ(kindsOf(toks), expected);
}

TEST(LexerStructure, PositionsAreOneBased) {
  auto toks = lexAll("a = b\n");
  EXPECT_EQ(toks[0].line, 1);
  EXPECT_EQ(toks[0].col, 1);
  EXPECT_EQ(toks[2].col, 5);
  EXPECT_EQ(toks[0].file, "lex.py");
}

TEST(LexerStructure, SoftKeywordsAreIdentifiers) {
  auto toks = lexAll("match = type = _\n");
  EXPECT_EQ(toks[0].kind, lex::TokenKind::Ident);
  EXPECT_EQ(toks[2].kind, lex::TokenKind::Ident);
  EXPECT_EQ(toks[4].kind, lex::TokenKind::Ident);
}

TEST(LexerStructure, InconsistentDedentThrows) {
  try {
    lexAll("if x:\n    a\n  b\n");
    FAIL() << "expected ParseError";
  } catch (const exceptions::ParseError& e) {
    EXPECT_EQ(std::string(e.what()), "unindent does not match any outer indentation level");
    EXPECT_EQ(e.line(), 3);
  }
}

TEST(LexerStructure, UnclosedBracketReportsOpener) {
  try {
    lexAll("x = (1,\n  2\n");
    FAIL() << "expected ParseError";
  } catch (const exceptions::ParseError& e) {
    EXPECT_EQ(std::string(e.what()), "'(' was never closed");
    EXPECT_EQ(e.line(), 1);
    EXPECT_EQ(e.col(), 5);
  }
}

TEST(LexerStructure, MismatchedCloser) {
  EXPECT_THROW(lexAll("x = (1]\n"), exceptions::ParseError);
  EXPECT_THROW(lexAll("x = 1)\n"), exceptions::ParseError);
}

TEST(LexerStructure, DeepBracketNestingIsRejected) {
  const std::string src = "x = " + std::string(100000, '(') + "1" + std::string(100000, ')') + "\n";
  try {
    lexAll(src.c_str());
    FAIL() << "expected ParseError";
  } catch (const exceptions::ParseError& e) {
    EXPECT_EQ(std::string(e.what()), "too many nested parentheses");
    EXPECT_EQ(e.line(), 1);
    EXPECT_EQ(e.col(), 5 + 200);
  }
}

TEST(LexerStructure, TwoHundredBracketsAreAccepted) {
  const std::string src = "x = " + std::string(200, '[') + std::string(200, ']') + "\n";
  EXPECT_NO_THROW(lexAll(src.c_str()));
}

TEST(LexerStructure, MixedTabsAndSpacesIsATabError) {
  try {
    lexAll("def f():\n\treturn 1\n        x = 1\n");
    FAIL() << "expected ParseError";
  } catch (const exceptions::ParseError& e) {
    EXPECT_EQ(std::string(e.what()), "inconsistent use of tabs and spaces in indentation");
    EXPECT_EQ(e.line(), 3);
  }
}

TEST(LexerStructure, ConsistentTabsStillIndent) {
  auto kinds = kindsOf(lexAll("if x:\n\tif y:\n\t\tz\n\tw\n"));
  EXPECT_EQ(std::count(kinds.begin(), kinds.end(), lex::TokenKind::Indent), 2);
  EXPECT_EQ(std::count(kinds.begin(), kinds.end(), lex::TokenKind::Dedent), 2);
}

TEST(LexerStructure, TabDeeperThanSpacesOnlyUnderTabSizeEight) {
  // four spaces then a tab: column 8 vs. 5 with tab size 1; then one tab: 8 vs. 1
  EXPECT_THROW(lexAll("if x:\n    \ta\n\tb\n"), exceptions::ParseError);
}

TEST(LexerStructure, IndentationDepthIsBounded) {
  std::string src;
  for (int level = 0; level <= 101; ++level) {
    src += std::string(static_cast<size_t>(level), ' ') + "if x:\n";
  }
  src += std::string(102, ' ') + "pass\n";
  try {
    lexAll(src.c_str());
    FAIL() << "expected ParseError";
  } catch (const exceptions::ParseError& e) {
    EXPECT_EQ(std::string(e.what()), "too many levels of indentation");
  }
}
