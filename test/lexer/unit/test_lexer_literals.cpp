/***
 * Name: test_lexer_literals
 * Purpose: Strings, bytes, f-strings and numeric literal scanning.
 */
#include <gtest/gtest.h>
#include <string>
#include "lexer/Lexer.h"
#include "pyspect/exceptions/parse_error.h"

using namespace pyspect;

static std::vector<lex::Token> lexAll(const char* src) {
  lex::Lexer L; L.pushString(src, "lit.py");
  return L.tokens();
}

TEST(LexerLiterals, StringPrefixesSelectKind) {
  auto toks = lexAll("a = 'x'\nb = b'y'\nc = rb'z'\nd = f'{a}'\ne = Rf\"{b}\"\n");
  EXPECT_EQ(toks[2].kind, lex::TokenKind::String);
  EXPECT_EQ(toks[6].kind, lex::TokenKind::Bytes);
  EXPECT_EQ(toks[10].kind, lex::TokenKind::Bytes);
  EXPECT_EQ(toks[14].kind, lex::TokenKind::FString);
  EXPECT_EQ(toks[18].kind, lex::TokenKind::FString);
  EXPECT_EQ(toks[10].text, "rb'z'");
}

TEST(LexerLiterals, TripleQuotedSpansLines) {
  auto toks = lexAll("s = \"\"\"one\ntwo\"\"\"\nx = 1\n");
  EXPECT_EQ(toks[2].kind, lex::TokenKind::String);
  EXPECT_EQ(toks[2].text, "\"\"\"one\ntwo\"\"\"");
  EXPECT_EQ(toks[2].line, 1);
  EXPECT_EQ(toks[4].line, 3);
}

TEST(LexerLiterals, RawStringKeepsEscapedQuote) {
  auto toks = lexAll("s = r'a\\'b'\n");
  EXPECT_EQ(toks[2].text, "r'a\\'b'");
}

TEST(LexerLiterals, FStringNestedQuotesInBraces) {
  auto toks = lexAll("s = f\"{d['k']}\"\n");
  EXPECT_EQ(toks[2].kind, lex::TokenKind::FString);
  EXPECT_EQ(toks[3].kind, lex::TokenKind::Newline);
}

TEST(LexerLiterals, Numbers) {
  auto toks = lexAll("a = 0x_ff + 1_000 + 1.5e-3 + .5 + 3j + 0o7 + 0b1\n");
  EXPECT_EQ(toks[2].kind, lex::TokenKind::Int);
  EXPECT_EQ(toks[2].text, "0x_ff");
  EXPECT_EQ(toks[4].kind, lex::TokenKind::Int);
  EXPECT_EQ(toks[6].kind, lex::TokenKind::Float);
  EXPECT_EQ(toks[8].kind, lex::TokenKind::Float);
  EXPECT_EQ(toks[10].kind, lex::TokenKind::Imag);
  EXPECT_EQ(toks[12].kind, lex::TokenKind::Int);
  EXPECT_EQ(toks[14].kind, lex::TokenKind::Int);
}

TEST(LexerLiterals, LeadingZeroDecimalIsRejected) {
  try {
    lexAll("x = 0777\n");
    FAIL() << "expected ParseError";
  } catch (const exceptions::ParseError& e) {
    EXPECT_EQ(std::string(e.what()),
              "leading zeros in decimal integer literals are not permitted; use an 0o prefix for octal integers");
    EXPECT_EQ(e.col(), 5);
  }
  EXPECT_THROW(lexAll("x = 0_7\n"), exceptions::ParseError);
}

TEST(LexerLiterals, ZeroFormsThatStayValid) {
  auto toks = lexAll("a = 0 + 00 + 0_0 + 0.5 + 007.5 + 0e1 + 07j\n");
  EXPECT_EQ(toks[2].kind, lex::TokenKind::Int);
  EXPECT_EQ(toks[4].kind, lex::TokenKind::Int);
  EXPECT_EQ(toks[6].kind, lex::TokenKind::Int);
  EXPECT_EQ(toks[8].kind, lex::TokenKind::Float);
  EXPECT_EQ(toks[10].kind, lex::TokenKind::Float);
  EXPECT_EQ(toks[12].kind, lex::TokenKind::Float);
  EXPECT_EQ(toks[14].kind, lex::TokenKind::Imag);
}

TEST(LexerLiterals, UnterminatedString) {
  try {
    lexAll("s = 'abc\n");
    FAIL() << "expected ParseError";
  } catch (const exceptions::ParseError& e) {
    EXPECT_EQ(std::string(e.what()), "unterminated string literal (detected at line 1)");
    EXPECT_EQ(e.line(), 1);
    EXPECT_EQ(e.col(), 5);
  }
}

TEST(LexerLiterals, UnterminatedTripleQuoted) {
  try {
    lexAll("s = '''abc\nmore\n");
    FAIL() << "expected ParseError";
  } catch (const exceptions::ParseError& e) {
    EXPECT_NE(std::string(e.what()).find("unterminated triple-quoted string literal"), std::string::npos);
    EXPECT_EQ(e.line(), 1);
  }
}

TEST(LexerLiterals, OperatorsLongestMatch) {
  auto toks = lexAll("a **= b // c -> d := e ... f != g\n");
  EXPECT_EQ(toks[1].kind, lex::TokenKind::StarStarEqual);
  EXPECT_EQ(toks[3].kind, lex::TokenKind::SlashSlash);
  EXPECT_EQ(toks[5].kind, lex::TokenKind::Arrow);
  EXPECT_EQ(toks[7].kind, lex::TokenKind::ColonEqual);
  EXPECT_EQ(toks[9].kind, lex::TokenKind::Ellipsis);
  EXPECT_EQ(toks[11].kind, lex::TokenKind::NotEq);
}
