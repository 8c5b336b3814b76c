/***
 * Name: test_string_decode
 * Purpose: Escape decoding for string and bytes tokens.
 */
#include <gtest/gtest.h>
#include "lexer/Token.h"
#include "parser/StringDecode.h"
#include "pyspect/exceptions/parse_error.h"

using namespace pyspect;

static lex::Token strTok(const std::string& text, lex::TokenKind kind = lex::TokenKind::String) {
  lex::Token t; t.kind = kind; t.text = text; t.line = 3; t.col = 7;
  return t;
}

TEST(StringDecode, SimpleEscapes) {
  auto d = parse::DecodeStringToken(strTok(R"('a\nb\t\\\'')"));
  EXPECT_EQ(d.value, "a\nb\t\\'");
  EXPECT_FALSE(d.isBytes);
}

TEST(StringDecode, NumericEscapes) {
  EXPECT_EQ(parse::DecodeStringToken(strTok(R"('\x41\101\u00e9\U0001F389')")).value,
            "AA\xC3\xA9\xF0\x9F\x8E\x89");
}

TEST(StringDecode, NamedEscapeViaIcu) {
  EXPECT_EQ(parse::DecodeStringToken(strTok(R"('\N{BULLET}')")).value, "\xE2\x80\xA2");
}

TEST(StringDecode, RawKeepsBackslashes) {
  auto d = parse::DecodeStringToken(strTok(R"(r'\n\x')"));
  EXPECT_TRUE(d.isRaw);
  EXPECT_EQ(d.value, "\\n\\x");
}

TEST(StringDecode, LineContinuationInsideString) {
  EXPECT_EQ(parse::DecodeStringToken(strTok("'ab\\\ncd'")).value, "abcd");
}

TEST(StringDecode, TripleQuotedBody) {
  EXPECT_EQ(parse::DecodeStringToken(strTok("\"\"\"one\ntwo\"\"\"")).value, "one\ntwo");
}

TEST(StringDecode, BytesKeepRawValues) {
  auto d = parse::DecodeStringToken(strTok(R"(b'\xff\x00')", lex::TokenKind::Bytes));
  EXPECT_TRUE(d.isBytes);
  EXPECT_EQ(d.value, std::string("\xff\x00", 2));
}

TEST(StringDecode, TruncatedHexEscapeThrows) {
  EXPECT_THROW(parse::DecodeStringToken(strTok(R"('\x4')")), exceptions::ParseError);
}
