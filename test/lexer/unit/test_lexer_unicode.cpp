/***
 * Name: test_lexer_unicode
 * Purpose: Non-ASCII identifiers are classified and NFKC-normalized.
 */
#include <gtest/gtest.h>
#include "lexer/Lexer.h"
#include "pyspect/exceptions/parse_error.h"

using namespace pyspect;

static std::vector<lex::Token> lexAll(const char* src) {
  lex::Lexer L; L.pushString(src, "uni.py");
  return L.tokens();
}

TEST(LexerUnicode, NonAsciiIdentifier) {
  auto toks = lexAll("caf\xC3\xA9 = 1\n");
  ASSERT_EQ(toks[0].kind, lex::TokenKind::Ident);
  EXPECT_EQ(toks[0].text, "caf\xC3\xA9");
}

TEST(LexerUnicode, IdentifierIsNfkcNormalized) {
  // U+FB01 LATIN SMALL LIGATURE FI normalizes to "fi"
  auto toks = lexAll("\xEF\xAC\x81x = 1\n");
  ASSERT_EQ(toks[0].kind, lex::TokenKind::Ident);
  EXPECT_EQ(toks[0].text, "fix");
}

TEST(LexerUnicode, InvalidCharacterRejected) {
  // U+20AC EURO SIGN is not an identifier character
  EXPECT_THROW(lexAll("x = \xE2\x82\xAC\n"), exceptions::ParseError);
  EXPECT_THROW(lexAll("x = $\n"), exceptions::ParseError);
}

TEST(LexerUnicode, ToStringNamesKinds) {
  EXPECT_STREQ(lex::to_string(lex::TokenKind::Def), "def");
  EXPECT_STREQ(lex::to_string(lex::TokenKind::End), "End");
  EXPECT_TRUE(lex::isAugAssign(lex::TokenKind::PlusEqual));
  EXPECT_FALSE(lex::isAugAssign(lex::TokenKind::EqEq));
}
