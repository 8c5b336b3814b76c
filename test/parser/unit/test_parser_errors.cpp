/***
 * Name: test_parser_errors
 * Purpose: Syntax errors carry the interpreter's wording and the offending position.
 */
#include <gtest/gtest.h>
#include <string>
#include "lexer/Lexer.h"
#include "parser/Parser.h"
#include "pyspect/exceptions/parse_error.h"

using namespace pyspect;

struct Failure {
  std::string message;
  int line{0};
  int col{0};
};

static Failure parseFailure(const char* src) {
  try {
    lex::Lexer L; L.pushString(src, "err.py");
    parse::Parser P(L);
    (void)P.parseModule();
  } catch (const exceptions::ParseError& e) {
    return Failure{e.what(), e.line(), e.col()};
  }
  return Failure{"<no error>", 0, 0};
}

TEST(ParserErrors, MissingIndentedBlock) {
  auto f = parseFailure("def f():\nreturn 1\n");
  EXPECT_EQ(f.message, "expected an indented block after function definition on line 1");
  EXPECT_EQ(f.line, 2);
}

TEST(ParserErrors, UnexpectedIndent) {
  auto f = parseFailure("x = 1\n    y = 2\n");
  EXPECT_EQ(f.message, "unexpected indent");
  EXPECT_EQ(f.line, 2);
}

TEST(ParserErrors, AssignToCall) {
  auto f = parseFailure("f() = 1\n");
  EXPECT_EQ(f.message, "cannot assign to function call here. Maybe you meant '==' instead of '='?");
  EXPECT_EQ(f.col, 1);
}

TEST(ParserErrors, AssignToKeywordConstantHasNoHint) {
  EXPECT_EQ(parseFailure("None = 1\n").message, "cannot assign to None");
}

TEST(ParserErrors, ParameterOrdering) {
  EXPECT_EQ(parseFailure("def f(a=1, b): pass\n").message,
            "parameter without a default follows parameter with a default");
  EXPECT_EQ(parseFailure("def f(*, **k): pass\n").message, "named arguments must follow bare *");
}

TEST(ParserErrors, ArgumentOrdering) {
  EXPECT_EQ(parseFailure("f(a=1, b)\n").message, "positional argument follows keyword argument");
  EXPECT_EQ(parseFailure("f(x for x in y, 1)\n").message, "Generator expression must be parenthesized");
}

TEST(ParserErrors, TryWithoutHandlers) {
  EXPECT_EQ(parseFailure("try:\n    pass\nx = 1\n").message, "expected 'except' or 'finally' block");
}

TEST(ParserErrors, MixedBytesAndStr) {
  EXPECT_EQ(parseFailure("x = b'a' 'b'\n").message, "cannot mix bytes and nonbytes literals");
}

TEST(ParserErrors, TrailingCommaInFromImport) {
  EXPECT_EQ(parseFailure("from a import b,\n").message,
            "trailing comma not allowed without surrounding parentheses");
}

TEST(ParserErrors, GenericInvalidSyntaxPointsAtToken) {
  auto f = parseFailure("x = = 1\n");
  EXPECT_EQ(f.message, "invalid syntax");
  EXPECT_EQ(f.line, 1);
  EXPECT_EQ(f.col, 5);
}

TEST(ParserErrors, ExpectedElseInConditional) {
  EXPECT_EQ(parseFailure("x = a if b\n").message, "expected 'else' after 'if' expression");
}

TEST(ParserErrors, DeepUnaryChainIsRejected) {
  const std::string src = "x = " + std::string(200000, '-') + "1\n";
  auto f = parseFailure(src.c_str());
  EXPECT_EQ(f.message, "too many nested expressions");
  EXPECT_EQ(f.line, 1);
}

TEST(ParserErrors, DeepNotAndLambdaChainsAreRejected) {
  std::string nots = "x = ";
  for (int i = 0; i < 5000; ++i) { nots += "not "; }
  EXPECT_EQ(parseFailure((nots + "y\n").c_str()).message, "too many nested expressions");
  std::string lambdas = "f = ";
  for (int i = 0; i < 5000; ++i) { lambdas += "lambda: "; }
  EXPECT_EQ(parseFailure((lambdas + "0\n").c_str()).message, "too many nested expressions");
}

TEST(ParserErrors, LongOperatorChainIsRejected) {
  std::string src = "x = 1";
  for (int i = 0; i < 100000; ++i) { src += " + 1"; }
  EXPECT_EQ(parseFailure((src + "\n").c_str()).message, "too many nested expressions");
  std::string calls = "x = f";
  for (int i = 0; i < 100000; ++i) { calls += "()"; }
  EXPECT_EQ(parseFailure((calls + "\n").c_str()).message, "too many nested expressions");
}

TEST(ParserErrors, ModerateNestingStillParses) {
  const std::string parens = "x = " + std::string(150, '(') + "-1" + std::string(150, ')') + "\n";
  EXPECT_EQ(parseFailure(parens.c_str()).message, "<no error>");
  std::string sum = "x = 1";
  for (int i = 0; i < 500; ++i) { sum += " + 1"; }
  EXPECT_EQ(parseFailure((sum + "\n").c_str()).message, "<no error>");
}
