/***
 * Name: test_parser_expressions
 * Purpose: Expression grammar: precedence, postfix chains, displays, literals.
 */
#include <gtest/gtest.h>
#include "ast/Nodes.h"
#include "ast/Unparse.h"
#include "lexer/Lexer.h"
#include "parser/Parser.h"

using namespace pyspect;

static std::unique_ptr<ast::Module> parseSrc(const std::string& src) {
  lex::Lexer L; L.pushString(src, "expr.py");
  parse::Parser P(L);
  return P.parseModule();
}

// Parse `x = <expr>` and return the value expression.
static const ast::Expr& valueOf(const ast::Module& mod) {
  const auto& as = static_cast<const ast::AssignStmt&>(*mod.body.front());
  return *as.value;
}

TEST(ParserExpressions, PowerBindsTighterThanUnaryMinus) {
  auto mod = parseSrc("x = -2 ** 2\n");
  const auto& v = valueOf(*mod);
  ASSERT_EQ(v.kind, ast::NodeKind::UnaryExpr);
}

TEST(ParserExpressions, MultiplicativeOverAdditive) {
  auto mod = parseSrc("x = 1 + 2 * 3\n");
  const auto& v = static_cast<const ast::Binary&>(valueOf(*mod));
  EXPECT_EQ(v.op, ast::BinaryOperator::Add);
  EXPECT_EQ(v.rhs->kind, ast::NodeKind::BinaryExpr);
}

TEST(ParserExpressions, ComparisonChainIsNotIn) {
  auto mod = parseSrc("x = a < b is not c not in d\n");
  const auto& v = static_cast<const ast::Compare&>(valueOf(*mod));
  ASSERT_EQ(v.ops.size(), 3u);
  EXPECT_EQ(v.comparators.size(), 3u);
}

TEST(ParserExpressions, PostfixLocatedAtBase) {
  auto mod = parseSrc("x = obj.attr[0](1)\n");
  const auto& v = valueOf(*mod);
  ASSERT_EQ(v.kind, ast::NodeKind::Call);
  EXPECT_EQ(v.line, 1);
  EXPECT_EQ(v.col, 5);
}

TEST(ParserExpressions, ImplicitStringConcatenation) {
  auto mod = parseSrc("x = 'a' \"b\" '''c'''\n");
  const auto& v = valueOf(*mod);
  ASSERT_EQ(v.kind, ast::NodeKind::StringLiteral);
  EXPECT_EQ(static_cast<const ast::StringLiteral&>(v).value, "abc");
}

TEST(ParserExpressions, BytesConcatenation) {
  auto mod = parseSrc("x = b'a' b'\\x00'\n");
  const auto& v = valueOf(*mod);
  ASSERT_EQ(v.kind, ast::NodeKind::BytesLiteral);
  EXPECT_EQ(static_cast<const ast::BytesLiteral&>(v).value, std::string("a\0", 2));
}

TEST(ParserExpressions, DisplaysAndComprehensions) {
  auto mod = parseSrc(
      "a = [1, *b]\n"
      "c = {k: v for k, v in items if k}\n"
      "d = {1, 2}\n"
      "e = {}\n"
      "f = (i async for i in g)\n"
      "h = {**m, 'k': 1}\n");
  EXPECT_EQ(static_cast<const ast::AssignStmt&>(*mod->body[0]).value->kind, ast::NodeKind::ListLiteral);
  EXPECT_EQ(static_cast<const ast::AssignStmt&>(*mod->body[1]).value->kind, ast::NodeKind::DictComp);
  EXPECT_EQ(static_cast<const ast::AssignStmt&>(*mod->body[2]).value->kind, ast::NodeKind::SetLiteral);
  EXPECT_EQ(static_cast<const ast::AssignStmt&>(*mod->body[3]).value->kind, ast::NodeKind::DictLiteral);
  const auto& gen = static_cast<const ast::GeneratorExpr&>(*static_cast<const ast::AssignStmt&>(*mod->body[4]).value);
  ASSERT_EQ(gen.fors.size(), 1u);
  EXPECT_TRUE(gen.fors[0].isAsync);
  EXPECT_EQ(static_cast<const ast::AssignStmt&>(*mod->body[5]).value->kind, ast::NodeKind::DictLiteral);
}

TEST(ParserExpressions, LambdaWalrusTernaryAwait) {
  auto mod = parseSrc(
      "f = lambda x, *a, k=1, **kw: x\n"
      "if (n := len(a)) > 1: pass\n"
      "y = a if b else c\n"
      "async def g():\n"
      "    return await h()\n");
  EXPECT_EQ(valueOf(*mod).kind, ast::NodeKind::LambdaExpr);
  EXPECT_EQ(static_cast<const ast::AssignStmt&>(*mod->body[2]).value->kind, ast::NodeKind::IfExpr);
}

TEST(ParserExpressions, SlicesAndTupleSubscripts) {
  auto mod = parseSrc("x = a[1:2, ::3]\ny = d[str, int]\n");
  const auto& s = static_cast<const ast::Subscript&>(valueOf(*mod));
  ASSERT_EQ(s.slice->kind, ast::NodeKind::TupleLiteral);
  const auto& t = static_cast<const ast::TupleLiteral&>(*s.slice);
  EXPECT_EQ(t.elements[0]->kind, ast::NodeKind::Slice);
}

TEST(ParserExpressions, FStringSplitsLiteralsAndFields) {
  auto mod = parseSrc("x = f'hi {name!r:>10}' 'tail'\n");
  ASSERT_EQ(valueOf(*mod).kind, ast::NodeKind::FStringLiteral);
  const auto& fs = static_cast<const ast::FStringLiteral&>(valueOf(*mod));
  ASSERT_EQ(fs.values.size(), 3u);
  EXPECT_EQ(fs.values[0].literal, "hi ");
  ASSERT_NE(fs.values[1].value, nullptr);
  EXPECT_EQ(fs.values[1].value->kind, ast::NodeKind::Name);
  EXPECT_EQ(fs.values[1].conversion, 'r');
  ASSERT_EQ(fs.values[1].formatSpec.size(), 1u);
  EXPECT_EQ(fs.values[1].formatSpec[0].literal, ">10");
  EXPECT_EQ(fs.values[2].literal, "tail");
}

TEST(ParserExpressions, FStringDebugFieldKeepsSourceText) {
  auto mod = parseSrc("x = f'{a + b = }'\n");
  const auto& fs = static_cast<const ast::FStringLiteral&>(valueOf(*mod));
  ASSERT_EQ(fs.values.size(), 2u);
  EXPECT_EQ(fs.values[0].literal, "a + b = ");
  EXPECT_EQ(fs.values[1].value->kind, ast::NodeKind::BinaryExpr);
  EXPECT_EQ(fs.values[1].conversion, 'r');
}

TEST(ParserExpressions, FStringDoubledBracesAndEscapes) {
  auto mod = parseSrc("x = f'{{a}}\\t{b}'\n");
  const auto& fs = static_cast<const ast::FStringLiteral&>(valueOf(*mod));
  ASSERT_EQ(fs.values.size(), 2u);
  EXPECT_EQ(fs.values[0].literal, "{a}\t");
  EXPECT_EQ(fs.values[1].conversion, 0);
}

TEST(ParserExpressions, CallArguments) {
  auto mod = parseSrc("f(a, *b, c=1, **d)\ng(x for x in y)\n");
  const auto& call = static_cast<const ast::Call&>(*static_cast<const ast::ExprStmt&>(*mod->body[0]).value);
  EXPECT_EQ(call.args.size(), 2u);
  EXPECT_EQ(call.keywords.size(), 2u);
  EXPECT_EQ(call.keywords[1].name, "");
  const auto& g = static_cast<const ast::Call&>(*static_cast<const ast::ExprStmt&>(*mod->body[1]).value);
  ASSERT_EQ(g.args.size(), 1u);
  EXPECT_EQ(g.args[0]->kind, ast::NodeKind::GeneratorExpr);
}
