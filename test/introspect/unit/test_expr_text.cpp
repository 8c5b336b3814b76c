/***
 * Name: test_expr_text
 * Purpose: Annotation, default and decorator text rendering.
 */
#include <gtest/gtest.h>
#include "ast/Nodes.h"
#include "introspect/ExprText.h"
#include "introspect/SyntaxAnalyzer.h"

using namespace pyspect;

static std::string render(const std::string& exprSrc) {
  auto mod = introspect::SyntaxAnalyzer::Parse(exprSrc + "\n", "expr.py");
  const auto& stmt = static_cast<const ast::ExprStmt&>(*mod->body.front());
  return introspect::RenderExpr(*stmt.value);
}

TEST(ExprText, NamesAttributesAndSubscripts) {
  EXPECT_EQ(render("pathlib.Path"), "pathlib.Path");
  EXPECT_EQ(render("dict[str, int]"), "dict[str, int]");
  EXPECT_EQ(render("tuple[int,]"), "tuple[int,]");
  EXPECT_EQ(render("Optional[list[str]]"), "Optional[list[str]]");
}

TEST(ExprText, ConstantsUseReprForm) {
  EXPECT_EQ(render("\"hi\""), "'hi'");
  EXPECT_EQ(render("b'\\x00'"), "b'\\x00'");
  EXPECT_EQ(render("1_000"), "1000");
  EXPECT_EQ(render("2.50"), "2.5");
  EXPECT_EQ(render("3j"), "3j");
  EXPECT_EQ(render("True"), "True");
  EXPECT_EQ(render("None"), "None");
  EXPECT_EQ(render("..."), "Ellipsis");
}

TEST(ExprText, CompositeExpressionsFallBackToUnparse) {
  EXPECT_EQ(render("int | None"), "int | None");
  EXPECT_EQ(render("[1,2]"), "[1, 2]");
  EXPECT_EQ(render("os.environ.get('HOME', '/')"), "os.environ.get('HOME', '/')");
}
