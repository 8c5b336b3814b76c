/***
 * Name: test_geometry
 * Purpose: Cover AST geometry summary and child enumeration.
 */
#include <gtest/gtest.h>
#include "ast/ForEachChild.h"
#include "ast/GeometrySummary.h"
#include "ast/Nodes.h"
#include "lexer/Lexer.h"
#include "parser/Parser.h"

using namespace pyspect;

static std::unique_ptr<ast::Module> parseSrcGeom(const char* src) {
  lex::Lexer L; L.pushString(src, "geo.py");
  parse::Parser P(L);
  return P.parseModule();
}

TEST(Geometry, NestedDepthIncreases) {
  const char* shallow =
      "def main() -> int:\n"
      "  return 1 + 2\n";
  const char* deep =
      "def main() -> int:\n"
      "  return 1 + (2 * (3 + 4))\n";
  auto modS = parseSrcGeom(shallow);
  auto modD = parseSrcGeom(deep);
  const auto gS = ast::ComputeGeometry(*modS);
  const auto gD = ast::ComputeGeometry(*modD);
  EXPECT_GT(gS.nodes, 0u);
  EXPECT_GT(gD.nodes, gS.nodes);
  EXPECT_GT(gD.maxDepth, gS.maxDepth);
}

TEST(Geometry, EmptyModuleIsOneNode) {
  auto mod = parseSrcGeom("");
  const auto g = ast::ComputeGeometry(*mod);
  EXPECT_EQ(g.nodes, 1u);
}

TEST(ForEachChild, VisitsInSourceOrder) {
  auto mod = parseSrcGeom("import a\nx = 1\ndef f(): pass\n");
  std::vector<ast::NodeKind> kinds;
  ast::ForEachChild(*mod, [&](const ast::Node& n) { kinds.push_back(n.kind); });
  const std::vector<ast::NodeKind> expected{ast::NodeKind::Import, ast::NodeKind::AssignStmt, ast::NodeKind::FunctionDef};
  EXPECT_EQ(kinds, expected);
}

TEST(ForEachChild, FunctionIncludesDecoratorsParamsAndBody) {
  auto mod = parseSrcGeom("@d\ndef f(a: int = 1) -> str:\n    return 'x'\n");
  std::size_t count = 0;
  ast::ForEachChild(*mod->body[0], [&](const ast::Node&) { ++count; });
  // decorator, annotation, default, return annotation, return statement
  EXPECT_EQ(count, 5u);
}
