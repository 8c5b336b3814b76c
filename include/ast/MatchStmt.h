/**
 * @file
 * @brief AST match/case declarations.
 */
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "Expr.h"
#include "Stmt.h"
#include "ast/Acceptable.h"

namespace pyspect::ast {

// Patterns are not analyzed; the case keeps its pattern as normalized source text.
struct MatchCase final : Node, Acceptable<MatchCase, NodeKind::MatchCase> {
  std::string pattern;
  std::unique_ptr<Expr> guard; // optional; null when absent
  std::vector<std::unique_ptr<Stmt>> body;
  MatchCase() : Node(NodeKind::MatchCase) {}
};

struct MatchStmt final : Stmt, Acceptable<MatchStmt, NodeKind::MatchStmt> {
  std::unique_ptr<Expr> subject;
  std::vector<std::unique_ptr<MatchCase>> cases;
  MatchStmt() : Stmt(NodeKind::MatchStmt) {}
};

} // namespace pyspect::ast
