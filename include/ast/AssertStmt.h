#pragma once

#include <memory>
#include "Expr.h"
#include "Stmt.h"
#include "ast/Acceptable.h"

namespace pyspect::ast {

struct AssertStmt final : Stmt, Acceptable<AssertStmt, NodeKind::AssertStmt> {
  std::unique_ptr<Expr> test;
  std::unique_ptr<Expr> msg; // optional
  AssertStmt() : Stmt(NodeKind::AssertStmt) {}
};

} // namespace pyspect::ast
