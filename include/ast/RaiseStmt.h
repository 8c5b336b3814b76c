#pragma once

#include <memory>
#include "Expr.h"
#include "Stmt.h"
#include "ast/Acceptable.h"

namespace pyspect::ast {

struct RaiseStmt final : Stmt, Acceptable<RaiseStmt, NodeKind::RaiseStmt> {
  std::unique_ptr<Expr> exc;   // optional
  std::unique_ptr<Expr> cause; // optional after 'from'
  RaiseStmt() : Stmt(NodeKind::RaiseStmt) {}
};

} // namespace pyspect::ast
