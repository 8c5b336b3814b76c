#pragma once

#include <memory>
#include "Expr.h"
#include "Stmt.h"
#include "ast/Acceptable.h"

namespace pyspect::ast {

struct ExprStmt final : Stmt, Acceptable<ExprStmt, NodeKind::ExprStmt> {
  std::unique_ptr<Expr> value;
  explicit ExprStmt(std::unique_ptr<Expr> v) : Stmt(NodeKind::ExprStmt), value(std::move(v)) {}
};

} // namespace pyspect::ast
