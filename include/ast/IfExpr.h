#pragma once

#include <memory>
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace pyspect::ast {

struct IfExpr final : Expr, Acceptable<IfExpr, NodeKind::IfExpr> {
  std::unique_ptr<Expr> body;
  std::unique_ptr<Expr> test;
  std::unique_ptr<Expr> orelse;
  IfExpr() : Expr(NodeKind::IfExpr) {}
};

} // namespace pyspect::ast
