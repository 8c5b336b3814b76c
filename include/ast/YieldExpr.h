#pragma once

#include <memory>
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace pyspect::ast {

struct YieldExpr final : Expr, Acceptable<YieldExpr, NodeKind::YieldExpr> {
  bool isFrom{false};
  std::unique_ptr<Expr> value; // optional when not 'from'
  YieldExpr() : Expr(NodeKind::YieldExpr) {}
};

} // namespace pyspect::ast
