#pragma once

#include <memory>
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace pyspect::ast {

struct AwaitExpr final : Expr, Acceptable<AwaitExpr, NodeKind::AwaitExpr> {
  std::unique_ptr<Expr> value;
  AwaitExpr() : Expr(NodeKind::AwaitExpr) {}
};

} // namespace pyspect::ast
