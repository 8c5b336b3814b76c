#pragma once

#include <memory>
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace pyspect::ast {

struct NamedExpr final : Expr, Acceptable<NamedExpr, NodeKind::NamedExpr> {
  std::unique_ptr<Expr> target; // Name
  std::unique_ptr<Expr> value;
  NamedExpr(std::unique_ptr<Expr> t, std::unique_ptr<Expr> v)
      : Expr(NodeKind::NamedExpr), target(std::move(t)), value(std::move(v)) {}
};

} // namespace pyspect::ast
