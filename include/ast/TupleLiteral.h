#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace pyspect::ast {

struct TupleLiteral final : Expr, Acceptable<TupleLiteral, NodeKind::TupleLiteral> {
  std::vector<std::unique_ptr<Expr>> elements;
  TupleLiteral() : Expr(NodeKind::TupleLiteral) {}
};

} // namespace pyspect::ast
