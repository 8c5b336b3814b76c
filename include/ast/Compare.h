#pragma once

#include <memory>
#include <vector>
#include "ast/BinaryOperator.h"
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace pyspect::ast {

struct Compare final : Expr, Acceptable<Compare, NodeKind::Compare> {
  std::unique_ptr<Expr> left;
  std::vector<BinaryOperator> ops;
  std::vector<std::unique_ptr<Expr>> comparators; // length equals ops.size()
  Compare() : Expr(NodeKind::Compare) {}
};

} // namespace pyspect::ast
