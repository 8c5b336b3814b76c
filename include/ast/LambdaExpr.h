#pragma once

#include <memory>
#include "ast/Expr.h"
#include "ast/Acceptable.h"
#include "ast/HasParams.h"
#include "ast/Param.h"

namespace pyspect::ast {

struct LambdaExpr final : Expr, HasParams<Param>, Acceptable<LambdaExpr, NodeKind::LambdaExpr> {
  std::unique_ptr<Expr> body;
  LambdaExpr() : Expr(NodeKind::LambdaExpr) {}
};

} // namespace pyspect::ast
