#pragma once

#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace pyspect::ast {

struct NoneLiteral final : Expr, Acceptable<NoneLiteral, NodeKind::NoneLiteral> {
  NoneLiteral() : Expr(NodeKind::NoneLiteral) {}
};

}
