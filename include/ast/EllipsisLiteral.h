#pragma once

#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace pyspect::ast {

struct EllipsisLiteral final : Expr, Acceptable<EllipsisLiteral, NodeKind::EllipsisLiteral> {
  EllipsisLiteral() : Expr(NodeKind::EllipsisLiteral) {}
};

}
