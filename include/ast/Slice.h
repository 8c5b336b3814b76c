#pragma once

#include <memory>
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace pyspect::ast {

struct Slice final : Expr, Acceptable<Slice, NodeKind::Slice> {
  std::unique_ptr<Expr> lower; // each part optional
  std::unique_ptr<Expr> upper;
  std::unique_ptr<Expr> step;
  Slice() : Expr(NodeKind::Slice) {}
};

} // namespace pyspect::ast
