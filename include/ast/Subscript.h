#pragma once

#include <memory>
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace pyspect::ast {

// a[i], a[i:j], a[x, y]; a multi-element index is a TupleLiteral slice
struct Subscript final : Expr, Acceptable<Subscript, NodeKind::Subscript> {
  std::unique_ptr<Expr> value;
  std::unique_ptr<Expr> slice;
  Subscript(std::unique_ptr<Expr> v, std::unique_ptr<Expr> s)
      : Expr(NodeKind::Subscript), value(std::move(v)), slice(std::move(s)) {}
};

} // namespace pyspect::ast
