#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace pyspect::ast {

// One piece of an f-string: decoded literal text when `value` is null,
// otherwise a replacement field `{value!conversion:formatSpec}`.
struct FStringPart {
  std::string literal;
  std::unique_ptr<Expr> value;
  char conversion{0}; // 's', 'r', 'a' or 0 for none
  std::vector<FStringPart> formatSpec;
};

// Implicitly concatenated pieces are merged; adjacent literal text is joined
// and empty literals are dropped.
struct FStringLiteral final : Expr, Acceptable<FStringLiteral, NodeKind::FStringLiteral> {
  std::vector<FStringPart> values;
  FStringLiteral() : Expr(NodeKind::FStringLiteral) {}
};

} // namespace pyspect::ast
