#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace pyspect::ast {

// key is null for a '**expr' unpack entry
struct DictItem {
  std::unique_ptr<Expr> key;
  std::unique_ptr<Expr> value;
};

struct DictLiteral final : Expr, Acceptable<DictLiteral, NodeKind::DictLiteral> {
  std::vector<DictItem> items;
  DictLiteral() : Expr(NodeKind::DictLiteral) {}
};

} // namespace pyspect::ast
