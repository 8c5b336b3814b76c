#pragma once

#include <memory>
#include "Expr.h"
#include "ast/Acceptable.h"

namespace pyspect::ast {
    struct WithItem final : Node, Acceptable<WithItem, NodeKind::WithItem> {
        std::unique_ptr<Expr> context;
        std::unique_ptr<Expr> optionalVars; // target after 'as', may be null
        WithItem() : Node(NodeKind::WithItem) {}
    };
}
