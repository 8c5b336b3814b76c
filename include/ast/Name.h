#pragma once

#include <string>
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace pyspect::ast {

    struct Name final : Expr, Acceptable<Name, NodeKind::Name> {
        std::string id;
        explicit Name(std::string s) : Expr(NodeKind::Name), id(std::move(s)) {}
    };

} // namespace pyspect::ast
