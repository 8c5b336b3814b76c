#pragma once
#include <memory>
#include <string>
#include <vector>

#include "Expr.h"
#include "ast/Acceptable.h"

namespace pyspect::ast {
    // name is empty for a **mapping unpack
    struct KeywordArg { std::string name; std::unique_ptr<Expr> value; };

    struct Call final : Expr, Acceptable<Call, NodeKind::Call> {
        std::unique_ptr<Expr> callee;
        std::vector<std::unique_ptr<Expr>> args;      // positional, *expr as Starred
        std::vector<KeywordArg> keywords;             // named args and **expr
        explicit Call(std::unique_ptr<Expr> c) : Expr(NodeKind::Call), callee(std::move(c)) {}
    };

} // namespace pyspect::ast
