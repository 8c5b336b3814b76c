#pragma once
#include <memory>

#include "UnaryOperator.h"
#include "Expr.h"
#include "ast/Acceptable.h"

namespace pyspect::ast {
    struct Unary final : Expr, Acceptable<Unary, NodeKind::UnaryExpr> {
        UnaryOperator op;
        std::unique_ptr<Expr> operand;
        Unary(const UnaryOperator o, std::unique_ptr<Expr> v)
            : Expr(NodeKind::UnaryExpr), op(o), operand(std::move(v)) {}
    };
} // namespace pyspect::ast
