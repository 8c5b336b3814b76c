#pragma once

#include <memory>
#include "Expr.h"
#include "Stmt.h"
#include "ast/Acceptable.h"

namespace pyspect::ast {
    struct ReturnStmt final : Stmt, Acceptable<ReturnStmt, NodeKind::ReturnStmt> {
        std::unique_ptr<Expr> value; // optional
        explicit ReturnStmt(std::unique_ptr<Expr> v) : Stmt(NodeKind::ReturnStmt), value(std::move(v)) {}
    };
} // namespace pyspect::ast
