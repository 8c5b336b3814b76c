#pragma once

#include <memory>
#include <vector>
#include "Expr.h"
#include "Stmt.h"
#include "ast/Acceptable.h"

namespace pyspect::ast {
    struct DelStmt final : Stmt, Acceptable<DelStmt, NodeKind::DelStmt> {
        std::vector<std::unique_ptr<Expr>> targets;
        DelStmt() : Stmt(NodeKind::DelStmt) {}
    };
}
