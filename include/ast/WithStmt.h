#pragma once

#include <memory>
#include <vector>
#include "Stmt.h"
#include "ast/Acceptable.h"
#include "ast/HasBody.h"
#include "ast/WithItem.h"

namespace pyspect::ast {
    struct WithStmt final : Stmt, HasBody<Stmt>, Acceptable<WithStmt, NodeKind::WithStmt> {
        std::vector<std::unique_ptr<WithItem>> items;
        bool isAsync{false};
        WithStmt() : Stmt(NodeKind::WithStmt) {}
    };
}
