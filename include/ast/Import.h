#pragma once

#include <memory>
#include <vector>
#include "Stmt.h"
#include "ast/Acceptable.h"
#include "ast/Alias.h"

namespace pyspect::ast {
    struct Import final : Stmt, Acceptable<Import, NodeKind::Import> {
        std::vector<std::unique_ptr<Alias>> names;
        Import() : Stmt(NodeKind::Import) {}
    };
}
