#pragma once

#include <memory>
#include <string>
#include <vector>
#include "Stmt.h"
#include "ast/Acceptable.h"
#include "ast/Alias.h"

namespace pyspect::ast {
    struct ImportFrom final : Stmt, Acceptable<ImportFrom, NodeKind::ImportFrom> {
        std::string module; // empty for relative-only
        int level{0};       // number of leading dots
        std::vector<std::unique_ptr<Alias>> names;
        ImportFrom() : Stmt(NodeKind::ImportFrom) {}
    };
}
