/**
 * @file
 * @brief AST module node declarations.
 */
#pragma once

#include "ast/Node.h"
#include "ast/Stmt.h"
#include "ast/HasBody.h"
#include "ast/Acceptable.h"

namespace pyspect::ast {
    struct Module final : Node, HasBody<Stmt>, Acceptable<Module, NodeKind::Module> {
        Module() : Node(NodeKind::Module) {}
    };
} // namespace pyspect::ast
