/**
 * @file
 * @brief AST expression base declarations.
 */
#pragma once

#include "Node.h"

namespace pyspect::ast {
    struct Expr : Node {
        using Node::Node;
    };
} // namespace pyspect::ast
