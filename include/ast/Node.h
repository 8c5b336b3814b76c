/**
 * @file
 * @brief AST base node declarations.
 */
#pragma once

#include "NodeKind.h"

namespace pyspect::ast {

    struct VisitorBase; // fwd

    struct Node {
        NodeKind kind;
        explicit Node(const NodeKind k) : kind(k) {}
        virtual ~Node() = default;
        Node(const Node&) = delete;
        Node& operator=(const Node&) = delete;
        Node(Node&&) = delete;
        Node& operator=(Node&&) = delete;

        // Polymorphic dispatch entrypoint (default implemented out-of-line)
        virtual void accept(VisitorBase& v) const;

        int line{0};
        int col{0};
    };

} // namespace pyspect::ast
