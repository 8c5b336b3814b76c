/**
 * @file
 * @brief AST base Node default accept implementation.
 */
/***
 * Name: pyspect::ast::Node::accept
 * Purpose: Dynamic dispatch via the central kind switch.
 */
#include "ast/Node.h"
#include "ast/Visitor.h"

namespace pyspect::ast {

void Node::accept(VisitorBase& visitor) const {
    dispatch(*this, visitor);
}

} // namespace pyspect::ast
