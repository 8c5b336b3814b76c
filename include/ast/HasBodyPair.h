/**
 * @file
 * @brief AST utility declarations (HasBodyPair mixin).
 */
/***
 * Name: pyspect::ast::HasBodyPair
 * Purpose: Mixin for nodes that contain then/else statement lists
 *   (if, while and for; the else list is empty when absent).
 */
#pragma once

#include <memory>
#include <vector>

namespace pyspect::ast {

template <typename StmtT>
struct HasBodyPair {
    std::vector<std::unique_ptr<StmtT>> thenBody;
    std::vector<std::unique_ptr<StmtT>> elseBody;
};

} // namespace pyspect::ast
