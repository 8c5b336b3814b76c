/***
 * Name: pyspect::ast::ForEachChild
 * Purpose: Enumerate the direct children of any node in source order.
 * Notes: Optional children that are absent are skipped. Parameter
 *   annotations and defaults count as children of their function or lambda.
 */
#pragma once

#include <functional>
#include "ast/Node.h"

namespace pyspect::ast {

void ForEachChild(const Node& node, const std::function<void(const Node&)>& fn);

} // namespace pyspect::ast
