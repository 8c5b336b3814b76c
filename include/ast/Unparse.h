/***
 * Name: pyspect::ast::Unparse
 * Purpose: Reconstruct source text for an expression the way the script
 *   language's own ast.unparse() does.
 * Theory of Operation:
 *   Each node kind has a binding strength. A child is rendered under the
 *   strength its parent requires and gains parentheses only when it binds
 *   more loosely. The top level requires a full test expression, so a bare
 *   tuple, walrus or yield comes back parenthesized. F-strings pick the
 *   first quote style that none of their parts contain, single quotes
 *   preferred, and string constants inside replacement fields choose a quote
 *   instead of escaping one.
 */
#pragma once

#include <string>
#include "ast/Expr.h"

namespace pyspect::ast {

std::string Unparse(const Expr& expr);

} // namespace pyspect::ast
