/***
 * Name: pyspect::introspect::RenderExpr
 * Purpose: Display text for annotations, defaults, decorators and bases.
 * Theory of Operation:
 *   Closed NodeKind dispatch: names render as the identifier, constants as
 *   their repr, attributes as `value.attr` and subscripts as `value[slice]`
 *   (recursively through this same function). Every other shape delegates to
 *   ast::Unparse. Rendering never fails.
 */
#pragma once

#include <string>
#include "ast/Expr.h"

namespace pyspect::introspect {

std::string RenderExpr(const ast::Expr& expr);

} // namespace pyspect::introspect
