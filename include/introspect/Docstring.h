/***
 * Name: pyspect::introspect (docstrings)
 * Purpose: Locate and clean docstrings.
 * Theory of Operation:
 *   A docstring is a plain string constant that is the first statement of a
 *   body. CleanDoc expands tabs to 8-column stops, strips the first line's
 *   leading whitespace, removes the common indentation of the remaining
 *   lines, and drops leading and trailing empty lines.
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "ast/Stmt.h"

namespace pyspect::introspect {

// Raw (uncleaned) docstring of a statement list, if any.
std::optional<std::string> BodyDocstring(const std::vector<std::unique_ptr<ast::Stmt>>& body);

std::string CleanDoc(std::string_view doc);

// First line of a module docstring, stripped; null when empty or when it
// begins with a triple quote.
std::optional<std::string> DescriptionFrom(const std::optional<std::string>& docstring);

} // namespace pyspect::introspect
