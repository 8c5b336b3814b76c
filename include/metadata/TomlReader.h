/***
 * Name: pyspect::metadata::ParseToml
 * Purpose: Restricted TOML reader for inline script metadata documents.
 * Inputs:
 *   - Document text (already un-prefixed from the comment block)
 * Outputs:
 *   - Root table as a ConfigValue
 * Theory of Operation:
 *   Single-pass character reader. Supports key/value pairs with bare, quoted
 *   and dotted keys; [table] and [[array-of-tables]] headers; basic, literal
 *   and multi-line strings; integers (decimal, hex, octal, binary), floats,
 *   booleans, arrays (multi-line, trailing comma) and inline tables.
 *   Date and time values are rejected. Any violation throws
 *   exceptions::TomlError carrying the 1-based document line.
 */
#pragma once

#include <string_view>
#include "metadata/ConfigValue.h"

namespace pyspect::metadata {

ConfigValue ParseToml(std::string_view text);

} // namespace pyspect::metadata
