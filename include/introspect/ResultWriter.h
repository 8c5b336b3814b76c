/***
 * Name: pyspect::introspect (result serialization)
 * Purpose: Render an IntrospectionResult as pretty JSON and deliver it.
 * Theory of Operation:
 *   Field order is fixed: schema_version, interpreter_version, content_hash,
 *   metadata; metadata fields follow the documented envelope order. Optional
 *   fields are written as null, never omitted. Text is written as UTF-8
 *   without \u escapes for non-ASCII characters.
 */
#pragma once

#include <optional>
#include <ostream>
#include <string>
#include "introspect/Schema.h"

namespace pyspect::introspect {

std::string SerializeResult(const IntrospectionResult& result);

// Writes to outputPath (no trailing newline) or to out (with one).
// Returns false with err set when the file cannot be written.
bool WriteResult(const IntrospectionResult& result, const std::optional<std::string>& outputPath,
                 std::ostream& out, std::string& err);

} // namespace pyspect::introspect
