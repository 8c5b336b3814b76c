/***
 * Name: pyspect::introspect::AssembleResult
 * Purpose: Wrap script metadata in the versioned result envelope.
 * Theory of Operation:
 *   The content hash is SHA-256 over the exact bytes read, computed
 *   independently of whether parsing succeeded. Throws
 *   exceptions::DigestError if the digest cannot be computed.
 */
#pragma once

#include <string>
#include "introspect/Schema.h"
#include "introspect/ScriptSource.h"

namespace pyspect::introspect {

// "pyspect <version> (static analysis, Python 3.12 grammar)"
std::string InterpreterVersion();

IntrospectionResult AssembleResult(const ScriptSource& source, ScriptMetadata metadata);

} // namespace pyspect::introspect
