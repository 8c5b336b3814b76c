/***
 * Name: pyspect::introspect::AssembleResult (impl)
 */
#include "introspect/ResultAssembler.h"
#include "pyspect/support/sha256.h"
#include "pyspect/version.h"

#include <string>
#include <utility>

namespace pyspect::introspect {

std::string InterpreterVersion() {
  return std::string("pyspect ") + kVersion + " (static analysis, Python 3.12 grammar)";
}

IntrospectionResult AssembleResult(const ScriptSource& source, ScriptMetadata metadata) {
  IntrospectionResult result;
  result.interpreterVersion = InterpreterVersion();
  result.contentHash = support::Sha256Hex(source.bytes);
  result.metadata = std::move(metadata);
  return result;
}

} // namespace pyspect::introspect
