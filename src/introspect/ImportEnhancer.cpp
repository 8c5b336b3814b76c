/***
 * Name: pyspect::introspect::PlaceholderImportEnhancer
 * Purpose: Baseline enhancer; the Import tier currently adds nothing.
 */
#include "introspect/ImportEnhancer.h"

namespace pyspect::introspect {

void PlaceholderImportEnhancer::enhance(const ScriptSource& /*source*/, ScriptMetadata& /*metadata*/) {}

} // namespace pyspect::introspect
