/***
 * Name: pyspect::introspect::ImportEnhancer
 * Purpose: Seam for the Import tier's enhancement step.
 * Theory of Operation:
 *   Runs after the Safe tier has produced its metadata. Implementations are
 *   permitted to evaluate the target and may add to the metadata. Failures
 *   are reported by throwing exceptions::EnhancementError; that, or any other
 *   std::exception, is recorded by the Introspector as an ImportError and the
 *   Safe results are kept. The built-in PlaceholderImportEnhancer
 *   performs no extraction.
 */
#pragma once

#include "introspect/Schema.h"
#include "introspect/ScriptSource.h"
#include "pyspect/exceptions/enhancement_error.h"

namespace pyspect::introspect {

class ImportEnhancer {
 public:
  virtual ~ImportEnhancer() = default;
  virtual void enhance(const ScriptSource& source, ScriptMetadata& metadata) = 0;
};

class PlaceholderImportEnhancer final : public ImportEnhancer {
 public:
  void enhance(const ScriptSource& source, ScriptMetadata& metadata) override;
};

} // namespace pyspect::introspect
