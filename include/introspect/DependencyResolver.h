/***
 * Name: pyspect::introspect::DependencyResolver
 * Purpose: Merge declared and import-inferred dependency candidates.
 * Inputs:
 *   - Inline metadata block (optional) and the extracted imports
 * Outputs:
 *   - Ordered DependencyInfo list: Declared entries first, then Inferred
 * Theory of Operation:
 *   Declared specifiers are split at the earliest version operator (==, >=,
 *   <=, >, <). Inferred entries come from imports whose module is a single
 *   top-level name. No deduplication is performed across provenance and the
 *   standard library is not filtered.
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "introspect/Schema.h"
#include "metadata/InlineMetadata.h"

namespace pyspect::introspect {

class DependencyResolver {
 public:
  static std::vector<DependencyInfo> Resolve(const std::optional<metadata::InlineMetadataBlock>& block,
                                             const std::vector<ImportInfo>& imports);

  static DependencyInfo SplitSpecifier(std::string_view specifier);
};

} // namespace pyspect::introspect
