/***
 * Name: pyspect::metadata::ParseInlineMetadata
 * Purpose: Extract the `# /// script` ... `# ///` block from a script's comments.
 * Inputs:
 *   - Full script text
 * Outputs:
 *   - InlineMetadataBlock, or std::nullopt when there is no usable block
 * Theory of Operation:
 *   1) Find the opening and closing marker lines (exact after trimming).
 *   2) Un-prefix the comment lines between them ('#' and one space).
 *   3) Parse the body with ParseToml; read `dependencies`, `requires-python`
 *      and the `tool` table.
 *   4) If the document does not parse, fall back to a single-line
 *      `dependencies = [...]` heuristic.
 *   Never throws: every failure mode ends in std::nullopt.
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "metadata/ConfigValue.h"

namespace pyspect::metadata {

struct InlineMetadataBlock {
  std::vector<std::string> dependencies;     // raw specifier strings
  std::optional<std::string> minInterpreter; // requires-python
  ConfigValue toolConfig{ConfigValue::makeTable()};
};

std::optional<InlineMetadataBlock> ParseInlineMetadata(std::string_view text);

// Heuristic used when the block body is not valid TOML; empty when no list was found.
std::vector<std::string> ScanDependencyLine(const std::vector<std::string>& bodyLines);

} // namespace pyspect::metadata
