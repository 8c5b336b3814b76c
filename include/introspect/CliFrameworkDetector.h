/***
 * Name: pyspect::introspect::DetectCliFramework
 * Purpose: Infer the argument-parsing framework from the import set.
 * Theory of Operation: Fixed priority over the distinct module paths:
 *   typer, then click, then argparse. Only the name is populated.
 */
#pragma once

#include <optional>
#include <vector>
#include "introspect/Schema.h"

namespace pyspect::introspect {

std::optional<CliFrameworkInfo> DetectCliFramework(const std::vector<ImportInfo>& imports);

} // namespace pyspect::introspect
