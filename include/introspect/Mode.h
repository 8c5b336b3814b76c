/***
 * Name: pyspect::introspect::Mode
 * Purpose: Trust tier selected by the caller.
 *   Safe   - static analysis only; the target is never evaluated.
 *   Import - Safe, then the gated enhancement step.
 */
#pragma once

#include <string_view>

namespace pyspect::introspect {

enum class Mode { Safe, Import };

const char* to_string(Mode mode);

// Parse "safe" or "import"; returns false for anything else.
bool ParseMode(std::string_view text, Mode& out);

} // namespace pyspect::introspect
