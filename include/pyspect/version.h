/***
 * Name: pyspect version
 * Purpose: Single source of the tool version reported by --version and the
 *   interpreter_version field.
 */
#pragma once

namespace pyspect {

inline constexpr const char* kVersion = "0.1.0";

} // namespace pyspect
