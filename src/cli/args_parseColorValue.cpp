#include "cli/ParseArgsInternals.h"

namespace pyspect::cli::detail {

/***
 * Name: pyspect::cli::detail::parseColorValue
 * Purpose: Parse --color value into ColorMode with default.
 */
ColorMode parseColorValue(std::string_view value) {
    using enum pyspect::cli::ColorMode;
    if (value == "always") { return Always; }
    if (value == "never") { return Never; }
    return Auto;
}

} // namespace pyspect::cli::detail
