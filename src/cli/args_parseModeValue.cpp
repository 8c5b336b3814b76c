#include "cli/ParseArgsInternals.h"

#include <iostream>

namespace pyspect::cli::detail {

/***
 * Name: pyspect::cli::detail::parseModeValue
 * Purpose: Parse --mode value into introspect::Mode; no fallback.
 */
bool parseModeValue(std::string_view value, Options& out) {
    if (introspect::ParseMode(value, out.mode)) { return true; }
    std::cerr << "pyspect: invalid value '" << value << "' for '--mode' (expected safe or import)\n";
    return false;
}

} // namespace pyspect::cli::detail
