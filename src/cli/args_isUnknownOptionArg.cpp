#include "cli/ParseArgsInternals.h"

namespace pyspect::cli::detail {
    /***
     * Name: pyspect::cli::detail::isUnknownOptionArg
     * Purpose: Detect unsupported option-like arguments that start with '-'.
     *   A lone "-" is treated the same way; scripts are never read from stdin.
     */
    bool isUnknownOptionArg(const std::string_view arg) {
        return !arg.empty() && arg[0] == '-';
    }
} // namespace pyspect::cli::detail
