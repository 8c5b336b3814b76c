#include "cli/ParseArgsInternals.h"

namespace pyspect::cli::detail {
    /***
     * Name: pyspect::cli::detail::isFlag
     * Purpose: Check if an argument exactly matches a flag.
     */
    bool isFlag(const std::string_view arg, const std::string_view flag) {
        return arg == flag;
    }
} // namespace pyspect::cli::detail
