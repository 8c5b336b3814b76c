#include "cli/ParseArgsInternals.h"

#include <iostream>

namespace pyspect::cli::detail {
    /***
     * Name: pyspect::cli::detail::handleSeparateValueFlag
     * Purpose: Handle `-o <file>`, `--output <file>` and `--mode <v>` by consuming the next argument.
     */
    ArgResult handleSeparateValueFlag(int &idx, int argc, char **argv, Options &out) {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        const std::string_view arg{argv[idx]};
        const bool isOutput = isFlag(arg, "-o") || isFlag(arg, "--output");
        const bool isMode = isFlag(arg, "--mode");
        if (!isOutput && !isMode) { return ArgResult::NotHandled; }
        if (idx + 1 >= argc) {
            std::cerr << "pyspect: missing value for '" << arg << "'\n";
            return ArgResult::Error;
        }
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        const std::string_view value{argv[++idx]};
        if (isMode) { return parseModeValue(value, out) ? ArgResult::Handled : ArgResult::Error; }
        out.outputPath = std::string(value);
        return ArgResult::Handled;
    }
} // namespace pyspect::cli::detail
