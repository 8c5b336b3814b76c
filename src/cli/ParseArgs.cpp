#include "cli/ParseArgs.h"
#include "cli/ColorMode.h"
#include "cli/Options.h"
#include "cli/ParseArgsInternals.h"
#include <iostream>

namespace pyspect::cli {
    /***
     * Name: pyspect::cli::ParseArgs
     * Purpose: Minimal GCC-like CLI argument parser for pyspect.
     */
    bool ParseArgs(const int argc, char **argv, Options &out) {
        for (int i = 1; i < argc; ++i) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            const std::string_view arg{argv[i]};
            if (detail::isFlag(arg, "--")) {
                detail::collectRemainingAsInputs(i + 1, argc, argv, out);
                break;
            }
            if (const auto res = detail::handleSeparateValueFlag(i, argc, argv, out); res != detail::ArgResult::NotHandled) {
                if (res == detail::ArgResult::Error) { return false; }
                continue;
            }
            if (detail::applySimpleBoolFlags(arg, out)) { continue; }
            if (const auto res = detail::applyPrefixedOptions(arg, out); res != detail::ArgResult::NotHandled) {
                if (res == detail::ArgResult::Error) { return false; }
                continue;
            }

            // Positional
            if (detail::isUnknownOptionArg(arg)) {
                std::cerr << "pyspect: unknown option '" << arg << "'\n";
                return false;
            }
            out.inputs.emplace_back(std::string(arg));
        }

        if (detail::hasConflictingMetrics(out)) {
            std::cerr << "pyspect: cannot use --metrics and --metrics-json together\n";
            return false;
        }

        // Help and version need no script.
        if (out.showHelp || out.showVersion) { return true; }

        if (out.inputs.empty()) {
            std::cerr << "pyspect: no input script provided\n";
            return false;
        }
        if (out.inputs.size() > 1) {
            std::cerr << "pyspect: expected exactly one script, got " << out.inputs.size() << "\n";
            return false;
        }
        return true;
    }
} // namespace pyspect::cli
