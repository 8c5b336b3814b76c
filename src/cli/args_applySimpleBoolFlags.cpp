#include "cli/ParseArgsInternals.h"

namespace pyspect::cli::detail {
    /***
     * Name: pyspect::cli::detail::applySimpleBoolFlags
     * Purpose: Handle flag-only boolean options and set outputs.
     */
    bool applySimpleBoolFlags(std::string_view arg, Options &out) {
        if (isFlag(arg, "-h")) {
            out.showHelp = true;
            return true;
        }
        if (isFlag(arg, "--help")) {
            out.showHelp = true;
            return true;
        }
        if (isFlag(arg, "--version")) {
            out.showVersion = true;
            return true;
        }
        if (isFlag(arg, "--metrics")) {
            out.metrics = true;
            return true;
        }
        if (isFlag(arg, "--metrics-json")) {
            out.metricsJson = true;
            return true;
        }
        if (isFlag(arg, "-q") || isFlag(arg, "--quiet")) {
            out.quiet = true;
            return true;
        }
        if (isFlag(arg, "--log-lexer")) {
            out.logLexer = true;
            return true;
        }
        if (isFlag(arg, "--log-ast")) {
            out.logAst = true;
            return true;
        }
        return false;
    }
} // namespace pyspect::cli::detail
