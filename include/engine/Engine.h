#ifndef PYSPECT_ENGINE_ENGINE_H
#define PYSPECT_ENGINE_ENGINE_H

/***
 * Name: pyspect::Engine
 * Purpose: Orchestrate one introspection run from parsed CLI options.
 * Inputs:
 *   - CLI options
 * Outputs:
 *   - Result envelope on stdout or in the output file; exit code
 * Theory of Operation:
 *   Checks the script exists, reads it once, runs the Introspector in the
 *   selected mode, assembles and writes the envelope, echoes recorded errors
 *   as diagnostics and reports optional metrics and logs. File IO failures
 *   are thrown as FileReadError/FileWriteError for main to report.
 */

#include <string_view>

// Forward declarations to reduce header coupling
namespace pyspect { namespace cli { struct Options; } }
namespace pyspect { struct Diagnostic; }

namespace pyspect {
    class Engine {
    public:
        static int run(const cli::Options &opts);

        static bool use_env_color();

        // sourceText supplies the line shown under the header; may be empty.
        static void print_diagnostic(const Diagnostic &diag, bool color, std::string_view sourceText);
    };
} // namespace pyspect

#endif // PYSPECT_ENGINE_ENGINE_H
