#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ColorMode.h"
#include "introspect/Mode.h"

namespace pyspect::cli {

    struct Options {
        bool showHelp{false};
        bool showVersion{false};     // --version
        bool metrics{false};         // --metrics
        bool metricsJson{false};     // --metrics-json
        bool quiet{false};           // -q, --quiet
        introspect::Mode mode{introspect::Mode::Safe};
        std::optional<std::string> outputPath{}; // unset: stdout
        std::vector<std::string> inputs{};
        ColorMode color{ColorMode::Auto};
        std::string logPath{"."};    // --log-path=<dir> (defaults to ./)
        bool logLexer{false};        // --log-lexer
        bool logAst{false};          // --log-ast
    };

} // namespace pyspect::cli
