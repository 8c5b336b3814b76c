#include "cli/Usage.h"
#include <string>
#include <string_view>
namespace pyspect::cli {

namespace {
// Keep help text as a compile-time constant to avoid reallocation work.
constexpr std::string_view kUsageText = R"(pyspect [options] <script>

Statically introspect a Python script and print a JSON description of it.

Options:
  -h, --help           Print this help and exit
  --version            Print the pyspect version and exit
  --mode=<mode>        Trust tier: safe|import (default: safe)
  --mode <mode>        Same as --mode=<mode>
  -o <file>            Write the result to <file> (default: stdout)
  --output=<file>      Same as -o <file>
  -q, --quiet          Do not echo recorded errors as diagnostics
  --metrics            Print a metrics summary to stderr
  --metrics-json       Print metrics in JSON to stderr
  --log-path=<dir>     Directory where logs are written (lexer/ast)
  --log-lexer          Enable lexer token log
  --log-ast            Enable AST file log
  --color=<mode>       Color diagnostics: always|never|auto (default: auto)
  --                   End of options

Environment:
  PYSPECT_COLOR        1/true/yes enables color when --color=auto
)";
} // namespace

std::string Usage() { return std::string(kUsageText); }
} // namespace pyspect::cli
