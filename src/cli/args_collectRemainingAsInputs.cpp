#include "cli/ParseArgsInternals.h"

namespace pyspect::cli::detail {

/***
 * Name: pyspect::cli::detail::collectRemainingAsInputs
 * Purpose: Gather argv entries after `--` as positional script paths.
 */
void collectRemainingAsInputs(std::size_t startIndex, int argc, char** argv, Options& out) {
    for (int j = static_cast<int>(startIndex); j < argc; ++j) {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        out.inputs.emplace_back(argv[j]);
    }
}

} // namespace pyspect::cli::detail
