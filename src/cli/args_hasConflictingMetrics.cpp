#include "cli/ParseArgsInternals.h"

namespace pyspect::cli::detail {
    /***
     * Name: pyspect::cli::detail::hasConflictingMetrics
     * Purpose: Validate mutually exclusive metrics formats.
     */
    bool hasConflictingMetrics(const Options &opts) {
        return opts.metrics && opts.metricsJson;
    }
} // namespace pyspect::cli::detail
