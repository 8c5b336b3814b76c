#pragma once

namespace pyspect::cli {

    // Diagnostic colouring on stderr.
    enum class ColorMode {
        Auto,
        Always,
        Never
    };

} // namespace pyspect::cli
