#pragma once

#include <string>
#include <vector>

#include "ColorMode.h"
#include "Options.h"

namespace pyspect::cli {

    // Parse argv into Options. Returns false on fatal parse error (exit code 2).
    bool ParseArgs(int argc, char** argv, Options& out);

} // namespace pyspect::cli
