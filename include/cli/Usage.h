#pragma once

#include <string>

namespace pyspect::cli {

    // Help text printed for -h/--help and after argument errors.
    std::string Usage();

} // namespace pyspect::cli
