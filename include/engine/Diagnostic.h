#ifndef PYSPECT_ENGINE_DIAGNOSTIC_H
#define PYSPECT_ENGINE_DIAGNOSTIC_H

#include <string>

namespace pyspect {
    // One stderr diagnostic derived from a recorded ErrorRecord.
    struct Diagnostic {
        std::string file;
        int line{0}; // 0: unknown
        int col{0};  // 0: unknown
        std::string kind;
        std::string message;
    };
} // namespace pyspect

#endif // PYSPECT_ENGINE_DIAGNOSTIC_H
