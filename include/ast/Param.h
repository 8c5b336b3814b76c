#pragma once

#include <memory>
#include <string>

namespace pyspect::ast {
    struct Expr; // fwd
    struct Param {
        std::string name;
        std::unique_ptr<Expr> annotation{}; // optional
        std::unique_ptr<Expr> defaultValue{}; // optional
        bool isVarArg{false};   // *args
        bool isKwVarArg{false}; // **kwargs
        bool isKwOnly{false};   // kw-only param (after * or *args)
        bool isPosOnly{false};  // positional-only (before '/')
        int line{0};

        // positional-only and regular parameters
        bool isPositional() const { return !isVarArg && !isKwVarArg && !isKwOnly; }
    };
} // namespace pyspect::ast
