/**
 * @file
 * @brief AST utility declarations (HasName mixin).
 */
#pragma once

#include <string>

namespace pyspect::ast {

struct HasName {
    std::string name;
};

}
