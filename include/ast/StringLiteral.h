#pragma once

#include <string>
#include "ast/Literal.h"

namespace pyspect::ast {

    // decoded UTF-8 value after implicit concatenation
    using StringLiteral = Literal<std::string, NodeKind::StringLiteral>;

} // namespace pyspect::ast
