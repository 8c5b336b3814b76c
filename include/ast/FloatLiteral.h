#pragma once

#include <string>
#include "ast/Literal.h"

namespace pyspect::ast {

    // source spelling, rendered with shortest round-trip repr
    using FloatLiteral = Literal<std::string, NodeKind::FloatLiteral>;

} // namespace pyspect::ast
