#pragma once

#include <string>
#include "ast/Literal.h"

namespace pyspect::ast {

    // decoded byte value
    using BytesLiteral = Literal<std::string, NodeKind::BytesLiteral>;

} // namespace pyspect::ast
