#pragma once

#include <string>
#include "ast/Literal.h"

namespace pyspect::ast {

    // source spelling including the trailing j
    using ImagLiteral = Literal<std::string, NodeKind::ImagLiteral>;

} // namespace pyspect::ast
