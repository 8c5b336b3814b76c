#pragma once

#include <string>
#include "ast/Literal.h"

namespace pyspect::ast {

    // source spelling; hex/octal/binary forms are normalized when rendered
    using IntLiteral = Literal<std::string, NodeKind::IntLiteral>;

} // namespace pyspect::ast
