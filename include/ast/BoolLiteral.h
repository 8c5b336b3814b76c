#pragma once

#include "ast/Literal.h"

namespace pyspect::ast {

    using BoolLiteral = Literal<bool, NodeKind::BoolLiteral>;

} // namespace pyspect::ast
