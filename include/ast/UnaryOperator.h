#pragma once

namespace pyspect::ast {

enum class UnaryOperator {
    Neg,
    Pos,
    Not,
    BitNot
};

} // namespace pyspect::ast
