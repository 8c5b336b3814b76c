#pragma once

namespace pyspect::ast {

enum class BinaryOperator {
    Add,
    Sub,
    Mul,
    MatMul,
    Div,
    Mod,
    FloorDiv,
    Pow,
    LShift,
    RShift,
    BitAnd,
    BitOr,
    BitXor,
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
    Is,
    IsNot,
    In,
    NotIn,
    And,
    Or
};

// Source spelling, e.g. "+" or "not in"
const char* to_symbol(BinaryOperator op);

} // namespace pyspect::ast
