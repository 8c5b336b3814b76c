/***
 * Name: pyspect::ast::to_symbol
 * Purpose: Source spelling of binary, boolean and comparison operators.
 */
#include "ast/BinaryOperator.h"

namespace pyspect::ast {

const char* to_symbol(const BinaryOperator op) {
  switch (op) {
    case BinaryOperator::Add: return "+";
    case BinaryOperator::Sub: return "-";
    case BinaryOperator::Mul: return "*";
    case BinaryOperator::MatMul: return "@";
    case BinaryOperator::Div: return "/";
    case BinaryOperator::Mod: return "%";
    case BinaryOperator::FloorDiv: return "//";
    case BinaryOperator::Pow: return "**";
    case BinaryOperator::LShift: return "<<";
    case BinaryOperator::RShift: return ">>";
    case BinaryOperator::BitAnd: return "&";
    case BinaryOperator::BitOr: return "|";
    case BinaryOperator::BitXor: return "^";
    case BinaryOperator::Eq: return "==";
    case BinaryOperator::Ne: return "!=";
    case BinaryOperator::Lt: return "<";
    case BinaryOperator::Le: return "<=";
    case BinaryOperator::Gt: return ">";
    case BinaryOperator::Ge: return ">=";
    case BinaryOperator::Is: return "is";
    case BinaryOperator::IsNot: return "is not";
    case BinaryOperator::In: return "in";
    case BinaryOperator::NotIn: return "not in";
    case BinaryOperator::And: return "and";
    case BinaryOperator::Or: return "or";
  }
  return "?";
}

} // namespace pyspect::ast
