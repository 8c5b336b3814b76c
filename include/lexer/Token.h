/**
 * Name: pyspect::lex::Token
 * Purpose: Token structure with source location and text.
 */
#pragma once

#include <string>
#include "lexer/TokenKind.h"

namespace pyspect::lex {

struct Token {
    TokenKind kind{TokenKind::End};
    std::string text{}; // source text; string literals keep prefix and quotes
    std::string file{};
    int line{1}; // 1-based line of the first character
    int col{1}; // 1-based column at token start
};

} // namespace pyspect::lex
