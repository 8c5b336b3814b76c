/**
 * Name: pyspect::lex::TokenKind
 * Purpose: Token kinds for the script tokenizer.
 * Note: soft keywords (match, case, type, _) are lexed as Ident and resolved
 *   by the parser from context.
 */
#pragma once

namespace pyspect::lex {

enum class TokenKind {
    End, // EOF
    Newline, // end of logical line
    Indent, // indentation increase
    Dedent, // indentation decrease

    // keywords
    And, As, Assert, Async, Await, Break, Class, Continue, Def, Del,
    Elif, Else, Except, Finally, For, From, Global, If, Import, In,
    Is, Lambda, Nonlocal, Not, Or, Pass, Raise, Return, Try, While,
    With, Yield,
    NoneLit, // None
    BoolLit, // True/False

    Arrow, // ->
    Colon, // :
    ColonEqual, // :=
    Comma, // ,
    Semicolon, // ;
    Dot, // .
    Ellipsis, // ...
    At, // @
    AtEqual, // @=
    Equal, // =
    Plus, PlusEqual,
    Minus, MinusEqual,
    Star, StarEqual,
    StarStar, StarStarEqual,
    Slash, SlashEqual,
    SlashSlash, SlashSlashEqual,
    Percent, PercentEqual,
    LShift, LShiftEqual,
    RShift, RShiftEqual,
    Amp, AmpEqual,
    Pipe, PipeEqual,
    Caret, CaretEqual,
    Tilde, // ~
    EqEq, NotEq, Lt, Le, Gt, Ge,
    LParen, RParen,
    LBracket, RBracket,
    LBrace, RBrace,

    Ident, // identifier (NFKC-normalized)
    Int, // integer literal (source text)
    Float, // float literal (source text)
    Imag, // imaginary literal, e.g. 1j
    String, // str literal, raw source text including prefix and quotes
    Bytes, // b'...'
    FString // f'...'
};

// Stable name for diagnostics and token logs
const char* to_string(TokenKind k);

// True for the augmented assignment operators (+=, -=, ...)
bool isAugAssign(TokenKind k);

} // namespace pyspect::lex
