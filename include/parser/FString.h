/***
 * Name: pyspect::parse::AppendFStringPiece
 * Purpose: Split one piece of an implicitly concatenated f-string into
 *   literal text and replacement fields.
 * Inputs:
 *   - The literal's token and its DecodeStringToken result
 * Outputs:
 *   - Parts appended to `out`; adjacent literal text is merged
 * Theory of Operation:
 *   Plain str pieces contribute their decoded value as literal text. In an
 *   f-string body, doubled braces are literal and escapes are decoded per
 *   literal run. Each replacement field's expression is re-lexed wrapped in
 *   parentheses and parsed with a fresh Parser. `{expr=}` keeps its source
 *   text as a literal and defaults to the !r conversion. Format specs may hold
 *   one further level of fields. Errors throw exceptions::ParseError at the
 *   token with an "f-string: " prefix.
 */
#pragma once

#include <vector>
#include "ast/FStringLiteral.h"
#include "lexer/Token.h"
#include "parser/StringDecode.h"

namespace pyspect::parse {

void AppendFStringPiece(const lex::Token& tok, const DecodedString& decoded, std::vector<ast::FStringPart>& out);

} // namespace pyspect::parse
