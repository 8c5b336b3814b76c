/***
 * Name: pyspect::parse::DecodeStringToken
 * Purpose: Turn a string/bytes literal token into its runtime value.
 * Inputs:
 *   - Token whose text is the raw literal (prefix and quotes included)
 * Outputs:
 *   - Decoded UTF-8 text (str) or raw byte values (bytes)
 * Theory of Operation:
 *   Strips the prefix and the single or triple quotes, then decodes escape
 *   sequences unless the literal is raw. \N{...} names are resolved through
 *   ICU's character name tables. Malformed escapes throw
 *   exceptions::ParseError at the token.
 */
#pragma once

#include <string>
#include <string_view>
#include "lexer/Token.h"

namespace pyspect::parse {

struct DecodedString {
  std::string value;
  bool isBytes{false};
  bool isFString{false};
  bool isRaw{false};
};

DecodedString DecodeStringToken(const lex::Token& tok);

// Decode the escapes of one non-raw str body segment; errors point at tok.
std::string DecodeEscapes(const lex::Token& tok, std::string_view body);

} // namespace pyspect::parse
