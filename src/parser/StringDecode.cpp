/***
 * Name: pyspect::parse::DecodeStringToken
 * Purpose: Escape decoding for str and bytes literals.
 */
#include "parser/StringDecode.h"
#include "pyspect/exceptions/parse_error.h"
#include "pyspect/support/text.h"

#include <unicode/uchar.h>

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace pyspect::parse {

using exceptions::ParseError;

namespace {

constexpr char32_t kMaxCodePoint = 0x10FFFF;

int hexValue(const char chr) {
  if (chr >= '0' && chr <= '9') { return chr - '0'; }
  if (chr >= 'a' && chr <= 'f') { return chr - 'a' + 10; }
  if (chr >= 'A' && chr <= 'F') { return chr - 'A' + 10; }
  return -1;
}

bool lookupName(const std::string& name, char32_t& out) {
  for (const UCharNameChoice choice : {U_UNICODE_CHAR_NAME, U_CHAR_NAME_ALIAS}) {
    UErrorCode status = U_ZERO_ERROR;
    const UChar32 codePoint = u_charFromName(choice, name.c_str(), &status);
    if (U_SUCCESS(status)) {
      out = static_cast<char32_t>(codePoint);
      return true;
    }
  }
  return false;
}

class Decoder {
 public:
  Decoder(const lex::Token& tok, std::string_view body, bool isBytes) : tok_(tok), body_(body), isBytes_(isBytes) {}

  // NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
  std::string run() {
    std::string out;
    size_t idx = 0;
    while (idx < body_.size()) {
      const char chr = body_[idx];
      if (chr != '\\') {
        if (isBytes_ && static_cast<unsigned char>(chr) >= 0x80U) {
          throw ParseError("bytes can only contain ASCII literal characters", tok_.line, tok_.col);
        }
        out.push_back(chr);
        ++idx;
        continue;
      }
      const size_t escStart = idx;
      if (idx + 1 >= body_.size()) { out.push_back('\\'); break; }
      const char esc = body_[idx + 1];
      idx += 2;
      switch (esc) {
        case '\n': break;
        case '\\': out.push_back('\\'); break;
        case '\'': out.push_back('\''); break;
        case '"': out.push_back('"'); break;
        case 'a': out.push_back('\a'); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case 'v': out.push_back('\v'); break;
        case '0': case '1': case '2': case '3': case '4': case '5': case '6': case '7': {
          unsigned value = static_cast<unsigned>(esc - '0');
          for (int extra = 0; extra < 2 && idx < body_.size() && body_[idx] >= '0' && body_[idx] <= '7'; ++extra) {
            value = value * 8U + static_cast<unsigned>(body_[idx] - '0');
            ++idx;
          }
          emit(out, value);
          break;
        }
        case 'x': emit(out, readHex(idx, 2, escStart, "\\xXX")); break;
        case 'u':
          if (isBytes_) { out += "\\u"; break; }
          emit(out, readHex(idx, 4, escStart, "\\uXXXX"));
          break;
        case 'U':
          if (isBytes_) { out += "\\U"; break; }
          emit(out, readHex(idx, 8, escStart, "\\UXXXXXXXX"));
          break;
        case 'N': {
          if (isBytes_) { out += "\\N"; break; }
          const size_t close = body_.find('}', idx);
          if (idx >= body_.size() || body_[idx] != '{' || close == std::string_view::npos || close == idx + 1) {
            fail(escStart, idx, "malformed \\N character escape");
          }
          char32_t codePoint = 0;
          if (!lookupName(std::string(body_.substr(idx + 1, close - idx - 1)), codePoint)) {
            fail(escStart, close, "unknown Unicode character name");
          }
          idx = close + 1;
          emit(out, codePoint);
          break;
        }
        default:
          // unrecognized escapes are kept verbatim
          out.push_back('\\');
          out.push_back(esc);
          break;
      }
    }
    return out;
  }

 private:
  const lex::Token& tok_;
  std::string_view body_;
  bool isBytes_;

  [[noreturn]] void fail(const size_t start, const size_t end, const std::string& what) const {
    const char* codec = isBytes_ ? "(value error) invalid escape" : "(unicode error) 'unicodeescape' codec can't decode bytes";
    if (isBytes_) {
      throw ParseError(std::string(codec) + " at position " + std::to_string(start) + ": " + what, tok_.line, tok_.col);
    }
    throw ParseError(std::string(codec) + " in position " + std::to_string(start) + "-" + std::to_string(end) + ": " + what,
                     tok_.line, tok_.col);
  }

  char32_t readHex(size_t& idx, const int digits, const size_t escStart, const char* form) {
    char32_t value = 0;
    for (int i = 0; i < digits; ++i) {
      const int digit = idx < body_.size() ? hexValue(body_[idx]) : -1;
      if (digit < 0) { fail(escStart, idx > 0 ? idx - 1 : 0, std::string("truncated ") + form + " escape"); }
      value = value * 16U + static_cast<char32_t>(digit);
      ++idx;
    }
    if (value > kMaxCodePoint) { fail(escStart, idx - 1, "illegal Unicode character"); }
    return value;
  }

  void emit(std::string& out, const char32_t value) const {
    if (isBytes_) {
      out.push_back(static_cast<char>(value & 0xFFU));
      return;
    }
    support::AppendUtf8(out, value);
  }
};

} // namespace

std::string DecodeEscapes(const lex::Token& tok, std::string_view body) {
  Decoder decoder(tok, body, false);
  return decoder.run();
}

DecodedString DecodeStringToken(const lex::Token& tok) {
  const std::string& text = tok.text;
  DecodedString result;
  size_t idx = 0;
  while (idx < text.size() && text[idx] != '"' && text[idx] != '\'') {
    const char low = static_cast<char>(std::tolower(static_cast<unsigned char>(text[idx])));
    if (low == 'b') { result.isBytes = true; }
    if (low == 'f') { result.isFString = true; }
    if (low == 'r') { result.isRaw = true; }
    ++idx;
  }
  if (idx >= text.size()) { throw ParseError("invalid string literal", tok.line, tok.col); }
  const char quote = text[idx];
  const bool triple = text.size() >= idx + 6 && text[idx + 1] == quote && text[idx + 2] == quote;
  const size_t quoteLen = triple ? 3 : 1;
  if (text.size() < idx + 2 * quoteLen) { throw ParseError("invalid string literal", tok.line, tok.col); }
  const std::string_view body = std::string_view(text).substr(idx + quoteLen, text.size() - idx - 2 * quoteLen);
  if (result.isRaw || result.isFString) {
    if (result.isBytes) {
      for (const char chr : body) {
        if (static_cast<unsigned char>(chr) >= 0x80U) {
          throw ParseError("bytes can only contain ASCII literal characters", tok.line, tok.col);
        }
      }
    }
    result.value = std::string(body);
    return result;
  }
  Decoder decoder(tok, body, result.isBytes);
  result.value = decoder.run();
  return result;
}

} // namespace pyspect::parse
