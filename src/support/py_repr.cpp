/***
 * Name: pyspect::support (py_repr impl)
 * Purpose: repr()-compatible rendering of string, bytes and numeric literals.
 */
#include "pyspect/support/py_repr.h"
#include "pyspect/support/text.h"

#include <unicode/uchar.h>

#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace pyspect::support {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

void appendHexEscape(std::string& out, const char prefix, const std::uint32_t value, const int width) {
  out.push_back('\\');
  out.push_back(prefix);
  for (int shift = (width - 1) * 4; shift >= 0; shift -= 4) {
    out.push_back(kHexDigits[(value >> static_cast<unsigned>(shift)) & 0xFU]);
  }
}

bool isPrintable(const char32_t codePoint) {
  if (codePoint == U' ') { return true; }
  switch (u_charType(static_cast<UChar32>(codePoint))) {
    case U_CONTROL_CHAR:
    case U_FORMAT_CHAR:
    case U_SURROGATE:
    case U_PRIVATE_USE_CHAR:
    case U_UNASSIGNED:
    case U_LINE_SEPARATOR:
    case U_PARAGRAPH_SEPARATOR:
    case U_SPACE_SEPARATOR:
      return false;
    default:
      return true;
  }
}

char chooseQuote(std::string_view text) {
  const bool hasSingle = text.find('\'') != std::string_view::npos;
  const bool hasDouble = text.find('"') != std::string_view::npos;
  return (hasSingle && !hasDouble) ? '"' : '\'';
}

std::string formatFloat(const double value, const bool addDotZero) {
  if (std::isnan(value)) { return "nan"; }
  if (std::isinf(value)) { return value < 0 ? "-inf" : "inf"; }
  if (value == 0.0) {
    std::string zero = std::signbit(value) ? "-0" : "0";
    return addDotZero ? zero + ".0" : zero;
  }
  char buf[64];
  const auto res = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::scientific);
  std::string sci(buf, res.ptr);
  std::string sign;
  if (!sci.empty() && sci.front() == '-') { sign = "-"; sci.erase(0, 1); }
  const auto epos = sci.find('e');
  const std::string mantissa = sci.substr(0, epos);
  const int exponent = std::atoi(sci.c_str() + epos + 1);
  std::string digits;
  for (const char chr : mantissa) { if (chr != '.') { digits.push_back(chr); } }
  const int count = static_cast<int>(digits.size());
  const int decpt = exponent + 1;

  std::string out = sign;
  if (decpt > -4 && decpt <= 16) {
    if (decpt <= 0) {
      out += "0." + std::string(static_cast<std::size_t>(-decpt), '0') + digits;
    } else if (decpt >= count) {
      out += digits + std::string(static_cast<std::size_t>(decpt - count), '0');
      if (addDotZero) { out += ".0"; }
    } else {
      out += digits.substr(0, static_cast<std::size_t>(decpt)) + "." + digits.substr(static_cast<std::size_t>(decpt));
    }
    return out;
  }
  out.push_back(digits[0]);
  if (count > 1) { out += "." + digits.substr(1); }
  const int exp10 = decpt - 1;
  out.push_back('e');
  out.push_back(exp10 < 0 ? '-' : '+');
  const std::string mag = std::to_string(exp10 < 0 ? -exp10 : exp10);
  if (mag.size() < 2) { out.push_back('0'); }
  out += mag;
  return out;
}

std::string stripUnderscores(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (const char chr : text) { if (chr != '_') { out.push_back(chr); } }
  return out;
}

int digitValue(const char chr) {
  if (chr >= '0' && chr <= '9') { return chr - '0'; }
  if (chr >= 'a' && chr <= 'f') { return chr - 'a' + 10; }
  if (chr >= 'A' && chr <= 'F') { return chr - 'A' + 10; }
  return -1;
}

} // namespace

std::string ReprString(std::string_view utf8) {
  const char quote = chooseQuote(utf8);
  std::string out(1, quote);
  std::size_t pos = 0;
  while (pos < utf8.size()) {
    const char chr = utf8[pos];
    const auto uchr = static_cast<unsigned char>(chr);
    if (chr == quote || chr == '\\') { out.push_back('\\'); out.push_back(chr); ++pos; continue; }
    if (chr == '\n') { out += "\\n"; ++pos; continue; }
    if (chr == '\r') { out += "\\r"; ++pos; continue; }
    if (chr == '\t') { out += "\\t"; ++pos; continue; }
    if (uchr < 0x20U || uchr == 0x7FU) { appendHexEscape(out, 'x', uchr, 2); ++pos; continue; }
    if (uchr < 0x80U) { out.push_back(chr); ++pos; continue; }
    const std::size_t start = pos;
    char32_t codePoint = 0;
    if (!DecodeUtf8(utf8, pos, codePoint)) {
      appendHexEscape(out, 'x', uchr, 2);
      pos = start + 1;
      continue;
    }
    if (isPrintable(codePoint)) {
      out.append(utf8.substr(start, pos - start));
    } else if (codePoint < 0x100U) {
      appendHexEscape(out, 'x', static_cast<std::uint32_t>(codePoint), 2);
    } else if (codePoint < 0x10000U) {
      appendHexEscape(out, 'u', static_cast<std::uint32_t>(codePoint), 4);
    } else {
      appendHexEscape(out, 'U', static_cast<std::uint32_t>(codePoint), 8);
    }
  }
  out.push_back(quote);
  return out;
}

std::string EscapeUnprintable(std::string_view utf8, const bool escapeWhitespace) {
  std::string out;
  std::size_t pos = 0;
  while (pos < utf8.size()) {
    const char chr = utf8[pos];
    const auto uchr = static_cast<unsigned char>(chr);
    if (!escapeWhitespace && (chr == '\n' || chr == '\t')) { out.push_back(chr); ++pos; continue; }
    if (chr == '\\') { out += "\\\\"; ++pos; continue; }
    if (chr == '\n') { out += "\\n"; ++pos; continue; }
    if (chr == '\r') { out += "\\r"; ++pos; continue; }
    if (chr == '\t') { out += "\\t"; ++pos; continue; }
    if (uchr < 0x20U || uchr == 0x7FU) { appendHexEscape(out, 'x', uchr, 2); ++pos; continue; }
    if (uchr < 0x80U) { out.push_back(chr); ++pos; continue; }
    const std::size_t start = pos;
    char32_t codePoint = 0;
    if (!DecodeUtf8(utf8, pos, codePoint)) {
      appendHexEscape(out, 'x', uchr, 2);
      pos = start + 1;
      continue;
    }
    if (isPrintable(codePoint)) {
      out.append(utf8.substr(start, pos - start));
    } else if (codePoint < 0x100U) {
      appendHexEscape(out, 'x', static_cast<std::uint32_t>(codePoint), 2);
    } else if (codePoint < 0x10000U) {
      appendHexEscape(out, 'u', static_cast<std::uint32_t>(codePoint), 4);
    } else {
      appendHexEscape(out, 'U', static_cast<std::uint32_t>(codePoint), 8);
    }
  }
  return out;
}

std::string ReprBytes(std::string_view bytes) {
  const char quote = chooseQuote(bytes);
  std::string out = "b";
  out.push_back(quote);
  for (const char chr : bytes) {
    const auto uchr = static_cast<unsigned char>(chr);
    if (chr == quote || chr == '\\') { out.push_back('\\'); out.push_back(chr); }
    else if (chr == '\n') { out += "\\n"; }
    else if (chr == '\r') { out += "\\r"; }
    else if (chr == '\t') { out += "\\t"; }
    else if (uchr < 0x20U || uchr >= 0x7FU) { appendHexEscape(out, 'x', uchr, 2); }
    else { out.push_back(chr); }
  }
  out.push_back(quote);
  return out;
}

std::string ReprFloat(const double value) { return formatFloat(value, true); }

std::string ReprIntLiteral(std::string_view text) {
  std::string clean = stripUnderscores(text);
  int base = 10;
  std::size_t start = 0;
  if (clean.size() > 1 && clean[0] == '0') {
    const char marker = clean[1];
    if (marker == 'x' || marker == 'X') { base = 16; start = 2; }
    else if (marker == 'o' || marker == 'O') { base = 8; start = 2; }
    else if (marker == 'b' || marker == 'B') { base = 2; start = 2; }
  }
  // little-endian base-10 digit vector; exact for arbitrarily large literals
  std::vector<int> decimal{0};
  for (std::size_t i = start; i < clean.size(); ++i) {
    const int digit = digitValue(clean[i]);
    if (digit < 0 || digit >= base) { return clean; }
    int carry = digit;
    for (int& slot : decimal) {
      const int next = slot * base + carry;
      slot = next % 10;
      carry = next / 10;
    }
    while (carry > 0) { decimal.push_back(carry % 10); carry /= 10; }
  }
  while (decimal.size() > 1 && decimal.back() == 0) { decimal.pop_back(); }
  std::string out;
  for (auto it = decimal.rbegin(); it != decimal.rend(); ++it) { out.push_back(static_cast<char>('0' + *it)); }
  return out;
}

std::string ReprFloatLiteral(std::string_view text) {
  const std::string clean = stripUnderscores(text);
  return formatFloat(std::strtod(clean.c_str(), nullptr), true);
}

std::string ReprImagLiteral(std::string_view text) {
  std::string clean = stripUnderscores(text);
  if (!clean.empty() && (clean.back() == 'j' || clean.back() == 'J')) { clean.pop_back(); }
  return formatFloat(std::strtod(clean.c_str(), nullptr), false) + "j";
}

} // namespace pyspect::support
