/***
 * Name: pyspect::support (text helpers)
 * Purpose: Trimming, prefix tests, line splitting and UTF-8 coding.
 */
#include "pyspect/support/text.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pyspect::support {

bool IsSpace(const char chr) {
  return chr == ' ' || chr == '\t' || chr == '\n' || chr == '\r' || chr == '\v' || chr == '\f';
}

std::string_view TrimView(std::string_view text) {
  std::size_t begin = 0;
  while (begin < text.size() && IsSpace(text[begin])) { ++begin; }
  std::size_t end = text.size();
  while (end > begin && IsSpace(text[end - 1])) { --end; }
  return text.substr(begin, end - begin);
}

std::string Trim(std::string_view text) { return std::string(TrimView(text)); }

std::string TrimLeft(std::string_view text) {
  std::size_t begin = 0;
  while (begin < text.size() && IsSpace(text[begin])) { ++begin; }
  return std::string(text.substr(begin));
}

bool StartsWith(std::string_view text, std::string_view prefix) {
  return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> SplitLines(std::string_view text) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (true) {
    const std::size_t nl = text.find('\n', start);
    std::string_view piece = text.substr(start, nl == std::string_view::npos ? std::string_view::npos : nl - start);
    if (!piece.empty() && piece.back() == '\r') { piece.remove_suffix(1); }
    lines.emplace_back(piece);
    if (nl == std::string_view::npos) { break; }
    start = nl + 1;
  }
  return lines;
}

void AppendUtf8(std::string& out, const char32_t codePoint) {
  const auto cp = static_cast<std::uint32_t>(codePoint);
  if (cp < 0x80U) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800U) {
    out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else if (cp < 0x10000U) {
    out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else {
    out.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  }
}

bool DecodeUtf8(std::string_view text, std::size_t& pos, char32_t& codePoint) {
  if (pos >= text.size()) { return false; }
  const auto lead = static_cast<unsigned char>(text[pos]);
  std::size_t extra = 0;
  std::uint32_t value = 0;
  if (lead < 0x80U) { codePoint = lead; ++pos; return true; }
  if ((lead & 0xE0U) == 0xC0U) { extra = 1; value = lead & 0x1FU; }
  else if ((lead & 0xF0U) == 0xE0U) { extra = 2; value = lead & 0x0FU; }
  else if ((lead & 0xF8U) == 0xF0U) { extra = 3; value = lead & 0x07U; }
  else { return false; }
  if (pos + extra >= text.size()) { return false; }
  for (std::size_t i = 1; i <= extra; ++i) {
    const auto cont = static_cast<unsigned char>(text[pos + i]);
    if ((cont & 0xC0U) != 0x80U) { return false; }
    value = (value << 6U) | (cont & 0x3FU);
  }
  // reject overlong forms and surrogates
  if ((extra == 1 && value < 0x80U) || (extra == 2 && value < 0x800U) || (extra == 3 && value < 0x10000U)) { return false; }
  if (value > 0x10FFFFU || (value >= 0xD800U && value <= 0xDFFFU)) { return false; }
  codePoint = static_cast<char32_t>(value);
  pos += extra + 1;
  return true;
}

}  // namespace pyspect::support
