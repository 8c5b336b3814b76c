/***
 * Name: pyspect::metadata::ParseToml (impl)
 * Purpose: Character-level reader for the restricted TOML subset.
 */
#include "metadata/TomlReader.h"
#include "pyspect/exceptions/toml_error.h"
#include "pyspect/support/text.h"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace pyspect::metadata {

namespace {

using exceptions::TomlError;
using KeyPath = std::vector<std::string>;

constexpr int kHexBase = 16;
constexpr int kShortEscapeDigits = 4;
constexpr int kLongEscapeDigits = 8;
constexpr char32_t kMaxCodePoint = 0x10FFFF;
constexpr char32_t kSurrogateLow = 0xD800;
constexpr char32_t kSurrogateHigh = 0xDFFF;
// arrays, inline tables and dotted key parts each count one level
constexpr int kMaxNestingDepth = 100;

bool isBareKeyChar(const char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
}

bool isDigit(const char c) { return c >= '0' && c <= '9'; }

std::string joinKey(const KeyPath& path) {
  std::string out;
  for (const auto& part : path) {
    if (!out.empty()) { out += "."; }
    out += part;
  }
  return out;
}

class Reader {
 public:
  explicit Reader(std::string_view src) : src_(src) {}

  ConfigValue run() {
    ConfigValue root = ConfigValue::makeTable();
    KeyPath currentPath;
    bool currentIsArrayItem = false;
    for (;;) {
      skipBlank();
      if (eof()) { break; }
      if (peek() == '[') {
        advance();
        const bool isArray = peek() == '[';
        if (isArray) { advance(); }
        skipWs();
        currentPath = parseKey();
        skipWs();
        expectChar(']', "expected ']' after table header");
        if (isArray) { expectChar(']', "expected ']]' after array of tables header"); }
        const int headerLine = line_;
        expectLineEnd();
        try {
          openHeader(root, currentPath, isArray);
        } catch (const TomlError& e) {
          throw TomlError(e.what(), headerLine);
        }
        currentIsArrayItem = isArray;
        continue;
      }
      const int keyLine = line_;
      KeyPath key = parseKey();
      skipWs();
      expectChar('=', "expected '=' after key");
      skipWs();
      ConfigValue value = parseValue();
      expectLineEnd();
      ConfigValue* table = resolveCurrent(root, currentPath, currentIsArrayItem);
      assign(*table, key, std::move(value), keyLine);
    }
    return root;
  }

 private:
  std::string_view src_;
  std::size_t pos_{0};
  int line_{1};
  int depth_{0};

  bool eof() const { return pos_ >= src_.size(); }
  char peek(const std::size_t off = 0) const { return pos_ + off < src_.size() ? src_[pos_ + off] : '\0'; }
  bool lookingAt(std::string_view s) const { return src_.substr(pos_, s.size()) == s; }
  void advance(const std::size_t n = 1) {
    for (std::size_t i = 0; i < n && pos_ < src_.size(); ++i) {
      if (src_[pos_] == '\n') { ++line_; }
      ++pos_;
    }
  }
  [[noreturn]] void fail(const std::string& msg) const { throw TomlError(msg, line_); }
  void expectChar(const char c, const char* msg) {
    if (peek() != c) { fail(msg); }
    advance();
  }

  void skipWs() {
    while (peek() == ' ' || peek() == '\t') { advance(); }
  }
  void skipComment() {
    if (peek() != '#') { return; }
    while (!eof() && peek() != '\n') { advance(); }
  }
  // whitespace, newlines and comments
  void skipBlank() {
    for (;;) {
      skipWs();
      skipComment();
      if (peek() == '\n' || peek() == '\r') { advance(); continue; }
      return;
    }
  }
  void expectLineEnd() {
    skipWs();
    skipComment();
    if (peek() == '\r') { advance(); }
    if (eof()) { return; }
    if (peek() != '\n') { fail("expected newline after value"); }
    advance();
  }

  KeyPath parseKey() {
    KeyPath path;
    for (;;) {
      skipWs();
      path.push_back(parseSimpleKey());
      if (path.size() > static_cast<std::size_t>(kMaxNestingDepth)) { fail("nesting too deep"); }
      skipWs();
      if (peek() != '.') { break; }
      advance();
    }
    return path;
  }

  std::string parseSimpleKey() {
    if (peek() == '"') { return parseBasicString(); }
    if (peek() == '\'') { return parseLiteralString(); }
    const std::size_t start = pos_;
    while (isBareKeyChar(peek())) { advance(); }
    if (pos_ == start) { fail("invalid key"); }
    return std::string(src_.substr(start, pos_ - start));
  }

  static void openHeader(ConfigValue& root, const KeyPath& path, const bool isArray) {
    ConfigValue* table = &root;
    for (std::size_t i = 0; i + 1 < path.size(); ++i) { table = descend(*table, path[i]); }
    const std::string& last = path.back();
    ConfigValue* existing = table->find(last);
    if (isArray) {
      if (existing == nullptr) {
        existing = table->insert(last, ConfigValue::makeArray());
      } else if (!existing->isArray() || existing->sealed()) {
        throw TomlError("cannot append to non-array key '" + joinKey(path) + "'", 0);
      }
      existing->push(ConfigValue::makeTable());
      return;
    }
    if (existing != nullptr) {
      if (!existing->isTable() || existing->defined() || existing->sealed()) {
        throw TomlError("table '" + joinKey(path) + "' defined more than once", 0);
      }
      existing->markDefined();
      return;
    }
    table->insert(last, ConfigValue::makeTable())->markDefined();
  }

  // Walk (and create) intermediate tables; an array of tables resolves to its last item.
  static ConfigValue* descend(ConfigValue& table, const std::string& key) {
    ConfigValue* child = table.find(key);
    if (child == nullptr) { return table.insert(key, ConfigValue::makeTable()); }
    if (child->isArray() && !child->sealed() && !child->items().empty()) { return &child->back(); }
    if (!child->isTable() || child->sealed()) {
      throw TomlError("key '" + key + "' is not a table", 0);
    }
    return child;
  }

  ConfigValue* resolveCurrent(ConfigValue& root, const KeyPath& path, const bool isArrayItem) const {
    try {
      ConfigValue* table = &root;
      for (std::size_t i = 0; i < path.size(); ++i) {
        if (i + 1 == path.size() && isArrayItem) {
          table = &table->find(path[i])->back();
        } else {
          table = descend(*table, path[i]);
        }
      }
      return table;
    } catch (const TomlError& e) {
      fail(e.what());
    }
  }

  static void assign(ConfigValue& table, const KeyPath& key, ConfigValue value, const int keyLine) {
    ConfigValue* target = &table;
    for (std::size_t i = 0; i + 1 < key.size(); ++i) {
      ConfigValue* child = target->find(key[i]);
      if (child == nullptr) {
        child = target->insert(key[i], ConfigValue::makeTable());
      } else if (!child->isTable() || child->sealed()) {
        throw TomlError("key '" + joinKey(key) + "' is not a table", keyLine);
      }
      target = child;
    }
    if (target->insert(key.back(), std::move(value)) == nullptr) {
      throw TomlError("duplicate key '" + joinKey(key) + "'", keyLine);
    }
  }

  ConfigValue parseValue() {
    const char c = peek();
    if (lookingAt("\"\"\"")) { return ConfigValue::makeString(parseMultilineBasic()); }
    if (c == '"') { return ConfigValue::makeString(parseBasicString()); }
    if (lookingAt("'''")) { return ConfigValue::makeString(parseMultilineLiteral()); }
    if (c == '\'') { return ConfigValue::makeString(parseLiteralString()); }
    if (lookingAt("true") && !isBareKeyChar(peek(4))) { advance(4); return ConfigValue::makeBoolean(true); }
    if (lookingAt("false") && !isBareKeyChar(peek(5))) { advance(5); return ConfigValue::makeBoolean(false); }
    if (c == '[' || c == '{') {
      if (depth_ >= kMaxNestingDepth) { fail("nesting too deep"); }
      ++depth_;
      ConfigValue nested = c == '[' ? parseArray() : parseInlineTable();
      --depth_;
      return nested;
    }
    if (isDigit(c) || c == '+' || c == '-' || c == 'i' || c == 'n') { return parseNumber(); }
    if (eof() || c == '\n') { fail("missing value"); }
    fail("invalid value");
  }

  void appendEscape(std::string& out) {
    advance(); // backslash
    const char esc = peek();
    switch (esc) {
      case 'b': out += '\b'; advance(); return;
      case 't': out += '\t'; advance(); return;
      case 'n': out += '\n'; advance(); return;
      case 'f': out += '\f'; advance(); return;
      case 'r': out += '\r'; advance(); return;
      case 'e': out += '\x1b'; advance(); return;
      case '"': out += '"'; advance(); return;
      case '\\': out += '\\'; advance(); return;
      case 'u': case 'U': {
        advance();
        const int digits = esc == 'u' ? kShortEscapeDigits : kLongEscapeDigits;
        char32_t cp = 0;
        for (int i = 0; i < digits; ++i) {
          const char h = peek();
          int v = 0;
          if (h >= '0' && h <= '9') { v = h - '0'; }
          else if (h >= 'a' && h <= 'f') { v = h - 'a' + 10; }
          else if (h >= 'A' && h <= 'F') { v = h - 'A' + 10; }
          else { fail("invalid unicode escape"); }
          cp = cp * kHexBase + static_cast<char32_t>(v);
          advance();
        }
        if (cp > kMaxCodePoint || (cp >= kSurrogateLow && cp <= kSurrogateHigh)) { fail("invalid unicode scalar in escape"); }
        support::AppendUtf8(out, cp);
        return;
      }
      default: fail("invalid escape sequence");
    }
  }

  std::string parseBasicString() {
    advance(); // opening quote
    std::string out;
    for (;;) {
      if (eof() || peek() == '\n') { fail("unterminated string"); }
      const char c = peek();
      if (c == '"') { advance(); return out; }
      if (c == '\\') { appendEscape(out); continue; }
      out += c;
      advance();
    }
  }

  std::string parseLiteralString() {
    advance();
    std::string out;
    for (;;) {
      if (eof() || peek() == '\n') { fail("unterminated string"); }
      const char c = peek();
      advance();
      if (c == '\'') { return out; }
      out += c;
    }
  }

  // Closing run of 3 to 5 quotes; extras belong to the content.
  bool consumeClosing(const char quote, std::string& out) {
    std::size_t run = 0;
    while (peek(run) == quote) { ++run; }
    if (run < 3) { return false; }
    if (run > 5) { fail("too many quotes at end of multi-line string"); }
    out.append(run - 3, quote);
    advance(run);
    return true;
  }

  void skipLeadingNewline() {
    if (peek() == '\r' && peek(1) == '\n') { advance(2); return; }
    if (peek() == '\n') { advance(); }
  }

  std::string parseMultilineBasic() {
    advance(3);
    skipLeadingNewline();
    std::string out;
    for (;;) {
      if (eof()) { fail("unterminated multi-line string"); }
      if (peek() == '"' && consumeClosing('"', out)) { return out; }
      if (peek() == '\\') {
        // line-ending backslash trims the newline and following whitespace
        std::size_t look = 1;
        while (peek(look) == ' ' || peek(look) == '\t' || peek(look) == '\r') { ++look; }
        if (peek(look) == '\n') {
          advance(look);
          while (peek() == ' ' || peek() == '\t' || peek() == '\n' || peek() == '\r') { advance(); }
          continue;
        }
        appendEscape(out);
        continue;
      }
      out += peek();
      advance();
    }
  }

  std::string parseMultilineLiteral() {
    advance(3);
    skipLeadingNewline();
    std::string out;
    for (;;) {
      if (eof()) { fail("unterminated multi-line string"); }
      if (peek() == '\'' && consumeClosing('\'', out)) { return out; }
      out += peek();
      advance();
    }
  }

  static bool validUnderscores(std::string_view digits) {
    if (digits.empty() || digits.front() == '_' || digits.back() == '_') { return false; }
    return digits.find("__") == std::string_view::npos;
  }

  static std::string stripUnderscores(std::string_view text) {
    std::string out;
    for (const char c : text) {
      if (c != '_') { out += c; }
    }
    return out;
  }

  // NOLINTNEXTLINE(readability-function-cognitive-complexity)
  ConfigValue parseNumber() {
    const std::size_t start = pos_;
    while (!eof()) {
      const char c = peek();
      if (isBareKeyChar(c) || c == '.' || c == '+' || c == ':') { advance(); continue; }
      break;
    }
    const std::string_view tok = src_.substr(start, pos_ - start);
    if (tok.size() > 4 && tok[4] == '-' && isDigit(tok[0])) { fail("date and time values are not supported"); }
    if (tok.find(':') != std::string_view::npos) { fail("date and time values are not supported"); }

    std::string_view body = tok;
    bool negative = false;
    if (!body.empty() && (body.front() == '+' || body.front() == '-')) {
      negative = body.front() == '-';
      body.remove_prefix(1);
    }
    if (body == "inf") { return ConfigValue::makeFloat(negative ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity()); }
    if (body == "nan") { return ConfigValue::makeFloat(std::numeric_limits<double>::quiet_NaN()); }
    if (body.empty() || !isDigit(body.front())) { fail("invalid number"); }

    if (body.size() > 2 && body[0] == '0' && (body[1] == 'x' || body[1] == 'o' || body[1] == 'b')) {
      if (tok.size() != body.size()) { fail("sign not allowed on prefixed integer"); }
      const int base = body[1] == 'x' ? 16 : (body[1] == 'o' ? 8 : 2);
      const std::string_view digits = body.substr(2);
      if (!validUnderscores(digits)) { fail("invalid number"); }
      const std::string clean = stripUnderscores(digits);
      std::uint64_t value = 0;
      const auto res = std::from_chars(clean.data(), clean.data() + clean.size(), value, base);
      if (res.ec != std::errc() || res.ptr != clean.data() + clean.size() ||
          value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        fail("invalid number");
      }
      return ConfigValue::makeInteger(static_cast<std::int64_t>(value));
    }

    const bool isFloat = body.find_first_of(".eE") != std::string_view::npos;
    // Split into integer part / rest for the leading-zero and underscore rules
    const std::size_t intEnd = std::min(body.find_first_of(".eE"), body.size());
    const std::string_view intPart = body.substr(0, intEnd);
    if (!validUnderscores(intPart)) { fail("invalid number"); }
    if (intPart.size() > 1 && intPart.front() == '0') { fail("leading zeros are not allowed"); }
    std::string clean = stripUnderscores(body);
    if (negative) { clean.insert(clean.begin(), '-'); }

    if (!isFloat) {
      std::int64_t value = 0;
      const auto res = std::from_chars(clean.data(), clean.data() + clean.size(), value);
      if (res.ec != std::errc() || res.ptr != clean.data() + clean.size()) { fail("invalid number"); }
      return ConfigValue::makeInteger(value);
    }
    const std::size_t dot = body.find('.');
    if (dot != std::string_view::npos) {
      const std::size_t fracEnd = std::min(body.find_first_of("eE", dot), body.size());
      if (!validUnderscores(body.substr(dot + 1, fracEnd - dot - 1))) { fail("invalid number"); }
    }
    double value = 0.0;
    const auto res = std::from_chars(clean.data(), clean.data() + clean.size(), value);
    if (res.ec != std::errc() || res.ptr != clean.data() + clean.size()) { fail("invalid number"); }
    return ConfigValue::makeFloat(value);
  }

  ConfigValue parseArray() {
    advance(); // '['
    ConfigValue array = ConfigValue::makeArray();
    for (;;) {
      skipBlank();
      if (peek() == ']') { break; }
      if (eof()) { fail("unterminated array"); }
      array.push(parseValue());
      skipBlank();
      if (peek() == ',') { advance(); continue; }
      if (peek() == ']') { break; }
      fail("expected ',' or ']' in array");
    }
    advance();
    array.seal();
    return array;
  }

  ConfigValue parseInlineTable() {
    advance(); // '{'
    ConfigValue table = ConfigValue::makeTable();
    skipWs();
    if (peek() == '}') {
      advance();
      table.seal();
      return table;
    }
    for (;;) {
      skipWs();
      const int keyLine = line_;
      KeyPath key = parseKey();
      skipWs();
      expectChar('=', "expected '=' after key");
      skipWs();
      ConfigValue value = parseValue();
      assign(table, key, std::move(value), keyLine);
      skipWs();
      if (peek() == ',') { advance(); continue; }
      if (peek() == '}') { advance(); break; }
      fail("expected ',' or '}' in inline table");
    }
    table.seal();
    return table;
  }
};

} // namespace

ConfigValue ParseToml(std::string_view text) {
  Reader reader(text);
  return reader.run();
}

} // namespace pyspect::metadata
