/***
 * Name: pyspect::parse::AppendFStringPiece (impl)
 * Purpose: Literal runs and replacement fields of f-string bodies.
 */
#include "parser/FString.h"
#include "parser/Parser.h"
#include "pyspect/exceptions/parse_error.h"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pyspect::parse {

using exceptions::ParseError;

namespace {

constexpr int kMaxFieldNesting = 2;

void appendLiteral(std::vector<ast::FStringPart>& out, std::string text) {
  if (text.empty()) { return; }
  if (!out.empty() && !out.back().value) {
    out.back().literal += text;
    return;
  }
  ast::FStringPart part;
  part.literal = std::move(text);
  out.push_back(std::move(part));
}

class Splitter {
 public:
  Splitter(const lex::Token& tok, std::string_view body, const bool isRaw) : tok_(tok), body_(body), isRaw_(isRaw) {}

  void run(std::vector<ast::FStringPart>& out) {
    parseParts(out, 0, false);
    if (pos_ < body_.size()) { fail("single '}' is not allowed"); }
  }

 private:
  const lex::Token& tok_;
  std::string_view body_;
  bool isRaw_;
  std::size_t pos_{0};

  [[noreturn]] void fail(const std::string& msg) const { throw ParseError("f-string: " + msg, tok_.line, tok_.col); }

  char at(const std::size_t idx) const { return idx < body_.size() ? body_[idx] : '\0'; }

  void flush(std::vector<ast::FStringPart>& out, std::string& raw) const {
    if (raw.empty()) { return; }
    appendLiteral(out, isRaw_ ? raw : DecodeEscapes(tok_, raw));
    raw.clear();
  }

  // Stops at the end of the body or, inside a format spec, at its closing '}'.
  // NOLINTNEXTLINE(readability-function-cognitive-complexity)
  void parseParts(std::vector<ast::FStringPart>& out, const int nesting, const bool inSpec) {
    std::string raw;
    while (pos_ < body_.size()) {
      const char chr = body_[pos_];
      if (chr == '\\' && !isRaw_) {
        raw.push_back(chr);
        ++pos_;
        if (at(pos_) == 'N' && at(pos_ + 1) == '{') {
          const std::size_t close = body_.find('}', pos_);
          const std::size_t end = close == std::string_view::npos ? body_.size() : close + 1;
          raw.append(body_.substr(pos_, end - pos_));
          pos_ = end;
        } else if (pos_ < body_.size() && at(pos_) != '{' && at(pos_) != '}') {
          raw.push_back(body_[pos_]);
          ++pos_;
        }
        continue;
      }
      if (chr == '{') {
        if (!inSpec && at(pos_ + 1) == '{') {
          raw.push_back('{');
          pos_ += 2;
          continue;
        }
        flush(out, raw);
        parseField(out, nesting);
        continue;
      }
      if (chr == '}') {
        if (inSpec) { break; }
        if (at(pos_ + 1) != '}') { fail("single '}' is not allowed"); }
        raw.push_back('}');
        pos_ += 2;
        continue;
      }
      raw.push_back(chr);
      ++pos_;
    }
    flush(out, raw);
  }

  void skipNestedString() {
    const char quote = body_[pos_];
    const bool triple = at(pos_ + 1) == quote && at(pos_ + 2) == quote;
    const std::string closer(triple ? 3 : 1, quote);
    const std::size_t close = body_.find(closer, pos_ + closer.size());
    if (close == std::string_view::npos) { fail("unterminated string"); }
    pos_ = close + closer.size();
  }

  // Leaves pos_ on the character that ended the expression.
  // NOLINTNEXTLINE(readability-function-cognitive-complexity)
  void scanExpression() {
    int depth = 0;
    while (pos_ < body_.size()) {
      const char chr = body_[pos_];
      const char following = at(pos_ + 1);
      if (chr == '\\') { fail("expression part cannot include a backslash"); }
      if (chr == '#') { fail("expression part cannot include '#'"); }
      if (chr == '\'' || chr == '"') { skipNestedString(); continue; }
      if (chr == '(' || chr == '[' || chr == '{') { ++depth; ++pos_; continue; }
      if (chr == ')' || chr == ']' || (chr == '}' && depth > 0)) {
        if (depth == 0) { fail(std::string("unmatched '") + chr + "'"); }
        --depth;
        ++pos_;
        continue;
      }
      if ((chr == '=' || chr == '!' || chr == '<' || chr == '>') && following == '=') { pos_ += 2; continue; }
      if (depth == 0 && (chr == '}' || chr == ':' || chr == '!' || chr == '=')) { return; }
      ++pos_;
    }
    fail("expecting '}'");
  }

  std::unique_ptr<ast::Expr> parseExpression(std::string_view text) const {
    std::unique_ptr<ast::Module> module;
    try {
      lex::Lexer lexer;
      lexer.pushString("(" + std::string(text) + ")", tok_.file);
      Parser parser(lexer);
      module = parser.parseModule();
    } catch (const ParseError& e) {
      fail(e.what());
    }
    if (module->body.size() != 1 || module->body.front()->kind != ast::NodeKind::ExprStmt) { fail("invalid syntax"); }
    return std::move(static_cast<ast::ExprStmt&>(*module->body.front()).value);
  }

  // NOLINTNEXTLINE(readability-function-cognitive-complexity)
  void parseField(std::vector<ast::FStringPart>& out, const int nesting) {
    if (nesting >= kMaxFieldNesting) { fail("expressions nested too deeply"); }
    ++pos_; // '{'
    const std::size_t exprStart = pos_;
    scanExpression();
    const std::string_view exprText = body_.substr(exprStart, pos_ - exprStart);
    if (exprText.find_first_not_of(" \t\n\r\f") == std::string_view::npos) { fail("empty expression not allowed"); }

    ast::FStringPart field;
    field.value = parseExpression(exprText);
    bool debug = false;
    if (body_[pos_] == '=') {
      debug = true;
      ++pos_;
      while (pos_ < body_.size() && (body_[pos_] == ' ' || body_[pos_] == '\t' || body_[pos_] == '\n')) { ++pos_; }
      appendLiteral(out, std::string(body_.substr(exprStart, pos_ - exprStart)));
    }
    if (at(pos_) == '!') {
      const char conversion = at(pos_ + 1);
      if (conversion != 's' && conversion != 'r' && conversion != 'a') {
        fail("invalid conversion character: expected 's', 'r', or 'a'");
      }
      field.conversion = conversion;
      pos_ += 2;
    }
    bool hasSpec = false;
    if (at(pos_) == ':') {
      hasSpec = true;
      ++pos_;
      parseParts(field.formatSpec, nesting + 1, true);
    }
    if (at(pos_) != '}') { fail("expecting '}'"); }
    ++pos_;
    if (debug && field.conversion == 0 && !hasSpec) { field.conversion = 'r'; }
    out.push_back(std::move(field));
  }
};

} // namespace

void AppendFStringPiece(const lex::Token& tok, const DecodedString& decoded, std::vector<ast::FStringPart>& out) {
  if (!decoded.isFString) {
    appendLiteral(out, decoded.value);
    return;
  }
  Splitter splitter(tok, decoded.value, decoded.isRaw);
  splitter.run(out);
}

} // namespace pyspect::parse
