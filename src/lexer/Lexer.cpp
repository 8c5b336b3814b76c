/***
 * Name: pyspect::lex::Lexer
 * Purpose: Tokenize script source into a flat token vector.
 * Inputs:
 *   - One in-memory source pushed with pushString()
 * Outputs:
 *   - Tokens with Newline/Indent/Dedent structure and 1-based locations
 * Theory of Operation:
 *   Works one physical line at a time. Indentation is only measured at the
 *   start of a logical line: inside (), [] or {} and after a trailing
 *   backslash the next physical line continues the current logical line and
 *   no Newline is emitted. String literals may pull further lines (triple
 *   quotes, escaped newlines) and keep their raw source text; decoding is the
 *   parser's job. Non-ASCII identifiers are validated against XID_Start and
 *   XID_Continue and NFKC-normalized with ICU. Bracket nesting stops at 200
 *   and indentation at 100 levels. Any lexical error throws
 *   exceptions::ParseError carrying the offending line.
 */
#include "lexer/Lexer.h"
#include "pyspect/exceptions/parse_error.h"
#include "pyspect/support/text.h"

#include <unicode/uchar.h>
#include <unicode/unorm2.h>
#include <unicode/ustring.h>

#include <array>
#include <cctype>
#include <cstddef>
#include <cstdio>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pyspect::lex {

using exceptions::ParseError;

namespace {

constexpr size_t kTabSize = 8;
constexpr size_t kMaxBracketDepth = 200;
constexpr size_t kMaxIndentDepth = 100;

bool isAsciiIdentStart(const char chr) { return (std::isalpha(static_cast<unsigned char>(chr)) != 0) || chr == '_'; }
bool isAsciiIdentChar(const char chr) { return (std::isalnum(static_cast<unsigned char>(chr)) != 0) || chr == '_'; }
bool isDigit(const char chr) { return std::isdigit(static_cast<unsigned char>(chr)) != 0; }

struct Keyword {
  std::string_view text;
  TokenKind kind;
};

constexpr auto kKeywords = std::to_array<Keyword>({
    {"and", TokenKind::And}, {"as", TokenKind::As}, {"assert", TokenKind::Assert},
    {"async", TokenKind::Async}, {"await", TokenKind::Await}, {"break", TokenKind::Break},
    {"class", TokenKind::Class}, {"continue", TokenKind::Continue}, {"def", TokenKind::Def},
    {"del", TokenKind::Del}, {"elif", TokenKind::Elif}, {"else", TokenKind::Else},
    {"except", TokenKind::Except}, {"finally", TokenKind::Finally}, {"for", TokenKind::For},
    {"from", TokenKind::From}, {"global", TokenKind::Global}, {"if", TokenKind::If},
    {"import", TokenKind::Import}, {"in", TokenKind::In}, {"is", TokenKind::Is},
    {"lambda", TokenKind::Lambda}, {"nonlocal", TokenKind::Nonlocal}, {"not", TokenKind::Not},
    {"or", TokenKind::Or}, {"pass", TokenKind::Pass}, {"raise", TokenKind::Raise},
    {"return", TokenKind::Return}, {"try", TokenKind::Try}, {"while", TokenKind::While},
    {"with", TokenKind::With}, {"yield", TokenKind::Yield}, {"None", TokenKind::NoneLit},
    {"True", TokenKind::BoolLit}, {"False", TokenKind::BoolLit},
});

TokenKind identKind(std::string_view ident) {
  for (const auto& kw : kKeywords) {
    if (kw.text == ident) { return kw.kind; }
  }
  return TokenKind::Ident;
}

struct Operator {
  std::string_view text;
  TokenKind kind;
};

// Longest spellings first so that maximal munch falls out of a linear scan.
constexpr auto kOperators = std::to_array<Operator>({
    {"**=", TokenKind::StarStarEqual}, {"//=", TokenKind::SlashSlashEqual},
    {">>=", TokenKind::RShiftEqual}, {"<<=", TokenKind::LShiftEqual}, {"...", TokenKind::Ellipsis},
    {"->", TokenKind::Arrow}, {":=", TokenKind::ColonEqual}, {"**", TokenKind::StarStar},
    {"//", TokenKind::SlashSlash}, {"<<", TokenKind::LShift}, {">>", TokenKind::RShift},
    {"<=", TokenKind::Le}, {">=", TokenKind::Ge}, {"==", TokenKind::EqEq}, {"!=", TokenKind::NotEq},
    {"+=", TokenKind::PlusEqual}, {"-=", TokenKind::MinusEqual}, {"*=", TokenKind::StarEqual},
    {"/=", TokenKind::SlashEqual}, {"%=", TokenKind::PercentEqual}, {"&=", TokenKind::AmpEqual},
    {"|=", TokenKind::PipeEqual}, {"^=", TokenKind::CaretEqual}, {"@=", TokenKind::AtEqual},
    {"+", TokenKind::Plus}, {"-", TokenKind::Minus}, {"*", TokenKind::Star}, {"/", TokenKind::Slash},
    {"%", TokenKind::Percent}, {"@", TokenKind::At}, {"&", TokenKind::Amp}, {"|", TokenKind::Pipe},
    {"^", TokenKind::Caret}, {"~", TokenKind::Tilde}, {"<", TokenKind::Lt}, {">", TokenKind::Gt},
    {"(", TokenKind::LParen}, {")", TokenKind::RParen}, {"[", TokenKind::LBracket},
    {"]", TokenKind::RBracket}, {"{", TokenKind::LBrace}, {"}", TokenKind::RBrace},
    {",", TokenKind::Comma}, {":", TokenKind::Colon}, {";", TokenKind::Semicolon},
    {".", TokenKind::Dot}, {"=", TokenKind::Equal},
});

bool isCloser(const TokenKind kind) {
  return kind == TokenKind::RParen || kind == TokenKind::RBracket || kind == TokenKind::RBrace;
}

TokenKind closerFor(const TokenKind opener) {
  if (opener == TokenKind::LParen) { return TokenKind::RParen; }
  if (opener == TokenKind::LBracket) { return TokenKind::RBracket; }
  return TokenKind::RBrace;
}

std::string codePointLabel(const char32_t codePoint) {
  std::array<char, 16> buf{};
  std::snprintf(buf.data(), buf.size(), "U+%04X", static_cast<unsigned>(codePoint));
  return std::string(buf.data());
}

std::string nfkc(const std::string& utf8) {
  UErrorCode status = U_ZERO_ERROR;
  const UNormalizer2* norm = unorm2_getNFKCInstance(&status);
  if (U_FAILURE(status)) { return utf8; }
  const auto srcLen = static_cast<int32_t>(utf8.size());
  int32_t uLen = 0;
  u_strFromUTF8(nullptr, 0, &uLen, utf8.data(), srcLen, &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) { return utf8; }
  status = U_ZERO_ERROR;
  std::vector<UChar> ustr(static_cast<size_t>(uLen) + 1);
  u_strFromUTF8(ustr.data(), uLen + 1, nullptr, utf8.data(), srcLen, &status);
  if (U_FAILURE(status)) { return utf8; }
  const int32_t nLen = unorm2_normalize(norm, ustr.data(), uLen, nullptr, 0, &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) { return utf8; }
  status = U_ZERO_ERROR;
  std::vector<UChar> normBuf(static_cast<size_t>(nLen) + 1);
  unorm2_normalize(norm, ustr.data(), uLen, normBuf.data(), nLen + 1, &status);
  if (U_FAILURE(status)) { return utf8; }
  int32_t outLen = 0;
  u_strToUTF8(nullptr, 0, &outLen, normBuf.data(), nLen, &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) { return utf8; }
  status = U_ZERO_ERROR;
  std::string out(static_cast<size_t>(outLen) + 1, '\0');
  u_strToUTF8(out.data(), outLen + 1, nullptr, normBuf.data(), nLen, &status);
  if (U_FAILURE(status)) { return utf8; }
  out.resize(static_cast<size_t>(outLen));
  return out;
}

} // namespace

void Lexer::pushString(const std::string& text, const std::string& name) {
  state_ = State{};
  state_.src = std::make_unique<StringInput>(text, name);
  tokens_.clear();
  pos_ = 0;
  finalized_ = false;
}

bool Lexer::readNextLine(State& state) {
  state.line.clear();
  if (!state.src->getline(state.line)) { return false; }
  ++state.lineNo;
  state.index = 0;
  // Handle CRLF
  if (!state.line.empty() && state.line.back() == '\r') { state.line.pop_back(); }
  if (state.lineNo == 1 && support::StartsWith(state.line, "\xEF\xBB\xBF")) { state.line.erase(0, 3); }
  return true;
}

void Lexer::emit(State& state, const TokenKind kind, const size_t start, const size_t end) {
  Token tok;
  tok.kind = kind;
  tok.text = state.line.substr(start, end - start);
  tok.file = state.src->name();
  tok.line = state.lineNo;
  tok.col = static_cast<int>(start + 1);
  tokens_.push_back(std::move(tok));
  state.logicalOpen = true;
}

// Returns true when the line carries no tokens (blank or comment-only).
// Each level is measured twice, with tab size 8 and tab size 1; the two
// measurements must order the line the same way against the stack.
bool Lexer::emitIndentTokens(State& state) {
  const auto& line = state.line;
  size_t idx = 0;
  size_t col = 0;
  size_t altCol = 0;
  while (idx < line.size()) {
    const char chr = line[idx];
    if (chr == ' ') { ++col; ++altCol; }
    else if (chr == '\t') { col = (col / kTabSize + 1) * kTabSize; ++altCol; }
    else if (chr == '\f') { col = 0; altCol = 0; }
    else { break; }
    ++idx;
  }
  if (idx >= line.size() || line[idx] == '#') { return true; }
  state.index = idx;
  auto makeTok = [&](TokenKind kind, const char* text) {
    Token tok; tok.kind = kind; tok.text = text; tok.file = state.src->name(); tok.line = state.lineNo; tok.col = static_cast<int>(idx + 1);
    return tok;
  };
  auto tabError = [&]() {
    return ParseError("inconsistent use of tabs and spaces in indentation", state.lineNo, static_cast<int>(idx + 1));
  };
  if (col == state.indentStack.back()) {
    if (altCol != state.altIndentStack.back()) { throw tabError(); }
    return false;
  }
  if (col > state.indentStack.back()) {
    if (altCol <= state.altIndentStack.back()) { throw tabError(); }
    if (state.indentStack.size() > kMaxIndentDepth) {
      throw ParseError("too many levels of indentation", state.lineNo, static_cast<int>(idx + 1));
    }
    state.indentStack.push_back(col);
    state.altIndentStack.push_back(altCol);
    tokens_.push_back(makeTok(TokenKind::Indent, "<INDENT>"));
    return false;
  }
  while (col < state.indentStack.back()) {
    state.indentStack.pop_back();
    state.altIndentStack.pop_back();
    tokens_.push_back(makeTok(TokenKind::Dedent, "<DEDENT>"));
  }
  if (col != state.indentStack.back()) {
    throw ParseError("unindent does not match any outer indentation level", state.lineNo, static_cast<int>(idx + 1));
  }
  if (altCol != state.altIndentStack.back()) { throw tabError(); }
  return false;
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
Token Lexer::scanString(State& state, const size_t start, const size_t quotePos, const bool isBytes, const bool isFString) {
  const char quote = state.line[quotePos];
  const bool triple = quotePos + 2 < state.line.size() && state.line[quotePos + 1] == quote && state.line[quotePos + 2] == quote;
  const int startLine = state.lineNo;
  const int startCol = static_cast<int>(start + 1);
  const size_t openLen = triple ? 3 : 1;
  std::string text = state.line.substr(start, quotePos - start + openLen);
  size_t idx = quotePos + openLen;
  int braceDepth = 0;

  auto unterminated = [&]() {
    const std::string what = triple ? "unterminated triple-quoted string literal" : "unterminated string literal";
    return ParseError(what + " (detected at line " + std::to_string(state.lineNo) + ")", startLine, startCol);
  };
  auto pullLine = [&]() {
    if (!readNextLine(state)) { throw unterminated(); }
    text.push_back('\n');
    idx = 0;
  };

  while (true) {
    const auto& line = state.line;
    if (idx >= line.size()) {
      if (!triple) { throw unterminated(); }
      pullLine();
      continue;
    }
    const char chr = line[idx];
    if (chr == '\\') {
      text.push_back(chr);
      if (idx + 1 < line.size()) { text.push_back(line[idx + 1]); idx += 2; continue; }
      // escaped newline: the literal continues on the next physical line
      pullLine();
      continue;
    }
    if (isFString) {
      if (chr == '{') {
        if (braceDepth == 0 && idx + 1 < line.size() && line[idx + 1] == '{') { text += "{{"; idx += 2; continue; }
        ++braceDepth; text.push_back(chr); ++idx; continue;
      }
      if (chr == '}' && braceDepth > 0) { --braceDepth; text.push_back(chr); ++idx; continue; }
      if (braceDepth > 0 && (chr == '"' || chr == '\'')) {
        // nested literal inside a replacement field
        size_t end = idx + 1;
        while (end < line.size() && line[end] != chr) { end += (line[end] == '\\') ? 2 : 1; }
        if (end < line.size()) {
          text.append(line, idx, end - idx + 1);
          idx = end + 1;
          continue;
        }
      }
    }
    if (chr == quote) {
      if (!triple) { text.push_back(chr); ++idx; break; }
      if (idx + 2 < line.size() && line[idx + 1] == quote && line[idx + 2] == quote) {
        text.append(3, quote); idx += 3; break;
      }
    }
    text.push_back(chr);
    ++idx;
  }
  state.index = idx;
  Token tok;
  tok.kind = isFString ? TokenKind::FString : (isBytes ? TokenKind::Bytes : TokenKind::String);
  tok.text = std::move(text);
  tok.file = state.src->name();
  tok.line = startLine;
  tok.col = startCol;
  return tok;
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
Token Lexer::scanNumber(State& state) {
  const auto& line = state.line;
  const size_t start = state.index;
  auto scanDigits = [&](size_t pos, auto isOk) {
    size_t idx = pos; bool have = false; bool prevUnderscore = false;
    while (idx < line.size()) {
      const char chr = line[idx];
      if (isOk(chr)) { have = true; prevUnderscore = false; ++idx; continue; }
      if (chr == '_' && have && !prevUnderscore) { prevUnderscore = true; ++idx; continue; }
      break;
    }
    if (prevUnderscore) { --idx; }
    return idx;
  };
  auto isDec = [](char chr) { return isDigit(chr); };
  auto isHex = [](char chr) { return std::isxdigit(static_cast<unsigned char>(chr)) != 0; };
  auto isOct = [](char chr) { return chr >= '0' && chr <= '7'; };
  auto isBin = [](char chr) { return chr == '0' || chr == '1'; };
  auto scanExponent = [&](size_t pos) {
    if (pos >= line.size() || (line[pos] != 'e' && line[pos] != 'E')) { return pos; }
    size_t idx = pos + 1;
    if (idx < line.size() && (line[idx] == '+' || line[idx] == '-')) { ++idx; }
    const size_t end = scanDigits(idx, isDec);
    return end == idx ? pos : end;
  };

  TokenKind kind = TokenKind::Int;
  size_t end = start;
  if (line[start] == '0' && start + 1 < line.size() && std::string_view("xXoObB").find(line[start + 1]) != std::string_view::npos) {
    const char marker = line[start + 1];
    // one underscore may separate the base prefix from the digits: 0x_ff
    const size_t digits = (start + 2 < line.size() && line[start + 2] == '_') ? start + 3 : start + 2;
    if (marker == 'x' || marker == 'X') { end = scanDigits(digits, isHex); }
    else if (marker == 'o' || marker == 'O') { end = scanDigits(digits, isOct); }
    else { end = scanDigits(digits, isBin); }
    if (end == digits) { throw ParseError("invalid number literal", state.lineNo, static_cast<int>(start + 1)); }
  } else {
    end = line[start] == '.' ? start : scanDigits(start, isDec);
    if (end < line.size() && line[end] == '.') {
      kind = TokenKind::Float;
      end = scanDigits(end + 1, isDec);
    }
    const size_t expEnd = scanExponent(end);
    if (expEnd != end) { kind = TokenKind::Float; end = expEnd; }
    if (end < line.size() && (line[end] == 'j' || line[end] == 'J')) { kind = TokenKind::Imag; ++end; }
    if (kind == TokenKind::Int && line[start] == '0' &&
        line.find_first_not_of("0_", start) < end) {
      throw ParseError("leading zeros in decimal integer literals are not permitted; use an 0o prefix for octal integers",
                       state.lineNo, static_cast<int>(start + 1));
    }
  }
  if (end < line.size() && isAsciiIdentChar(line[end])) {
    // "1if x else y" is legal; "1abc" is not
    size_t wordEnd = end;
    while (wordEnd < line.size() && isAsciiIdentChar(line[wordEnd])) { ++wordEnd; }
    const auto word = std::string_view(line).substr(end, wordEnd - end);
    if (identKind(word) == TokenKind::Ident || word == "None" || word == "True" || word == "False") {
      throw ParseError("invalid decimal literal", state.lineNo, static_cast<int>(start + 1));
    }
  }
  Token tok;
  tok.kind = kind;
  tok.text = line.substr(start, end - start);
  tok.file = state.src->name();
  tok.line = state.lineNo;
  tok.col = static_cast<int>(start + 1);
  state.index = end;
  return tok;
}

Token Lexer::scanIdentifier(State& state) {
  const auto& line = state.line;
  const size_t start = state.index;
  size_t idx = start;
  bool nonAscii = false;
  while (idx < line.size()) {
    const char chr = line[idx];
    const bool first = idx == start;
    if (static_cast<unsigned char>(chr) < 0x80U) {
      if (first ? isAsciiIdentStart(chr) : isAsciiIdentChar(chr)) { ++idx; continue; }
      break;
    }
    size_t next = idx;
    char32_t codePoint = 0;
    if (!support::DecodeUtf8(line, next, codePoint)) {
      throw ParseError("invalid UTF-8 in source", state.lineNo, static_cast<int>(idx + 1));
    }
    const UProperty prop = first ? UCHAR_XID_START : UCHAR_XID_CONTINUE;
    if (u_hasBinaryProperty(static_cast<UChar32>(codePoint), prop) == 0) {
      if (first) {
        throw ParseError("invalid character '" + line.substr(idx, next - idx) + "' (" + codePointLabel(codePoint) + ")",
                         state.lineNo, static_cast<int>(idx + 1));
      }
      break;
    }
    nonAscii = true;
    idx = next;
  }
  Token tok;
  tok.text = line.substr(start, idx - start);
  if (nonAscii) { tok.text = nfkc(tok.text); }
  tok.kind = identKind(tok.text);
  tok.file = state.src->name();
  tok.line = state.lineNo;
  tok.col = static_cast<int>(start + 1);
  state.index = idx;
  return tok;
}

bool Lexer::scanOperator(State& state) {
  const std::string_view rest = std::string_view(state.line).substr(state.index);
  for (const auto& op : kOperators) {
    if (!support::StartsWith(rest, op.text)) { continue; }
    const size_t start = state.index;
    if (op.kind == TokenKind::LParen || op.kind == TokenKind::LBracket || op.kind == TokenKind::LBrace) {
      if (state.brackets.size() >= kMaxBracketDepth) {
        throw ParseError("too many nested parentheses", state.lineNo, static_cast<int>(start + 1));
      }
      emit(state, op.kind, start, start + op.text.size());
      state.brackets.push_back(tokens_.back());
    } else if (isCloser(op.kind)) {
      if (state.brackets.empty()) {
        throw ParseError("unmatched '" + std::string(op.text) + "'", state.lineNo, static_cast<int>(start + 1));
      }
      const Token& opener = state.brackets.back();
      if (closerFor(opener.kind) != op.kind) {
        throw ParseError("closing parenthesis '" + std::string(op.text) + "' does not match opening parenthesis '" + opener.text + "'",
                         state.lineNo, static_cast<int>(start + 1));
      }
      state.brackets.pop_back();
      emit(state, op.kind, start, start + op.text.size());
    } else {
      emit(state, op.kind, start, start + op.text.size());
    }
    state.index = start + op.text.size();
    return true;
  }
  return false;
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
void Lexer::scanLine(State& state) {
  auto push = [&](Token tok) { tokens_.push_back(std::move(tok)); state.logicalOpen = true; };
  while (state.index < state.line.size()) {
    const auto& line = state.line;
    const size_t idx = state.index;
    const char chr = line[idx];
    if (chr == ' ' || chr == '\t' || chr == '\f') { ++state.index; continue; }
    if (chr == '#') { state.index = line.size(); return; }
    if (chr == '\\') {
      if (idx + 1 == line.size()) { state.continuation = true; state.index = line.size(); return; }
      throw ParseError("unexpected character after line continuation character", state.lineNo, static_cast<int>(idx + 1));
    }
    if (chr == '"' || chr == '\'') { push(scanString(state, idx, idx, false, false)); continue; }
    if (isAsciiIdentStart(chr) || static_cast<unsigned char>(chr) >= 0x80U) {
      // string prefixes: r u b f and the two-letter br/rb/fr/rf combinations
      size_t pos = idx; bool hasB = false; bool hasF = false; bool hasU = false; bool hasR = false;
      while (pos < line.size() && pos - idx < 2) {
        const char low = static_cast<char>(std::tolower(static_cast<unsigned char>(line[pos])));
        if (low == 'b') { hasB = true; } else if (low == 'f') { hasF = true; }
        else if (low == 'u') { hasU = true; } else if (low == 'r') { hasR = true; }
        else { break; }
        ++pos;
      }
      const size_t prefixLen = pos - idx;
      const bool validPrefix = prefixLen == 1 || (prefixLen == 2 && hasR && !hasU && (hasB != hasF));
      if (prefixLen > 0 && validPrefix && pos < line.size() && (line[pos] == '"' || line[pos] == '\'')) {
        push(scanString(state, idx, pos, hasB, hasF));
        continue;
      }
      push(scanIdentifier(state));
      continue;
    }
    if (isDigit(chr) || (chr == '.' && idx + 1 < line.size() && isDigit(line[idx + 1]))) {
      push(scanNumber(state));
      continue;
    }
    if (scanOperator(state)) { continue; }
    throw ParseError(std::string("invalid character '") + chr + "'", state.lineNo, static_cast<int>(idx + 1));
  }
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
void Lexer::buildAll() {
  if (finalized_) { return; }
  finalized_ = true;
  State& state = state_;
  std::string fileName;
  if (state.src) {
    fileName = state.src->name();
    while (readNextLine(state)) {
      if (!state.continuation && state.brackets.empty()) {
        if (emitIndentTokens(state)) { continue; }
      }
      state.continuation = false;
      scanLine(state);
      if (state.continuation) { continue; }
      if (state.brackets.empty() && state.logicalOpen) {
        Token newlineTok; newlineTok.kind = TokenKind::Newline; newlineTok.text = "\n"; newlineTok.file = fileName; newlineTok.line = state.lineNo; newlineTok.col = static_cast<int>(state.line.size() + 1);
        tokens_.push_back(std::move(newlineTok));
        state.logicalOpen = false;
      }
    }
    if (!state.brackets.empty()) {
      const Token& opener = state.brackets.back();
      throw ParseError("'" + opener.text + "' was never closed", opener.line, opener.col);
    }
    if (state.continuation) {
      throw ParseError("unexpected EOF while parsing", state.lineNo, static_cast<int>(state.line.size() + 1));
    }
    // flush dedents
    while (state.indentStack.size() > 1) {
      state.indentStack.pop_back();
      Token ded; ded.kind = TokenKind::Dedent; ded.text = "<DEDENT>"; ded.file = fileName; ded.line = state.lineNo + 1; ded.col = 1;
      tokens_.push_back(std::move(ded));
    }
  }
  // Final EOF
  Token eof; eof.kind = TokenKind::End; eof.text = "<EOF>"; eof.file = fileName; eof.line = state.lineNo > 0 ? state.lineNo : 1; eof.col = 1;
  tokens_.push_back(std::move(eof));
}

const Token& Lexer::peek(size_t lookahead) {
  if (!finalized_) { buildAll(); }
  if (pos_ + lookahead < tokens_.size()) {
    return tokens_[pos_ + lookahead];
  }
  return tokens_.back();
}

Token Lexer::next() {
  if (!finalized_) { buildAll(); }
  if (pos_ < tokens_.size()) {
    return tokens_[pos_++];
  }
  return tokens_.back();
}

std::vector<Token> Lexer::tokens() {
  if (!finalized_) { buildAll(); }
  return tokens_;
}

} // namespace pyspect::lex
