/***
 * Name: pyspect::parse::Parser (impl)
 * Purpose: Token buffer helpers and the statement grammar.
 */
#include "parser/Parser.h"
#include "pyspect/exceptions/parse_error.h"

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace pyspect::parse {

using TK = lex::TokenKind;
using exceptions::ParseError;

void Parser::initBuffer() {
  if (initialized_) return;
  // Take the full token vector when backed by Lexer; otherwise, drain
  if (auto* lx = dynamic_cast<lex::Lexer*>(&ts_)) {
    tokens_ = lx->tokens();
  } else {
    tokens_.clear();
    for (;;) {
      auto t = ts_.next();
      tokens_.push_back(t);
      if (t.kind == TK::End) break;
    }
  }
  if (tokens_.empty() || tokens_.back().kind != TK::End) {
    lex::Token eof;
    eof.kind = TK::End;
    tokens_.push_back(eof);
  }
  pos_ = 0;
  initialized_ = true;
}

const lex::Token& Parser::peek() const {
  // Safe in presence of End sentry
  return tokens_[pos_ < tokens_.size() ? pos_ : (tokens_.size() - 1)];
}
const lex::Token& Parser::peekNext() const { return peekAt(1); }
const lex::Token& Parser::peekAt(const size_t offset) const {
  const size_t idx = pos_ + offset;
  return tokens_[idx < tokens_.size() ? idx : (tokens_.size() - 1)];
}
lex::Token Parser::get() {
  if (pos_ < tokens_.size()) {
    return tokens_[pos_++];
  }
  return tokens_.back();
}

bool Parser::match(TK tokenKind) {
  if (peek().kind == tokenKind) { (void)get(); return true; }
  return false;
}

lex::Token Parser::expect(TK tokenKind, const char* msg) {
  if (peek().kind != tokenKind) { fail(msg); }
  return get();
}

bool Parser::atSoftKeyword(const char* word) const {
  return peek().kind == TK::Ident && peek().text == word;
}

bool Parser::atStatementEnd() const {
  const auto kind = peek().kind;
  return kind == TK::Newline || kind == TK::Semicolon || kind == TK::End;
}

Parser::DepthGuard::DepthGuard(Parser& parser, const lex::Token& at) : depth_(parser.depth_) { extend(at); }

void Parser::DepthGuard::extend(const lex::Token& at) {
  if (depth_ >= kMaxNestingDepth) { failAt(at, "too many nested expressions"); }
  ++depth_;
  ++levels_;
}

void Parser::fail(const std::string& msg) const { failAt(peek(), msg); }

void Parser::failAt(const lex::Token& tok, const std::string& msg) {
  throw ParseError(msg, tok.line, tok.col);
}

void Parser::failAt(const ast::Node& node, const std::string& msg) {
  throw ParseError(msg, node.line, node.col);
}

std::unique_ptr<ast::Module> Parser::parseModule() {
  initBuffer();
  auto module = std::make_unique<ast::Module>();
  module->line = 1;
  module->col = 1;
  while (peek().kind != TK::End) {
    if (match(TK::Newline)) { continue; }
    parseStatementInto(module->body);
  }
  return module;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void Parser::parseStatementInto(StmtList& out) {
  const lex::Token& tok = peek();
  const DepthGuard guard(*this, tok);
  switch (tok.kind) {
    case TK::Indent: fail("unexpected indent");
    case TK::Dedent: fail("unindent does not match any outer indentation level");
    case TK::If: out.push_back(parseIfStmt()); return;
    case TK::While: out.push_back(parseWhileStmt()); return;
    case TK::For: out.push_back(parseForStmt()); return;
    case TK::Try: out.push_back(parseTryStmt()); return;
    case TK::With: out.push_back(parseWithStmt()); return;
    case TK::Def: out.push_back(parseFunction({})); return;
    case TK::Class: out.push_back(parseClass({})); return;
    case TK::At: out.push_back(parseDecorated()); return;
    case TK::Async: {
      const auto next = peekNext().kind;
      if (next == TK::Def) { out.push_back(parseFunction({})); return; }
      if (next == TK::For) { out.push_back(parseForStmt()); return; }
      if (next == TK::With) { out.push_back(parseWithStmt()); return; }
      failAt(peekNext(), "invalid syntax");
    }
    case TK::Ident:
      if (atSoftKeyword("match")) {
        if (auto stmt = tryParseMatchStmt()) { out.push_back(std::move(stmt)); return; }
      }
      break;
    default: break;
  }
  parseSimpleStatementsInto(out);
}

void Parser::parseSimpleStatementsInto(StmtList& out) {
  out.push_back(parseSimpleStatement());
  while (match(TK::Semicolon)) {
    if (peek().kind == TK::Newline || peek().kind == TK::End) { break; }
    out.push_back(parseSimpleStatement());
  }
  if (!match(TK::Newline) && peek().kind != TK::End) { fail("invalid syntax"); }
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Stmt> Parser::parseSimpleStatement() {
  const lex::Token tok = peek();
  switch (tok.kind) {
    case TK::Pass: get(); return makeAt<ast::PassStmt>(tok);
    case TK::Break: get(); return makeAt<ast::BreakStmt>(tok);
    case TK::Continue: get(); return makeAt<ast::ContinueStmt>(tok);
    case TK::Return: {
      get();
      ExprPtr value;
      if (!atStatementEnd()) { value = parseStarExpressions(); }
      return makeAt<ast::ReturnStmt>(tok, std::move(value));
    }
    case TK::Raise: return parseRaiseStmt();
    case TK::Global: return parseGlobalStmt(false);
    case TK::Nonlocal: return parseGlobalStmt(true);
    case TK::Del: return parseDelStmt();
    case TK::Assert: return parseAssertStmt();
    case TK::Import: return parseImportStmt();
    case TK::From: return parseFromImportStmt();
    case TK::Ident:
      if (atSoftKeyword("type") && peekNext().kind == TK::Ident &&
          (peekAt(2).kind == TK::Equal || peekAt(2).kind == TK::LBracket)) {
        return parseTypeAliasStmt();
      }
      break;
    default: break;
  }
  return parseExprOrAssignStmt();
}

namespace {

ast::BinaryOperator augOperator(const TK kind) {
  switch (kind) {
    case TK::PlusEqual: return ast::BinaryOperator::Add;
    case TK::MinusEqual: return ast::BinaryOperator::Sub;
    case TK::StarEqual: return ast::BinaryOperator::Mul;
    case TK::AtEqual: return ast::BinaryOperator::MatMul;
    case TK::SlashEqual: return ast::BinaryOperator::Div;
    case TK::PercentEqual: return ast::BinaryOperator::Mod;
    case TK::SlashSlashEqual: return ast::BinaryOperator::FloorDiv;
    case TK::StarStarEqual: return ast::BinaryOperator::Pow;
    case TK::LShiftEqual: return ast::BinaryOperator::LShift;
    case TK::RShiftEqual: return ast::BinaryOperator::RShift;
    case TK::AmpEqual: return ast::BinaryOperator::BitAnd;
    case TK::PipeEqual: return ast::BinaryOperator::BitOr;
    default: return ast::BinaryOperator::BitXor;
  }
}

bool isSingleTarget(const ast::Expr& expr) {
  return expr.kind == ast::NodeKind::Name || expr.kind == ast::NodeKind::Attribute || expr.kind == ast::NodeKind::Subscript;
}

} // namespace

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Stmt> Parser::parseExprOrAssignStmt() {
  const lex::Token start = peek();
  auto readValue = [this]() { return peek().kind == TK::Yield ? parseYieldExpr() : parseStarExpressions(); };
  ExprPtr first = readValue();

  if (peek().kind == TK::Colon) {
    get();
    if (first->kind == ast::NodeKind::TupleLiteral) { failAt(*first, "only single target (not tuple) can be annotated"); }
    if (first->kind == ast::NodeKind::ListLiteral) { failAt(*first, "only single target (not list) can be annotated"); }
    if (!isSingleTarget(*first)) { failAt(*first, "illegal target for annotation"); }
    auto stmt = makeAt<ast::AnnAssignStmt>(start);
    stmt->target = std::move(first);
    stmt->annotation = parseExpr();
    if (match(TK::Equal)) { stmt->value = readValue(); }
    return stmt;
  }

  if (lex::isAugAssign(peek().kind)) {
    const auto opTok = get();
    checkAugTarget(*first);
    ExprPtr value = readValue();
    return makeAt<ast::AugAssignStmt>(start, std::move(first), augOperator(opTok.kind), std::move(value));
  }

  if (peek().kind == TK::Equal) {
    auto stmt = makeAt<ast::AssignStmt>(start);
    std::vector<ExprPtr> chain;
    chain.push_back(std::move(first));
    while (match(TK::Equal)) { chain.push_back(readValue()); }
    stmt->value = std::move(chain.back());
    chain.pop_back();
    for (const auto& target : chain) { checkAssignTarget(*target, true); }
    stmt->targets = std::move(chain);
    return stmt;
  }

  if (first->kind == ast::NodeKind::Starred) { failAt(*first, "can't use starred expression here"); }
  return makeAt<ast::ExprStmt>(start, std::move(first));
}

void Parser::parseBlockInto(StmtList& out, const std::string& owner, const int ownerLine) {
  expect(TK::Colon, "expected ':'");
  if (match(TK::Newline)) {
    if (peek().kind != TK::Indent) {
      fail("expected an indented block after " + owner + " on line " + std::to_string(ownerLine));
    }
    get();
    while (peek().kind != TK::Dedent && peek().kind != TK::End) { parseStatementInto(out); }
    match(TK::Dedent);
    return;
  }
  parseSimpleStatementsInto(out);
}

namespace {

std::string dottedName(const std::vector<lex::Token>& parts) {
  std::string out;
  for (const auto& part : parts) {
    if (!out.empty()) { out += "."; }
    out += part.text;
  }
  return out;
}

} // namespace

std::unique_ptr<ast::Stmt> Parser::parseImportStmt() {
  const auto start = get();
  auto stmt = makeAt<ast::Import>(start);
  do {
    const lex::Token nameTok = peek();
    std::vector<lex::Token> parts{expect(TK::Ident, "invalid syntax")};
    while (match(TK::Dot)) { parts.push_back(expect(TK::Ident, "invalid syntax")); }
    auto alias = makeAt<ast::Alias>(nameTok, dottedName(parts), std::string());
    if (match(TK::As)) { alias->asname = expect(TK::Ident, "invalid syntax").text; }
    stmt->names.push_back(std::move(alias));
  } while (match(TK::Comma));
  return stmt;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Stmt> Parser::parseFromImportStmt() {
  const auto start = get();
  auto stmt = makeAt<ast::ImportFrom>(start);
  while (peek().kind == TK::Dot || peek().kind == TK::Ellipsis) {
    stmt->level += peek().kind == TK::Dot ? 1 : 3;
    get();
  }
  if (peek().kind == TK::Ident) {
    std::vector<lex::Token> parts{get()};
    while (match(TK::Dot)) { parts.push_back(expect(TK::Ident, "invalid syntax")); }
    stmt->module = dottedName(parts);
  }
  if (stmt->level == 0 && stmt->module.empty()) { fail("invalid syntax"); }
  expect(TK::Import, "invalid syntax");
  if (peek().kind == TK::Star) {
    const auto star = get();
    stmt->names.push_back(makeAt<ast::Alias>(star, "*", std::string()));
    return stmt;
  }
  const bool paren = match(TK::LParen);
  do {
    if (paren && peek().kind == TK::RParen) { break; }
    if (!paren && atStatementEnd() && !stmt->names.empty()) {
      fail("trailing comma not allowed without surrounding parentheses");
    }
    const auto nameTok = expect(TK::Ident, "invalid syntax");
    auto alias = makeAt<ast::Alias>(nameTok, nameTok.text, std::string());
    if (match(TK::As)) { alias->asname = expect(TK::Ident, "invalid syntax").text; }
    stmt->names.push_back(std::move(alias));
  } while (match(TK::Comma));
  if (paren) { expect(TK::RParen, "invalid syntax"); }
  if (stmt->names.empty()) { fail("invalid syntax"); }
  return stmt;
}

std::unique_ptr<ast::Stmt> Parser::parseRaiseStmt() {
  const auto start = get();
  auto stmt = makeAt<ast::RaiseStmt>(start);
  if (!atStatementEnd()) {
    stmt->exc = parseExpr();
    if (match(TK::From)) { stmt->cause = parseExpr(); }
  }
  return stmt;
}

std::unique_ptr<ast::Stmt> Parser::parseGlobalStmt(const bool isNonlocal) {
  const auto start = get();
  std::vector<std::string> names;
  do {
    names.push_back(expect(TK::Ident, "invalid syntax").text);
  } while (match(TK::Comma));
  if (isNonlocal) {
    auto stmt = makeAt<ast::NonlocalStmt>(start);
    stmt->names = std::move(names);
    return stmt;
  }
  auto stmt = makeAt<ast::GlobalStmt>(start);
  stmt->names = std::move(names);
  return stmt;
}

std::unique_ptr<ast::Stmt> Parser::parseDelStmt() {
  const auto start = get();
  auto stmt = makeAt<ast::DelStmt>(start);
  do {
    if (atStatementEnd() && !stmt->targets.empty()) { break; }
    auto target = parseBitwiseOr();
    checkDelTarget(*target);
    stmt->targets.push_back(std::move(target));
  } while (match(TK::Comma));
  return stmt;
}

std::unique_ptr<ast::Stmt> Parser::parseAssertStmt() {
  const auto start = get();
  auto stmt = makeAt<ast::AssertStmt>(start);
  stmt->test = parseExpr();
  if (match(TK::Comma)) { stmt->msg = parseExpr(); }
  return stmt;
}

std::unique_ptr<ast::Stmt> Parser::parseTypeAliasStmt() {
  const auto start = get(); // soft keyword 'type'
  auto stmt = makeAt<ast::TypeAliasStmt>(start);
  const auto nameTok = get();
  stmt->name = makeAt<ast::Name>(nameTok, nameTok.text);
  if (peek().kind == TK::LBracket) { stmt->typeParams = skipTypeParams(); }
  expect(TK::Equal, "invalid syntax");
  stmt->value = parseExpr();
  return stmt;
}

std::string Parser::skipTypeParams() {
  std::string text;
  int depth = 0;
  do {
    const auto tok = get();
    if (tok.kind == TK::End) { failAt(tok, "invalid syntax"); }
    if (tok.kind == TK::LBracket || tok.kind == TK::LParen) { ++depth; }
    if (tok.kind == TK::RBracket || tok.kind == TK::RParen) { --depth; }
    text += tok.text;
    if (tok.kind == TK::Comma || tok.kind == TK::Colon) { text += " "; }
  } while (depth > 0);
  return text;
}

std::unique_ptr<ast::Stmt> Parser::parseIfStmt() {
  const DepthGuard guard(*this, peek());
  const auto start = get(); // 'if' or 'elif'
  const std::string owner = start.kind == TK::Elif ? "'elif' statement" : "'if' statement";
  auto stmt = makeAt<ast::IfStmt>(start, parseNamedExpr());
  parseBlockInto(stmt->thenBody, owner, start.line);
  if (peek().kind == TK::Elif) {
    stmt->elseBody.push_back(parseIfStmt());
  } else if (peek().kind == TK::Else) {
    const auto elseTok = get();
    parseBlockInto(stmt->elseBody, "'else' statement", elseTok.line);
  }
  return stmt;
}

std::unique_ptr<ast::Stmt> Parser::parseWhileStmt() {
  const auto start = get();
  auto stmt = makeAt<ast::WhileStmt>(start, parseNamedExpr());
  parseBlockInto(stmt->thenBody, "'while' statement", start.line);
  if (peek().kind == TK::Else) {
    const auto elseTok = get();
    parseBlockInto(stmt->elseBody, "'else' statement", elseTok.line);
  }
  return stmt;
}

std::unique_ptr<ast::Stmt> Parser::parseForStmt() {
  const lex::Token start = peek();
  const bool isAsync = match(TK::Async);
  expect(TK::For, "invalid syntax");
  auto target = parseTargetList(TK::In);
  checkAssignTarget(*target, false);
  expect(TK::In, "invalid syntax");
  auto iterable = parseStarExpressions();
  auto stmt = makeAt<ast::ForStmt>(start, std::move(target), std::move(iterable));
  stmt->isAsync = isAsync;
  parseBlockInto(stmt->thenBody, "'for' statement", start.line);
  if (peek().kind == TK::Else) {
    const auto elseTok = get();
    parseBlockInto(stmt->elseBody, "'else' statement", elseTok.line);
  }
  return stmt;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Stmt> Parser::parseTryStmt() {
  const auto start = get();
  auto stmt = makeAt<ast::TryStmt>(start);
  parseBlockInto(stmt->body, "'try' statement", start.line);
  bool sawPlain = false;
  while (peek().kind == TK::Except) {
    const auto exTok = get();
    const bool star = match(TK::Star);
    if ((star && sawPlain) || (!star && stmt->isStar)) {
      failAt(exTok, "cannot have both 'except' and 'except*' on the same 'try'");
    }
    if (star) { stmt->isStar = true; } else { sawPlain = true; }
    auto handler = makeAt<ast::ExceptHandler>(exTok);
    if (peek().kind != TK::Colon) {
      handler->type = parseExpr();
      if (peek().kind == TK::Comma) { failAt(*handler->type, "multiple exception types must be parenthesized"); }
      if (match(TK::As)) { handler->name = expect(TK::Ident, "invalid syntax").text; }
    } else if (star) {
      fail("expected one or more exception types");
    }
    parseBlockInto(handler->body, star ? "'except*' statement" : "'except' statement", exTok.line);
    stmt->handlers.push_back(std::move(handler));
  }
  if (peek().kind == TK::Else) {
    if (stmt->handlers.empty()) { fail("expected 'except' or 'finally' block"); }
    const auto elseTok = get();
    parseBlockInto(stmt->orelse, "'else' statement", elseTok.line);
  }
  if (peek().kind == TK::Finally) {
    const auto finTok = get();
    parseBlockInto(stmt->finalbody, "'finally' statement", finTok.line);
  }
  if (stmt->handlers.empty() && stmt->finalbody.empty()) { fail("expected 'except' or 'finally' block"); }
  return stmt;
}

std::unique_ptr<ast::Stmt> Parser::parseWithStmt() {
  const lex::Token start = peek();
  const bool isAsync = match(TK::Async);
  expect(TK::With, "invalid syntax");
  auto stmt = makeAt<ast::WithStmt>(start);
  stmt->isAsync = isAsync;
  if (peek().kind != TK::LParen || !tryParseParenthesizedWithItems(*stmt)) {
    do {
      stmt->items.push_back(parseWithItem());
    } while (match(TK::Comma));
  }
  parseBlockInto(stmt->body, "'with' statement", start.line);
  return stmt;
}

// with (a as b, c as d): ... is only a group of items when ':' follows the ')'.
bool Parser::tryParseParenthesizedWithItems(ast::WithStmt& stmt) {
  const size_t mark = pos_;
  try {
    get(); // '('
    std::vector<std::unique_ptr<ast::WithItem>> items;
    do {
      if (peek().kind == TK::RParen) { break; }
      items.push_back(parseWithItem());
    } while (match(TK::Comma));
    if (items.empty() || !match(TK::RParen) || peek().kind != TK::Colon) {
      pos_ = mark;
      return false;
    }
    stmt.items = std::move(items);
    return true;
  } catch (const ParseError&) {
    pos_ = mark;
    return false;
  }
}

std::unique_ptr<ast::WithItem> Parser::parseWithItem() {
  auto item = makeAt<ast::WithItem>(peek());
  item->context = parseExpr();
  if (match(TK::As)) {
    item->optionalVars = parseBitwiseOr();
    checkAssignTarget(*item->optionalVars, false);
  }
  return item;
}

std::unique_ptr<ast::Stmt> Parser::parseDecorated() {
  std::vector<ExprPtr> decorators;
  while (match(TK::At)) {
    decorators.push_back(parseNamedExpr());
    expect(TK::Newline, "invalid syntax");
  }
  if (peek().kind == TK::Def || (peek().kind == TK::Async && peekNext().kind == TK::Def)) {
    return parseFunction(std::move(decorators));
  }
  if (peek().kind == TK::Class) { return parseClass(std::move(decorators)); }
  fail("invalid syntax");
}

std::unique_ptr<ast::Stmt> Parser::parseFunction(std::vector<ExprPtr> decorators) {
  const lex::Token start = peek();
  const bool isAsync = match(TK::Async);
  expect(TK::Def, "invalid syntax");
  const auto nameTok = expect(TK::Ident, "invalid syntax");
  auto def = makeAt<ast::FunctionDef>(start, nameTok.text);
  def->isAsync = isAsync;
  def->decorators = std::move(decorators);
  if (peek().kind == TK::LBracket) { (void)skipTypeParams(); }
  expect(TK::LParen, "expected '('");
  parseParamList(def->params, TK::RParen, true);
  expect(TK::RParen, "invalid syntax");
  if (match(TK::Arrow)) { def->returns = parseExpr(); }
  parseBlockInto(def->body, "function definition", start.line);
  return def;
}

std::unique_ptr<ast::Stmt> Parser::parseClass(std::vector<ExprPtr> decorators) {
  const auto start = get();
  const auto nameTok = expect(TK::Ident, "invalid syntax");
  auto cls = makeAt<ast::ClassDef>(start, nameTok.text);
  cls->decorators = std::move(decorators);
  if (peek().kind == TK::LBracket) { (void)skipTypeParams(); }
  if (match(TK::LParen)) {
    ast::Call args(nullptr);
    parseCallArgs(args);
    cls->bases = std::move(args.args);
    cls->keywords = std::move(args.keywords);
  }
  parseBlockInto(cls->body, "class definition", start.line);
  return cls;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void Parser::parseParamList(std::vector<ast::Param>& outParams, const TK closer, const bool allowAnnotations) {
  bool sawDefault = false;
  bool sawSlash = false;
  bool sawStar = false;
  bool sawKwVar = false;
  bool needKwOnly = false;
  lex::Token starTok;
  auto annotation = [&](ast::Param& param) {
    if (allowAnnotations && match(TK::Colon)) {
      const lex::Token annTok = peek();
      if (match(TK::Star)) {
        param.annotation = makeAt<ast::Starred>(annTok, parseExpr());
      } else {
        param.annotation = parseExpr();
      }
    }
  };
  while (peek().kind != closer) {
    const lex::Token tok = peek();
    if (sawKwVar) { failAt(tok, "arguments cannot follow var-keyword argument"); }
    if (match(TK::Slash)) {
      if (sawSlash) { failAt(tok, "/ may appear only once"); }
      if (sawStar) { failAt(tok, "/ must be ahead of *"); }
      if (outParams.empty()) { failAt(tok, "at least one argument must precede /"); }
      sawSlash = true;
      for (auto& param : outParams) { param.isPosOnly = true; }
    } else if (match(TK::Star)) {
      if (sawStar) { failAt(tok, "* argument may appear only once"); }
      sawStar = true;
      starTok = tok;
      if (peek().kind == TK::Ident) {
        ast::Param param;
        const auto nameTok = get();
        param.name = nameTok.text;
        param.line = nameTok.line;
        param.isVarArg = true;
        annotation(param);
        if (peek().kind == TK::Equal) { fail("var-positional argument cannot have default value"); }
        outParams.push_back(std::move(param));
      } else {
        needKwOnly = true;
      }
    } else if (match(TK::StarStar)) {
      if (needKwOnly) { failAt(starTok, "named arguments must follow bare *"); }
      ast::Param param;
      const auto nameTok = expect(TK::Ident, "invalid syntax");
      param.name = nameTok.text;
      param.line = nameTok.line;
      param.isKwVarArg = true;
      annotation(param);
      if (peek().kind == TK::Equal) { fail("var-keyword argument cannot have default value"); }
      sawKwVar = true;
      outParams.push_back(std::move(param));
    } else {
      const auto nameTok = expect(TK::Ident, "invalid syntax");
      ast::Param param;
      param.name = nameTok.text;
      param.line = nameTok.line;
      annotation(param);
      if (match(TK::Equal)) {
        param.defaultValue = parseExpr();
        if (!sawStar) { sawDefault = true; }
      } else if (sawDefault && !sawStar) {
        failAt(nameTok, "parameter without a default follows parameter with a default");
      }
      param.isKwOnly = sawStar;
      needKwOnly = false;
      outParams.push_back(std::move(param));
    }
    if (!match(TK::Comma)) { break; }
  }
  if (needKwOnly) { failAt(starTok, "named arguments must follow bare *"); }
}

// Returns null (and rewinds) when `match` is an ordinary name on this line.
std::unique_ptr<ast::Stmt> Parser::tryParseMatchStmt() {
  const size_t mark = pos_;
  const auto start = get();
  ExprPtr subject;
  try {
    if (!startsExpression(peek().kind)) {
      pos_ = mark;
      return nullptr;
    }
    const lex::Token subjTok = peek();
    subject = parseStarNamedExpression();
    if (peek().kind == TK::Comma) {
      auto tuple = makeAt<ast::TupleLiteral>(subjTok);
      tuple->elements.push_back(std::move(subject));
      while (match(TK::Comma)) {
        if (peek().kind == TK::Colon) { break; }
        tuple->elements.push_back(parseStarNamedExpression());
      }
      subject = std::move(tuple);
    }
  } catch (const ParseError&) {
    pos_ = mark;
    return nullptr;
  }
  if (peek().kind != TK::Colon || peekNext().kind != TK::Newline) {
    pos_ = mark;
    return nullptr;
  }
  get();
  get();
  if (peek().kind != TK::Indent) {
    fail("expected an indented block after 'match' statement on line " + std::to_string(start.line));
  }
  get();
  auto stmt = makeAt<ast::MatchStmt>(start);
  stmt->subject = std::move(subject);
  while (peek().kind != TK::Dedent && peek().kind != TK::End) {
    if (!atSoftKeyword("case")) { fail("invalid syntax"); }
    stmt->cases.push_back(parseMatchCase());
  }
  match(TK::Dedent);
  return stmt;
}

namespace {

bool isOpener(const TK kind) { return kind == TK::LParen || kind == TK::LBracket || kind == TK::LBrace; }
bool isCloser(const TK kind) { return kind == TK::RParen || kind == TK::RBracket || kind == TK::RBrace; }

bool spaceBetween(const lex::Token* prev, const lex::Token& cur) {
  if (prev == nullptr) { return false; }
  if (isOpener(prev->kind) || prev->kind == TK::Dot || prev->kind == TK::Star || prev->kind == TK::StarStar ||
      prev->kind == TK::Equal || prev->kind == TK::Minus) {
    return false;
  }
  if (isCloser(cur.kind) || cur.kind == TK::Comma || cur.kind == TK::Colon || cur.kind == TK::Dot || cur.kind == TK::Equal) {
    return false;
  }
  if ((cur.kind == TK::LParen || cur.kind == TK::LBracket) && (prev->kind == TK::Ident || isCloser(prev->kind))) {
    return false;
  }
  return true;
}

} // namespace

std::unique_ptr<ast::MatchCase> Parser::parseMatchCase() {
  const auto caseTok = get();
  auto mc = makeAt<ast::MatchCase>(caseTok);
  int depth = 0;
  const lex::Token* prev = nullptr;
  while (true) {
    const lex::Token& tok = peek();
    if (tok.kind == TK::End || tok.kind == TK::Newline) { fail("expected ':'"); }
    if (depth == 0 && (tok.kind == TK::If || tok.kind == TK::Colon)) { break; }
    if (isOpener(tok.kind)) { ++depth; }
    if (isCloser(tok.kind)) { --depth; }
    if (spaceBetween(prev, tok)) { mc->pattern += " "; }
    mc->pattern += tok.text;
    prev = &tok;
    get();
  }
  if (mc->pattern.empty()) { fail("invalid syntax"); }
  if (match(TK::If)) { mc->guard = parseNamedExpr(); }
  parseBlockInto(mc->body, "'case' statement", caseTok.line);
  return mc;
}

} // namespace pyspect::parse
