/***
 * Name: pyspect::parse::Parser (expressions)
 * Purpose: Expression grammar, target validation and call argument parsing.
 * Notes:
 *   Precedence climbs from named expressions down to atoms; binary nodes take
 *   the location of their left operand.
 */
#include "parser/Parser.h"
#include "parser/FString.h"
#include "parser/StringDecode.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace pyspect::parse {

using TK = lex::TokenKind;
using ast::BinaryOperator;
using ast::NodeKind;

bool Parser::startsExpression(const TK kind) {
  switch (kind) {
    case TK::Ident: case TK::Int: case TK::Float: case TK::Imag:
    case TK::String: case TK::Bytes: case TK::FString:
    case TK::NoneLit: case TK::BoolLit: case TK::Ellipsis:
    case TK::LParen: case TK::LBracket: case TK::LBrace:
    case TK::Minus: case TK::Plus: case TK::Tilde:
    case TK::Not: case TK::Lambda: case TK::Await: case TK::Star:
      return true;
    default:
      return false;
  }
}

Parser::ExprPtr Parser::parseStarExpressions() {
  ExprPtr first = parseStarExpression();
  if (peek().kind != TK::Comma) { return first; }
  auto tuple = makeAt<ast::TupleLiteral>(*first);
  tuple->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (!startsExpression(peek().kind)) { break; }
    tuple->elements.push_back(parseStarExpression());
  }
  return tuple;
}

Parser::ExprPtr Parser::parseStarExpression() {
  if (peek().kind == TK::Star) {
    const auto star = get();
    return makeAt<ast::Starred>(star, parseBitwiseOr());
  }
  return parseExpr();
}

Parser::ExprPtr Parser::parseStarNamedExpression() {
  if (peek().kind == TK::Star) {
    const auto star = get();
    return makeAt<ast::Starred>(star, parseBitwiseOr());
  }
  return parseNamedExpr();
}

Parser::ExprPtr Parser::parseNamedExpr() {
  if (peek().kind == TK::Ident && peekNext().kind == TK::ColonEqual) {
    const auto nameTok = get();
    get(); // ':='
    auto target = makeAt<ast::Name>(nameTok, nameTok.text);
    auto value = parseExpr();
    return makeAt<ast::NamedExpr>(nameTok, std::move(target), std::move(value));
  }
  ExprPtr expr = parseExpr();
  if (peek().kind == TK::ColonEqual) {
    failAt(*expr, std::string("cannot use assignment expressions with ") + describe(*expr));
  }
  return expr;
}

Parser::ExprPtr Parser::parseExpr() {
  const DepthGuard guard(*this, peek());
  if (peek().kind == TK::Lambda) { return parseLambda(); }
  ExprPtr body = parseLogicalOr();
  if (peek().kind != TK::If) { return body; }
  get();
  auto cond = makeAt<ast::IfExpr>(*body);
  cond->test = parseLogicalOr();
  if (!match(TK::Else)) { failAt(*cond, "expected 'else' after 'if' expression"); }
  cond->body = std::move(body);
  cond->orelse = parseExpr();
  return cond;
}

Parser::ExprPtr Parser::parseLambda() {
  const auto start = get();
  auto lambda = makeAt<ast::LambdaExpr>(start);
  parseParamList(lambda->params, TK::Colon, false);
  expect(TK::Colon, "expected ':'");
  lambda->body = parseExpr();
  return lambda;
}

Parser::ExprPtr Parser::parseYieldExpr() {
  const auto start = get();
  auto yield = makeAt<ast::YieldExpr>(start);
  if (match(TK::From)) {
    yield->isFrom = true;
    yield->value = parseExpr();
  } else if (startsExpression(peek().kind)) {
    yield->value = parseStarExpressions();
  }
  return yield;
}

Parser::ExprPtr Parser::parseLogicalOr() {
  ExprPtr lhs = parseLogicalAnd();
  DepthGuard chain(*this);
  while (match(TK::Or)) {
    chain.extend(peek());
    auto rhs = parseLogicalAnd();
    const ast::Node& loc = *lhs;
    lhs = makeAt<ast::Binary>(loc, BinaryOperator::Or, std::move(lhs), std::move(rhs));
  }
  return lhs;
}

Parser::ExprPtr Parser::parseLogicalAnd() {
  ExprPtr lhs = parseLogicalNot();
  DepthGuard chain(*this);
  while (match(TK::And)) {
    chain.extend(peek());
    auto rhs = parseLogicalNot();
    const ast::Node& loc = *lhs;
    lhs = makeAt<ast::Binary>(loc, BinaryOperator::And, std::move(lhs), std::move(rhs));
  }
  return lhs;
}

Parser::ExprPtr Parser::parseLogicalNot() {
  if (peek().kind == TK::Not) {
    const DepthGuard guard(*this, peek());
    const auto notTok = get();
    return makeAt<ast::Unary>(notTok, ast::UnaryOperator::Not, parseLogicalNot());
  }
  return parseComparison();
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
Parser::ExprPtr Parser::parseComparison() {
  ExprPtr lhs = parseBitwiseOr();
  std::unique_ptr<ast::Compare> cmp;
  for (;;) {
    BinaryOperator op{};
    switch (peek().kind) {
      case TK::EqEq: op = BinaryOperator::Eq; break;
      case TK::NotEq: op = BinaryOperator::Ne; break;
      case TK::Lt: op = BinaryOperator::Lt; break;
      case TK::Le: op = BinaryOperator::Le; break;
      case TK::Gt: op = BinaryOperator::Gt; break;
      case TK::Ge: op = BinaryOperator::Ge; break;
      case TK::In: op = BinaryOperator::In; break;
      case TK::Is:
        op = peekNext().kind == TK::Not ? BinaryOperator::IsNot : BinaryOperator::Is;
        break;
      case TK::Not:
        if (peekNext().kind != TK::In) { fail("invalid syntax"); }
        op = BinaryOperator::NotIn;
        break;
      default:
        if (cmp) { return cmp; }
        return lhs;
    }
    get();
    if (op == BinaryOperator::IsNot || op == BinaryOperator::NotIn) { get(); }
    if (!cmp) {
      cmp = makeAt<ast::Compare>(*lhs);
      cmp->left = std::move(lhs);
    }
    cmp->ops.push_back(op);
    cmp->comparators.push_back(parseBitwiseOr());
  }
}

namespace {

template <typename Next>
std::unique_ptr<ast::Expr> foldBinary(std::unique_ptr<ast::Expr> lhs, const BinaryOperator op, Next&& next) {
  auto rhs = next();
  const int line = lhs->line;
  const int col = lhs->col;
  auto node = std::make_unique<ast::Binary>(op, std::move(lhs), std::move(rhs));
  node->line = line;
  node->col = col;
  return node;
}

} // namespace

Parser::ExprPtr Parser::parseBitwiseOr() {
  ExprPtr lhs = parseBitwiseXor();
  DepthGuard chain(*this);
  while (match(TK::Pipe)) {
    chain.extend(peek());
    lhs = foldBinary(std::move(lhs), BinaryOperator::BitOr, [this] { return parseBitwiseXor(); });
  }
  return lhs;
}

Parser::ExprPtr Parser::parseBitwiseXor() {
  ExprPtr lhs = parseBitwiseAnd();
  DepthGuard chain(*this);
  while (match(TK::Caret)) {
    chain.extend(peek());
    lhs = foldBinary(std::move(lhs), BinaryOperator::BitXor, [this] { return parseBitwiseAnd(); });
  }
  return lhs;
}

Parser::ExprPtr Parser::parseBitwiseAnd() {
  ExprPtr lhs = parseShift();
  DepthGuard chain(*this);
  while (match(TK::Amp)) {
    chain.extend(peek());
    lhs = foldBinary(std::move(lhs), BinaryOperator::BitAnd, [this] { return parseShift(); });
  }
  return lhs;
}

Parser::ExprPtr Parser::parseShift() {
  ExprPtr lhs = parseAdditive();
  DepthGuard chain(*this);
  for (;;) {
    if (peek().kind == TK::LShift || peek().kind == TK::RShift) { chain.extend(peek()); }
    if (match(TK::LShift)) {
      lhs = foldBinary(std::move(lhs), BinaryOperator::LShift, [this] { return parseAdditive(); });
    } else if (match(TK::RShift)) {
      lhs = foldBinary(std::move(lhs), BinaryOperator::RShift, [this] { return parseAdditive(); });
    } else {
      return lhs;
    }
  }
}

Parser::ExprPtr Parser::parseAdditive() {
  ExprPtr lhs = parseMultiplicative();
  DepthGuard chain(*this);
  for (;;) {
    if (peek().kind == TK::Plus || peek().kind == TK::Minus) { chain.extend(peek()); }
    if (match(TK::Plus)) {
      lhs = foldBinary(std::move(lhs), BinaryOperator::Add, [this] { return parseMultiplicative(); });
    } else if (match(TK::Minus)) {
      lhs = foldBinary(std::move(lhs), BinaryOperator::Sub, [this] { return parseMultiplicative(); });
    } else {
      return lhs;
    }
  }
}

Parser::ExprPtr Parser::parseMultiplicative() {
  ExprPtr lhs = parseUnary();
  DepthGuard chain(*this);
  for (;;) {
    BinaryOperator op{};
    switch (peek().kind) {
      case TK::Star: op = BinaryOperator::Mul; break;
      case TK::At: op = BinaryOperator::MatMul; break;
      case TK::Slash: op = BinaryOperator::Div; break;
      case TK::SlashSlash: op = BinaryOperator::FloorDiv; break;
      case TK::Percent: op = BinaryOperator::Mod; break;
      default: return lhs;
    }
    chain.extend(get());
    lhs = foldBinary(std::move(lhs), op, [this] { return parseUnary(); });
  }
}

Parser::ExprPtr Parser::parseUnary() {
  const lex::Token tok = peek();
  ast::UnaryOperator op{};
  switch (tok.kind) {
    case TK::Minus: op = ast::UnaryOperator::Neg; break;
    case TK::Plus: op = ast::UnaryOperator::Pos; break;
    case TK::Tilde: op = ast::UnaryOperator::BitNot; break;
    default: return parsePower();
  }
  const DepthGuard guard(*this, get());
  return makeAt<ast::Unary>(tok, op, parseUnary());
}

Parser::ExprPtr Parser::parsePower() {
  ExprPtr base = parseAwaitPrimary();
  if (peek().kind == TK::StarStar) {
    const DepthGuard guard(*this, get());
    return foldBinary(std::move(base), BinaryOperator::Pow, [this] { return parseUnary(); });
  }
  return base;
}

Parser::ExprPtr Parser::parseAwaitPrimary() {
  if (peek().kind == TK::Await) {
    const auto awaitTok = get();
    auto node = makeAt<ast::AwaitExpr>(awaitTok);
    node->value = parsePostfix(parseAtom());
    return node;
  }
  return parsePostfix(parseAtom());
}

Parser::ExprPtr Parser::parsePostfix(ExprPtr base) {
  DepthGuard chain(*this);
  for (;;) {
    const TK kind = peek().kind;
    if (kind == TK::Dot || kind == TK::LParen || kind == TK::LBracket) { chain.extend(peek()); }
    if (match(TK::Dot)) {
      const auto attr = expect(TK::Ident, "invalid syntax");
      const ast::Node& loc = *base;
      base = makeAt<ast::Attribute>(loc, std::move(base), attr.text);
    } else if (match(TK::LParen)) {
      const ast::Node& loc = *base;
      auto call = makeAt<ast::Call>(loc, std::move(base));
      parseCallArgs(*call);
      base = std::move(call);
    } else if (match(TK::LBracket)) {
      auto slice = parseSlices();
      expect(TK::RBracket, "invalid syntax");
      const ast::Node& loc = *base;
      base = makeAt<ast::Subscript>(loc, std::move(base), std::move(slice));
    } else {
      return base;
    }
  }
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
Parser::ExprPtr Parser::parseAtom() {
  const lex::Token tok = peek();
  switch (tok.kind) {
    case TK::Ident: get(); return makeAt<ast::Name>(tok, tok.text);
    case TK::Int: get(); return makeAt<ast::IntLiteral>(tok, tok.text);
    case TK::Float: get(); return makeAt<ast::FloatLiteral>(tok, tok.text);
    case TK::Imag: get(); return makeAt<ast::ImagLiteral>(tok, tok.text);
    case TK::NoneLit: get(); return makeAt<ast::NoneLiteral>(tok);
    case TK::BoolLit: get(); return makeAt<ast::BoolLiteral>(tok, tok.text == "True");
    case TK::Ellipsis: get(); return makeAt<ast::EllipsisLiteral>(tok);
    case TK::String: case TK::Bytes: case TK::FString: return parseStrings();
    case TK::LParen: get(); return parseParenthesized(tok);
    case TK::LBracket: get(); return parseListDisplay(tok);
    case TK::LBrace: get(); return parseBraceDisplay(tok);
    case TK::Star: fail("can't use starred expression here");
    case TK::End: fail("unexpected EOF while parsing");
    default: fail("invalid syntax");
  }
}

Parser::ExprPtr Parser::parseStrings() {
  const lex::Token first = peek();
  std::string value;
  std::vector<ast::FStringPart> parts;
  bool anyBytes = false;
  bool anyText = false;
  bool anyFString = false;
  while (peek().kind == TK::String || peek().kind == TK::Bytes || peek().kind == TK::FString) {
    const auto tok = get();
    const DecodedString decoded = DecodeStringToken(tok);
    if (decoded.isBytes) { anyBytes = true; } else { anyText = true; }
    if (anyBytes && anyText) { failAt(first, "cannot mix bytes and nonbytes literals"); }
    if (decoded.isFString) { anyFString = true; }
    if (!anyBytes) { AppendFStringPiece(tok, decoded, parts); }
    value += decoded.value;
  }
  if (anyFString) {
    auto node = makeAt<ast::FStringLiteral>(first);
    node->values = std::move(parts);
    return node;
  }
  if (anyBytes) { return makeAt<ast::BytesLiteral>(first, std::move(value)); }
  return makeAt<ast::StringLiteral>(first, std::move(value));
}

namespace {

bool atComprehension(const lex::Token& cur, const lex::Token& next) {
  return cur.kind == TK::For || (cur.kind == TK::Async && next.kind == TK::For);
}

} // namespace

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
Parser::ExprPtr Parser::parseParenthesized(const lex::Token& openTok) {
  if (match(TK::RParen)) { return makeAt<ast::TupleLiteral>(openTok); }
  if (peek().kind == TK::Yield) {
    auto yield = parseYieldExpr();
    expect(TK::RParen, "invalid syntax");
    return yield;
  }
  ExprPtr first = parseStarNamedExpression();
  if (atComprehension(peek(), peekNext())) {
    if (first->kind == NodeKind::Starred) { failAt(*first, "iterable unpacking cannot be used in comprehension"); }
    auto gen = makeAt<ast::GeneratorExpr>(openTok);
    gen->elt = std::move(first);
    gen->fors = parseComprehensionFors();
    expect(TK::RParen, "invalid syntax");
    return gen;
  }
  if (match(TK::RParen)) {
    if (first->kind == NodeKind::Starred) { failAt(*first, "cannot use starred expression here"); }
    return first;
  }
  if (peek().kind != TK::Comma) {
    if (startsExpression(peek().kind)) { failAt(*first, "invalid syntax. Perhaps you forgot a comma?"); }
    fail("invalid syntax");
  }
  auto tuple = makeAt<ast::TupleLiteral>(openTok);
  tuple->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (peek().kind == TK::RParen) { break; }
    tuple->elements.push_back(parseStarNamedExpression());
  }
  if (!match(TK::RParen)) {
    if (startsExpression(peek().kind)) { failAt(openTok, "invalid syntax. Perhaps you forgot a comma?"); }
    fail("invalid syntax");
  }
  return tuple;
}

Parser::ExprPtr Parser::parseListDisplay(const lex::Token& openTok) {
  auto list = makeAt<ast::ListLiteral>(openTok);
  if (match(TK::RBracket)) { return list; }
  ExprPtr first = parseStarNamedExpression();
  if (atComprehension(peek(), peekNext())) {
    if (first->kind == NodeKind::Starred) { failAt(*first, "iterable unpacking cannot be used in comprehension"); }
    auto comp = makeAt<ast::ListComp>(openTok);
    comp->elt = std::move(first);
    comp->fors = parseComprehensionFors();
    expect(TK::RBracket, "invalid syntax");
    return comp;
  }
  list->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (peek().kind == TK::RBracket) { break; }
    list->elements.push_back(parseStarNamedExpression());
  }
  if (!match(TK::RBracket)) {
    if (startsExpression(peek().kind)) { failAt(openTok, "invalid syntax. Perhaps you forgot a comma?"); }
    fail("invalid syntax");
  }
  return list;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
Parser::ExprPtr Parser::parseBraceDisplay(const lex::Token& openTok) {
  if (match(TK::RBrace)) { return makeAt<ast::DictLiteral>(openTok); }

  // dict: first entry is key ':' value or '**' mapping
  const bool dictStart = peek().kind == TK::StarStar;
  ExprPtr first;
  if (!dictStart) { first = parseStarNamedExpression(); }
  if (dictStart || peek().kind == TK::Colon) {
    auto dict = makeAt<ast::DictLiteral>(openTok);
    ast::DictItem item;
    if (dictStart) {
      get();
      item.value = parseBitwiseOr();
    } else {
      if (first->kind == NodeKind::Starred) { failAt(*first, "cannot use a starred expression in a dictionary key"); }
      get(); // ':'
      item.key = std::move(first);
      item.value = parseExpr();
      if (atComprehension(peek(), peekNext())) {
        auto comp = makeAt<ast::DictComp>(openTok);
        comp->key = std::move(item.key);
        comp->value = std::move(item.value);
        comp->fors = parseComprehensionFors();
        expect(TK::RBrace, "invalid syntax");
        return comp;
      }
    }
    dict->items.push_back(std::move(item));
    while (match(TK::Comma)) {
      if (peek().kind == TK::RBrace) { break; }
      ast::DictItem next;
      if (match(TK::StarStar)) {
        next.value = parseBitwiseOr();
      } else {
        next.key = parseExpr();
        if (!match(TK::Colon)) { failAt(*next.key, "':' expected after dictionary key"); }
        next.value = parseExpr();
      }
      dict->items.push_back(std::move(next));
    }
    if (!match(TK::RBrace)) {
      if (startsExpression(peek().kind)) { failAt(openTok, "invalid syntax. Perhaps you forgot a comma?"); }
      fail("invalid syntax");
    }
    return dict;
  }

  if (atComprehension(peek(), peekNext())) {
    if (first->kind == NodeKind::Starred) { failAt(*first, "iterable unpacking cannot be used in comprehension"); }
    auto comp = makeAt<ast::SetComp>(openTok);
    comp->elt = std::move(first);
    comp->fors = parseComprehensionFors();
    expect(TK::RBrace, "invalid syntax");
    return comp;
  }
  auto set = makeAt<ast::SetLiteral>(openTok);
  set->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (peek().kind == TK::RBrace) { break; }
    set->elements.push_back(parseStarNamedExpression());
  }
  if (!match(TK::RBrace)) {
    if (startsExpression(peek().kind)) { failAt(openTok, "invalid syntax. Perhaps you forgot a comma?"); }
    fail("invalid syntax");
  }
  return set;
}

Parser::ExprPtr Parser::parseSlices() {
  ExprPtr first = parseSliceItem();
  if (peek().kind != TK::Comma) { return first; }
  auto tuple = makeAt<ast::TupleLiteral>(*first);
  tuple->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (peek().kind == TK::RBracket) { break; }
    tuple->elements.push_back(parseSliceItem());
  }
  return tuple;
}

Parser::ExprPtr Parser::parseSliceItem() {
  const lex::Token start = peek();
  if (start.kind == TK::Star) { return parseStarNamedExpression(); }
  ExprPtr lower;
  if (start.kind != TK::Colon) {
    lower = parseNamedExpr();
    if (peek().kind != TK::Colon) { return lower; }
  }
  auto slice = lower ? makeAt<ast::Slice>(*lower) : makeAt<ast::Slice>(start);
  slice->lower = std::move(lower);
  get(); // ':'
  auto atPartEnd = [this]() {
    const auto kind = peek().kind;
    return kind == TK::Colon || kind == TK::Comma || kind == TK::RBracket;
  };
  if (!atPartEnd()) { slice->upper = parseExpr(); }
  if (match(TK::Colon)) {
    if (!atPartEnd()) { slice->step = parseExpr(); }
  }
  return slice;
}

// Consumes everything up to and including the closing ')'.
// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void Parser::parseCallArgs(ast::Call& call) {
  bool sawKeyword = false;
  bool sawKwUnpack = false;
  size_t count = 0;
  while (peek().kind != TK::RParen) {
    const lex::Token tok = peek();
    if (match(TK::StarStar)) {
      call.keywords.push_back(ast::KeywordArg{std::string(), parseExpr()});
      sawKwUnpack = true;
    } else if (match(TK::Star)) {
      if (sawKwUnpack) { failAt(tok, "iterable argument unpacking follows keyword argument unpacking"); }
      call.args.push_back(makeAt<ast::Starred>(tok, parseExpr()));
    } else if (tok.kind == TK::Ident && peekNext().kind == TK::Equal) {
      get();
      get(); // '='
      call.keywords.push_back(ast::KeywordArg{tok.text, parseExpr()});
      sawKeyword = true;
    } else {
      ExprPtr arg = parseNamedExpr();
      if (peek().kind == TK::Equal) {
        failAt(*arg, "expression cannot contain assignment, perhaps you meant \"==\"?");
      }
      if (atComprehension(peek(), peekNext())) {
        auto gen = makeAt<ast::GeneratorExpr>(*arg);
        gen->elt = std::move(arg);
        gen->fors = parseComprehensionFors();
        if (count != 0 || peek().kind != TK::RParen) { failAt(*gen, "Generator expression must be parenthesized"); }
        arg = std::move(gen);
      }
      if (sawKwUnpack) { failAt(*arg, "positional argument follows keyword argument unpacking"); }
      if (sawKeyword) { failAt(*arg, "positional argument follows keyword argument"); }
      call.args.push_back(std::move(arg));
    }
    ++count;
    if (!match(TK::Comma)) {
      if (peek().kind != TK::RParen && startsExpression(peek().kind)) {
        fail("invalid syntax. Perhaps you forgot a comma?");
      }
      break;
    }
  }
  expect(TK::RParen, "invalid syntax");
}

std::vector<ast::ComprehensionFor> Parser::parseComprehensionFors() {
  std::vector<ast::ComprehensionFor> fors;
  while (atComprehension(peek(), peekNext())) {
    ast::ComprehensionFor clause;
    clause.isAsync = match(TK::Async);
    expect(TK::For, "invalid syntax");
    clause.target = parseTargetList(TK::In);
    checkAssignTarget(*clause.target, false);
    expect(TK::In, "invalid syntax");
    clause.iter = parseLogicalOr();
    while (match(TK::If)) { clause.ifs.push_back(parseLogicalOr()); }
    fors.push_back(std::move(clause));
  }
  return fors;
}

Parser::ExprPtr Parser::parseTargetList(const TK stop) {
  auto element = [this]() -> ExprPtr {
    if (peek().kind == TK::Star) {
      const auto star = get();
      return makeAt<ast::Starred>(star, parseBitwiseOr());
    }
    return parseBitwiseOr();
  };
  ExprPtr first = element();
  if (peek().kind != TK::Comma) { return first; }
  auto tuple = makeAt<ast::TupleLiteral>(*first);
  tuple->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (peek().kind == stop) { break; }
    tuple->elements.push_back(element());
  }
  return tuple;
}

const char* Parser::describe(const ast::Expr& expr) {
  switch (expr.kind) {
    case NodeKind::Call: return "function call";
    case NodeKind::IntLiteral:
    case NodeKind::FloatLiteral:
    case NodeKind::ImagLiteral:
    case NodeKind::StringLiteral:
    case NodeKind::BytesLiteral: return "literal";
    case NodeKind::FStringLiteral: return "f-string expression";
    case NodeKind::BoolLiteral:
      return static_cast<const ast::BoolLiteral&>(expr).value ? "True" : "False";
    case NodeKind::NoneLiteral: return "None";
    case NodeKind::EllipsisLiteral: return "ellipsis";
    case NodeKind::Compare: return "comparison";
    case NodeKind::LambdaExpr: return "lambda";
    case NodeKind::IfExpr: return "conditional expression";
    case NodeKind::NamedExpr: return "named expression";
    case NodeKind::AwaitExpr: return "await expression";
    case NodeKind::YieldExpr: return "yield expression";
    case NodeKind::DictLiteral: return "dict literal";
    case NodeKind::SetLiteral: return "set display";
    case NodeKind::ListComp: return "list comprehension";
    case NodeKind::SetComp: return "set comprehension";
    case NodeKind::DictComp: return "dict comprehension";
    case NodeKind::GeneratorExpr: return "generator expression";
    case NodeKind::TupleLiteral: return "tuple";
    case NodeKind::ListLiteral: return "list";
    case NodeKind::Starred: return "starred";
    default: return "expression";
  }
}

void Parser::checkAssignTarget(const ast::Expr& expr, const bool assignHint) {
  switch (expr.kind) {
    case NodeKind::Name:
    case NodeKind::Attribute:
    case NodeKind::Subscript:
      return;
    case NodeKind::Starred:
      checkAssignTarget(*static_cast<const ast::Starred&>(expr).value, false);
      return;
    case NodeKind::TupleLiteral:
      for (const auto& elt : static_cast<const ast::TupleLiteral&>(expr).elements) { checkAssignTarget(*elt, false); }
      return;
    case NodeKind::ListLiteral:
      for (const auto& elt : static_cast<const ast::ListLiteral&>(expr).elements) { checkAssignTarget(*elt, false); }
      return;
    default: break;
  }
  std::string msg = std::string("cannot assign to ") + describe(expr);
  const bool keywordConstant = expr.kind == NodeKind::NoneLiteral || expr.kind == NodeKind::BoolLiteral;
  if (assignHint && !keywordConstant) { msg += " here. Maybe you meant '==' instead of '='?"; }
  failAt(expr, msg);
}

void Parser::checkAugTarget(const ast::Expr& expr) {
  if (expr.kind == NodeKind::Name || expr.kind == NodeKind::Attribute || expr.kind == NodeKind::Subscript) { return; }
  failAt(expr, std::string("'") + describe(expr) + "' is an illegal expression for augmented assignment");
}

void Parser::checkDelTarget(const ast::Expr& expr) {
  switch (expr.kind) {
    case NodeKind::Name:
    case NodeKind::Attribute:
    case NodeKind::Subscript:
      return;
    case NodeKind::TupleLiteral:
      for (const auto& elt : static_cast<const ast::TupleLiteral&>(expr).elements) { checkDelTarget(*elt); }
      return;
    case NodeKind::ListLiteral:
      for (const auto& elt : static_cast<const ast::ListLiteral&>(expr).elements) { checkDelTarget(*elt); }
      return;
    default: break;
  }
  failAt(expr, std::string("cannot delete ") + describe(expr));
}

} // namespace pyspect::parse
