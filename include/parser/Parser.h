/***
 * Name: pyspect::parse::Parser
 * Purpose: Build a complete syntax tree for one script from its tokens.
 * Inputs:
 *   - Token stream from Lexer (drained into a buffer up front)
 * Outputs:
 *   - ast::Module holding every statement in source order
 * Theory of Operation:
 *   Recursive descent over the 3.12 statement and expression grammar. The
 *   parser is all-or-nothing: the first error throws exceptions::ParseError
 *   with the offending token's line and column. Soft keywords (match, case,
 *   type) are recognized from context; `match` is tried speculatively and the
 *   buffer is rewound when the line turns out to be an ordinary expression.
 *   Match patterns are not modelled; each case keeps its pattern text.
 *   Nesting is bounded (kMaxNestingDepth) so that neither the parser nor the
 *   tree walkers downstream can exhaust the stack.
 */
#pragma once

#include "ast/Nodes.h"
#include "lexer/Lexer.h"
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace pyspect::parse {

inline constexpr int kMaxNestingDepth = 1000;

class Parser {
 public:
  explicit Parser(lex::ITokenStream& stream) : ts_(stream) {}
  std::unique_ptr<ast::Module> parseModule();

 private:
  using StmtList = std::vector<std::unique_ptr<ast::Stmt>>;
  using ExprPtr = std::unique_ptr<ast::Expr>;

  lex::ITokenStream& ts_;
  std::vector<lex::Token> tokens_{};
  size_t pos_{0};
  bool initialized_{false};
  int depth_{0};

  // Counts one recursion level (or one link of a left-deep operator chain)
  // for as long as it lives; past the limit the script is rejected.
  class DepthGuard {
   public:
    explicit DepthGuard(Parser& parser) : depth_(parser.depth_) {}
    DepthGuard(Parser& parser, const lex::Token& at);
    ~DepthGuard() { depth_ -= levels_; }
    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;
    void extend(const lex::Token& at);

   private:
    int& depth_;
    int levels_{0};
  };

  // token buffer
  void initBuffer();
  const lex::Token& peek() const;
  const lex::Token& peekNext() const;
  const lex::Token& peekAt(size_t offset) const;
  lex::Token get();
  bool match(lex::TokenKind tokenKind);
  lex::Token expect(lex::TokenKind tokenKind, const char* msg);
  bool atSoftKeyword(const char* word) const;
  bool atStatementEnd() const;
  static bool startsExpression(lex::TokenKind kind);
  [[noreturn]] void fail(const std::string& msg) const;
  [[noreturn]] static void failAt(const lex::Token& tok, const std::string& msg);
  [[noreturn]] static void failAt(const ast::Node& node, const std::string& msg);

  // statements
  void parseStatementInto(StmtList& out);
  void parseSimpleStatementsInto(StmtList& out);
  std::unique_ptr<ast::Stmt> parseSimpleStatement();
  void parseBlockInto(StmtList& out, const std::string& owner, int ownerLine);
  std::unique_ptr<ast::Stmt> parseExprOrAssignStmt();
  std::unique_ptr<ast::Stmt> parseImportStmt();
  std::unique_ptr<ast::Stmt> parseFromImportStmt();
  std::unique_ptr<ast::Stmt> parseRaiseStmt();
  std::unique_ptr<ast::Stmt> parseGlobalStmt(bool isNonlocal);
  std::unique_ptr<ast::Stmt> parseDelStmt();
  std::unique_ptr<ast::Stmt> parseAssertStmt();
  std::unique_ptr<ast::Stmt> parseTypeAliasStmt();
  std::unique_ptr<ast::Stmt> parseIfStmt();
  std::unique_ptr<ast::Stmt> parseWhileStmt();
  std::unique_ptr<ast::Stmt> parseForStmt();
  std::unique_ptr<ast::Stmt> parseTryStmt();
  std::unique_ptr<ast::Stmt> parseWithStmt();
  bool tryParseParenthesizedWithItems(ast::WithStmt& stmt);
  std::unique_ptr<ast::WithItem> parseWithItem();
  std::unique_ptr<ast::Stmt> parseDecorated();
  std::unique_ptr<ast::Stmt> parseFunction(std::vector<ExprPtr> decorators);
  std::unique_ptr<ast::Stmt> parseClass(std::vector<ExprPtr> decorators);
  std::unique_ptr<ast::Stmt> tryParseMatchStmt();
  std::unique_ptr<ast::MatchCase> parseMatchCase();
  std::string skipTypeParams();
  void parseParamList(std::vector<ast::Param>& outParams, lex::TokenKind closer, bool allowAnnotations);

  // expressions
  ExprPtr parseStarExpressions();
  ExprPtr parseStarExpression();
  ExprPtr parseStarNamedExpression();
  ExprPtr parseNamedExpr();
  ExprPtr parseExpr();
  ExprPtr parseLambda();
  ExprPtr parseYieldExpr();
  ExprPtr parseLogicalOr();
  ExprPtr parseLogicalAnd();
  ExprPtr parseLogicalNot();
  ExprPtr parseComparison();
  ExprPtr parseBitwiseOr();
  ExprPtr parseBitwiseXor();
  ExprPtr parseBitwiseAnd();
  ExprPtr parseShift();
  ExprPtr parseAdditive();
  ExprPtr parseMultiplicative();
  ExprPtr parseUnary();
  ExprPtr parsePower();
  ExprPtr parseAwaitPrimary();
  ExprPtr parsePostfix(ExprPtr base);
  ExprPtr parseAtom();
  ExprPtr parseStrings();
  ExprPtr parseParenthesized(const lex::Token& openTok);
  ExprPtr parseListDisplay(const lex::Token& openTok);
  ExprPtr parseBraceDisplay(const lex::Token& openTok);
  ExprPtr parseSlices();
  ExprPtr parseSliceItem();
  void parseCallArgs(ast::Call& call);
  std::vector<ast::ComprehensionFor> parseComprehensionFors();
  ExprPtr parseTargetList(lex::TokenKind stop);

  // targets
  static void checkAssignTarget(const ast::Expr& expr, bool assignHint);
  static void checkAugTarget(const ast::Expr& expr);
  static void checkDelTarget(const ast::Expr& expr);
  static const char* describe(const ast::Expr& expr);

  template <typename T, typename... Args>
  static std::unique_ptr<T> makeAt(const lex::Token& tok, Args&&... args) {
    auto node = std::make_unique<T>(std::forward<Args>(args)...);
    node->line = tok.line;
    node->col = tok.col;
    return node;
  }
  template <typename T, typename... Args>
  static std::unique_ptr<T> makeAt(const ast::Node& loc, Args&&... args) {
    auto node = std::make_unique<T>(std::forward<Args>(args)...);
    node->line = loc.line;
    node->col = loc.col;
    return node;
  }
};

} // namespace pyspect::parse
