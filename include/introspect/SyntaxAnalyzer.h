/***
 * Name: pyspect::introspect::SyntaxAnalyzer
 * Purpose: Parse a script and extract its structural facts.
 * Inputs:
 *   - Script text and the display file name used in messages
 * Outputs:
 *   - ast::Module (Parse) and SyntaxFacts (Extract)
 * Theory of Operation:
 *   Parse validates UTF-8, tokenizes with lex::Lexer and builds the tree
 *   with parse::Parser; any failure is an exceptions::ParseError. Extract is
 *   a StmtWalker: it visits every statement in pre-order so functions,
 *   classes and imports come out in the order they appear in the text.
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "ast/Nodes.h"
#include "introspect/Schema.h"
#include "lexer/Token.h"
#include "observability/Metrics.h"
#include "pyspect/exceptions/parse_error.h"

namespace pyspect::introspect {

struct SyntaxFacts {
  std::optional<std::string> docstring;
  std::optional<std::string> description;
  std::vector<FunctionInfo> functions;
  std::vector<ClassInfo> classes;
  std::vector<ImportInfo> imports;
  std::vector<EntryPointInfo> entryPoints;
};

class SyntaxAnalyzer {
 public:
  // Throws exceptions::ParseError. When tokensOut is set it receives the token
  // stream; when metrics is set the Lex and Parse stages are timed.
  static std::unique_ptr<ast::Module> Parse(const std::string& text, const std::string& file,
                                            std::vector<lex::Token>* tokensOut = nullptr,
                                            obs::Metrics* metrics = nullptr);

  static SyntaxFacts Extract(const ast::Module& module);

  // "<message> (<file>, line N)"
  static std::string FormatSyntaxError(const exceptions::ParseError& err, const std::string& file);

  // Shared by function and method extraction
  static FunctionInfo DescribeFunction(const ast::FunctionDef& def);

  // `@x.command` or `@x.command(...)`
  static bool IsCommandDecorator(const ast::Expr& decorator);
};

} // namespace pyspect::introspect
