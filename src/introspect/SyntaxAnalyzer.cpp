/***
 * Name: pyspect::introspect::SyntaxAnalyzer (impl)
 * Purpose: Tokenize, parse and walk one script.
 */
#include "introspect/SyntaxAnalyzer.h"
#include "ast/StmtWalker.h"
#include "introspect/Docstring.h"
#include "introspect/ExprText.h"
#include "lexer/Lexer.h"
#include "parser/Parser.h"
#include "pyspect/support/text.h"

#include <array>
#include <cstddef>
#include <cstdio>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace pyspect::introspect {

namespace {

constexpr unsigned kContinuationTag = 0x80U;
constexpr unsigned kFirstLeadByte = 0xC2U;
constexpr unsigned kLastLeadByte = 0xF4U;

// Reject bytes that are not UTF-8 before tokenizing, with the decoder's wording.
void validateSource(const std::string& text) {
  int line = 1;
  std::size_t lineStart = 0;
  std::size_t pos = 0;
  while (pos < text.size()) {
    const auto byte = static_cast<unsigned char>(text[pos]);
    if (byte == 0U) {
      throw exceptions::ParseError("source code cannot contain null bytes", line, static_cast<int>(pos - lineStart + 1));
    }
    if (byte == '\n') {
      ++line;
      lineStart = pos + 1;
    }
    if (byte < kContinuationTag) {
      ++pos;
      continue;
    }
    const std::size_t at = pos;
    char32_t cp = 0;
    if (!support::DecodeUtf8(text, pos, cp)) {
      std::array<char, 8> hex{};
      std::snprintf(hex.data(), hex.size(), "0x%02x", static_cast<unsigned>(byte));
      const bool lead = byte >= kFirstLeadByte && byte <= kLastLeadByte;
      throw exceptions::ParseError(std::string("(unicode error) 'utf-8' codec can't decode byte ") + hex.data() +
                                       " in position " + std::to_string(at) + ": " +
                                       (lead ? "invalid continuation byte" : "invalid start byte"),
                                   line, static_cast<int>(at - lineStart + 1));
    }
  }
}

class FactCollector : public ast::StmtWalker {
 public:
  explicit FactCollector(SyntaxFacts& out) : out_(out) {}

  void visit(const ast::FunctionDef& def) override {
    out_.functions.push_back(SyntaxAnalyzer::DescribeFunction(def));
    if (def.name == "main") {
      out_.entryPoints.push_back(EntryPointInfo{"main", "main", std::nullopt, EntryPointKind::MainFunction});
    } else {
      for (const auto& dec : def.decorators) {
        if (SyntaxAnalyzer::IsCommandDecorator(*dec)) {
          out_.entryPoints.push_back(EntryPointInfo{def.name, def.name, std::nullopt, EntryPointKind::CliCommand});
          break;
        }
      }
    }
    ast::StmtWalker::visit(def);
  }

  void visit(const ast::ClassDef& cls) override {
    ClassInfo info;
    info.name = cls.name;
    info.line = cls.line;
    if (auto doc = BodyDocstring(cls.body)) { info.docstring = CleanDoc(*doc); }
    for (const auto& base : cls.bases) { info.baseClasses.push_back(RenderExpr(*base)); }
    for (const auto& stmt : cls.body) {
      if (stmt->kind == ast::NodeKind::FunctionDef) {
        info.methods.push_back(SyntaxAnalyzer::DescribeFunction(static_cast<const ast::FunctionDef&>(*stmt)));
      }
    }
    out_.classes.push_back(std::move(info));
    ast::StmtWalker::visit(cls);
  }

  void visit(const ast::Import& imp) override {
    for (const auto& alias : imp.names) {
      ImportInfo info;
      info.module = alias->name;
      if (!alias->asname.empty()) { info.alias = alias->asname; }
      info.line = imp.line;
      out_.imports.push_back(std::move(info));
    }
  }

  void visit(const ast::ImportFrom& imp) override {
    ImportInfo info;
    // the relative level is not recorded: `from ..pkg import x` gives "pkg"
    info.module = imp.module;
    for (const auto& alias : imp.names) { info.names.push_back(alias->name); }
    info.isFromImport = true;
    info.line = imp.line;
    out_.imports.push_back(std::move(info));
  }

 private:
  SyntaxFacts& out_;
};

} // namespace

std::unique_ptr<ast::Module> SyntaxAnalyzer::Parse(const std::string& text, const std::string& file,
                                                   std::vector<lex::Token>* tokensOut,
                                                   obs::Metrics* metrics) {
  validateSource(text);
  lex::Lexer lexer;
  lexer.pushString(text, file);
  if (metrics != nullptr) { metrics->start("Lex"); }
  std::vector<lex::Token> tokens = lexer.tokens(); // tokenizes eagerly; errors surface here
  if (metrics != nullptr) { metrics->stop("Lex"); }
  if (tokensOut != nullptr) { *tokensOut = std::move(tokens); }
  if (metrics != nullptr) { metrics->start("Parse"); }
  parse::Parser parser(lexer);
  auto module = parser.parseModule();
  if (metrics != nullptr) { metrics->stop("Parse"); }
  return module;
}

SyntaxFacts SyntaxAnalyzer::Extract(const ast::Module& module) {
  SyntaxFacts facts;
  facts.docstring = BodyDocstring(module.body);
  facts.description = DescriptionFrom(facts.docstring);
  FactCollector collector(facts);
  module.accept(collector);
  return facts;
}

std::string SyntaxAnalyzer::FormatSyntaxError(const exceptions::ParseError& err, const std::string& file) {
  return std::string(err.what()) + " (" + file + ", line " + std::to_string(err.line()) + ")";
}

FunctionInfo SyntaxAnalyzer::DescribeFunction(const ast::FunctionDef& def) {
  FunctionInfo info;
  info.name = def.name;
  info.line = def.line;
  if (auto doc = BodyDocstring(def.body)) { info.docstring = CleanDoc(*doc); }
  for (const auto& param : def.params) {
    if (!param.isPositional()) { continue; }
    ParameterInfo p;
    p.name = param.name;
    if (param.annotation) { p.typeHint = RenderExpr(*param.annotation); }
    if (param.defaultValue) {
      p.defaultValue = RenderExpr(*param.defaultValue);
      p.hasDefault = true;
    }
    info.parameters.push_back(std::move(p));
  }
  if (def.returns) { info.returns = RenderExpr(*def.returns); }
  for (const auto& dec : def.decorators) { info.decorators.push_back(RenderExpr(*dec)); }
  info.isAsync = def.isAsync;
  return info;
}

bool SyntaxAnalyzer::IsCommandDecorator(const ast::Expr& decorator) {
  const ast::Expr* target = &decorator;
  if (target->kind == ast::NodeKind::Call) { target = static_cast<const ast::Call&>(*target).callee.get(); }
  return target != nullptr && target->kind == ast::NodeKind::Attribute &&
         static_cast<const ast::Attribute&>(*target).attr == "command";
}

} // namespace pyspect::introspect
