/***
 * Name: pyspect::introspect::Introspector (impl)
 * Purpose: Run the Safe tier and, when asked, the enhancement step.
 */
#include "introspect/Introspector.h"
#include "ast/GeometrySummary.h"
#include "introspect/CliFrameworkDetector.h"
#include "introspect/DependencyResolver.h"
#include "introspect/SyntaxAnalyzer.h"
#include "metadata/InlineMetadata.h"
#include "pyspect/exceptions/parse_error.h"

#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pyspect::introspect {

Introspector::Introspector(const Mode mode)
    : mode_(mode), enhancer_(std::make_unique<PlaceholderImportEnhancer>()) {}

Introspector::Introspector(const Mode mode, std::unique_ptr<ImportEnhancer> enhancer)
    : mode_(mode), enhancer_(std::move(enhancer)) {
  if (!enhancer_) { enhancer_ = std::make_unique<PlaceholderImportEnhancer>(); }
}

ScriptMetadata Introspector::Fallback(const ScriptSource& source) {
  ScriptMetadata md;
  md.name = source.name;
  md.path = source.path;
  return md;
}

ScriptMetadata Introspector::run(const ScriptSource& source) {
  ScriptMetadata metadata = runSafe(source);
  if (mode_ == Mode::Import) {
    std::optional<obs::ScopedTimer> timer;
    if (hooks_.metrics != nullptr) { timer.emplace(*hooks_.metrics, "Enhance"); }
    runEnhancement(source, metadata);
  }
  if (hooks_.metrics != nullptr) {
    auto& m = *hooks_.metrics;
    m.setCounter("introspect.functions", static_cast<uint64_t>(metadata.functions.size()));
    m.setCounter("introspect.classes", static_cast<uint64_t>(metadata.classes.size()));
    m.setCounter("introspect.imports", static_cast<uint64_t>(metadata.imports.size()));
    m.setCounter("introspect.dependencies", static_cast<uint64_t>(metadata.dependencies.size()));
    m.setCounter("introspect.errors", static_cast<uint64_t>(metadata.errors.size()));
  }
  return metadata;
}

ScriptMetadata Introspector::runSafe(const ScriptSource& source) {
  std::unique_ptr<ast::Module> module;
  try {
    std::vector<lex::Token> tokens;
    module = SyntaxAnalyzer::Parse(source.bytes, source.path, hooks_.onTokens ? &tokens : nullptr, hooks_.metrics);
    if (hooks_.onTokens) { hooks_.onTokens(tokens); }
  } catch (const exceptions::ParseError& e) {
    ScriptMetadata md = Fallback(source);
    ErrorRecord rec;
    rec.kind = ErrorKind::SyntaxError;
    rec.message = SyntaxAnalyzer::FormatSyntaxError(e, source.path);
    rec.line = e.line();
    rec.col = e.col();
    md.errors.push_back(std::move(rec));
    return md;
  }

  try {
    if (hooks_.metrics != nullptr) {
      const auto geom = ast::ComputeGeometry(*module);
      hooks_.metrics->setAstGeometry({geom.nodes, geom.maxDepth});
    }
    if (hooks_.onAst) { hooks_.onAst(*module); }

    std::optional<obs::ScopedTimer> timer;
    if (hooks_.metrics != nullptr) { timer.emplace(*hooks_.metrics, "Extract"); }
    SyntaxFacts facts = SyntaxAnalyzer::Extract(*module);
    if (hooks_.onFacts) { hooks_.onFacts(facts); }
    ScriptMetadata md = Fallback(source);
    md.docstring = std::move(facts.docstring);
    md.description = std::move(facts.description);
    md.inlineMetadata = metadata::ParseInlineMetadata(source.bytes);
    md.dependencies = DependencyResolver::Resolve(md.inlineMetadata, facts.imports);
    md.entryPoints = std::move(facts.entryPoints);
    md.functions = std::move(facts.functions);
    md.classes = std::move(facts.classes);
    md.imports = std::move(facts.imports);
    md.cliFramework = DetectCliFramework(md.imports);
    return md;
  } catch (const std::exception& e) {
    ScriptMetadata md = Fallback(source);
    ErrorRecord rec;
    rec.kind = ErrorKind::RuntimeError;
    rec.message = std::string("Introspection failed: ") + e.what();
    md.errors.push_back(std::move(rec));
    return md;
  }
}

void Introspector::runEnhancement(const ScriptSource& source, ScriptMetadata& metadata) {
  try {
    enhancer_->enhance(source, metadata);
  } catch (const std::exception& e) {
    ErrorRecord rec;
    rec.kind = ErrorKind::ImportError;
    rec.message = std::string("Import-based analysis failed: ") + e.what();
    metadata.errors.push_back(std::move(rec));
  }
}

} // namespace pyspect::introspect
