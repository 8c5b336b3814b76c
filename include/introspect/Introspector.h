/***
 * Name: pyspect::introspect::Introspector
 * Purpose: Trust-tiered introspection of one script.
 * Inputs:
 *   - ScriptSource and the caller's Mode
 * Outputs:
 *   - ScriptMetadata with every sequence present and errors accumulated
 * Theory of Operation:
 *   Safe: parse and walk the script (SyntaxAnalyzer), read the inline
 *   metadata block, then resolve dependencies and detect the CLI framework.
 *   A parse error or any other exception inside this tier is converted into
 *   one ErrorRecord and the all-empty fallback shape is returned.
 *   Import: Safe, then ImportEnhancer::enhance; a failure there appends an
 *   ImportError record and keeps the Safe results.
 */
#pragma once

#include <functional>
#include <memory>
#include <utility>
#include <vector>
#include "ast/Module.h"
#include "introspect/ImportEnhancer.h"
#include "introspect/Mode.h"
#include "introspect/Schema.h"
#include "introspect/ScriptSource.h"
#include "introspect/SyntaxAnalyzer.h"
#include "lexer/Token.h"
#include "observability/Metrics.h"

namespace pyspect::introspect {

// Optional observers for logging and metrics; all may be left empty. An
// exception thrown by onFacts is handled like any other extraction failure.
struct IntrospectorHooks {
  obs::Metrics* metrics{nullptr};
  std::function<void(const std::vector<lex::Token>&)> onTokens;
  std::function<void(const ast::Module&)> onAst;
  std::function<void(const SyntaxFacts&)> onFacts;
};

class Introspector {
 public:
  explicit Introspector(Mode mode);
  Introspector(Mode mode, std::unique_ptr<ImportEnhancer> enhancer);

  void setHooks(IntrospectorHooks hooks) { hooks_ = std::move(hooks); }

  ScriptMetadata run(const ScriptSource& source);

  // Name and path set, every other field empty or null.
  static ScriptMetadata Fallback(const ScriptSource& source);

 private:
  ScriptMetadata runSafe(const ScriptSource& source);
  void runEnhancement(const ScriptSource& source, ScriptMetadata& metadata);

  Mode mode_;
  std::unique_ptr<ImportEnhancer> enhancer_;
  IntrospectorHooks hooks_{};
};

} // namespace pyspect::introspect
