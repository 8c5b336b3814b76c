/***
 * Name: pyspect::obs::AstPrinter
 * Purpose: Syntax tree pretty-printer for the --log-ast dump.
 * Inputs:
 *   - ast::Module
 * Outputs:
 *   - One line per node: kind, line:col and salient fields, indented by depth.
 * Theory of Operation:
 *   Recurses over ast::ForEachChild so every node kind is covered without a
 *   per-kind traversal; only the label is specialized per kind.
 */
#pragma once

#include <sstream>
#include <string>
#include "ast/Nodes.h"

namespace pyspect::obs {

class AstPrinter {
 public:
  std::string print(const ast::Module& m);

  // Label for a single node, without indentation or children
  static std::string label(const ast::Node& node);

 private:
  void emit(const ast::Node& node);
  void indent() { for (int i = 0; i < depth_; ++i) ss_ << "  "; }
  std::ostringstream ss_{};
  int depth_{0};
};

} // namespace pyspect::obs
