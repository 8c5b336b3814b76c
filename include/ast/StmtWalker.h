/***
 * Name: pyspect::ast::StmtWalker
 * Purpose: Visitor base that walks every statement of a module in source
 *   order, descending into compound statement bodies, functions and classes.
 * Usage: Override a visit() to observe a statement kind; call the
 *   StmtWalker overload from the override to keep descending.
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/Stmt.h"
#include "ast/VisitorBase.h"

namespace pyspect::ast {

class StmtWalker : public VisitorBase {
 public:
  void walk(const std::vector<std::unique_ptr<Stmt>>& body);

  void visit(const Module& module) override;
  void visit(const FunctionDef& def) override;
  void visit(const ClassDef& cls) override;
  void visit(const IfStmt& iff) override;
  void visit(const WhileStmt& loop) override;
  void visit(const ForStmt& loop) override;
  void visit(const TryStmt& stmt) override;
  void visit(const ExceptHandler& handler) override;
  void visit(const WithStmt& stmt) override;
  void visit(const MatchStmt& stmt) override;
  void visit(const MatchCase& mc) override;
};

} // namespace pyspect::ast
