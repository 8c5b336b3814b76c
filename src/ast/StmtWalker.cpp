/***
 * Name: pyspect::ast::StmtWalker
 * Purpose: Pre-order statement traversal shared by the extractors.
 */
#include "ast/StmtWalker.h"
#include "ast/Nodes.h"

namespace pyspect::ast {

void StmtWalker::walk(const std::vector<std::unique_ptr<Stmt>>& body) {
  for (const auto& stmt : body) {
    if (stmt) { stmt->accept(*this); }
  }
}

void StmtWalker::visit(const Module& module) { walk(module.body); }
void StmtWalker::visit(const FunctionDef& def) { walk(def.body); }
void StmtWalker::visit(const ClassDef& cls) { walk(cls.body); }

void StmtWalker::visit(const IfStmt& iff) {
  walk(iff.thenBody);
  walk(iff.elseBody);
}

void StmtWalker::visit(const WhileStmt& loop) {
  walk(loop.thenBody);
  walk(loop.elseBody);
}

void StmtWalker::visit(const ForStmt& loop) {
  walk(loop.thenBody);
  walk(loop.elseBody);
}

void StmtWalker::visit(const TryStmt& stmt) {
  walk(stmt.body);
  for (const auto& handler : stmt.handlers) {
    if (handler) { handler->accept(*this); }
  }
  walk(stmt.orelse);
  walk(stmt.finalbody);
}

void StmtWalker::visit(const ExceptHandler& handler) { walk(handler.body); }
void StmtWalker::visit(const WithStmt& stmt) { walk(stmt.body); }

void StmtWalker::visit(const MatchStmt& stmt) {
  for (const auto& mc : stmt.cases) {
    if (mc) { mc->accept(*this); }
  }
}

void StmtWalker::visit(const MatchCase& mc) { walk(mc.body); }

} // namespace pyspect::ast
