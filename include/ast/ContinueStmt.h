#pragma once

#include "Stmt.h"
#include "ast/Acceptable.h"

namespace pyspect::ast {

struct ContinueStmt final : Stmt, Acceptable<ContinueStmt, NodeKind::ContinueStmt> {
  ContinueStmt() : Stmt(NodeKind::ContinueStmt) {}
};

} // namespace pyspect::ast
