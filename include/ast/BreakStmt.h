#pragma once

#include "Stmt.h"
#include "ast/Acceptable.h"

namespace pyspect::ast {

struct BreakStmt final : Stmt, Acceptable<BreakStmt, NodeKind::BreakStmt> {
  BreakStmt() : Stmt(NodeKind::BreakStmt) {}
};

} // namespace pyspect::ast
