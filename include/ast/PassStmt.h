#pragma once

#include "Stmt.h"
#include "ast/Acceptable.h"

namespace pyspect::ast {

struct PassStmt final : Stmt, Acceptable<PassStmt, NodeKind::PassStmt> {
  PassStmt() : Stmt(NodeKind::PassStmt) {}
};

} // namespace pyspect::ast
