#pragma once

#include <string>
#include <vector>
#include "Stmt.h"
#include "ast/Acceptable.h"

namespace pyspect::ast {

struct GlobalStmt final : Stmt, Acceptable<GlobalStmt, NodeKind::GlobalStmt> {
  std::vector<std::string> names;
  GlobalStmt() : Stmt(NodeKind::GlobalStmt) {}
};

} // namespace pyspect::ast
