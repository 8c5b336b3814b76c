#pragma once

#include <string>
#include <vector>
#include "Stmt.h"
#include "ast/Acceptable.h"

namespace pyspect::ast {

struct NonlocalStmt final : Stmt, Acceptable<NonlocalStmt, NodeKind::NonlocalStmt> {
  std::vector<std::string> names;
  NonlocalStmt() : Stmt(NodeKind::NonlocalStmt) {}
};

} // namespace pyspect::ast
