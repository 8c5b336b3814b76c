#pragma once

#include <memory>
#include <string>
#include "Expr.h"
#include "Stmt.h"
#include "ast/Acceptable.h"

namespace pyspect::ast {

// type X[T] = value; type parameters are kept as source text
struct TypeAliasStmt final : Stmt, Acceptable<TypeAliasStmt, NodeKind::TypeAliasStmt> {
  std::unique_ptr<Expr> name;
  std::string typeParams; // "[T, U]" or empty
  std::unique_ptr<Expr> value;
  TypeAliasStmt() : Stmt(NodeKind::TypeAliasStmt) {}
};

} // namespace pyspect::ast
