/***
 * Name: pyspect::ast::to_string(NodeKind)
 * Purpose: Stable node-kind names for AST dumps.
 */
#include "ast/NodeKind.h"

namespace pyspect::ast {

const char* to_string(const NodeKind element) {
  switch (element) {
    case NodeKind::Module: return "Module";
    case NodeKind::FunctionDef: return "FunctionDef";
    case NodeKind::ClassDef: return "ClassDef";
    case NodeKind::Import: return "Import";
    case NodeKind::ImportFrom: return "ImportFrom";
    case NodeKind::Alias: return "Alias";
    case NodeKind::ExprStmt: return "ExprStmt";
    case NodeKind::AssignStmt: return "AssignStmt";
    case NodeKind::AnnAssignStmt: return "AnnAssignStmt";
    case NodeKind::AugAssignStmt: return "AugAssignStmt";
    case NodeKind::ReturnStmt: return "ReturnStmt";
    case NodeKind::PassStmt: return "PassStmt";
    case NodeKind::BreakStmt: return "BreakStmt";
    case NodeKind::ContinueStmt: return "ContinueStmt";
    case NodeKind::RaiseStmt: return "RaiseStmt";
    case NodeKind::GlobalStmt: return "GlobalStmt";
    case NodeKind::NonlocalStmt: return "NonlocalStmt";
    case NodeKind::DelStmt: return "DelStmt";
    case NodeKind::AssertStmt: return "AssertStmt";
    case NodeKind::TypeAliasStmt: return "TypeAliasStmt";
    case NodeKind::IfStmt: return "IfStmt";
    case NodeKind::WhileStmt: return "WhileStmt";
    case NodeKind::ForStmt: return "ForStmt";
    case NodeKind::TryStmt: return "TryStmt";
    case NodeKind::ExceptHandler: return "ExceptHandler";
    case NodeKind::WithStmt: return "WithStmt";
    case NodeKind::WithItem: return "WithItem";
    case NodeKind::MatchStmt: return "MatchStmt";
    case NodeKind::MatchCase: return "MatchCase";
    case NodeKind::Name: return "Name";
    case NodeKind::IntLiteral: return "IntLiteral";
    case NodeKind::FloatLiteral: return "FloatLiteral";
    case NodeKind::ImagLiteral: return "ImagLiteral";
    case NodeKind::StringLiteral: return "StringLiteral";
    case NodeKind::BytesLiteral: return "BytesLiteral";
    case NodeKind::FStringLiteral: return "FStringLiteral";
    case NodeKind::BoolLiteral: return "BoolLiteral";
    case NodeKind::NoneLiteral: return "NoneLiteral";
    case NodeKind::EllipsisLiteral: return "EllipsisLiteral";
    case NodeKind::Attribute: return "Attribute";
    case NodeKind::Subscript: return "Subscript";
    case NodeKind::Slice: return "Slice";
    case NodeKind::Starred: return "Starred";
    case NodeKind::Call: return "Call";
    case NodeKind::BinaryExpr: return "BinaryExpr";
    case NodeKind::UnaryExpr: return "UnaryExpr";
    case NodeKind::Compare: return "Compare";
    case NodeKind::IfExpr: return "IfExpr";
    case NodeKind::LambdaExpr: return "LambdaExpr";
    case NodeKind::NamedExpr: return "NamedExpr";
    case NodeKind::AwaitExpr: return "AwaitExpr";
    case NodeKind::YieldExpr: return "YieldExpr";
    case NodeKind::TupleLiteral: return "TupleLiteral";
    case NodeKind::ListLiteral: return "ListLiteral";
    case NodeKind::SetLiteral: return "SetLiteral";
    case NodeKind::DictLiteral: return "DictLiteral";
    case NodeKind::ListComp: return "ListComp";
    case NodeKind::SetComp: return "SetComp";
    case NodeKind::DictComp: return "DictComp";
    case NodeKind::GeneratorExpr: return "GeneratorExpr";
  }
  return "unknown";
}

} // namespace pyspect::ast
