#pragma once

#include <string>
#include "ast/NodeKind.h"

namespace pyspect::ast {

// Forward declarations to break include cycles
template <typename T, NodeKind K> struct Literal;
struct Name; struct Call; struct Binary; struct Unary; struct TupleLiteral; struct ListLiteral; struct DictLiteral; struct SetLiteral; struct NoneLiteral; struct Attribute; struct Subscript; struct Slice; struct Starred; struct EllipsisLiteral; struct Compare; struct FStringLiteral;
struct ReturnStmt; struct AssignStmt; struct AnnAssignStmt; struct AugAssignStmt; struct RaiseStmt; struct GlobalStmt; struct NonlocalStmt; struct AssertStmt; struct TypeAliasStmt; struct IfStmt; struct ExprStmt;
struct WhileStmt; struct ForStmt; struct BreakStmt; struct ContinueStmt; struct PassStmt;
struct TryStmt; struct ExceptHandler; struct WithItem; struct WithStmt;
struct Import; struct ImportFrom; struct Alias; struct ClassDef; struct DelStmt; struct NamedExpr; struct IfExpr; struct LambdaExpr; struct YieldExpr; struct AwaitExpr; struct ListComp; struct SetComp; struct DictComp; struct GeneratorExpr;
struct FunctionDef; struct Module;
struct MatchStmt; struct MatchCase;

// Virtual visitor interface for AST traversal using polymorphism.
struct VisitorBase {
  virtual ~VisitorBase() = default;
  // One visit overload per concrete node type
  virtual void visit(const Module&) = 0;
  virtual void visit(const FunctionDef&) = 0;
  virtual void visit(const ClassDef&) = 0;
  // Default no-ops for the remaining nodes
  virtual void visit(const Import&) {}
  virtual void visit(const ImportFrom&) {}
  virtual void visit(const Alias&) {}
  virtual void visit(const ExprStmt&) {}
  virtual void visit(const AssignStmt&) {}
  virtual void visit(const AnnAssignStmt&) {}
  virtual void visit(const AugAssignStmt&) {}
  virtual void visit(const ReturnStmt&) {}
  virtual void visit(const PassStmt&) {}
  virtual void visit(const BreakStmt&) {}
  virtual void visit(const ContinueStmt&) {}
  virtual void visit(const RaiseStmt&) {}
  virtual void visit(const GlobalStmt&) {}
  virtual void visit(const NonlocalStmt&) {}
  virtual void visit(const DelStmt&) {}
  virtual void visit(const AssertStmt&) {}
  virtual void visit(const TypeAliasStmt&) {}
  virtual void visit(const IfStmt&) {}
  virtual void visit(const WhileStmt&) {}
  virtual void visit(const ForStmt&) {}
  virtual void visit(const TryStmt&) {}
  virtual void visit(const ExceptHandler&) {}
  virtual void visit(const WithStmt&) {}
  virtual void visit(const WithItem&) {}
  virtual void visit(const MatchStmt&) {}
  virtual void visit(const MatchCase&) {}
  virtual void visit(const Literal<std::string, NodeKind::IntLiteral>&) {}
  virtual void visit(const Literal<std::string, NodeKind::FloatLiteral>&) {}
  virtual void visit(const Literal<std::string, NodeKind::ImagLiteral>&) {}
  virtual void visit(const Literal<std::string, NodeKind::StringLiteral>&) {}
  virtual void visit(const Literal<std::string, NodeKind::BytesLiteral>&) {}
  virtual void visit(const Literal<bool, NodeKind::BoolLiteral>&) {}
  virtual void visit(const FStringLiteral&) {}
  virtual void visit(const NoneLiteral&) {}
  virtual void visit(const EllipsisLiteral&) {}
  virtual void visit(const Name&) {}
  virtual void visit(const Attribute&) {}
  virtual void visit(const Subscript&) {}
  virtual void visit(const Slice&) {}
  virtual void visit(const Starred&) {}
  virtual void visit(const Call&) {}
  virtual void visit(const Binary&) {}
  virtual void visit(const Unary&) {}
  virtual void visit(const Compare&) {}
  virtual void visit(const IfExpr&) {}
  virtual void visit(const LambdaExpr&) {}
  virtual void visit(const NamedExpr&) {}
  virtual void visit(const AwaitExpr&) {}
  virtual void visit(const YieldExpr&) {}
  virtual void visit(const TupleLiteral&) {}
  virtual void visit(const ListLiteral&) {}
  virtual void visit(const SetLiteral&) {}
  virtual void visit(const DictLiteral&) {}
  virtual void visit(const ListComp&) {}
  virtual void visit(const SetComp&) {}
  virtual void visit(const DictComp&) {}
  virtual void visit(const GeneratorExpr&) {}
};

} // namespace pyspect::ast
