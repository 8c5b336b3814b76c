/***
 * Name: pyspect::ast::ForEachChild
 * Purpose: Generic child enumeration for geometry and dumps.
 */
#include "ast/ForEachChild.h"
#include "ast/Nodes.h"

#include <memory>
#include <vector>

namespace pyspect::ast {

namespace {

using Fn = std::function<void(const Node&)>;

template <typename T>
void one(const std::unique_ptr<T>& child, const Fn& fn) {
  if (child) { fn(*child); }
}

template <typename T>
void each(const std::vector<std::unique_ptr<T>>& children, const Fn& fn) {
  for (const auto& child : children) { one(child, fn); }
}

void params(const std::vector<Param>& list, const Fn& fn) {
  for (const auto& param : list) {
    one(param.annotation, fn);
    one(param.defaultValue, fn);
  }
}

void fors(const std::vector<ComprehensionFor>& list, const Fn& fn) {
  for (const auto& gen : list) {
    one(gen.target, fn);
    one(gen.iter, fn);
    each(gen.ifs, fn);
  }
}

void keywords(const std::vector<KeywordArg>& list, const Fn& fn) {
  for (const auto& kw : list) { one(kw.value, fn); }
}

} // namespace

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
void ForEachChild(const Node& node, const Fn& fn) {
  switch (node.kind) {
    case NodeKind::Module: each(static_cast<const Module&>(node).body, fn); break;
    case NodeKind::FunctionDef: {
      const auto& def = static_cast<const FunctionDef&>(node);
      each(def.decorators, fn); params(def.params, fn); one(def.returns, fn); each(def.body, fn);
      break;
    }
    case NodeKind::ClassDef: {
      const auto& cls = static_cast<const ClassDef&>(node);
      each(cls.decorators, fn); each(cls.bases, fn); keywords(cls.keywords, fn); each(cls.body, fn);
      break;
    }
    case NodeKind::Import: each(static_cast<const Import&>(node).names, fn); break;
    case NodeKind::ImportFrom: each(static_cast<const ImportFrom&>(node).names, fn); break;
    case NodeKind::ExprStmt: one(static_cast<const ExprStmt&>(node).value, fn); break;
    case NodeKind::AssignStmt: {
      const auto& asg = static_cast<const AssignStmt&>(node);
      each(asg.targets, fn); one(asg.value, fn);
      break;
    }
    case NodeKind::AnnAssignStmt: {
      const auto& asg = static_cast<const AnnAssignStmt&>(node);
      one(asg.target, fn); one(asg.annotation, fn); one(asg.value, fn);
      break;
    }
    case NodeKind::AugAssignStmt: {
      const auto& asg = static_cast<const AugAssignStmt&>(node);
      one(asg.target, fn); one(asg.value, fn);
      break;
    }
    case NodeKind::ReturnStmt: one(static_cast<const ReturnStmt&>(node).value, fn); break;
    case NodeKind::RaiseStmt: {
      const auto& raise = static_cast<const RaiseStmt&>(node);
      one(raise.exc, fn); one(raise.cause, fn);
      break;
    }
    case NodeKind::DelStmt: each(static_cast<const DelStmt&>(node).targets, fn); break;
    case NodeKind::AssertStmt: {
      const auto& stmt = static_cast<const AssertStmt&>(node);
      one(stmt.test, fn); one(stmt.msg, fn);
      break;
    }
    case NodeKind::TypeAliasStmt: {
      const auto& stmt = static_cast<const TypeAliasStmt&>(node);
      one(stmt.name, fn); one(stmt.value, fn);
      break;
    }
    case NodeKind::IfStmt: {
      const auto& iff = static_cast<const IfStmt&>(node);
      one(iff.cond, fn); each(iff.thenBody, fn); each(iff.elseBody, fn);
      break;
    }
    case NodeKind::WhileStmt: {
      const auto& loop = static_cast<const WhileStmt&>(node);
      one(loop.cond, fn); each(loop.thenBody, fn); each(loop.elseBody, fn);
      break;
    }
    case NodeKind::ForStmt: {
      const auto& loop = static_cast<const ForStmt&>(node);
      one(loop.target, fn); one(loop.iterable, fn); each(loop.thenBody, fn); each(loop.elseBody, fn);
      break;
    }
    case NodeKind::TryStmt: {
      const auto& stmt = static_cast<const TryStmt&>(node);
      each(stmt.body, fn); each(stmt.handlers, fn); each(stmt.orelse, fn); each(stmt.finalbody, fn);
      break;
    }
    case NodeKind::ExceptHandler: {
      const auto& handler = static_cast<const ExceptHandler&>(node);
      one(handler.type, fn); each(handler.body, fn);
      break;
    }
    case NodeKind::WithStmt: {
      const auto& stmt = static_cast<const WithStmt&>(node);
      each(stmt.items, fn); each(stmt.body, fn);
      break;
    }
    case NodeKind::WithItem: {
      const auto& item = static_cast<const WithItem&>(node);
      one(item.context, fn); one(item.optionalVars, fn);
      break;
    }
    case NodeKind::MatchStmt: {
      const auto& stmt = static_cast<const MatchStmt&>(node);
      one(stmt.subject, fn); each(stmt.cases, fn);
      break;
    }
    case NodeKind::MatchCase: {
      const auto& mc = static_cast<const MatchCase&>(node);
      one(mc.guard, fn); each(mc.body, fn);
      break;
    }
    case NodeKind::Attribute: one(static_cast<const Attribute&>(node).value, fn); break;
    case NodeKind::Subscript: {
      const auto& sub = static_cast<const Subscript&>(node);
      one(sub.value, fn); one(sub.slice, fn);
      break;
    }
    case NodeKind::Slice: {
      const auto& slice = static_cast<const Slice&>(node);
      one(slice.lower, fn); one(slice.upper, fn); one(slice.step, fn);
      break;
    }
    case NodeKind::Starred: one(static_cast<const Starred&>(node).value, fn); break;
    case NodeKind::Call: {
      const auto& call = static_cast<const Call&>(node);
      one(call.callee, fn); each(call.args, fn); keywords(call.keywords, fn);
      break;
    }
    case NodeKind::BinaryExpr: {
      const auto& bin = static_cast<const Binary&>(node);
      one(bin.lhs, fn); one(bin.rhs, fn);
      break;
    }
    case NodeKind::UnaryExpr: one(static_cast<const Unary&>(node).operand, fn); break;
    case NodeKind::Compare: {
      const auto& cmp = static_cast<const Compare&>(node);
      one(cmp.left, fn); each(cmp.comparators, fn);
      break;
    }
    case NodeKind::IfExpr: {
      const auto& expr = static_cast<const IfExpr&>(node);
      one(expr.body, fn); one(expr.test, fn); one(expr.orelse, fn);
      break;
    }
    case NodeKind::LambdaExpr: {
      const auto& lam = static_cast<const LambdaExpr&>(node);
      params(lam.params, fn); one(lam.body, fn);
      break;
    }
    case NodeKind::NamedExpr: {
      const auto& named = static_cast<const NamedExpr&>(node);
      one(named.target, fn); one(named.value, fn);
      break;
    }
    case NodeKind::AwaitExpr: one(static_cast<const AwaitExpr&>(node).value, fn); break;
    case NodeKind::YieldExpr: one(static_cast<const YieldExpr&>(node).value, fn); break;
    case NodeKind::TupleLiteral: each(static_cast<const TupleLiteral&>(node).elements, fn); break;
    case NodeKind::ListLiteral: each(static_cast<const ListLiteral&>(node).elements, fn); break;
    case NodeKind::SetLiteral: each(static_cast<const SetLiteral&>(node).elements, fn); break;
    case NodeKind::DictLiteral:
      for (const auto& item : static_cast<const DictLiteral&>(node).items) { one(item.key, fn); one(item.value, fn); }
      break;
    case NodeKind::ListComp: {
      const auto& comp = static_cast<const ListComp&>(node);
      one(comp.elt, fn); fors(comp.fors, fn);
      break;
    }
    case NodeKind::SetComp: {
      const auto& comp = static_cast<const SetComp&>(node);
      one(comp.elt, fn); fors(comp.fors, fn);
      break;
    }
    case NodeKind::DictComp: {
      const auto& comp = static_cast<const DictComp&>(node);
      one(comp.key, fn); one(comp.value, fn); fors(comp.fors, fn);
      break;
    }
    case NodeKind::GeneratorExpr: {
      const auto& comp = static_cast<const GeneratorExpr&>(node);
      one(comp.elt, fn); fors(comp.fors, fn);
      break;
    }
    default: break; // leaves
  }
}

} // namespace pyspect::ast
