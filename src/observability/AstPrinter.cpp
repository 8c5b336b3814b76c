/***
 * Name: pyspect::obs::AstPrinter (impl)
 * Purpose: Format nodes for the AST log.
 */
#include "observability/AstPrinter.h"
#include "ast/ForEachChild.h"
#include "pyspect/support/py_repr.h"

#include <string>

namespace pyspect::obs {

using ast::NodeKind;

std::string AstPrinter::print(const ast::Module& m) {
  ss_.str("");
  ss_.clear();
  depth_ = 0;
  emit(m);
  return ss_.str();
}

void AstPrinter::emit(const ast::Node& node) {
  indent();
  ss_ << label(node) << "\n";
  depth_++;
  ast::ForEachChild(node, [this](const ast::Node& child) { emit(child); });
  depth_--;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::string AstPrinter::label(const ast::Node& node) {
  std::string out = ast::to_string(node.kind);
  out += " @" + std::to_string(node.line) + ":" + std::to_string(node.col);
  switch (node.kind) {
    case NodeKind::FunctionDef: {
      const auto& f = static_cast<const ast::FunctionDef&>(node);
      out += " name=" + f.name;
      if (f.isAsync) { out += " async"; }
      break;
    }
    case NodeKind::ClassDef: out += " name=" + static_cast<const ast::ClassDef&>(node).name; break;
    case NodeKind::Alias: {
      const auto& a = static_cast<const ast::Alias&>(node);
      out += " name=" + a.name;
      if (!a.asname.empty()) { out += " as=" + a.asname; }
      break;
    }
    case NodeKind::ImportFrom: {
      const auto& i = static_cast<const ast::ImportFrom&>(node);
      out += " module=" + std::string(static_cast<size_t>(i.level), '.') + i.module;
      break;
    }
    case NodeKind::Name: out += " id=" + static_cast<const ast::Name&>(node).id; break;
    case NodeKind::Attribute: out += " attr=" + static_cast<const ast::Attribute&>(node).attr; break;
    case NodeKind::IntLiteral: out += " " + static_cast<const ast::IntLiteral&>(node).value; break;
    case NodeKind::FloatLiteral: out += " " + static_cast<const ast::FloatLiteral&>(node).value; break;
    case NodeKind::ImagLiteral: out += " " + static_cast<const ast::ImagLiteral&>(node).value; break;
    case NodeKind::StringLiteral: out += " " + support::ReprString(static_cast<const ast::StringLiteral&>(node).value); break;
    case NodeKind::BytesLiteral: out += " " + support::ReprBytes(static_cast<const ast::BytesLiteral&>(node).value); break;
    case NodeKind::BoolLiteral: out += static_cast<const ast::BoolLiteral&>(node).value ? " True" : " False"; break;
    case NodeKind::BinaryExpr: out += std::string(" op=") + ast::to_symbol(static_cast<const ast::Binary&>(node).op); break;
    case NodeKind::AugAssignStmt: out += std::string(" op=") + ast::to_symbol(static_cast<const ast::AugAssignStmt&>(node).op) + "="; break;
    case NodeKind::MatchCase: out += " pattern=" + static_cast<const ast::MatchCase&>(node).pattern; break;
    default: break;
  }
  return out;
}

} // namespace pyspect::obs
