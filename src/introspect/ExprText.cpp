/***
 * Name: pyspect::introspect::RenderExpr (impl)
 */
#include "introspect/ExprText.h"
#include "ast/Nodes.h"
#include "ast/Unparse.h"
#include "pyspect/support/py_repr.h"

#include <cstddef>
#include <string>

namespace pyspect::introspect {

using ast::NodeKind;

namespace {

// a[x, y] keeps the index bare rather than parenthesizing the tuple
std::string renderSlice(const ast::Expr& slice) {
  if (slice.kind != NodeKind::TupleLiteral) { return RenderExpr(slice); }
  const auto& tuple = static_cast<const ast::TupleLiteral&>(slice);
  if (tuple.elements.empty()) { return "()"; }
  std::string out;
  for (std::size_t i = 0; i < tuple.elements.size(); ++i) {
    if (i != 0) { out += ", "; }
    out += ast::Unparse(*tuple.elements[i]);
  }
  if (tuple.elements.size() == 1) { out += ","; }
  return out;
}

} // namespace

std::string RenderExpr(const ast::Expr& expr) {
  switch (expr.kind) {
    case NodeKind::Name: return static_cast<const ast::Name&>(expr).id;
    case NodeKind::IntLiteral: return support::ReprIntLiteral(static_cast<const ast::IntLiteral&>(expr).value);
    case NodeKind::FloatLiteral: return support::ReprFloatLiteral(static_cast<const ast::FloatLiteral&>(expr).value);
    case NodeKind::ImagLiteral: return support::ReprImagLiteral(static_cast<const ast::ImagLiteral&>(expr).value);
    case NodeKind::StringLiteral: return support::ReprString(static_cast<const ast::StringLiteral&>(expr).value);
    case NodeKind::BytesLiteral: return support::ReprBytes(static_cast<const ast::BytesLiteral&>(expr).value);
    case NodeKind::BoolLiteral: return static_cast<const ast::BoolLiteral&>(expr).value ? "True" : "False";
    case NodeKind::NoneLiteral: return "None";
    case NodeKind::EllipsisLiteral: return "Ellipsis";
    case NodeKind::Attribute: {
      const auto& attr = static_cast<const ast::Attribute&>(expr);
      return RenderExpr(*attr.value) + "." + attr.attr;
    }
    case NodeKind::Subscript: {
      const auto& sub = static_cast<const ast::Subscript&>(expr);
      return RenderExpr(*sub.value) + "[" + renderSlice(*sub.slice) + "]";
    }
    default:
      return ast::Unparse(expr);
  }
}

} // namespace pyspect::introspect
