/***
 * Name: pyspect::ast::Unparse
 * Purpose: Precedence-aware expression printer.
 */
#include "ast/Unparse.h"
#include "ast/Nodes.h"
#include "pyspect/support/py_repr.h"

#include <algorithm>
#include <array>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pyspect::ast {

namespace {

enum class Prec : int {
  NamedExpr, Tuple, Yield, Test, Or, And, Not, Cmp, Bor, Bxor, Band, Shift, Arith, Term, Factor, Power, Await, Atom
};

Prec next(const Prec prec) { return prec == Prec::Atom ? Prec::Atom : static_cast<Prec>(static_cast<int>(prec) + 1); }

Prec binaryPrec(const BinaryOperator op) {
  switch (op) {
    case BinaryOperator::Add: case BinaryOperator::Sub: return Prec::Arith;
    case BinaryOperator::Mul: case BinaryOperator::MatMul: case BinaryOperator::Div:
    case BinaryOperator::Mod: case BinaryOperator::FloorDiv: return Prec::Term;
    case BinaryOperator::Pow: return Prec::Power;
    case BinaryOperator::LShift: case BinaryOperator::RShift: return Prec::Shift;
    case BinaryOperator::BitAnd: return Prec::Band;
    case BinaryOperator::BitXor: return Prec::Bxor;
    case BinaryOperator::BitOr: return Prec::Bor;
    case BinaryOperator::And: return Prec::And;
    case BinaryOperator::Or: return Prec::Or;
    default: return Prec::Cmp;
  }
}

constexpr std::array<std::string_view, 4> kAllQuotes{"'", "\"", "\"\"\"", "'''"};

struct QuotedText {
  std::string text;
  std::vector<std::string_view> quotes; // still usable, preferred first
};

// Escape `raw` and narrow the quote choices that can still enclose it.
QuotedText strLiteralHelper(const std::string& raw, const std::vector<std::string_view>& quoteTypes, const bool escapeWhitespace) {
  QuotedText result;
  result.text = support::EscapeUnprintable(raw, escapeWhitespace);
  const bool multiline = result.text.find('\n') != std::string::npos;
  for (const auto quote : quoteTypes) {
    if (multiline && quote.size() != 3) { continue; }
    if (result.text.find(quote) != std::string::npos) { continue; }
    result.quotes.push_back(quote);
  }
  if (result.quotes.empty()) {
    const std::string repr = support::ReprString(raw);
    std::string_view quote = repr.front() == '"' ? kAllQuotes[1] : kAllQuotes[0];
    for (const auto candidate : quoteTypes) {
      if (candidate.find(repr.front()) != std::string_view::npos) { quote = candidate; break; }
    }
    result.text = repr.substr(1, repr.size() - 2);
    result.quotes = {quote};
    return result;
  }
  if (!result.text.empty()) {
    const char last = result.text.back();
    std::stable_sort(result.quotes.begin(), result.quotes.end(),
                     [last](std::string_view lhs, std::string_view rhs) { return (lhs.front() == last) < (rhs.front() == last); });
    if (result.quotes.front().front() == last) {
      result.text.insert(result.text.size() - 1, "\\");
    }
  }
  return result;
}

std::string doubleBraces(const std::string& text) {
  std::string out;
  for (const char chr : text) {
    out.push_back(chr);
    if (chr == '{' || chr == '}') { out.push_back(chr); }
  }
  return out;
}

class Printer {
 public:
  Printer() = default;
  explicit Printer(const bool avoidBackslashes) : avoidBackslashes_(avoidBackslashes) {}

  std::string expr(const Expr& node, Prec context);

 private:
  static std::string wrap(std::string body, const Prec own, const Prec context) {
    if (static_cast<int>(own) < static_cast<int>(context)) { return "(" + body + ")"; }
    return body;
  }

  std::string items(const std::vector<std::unique_ptr<Expr>>& elts) {
    std::string out;
    for (size_t i = 0; i < elts.size(); ++i) {
      if (i > 0) { out += ", "; }
      out += expr(*elts[i], Prec::Test);
    }
    return out;
  }

  std::string fors(const std::vector<ComprehensionFor>& gens) {
    std::string out;
    for (const auto& gen : gens) {
      out += gen.isAsync ? " async for " : " for ";
      out += expr(*gen.target, Prec::Tuple);
      out += " in ";
      out += expr(*gen.iter, next(Prec::Test));
      for (const auto& cond : gen.ifs) { out += " if " + expr(*cond, next(Prec::Test)); }
    }
    return out;
  }

  std::string params(const std::vector<Param>& list);
  std::string call(const Call& node);
  std::string constant(const Expr& node);
  std::string fstring(const FStringLiteral& node);
  static std::string fstringInner(const std::vector<FStringPart>& parts);
  static std::string field(const FStringPart& part);

  // set inside f-string replacement fields: string constants pick a quote
  // rather than escaping one
  bool avoidBackslashes_{false};

  static std::string quoteAvoidingBackslashes(const std::string& raw) {
    std::vector<std::string_view> all(kAllQuotes.begin(), kAllQuotes.end());
    QuotedText quoted = strLiteralHelper(raw, all, false);
    const std::string quote(quoted.quotes.front());
    return quote + quoted.text + quote;
  }
};

std::string Printer::field(const FStringPart& part) {
  Printer inner(true);
  const std::string text = inner.expr(*part.value, next(Prec::Test));
  std::string out = "{";
  // "{ {": a set or dict display must not read as a doubled brace
  if (!text.empty() && text.front() == '{') { out += " "; }
  out += text;
  if (part.conversion != 0) { out += "!"; out.push_back(part.conversion); }
  if (!part.formatSpec.empty()) { out += ":" + fstringInner(part.formatSpec); }
  return out + "}";
}

std::string Printer::fstringInner(const std::vector<FStringPart>& parts) {
  std::string out;
  for (const auto& part : parts) { out += part.value ? field(part) : doubleBraces(part.literal); }
  return out;
}

std::string Printer::fstring(const FStringLiteral& node) {
  if (avoidBackslashes_) { return "f" + quoteAvoidingBackslashes(fstringInner(node.values)); }
  std::vector<std::string_view> quotes(kAllQuotes.begin(), kAllQuotes.end());
  std::string body;
  for (const auto& part : node.values) {
    const std::string piece = part.value ? field(part) : doubleBraces(part.literal);
    QuotedText quoted = strLiteralHelper(piece, quotes, !part.value);
    body += quoted.text;
    quotes = std::move(quoted.quotes);
  }
  const std::string quote(quotes.front());
  return "f" + quote + body + quote;
}

std::string Printer::params(const std::vector<Param>& list) {
  std::string out;
  bool first = true;
  bool sawStar = false;
  auto sep = [&]() { if (!first) { out += ", "; } first = false; };
  for (size_t i = 0; i < list.size(); ++i) {
    const auto& param = list[i];
    if (param.isKwOnly && !sawStar) { sep(); out += "*"; sawStar = true; }
    sep();
    if (param.isVarArg) { out += "*"; sawStar = true; }
    if (param.isKwVarArg) { out += "**"; }
    out += param.name;
    if (param.annotation) { out += ": " + expr(*param.annotation, Prec::Test); }
    if (param.defaultValue) {
      out += param.annotation ? " = " : "=";
      out += expr(*param.defaultValue, Prec::Test);
    }
    const bool lastPosOnly = param.isPosOnly && (i + 1 == list.size() || !list[i + 1].isPosOnly);
    if (lastPosOnly) { sep(); out += "/"; }
  }
  return out;
}

std::string Printer::call(const Call& node) {
  std::string out = expr(*node.callee, Prec::Atom) + "(";
  bool first = true;
  for (const auto& arg : node.args) {
    if (!first) { out += ", "; }
    first = false;
    out += expr(*arg, Prec::Test);
  }
  for (const auto& kw : node.keywords) {
    if (!first) { out += ", "; }
    first = false;
    if (kw.name.empty()) { out += "**" + expr(*kw.value, Prec::Test); }
    else { out += kw.name + "=" + expr(*kw.value, Prec::Test); }
  }
  return out + ")";
}

std::string Printer::constant(const Expr& node) {
  switch (node.kind) {
    case NodeKind::IntLiteral: return support::ReprIntLiteral(static_cast<const IntLiteral&>(node).value);
    case NodeKind::FloatLiteral: {
      std::string text = support::ReprFloatLiteral(static_cast<const FloatLiteral&>(node).value);
      return text == "inf" ? "1e309" : text;
    }
    case NodeKind::ImagLiteral: {
      std::string text = support::ReprImagLiteral(static_cast<const ImagLiteral&>(node).value);
      return text == "infj" ? "1e309j" : text;
    }
    case NodeKind::StringLiteral: {
      const std::string& value = static_cast<const StringLiteral&>(node).value;
      return avoidBackslashes_ ? quoteAvoidingBackslashes(value) : support::ReprString(value);
    }
    case NodeKind::BytesLiteral: return support::ReprBytes(static_cast<const BytesLiteral&>(node).value);
    case NodeKind::BoolLiteral: return static_cast<const BoolLiteral&>(node).value ? "True" : "False";
    case NodeKind::NoneLiteral: return "None";
    case NodeKind::EllipsisLiteral: return "...";
    case NodeKind::FStringLiteral: return fstring(static_cast<const FStringLiteral&>(node));
    default: return "";
  }
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
std::string Printer::expr(const Expr& node, const Prec context) {
  switch (node.kind) {
    case NodeKind::Name: return static_cast<const Name&>(node).id;
    case NodeKind::IntLiteral: case NodeKind::FloatLiteral: case NodeKind::ImagLiteral:
    case NodeKind::StringLiteral: case NodeKind::BytesLiteral: case NodeKind::BoolLiteral:
    case NodeKind::NoneLiteral: case NodeKind::EllipsisLiteral: case NodeKind::FStringLiteral:
      return constant(node);
    case NodeKind::Attribute: {
      const auto& attr = static_cast<const Attribute&>(node);
      std::string base = expr(*attr.value, Prec::Atom);
      // "1 .real": an int literal would otherwise swallow the dot
      if (attr.value->kind == NodeKind::IntLiteral) { base += " "; }
      return base + "." + attr.attr;
    }
    case NodeKind::Subscript: {
      const auto& sub = static_cast<const Subscript&>(node);
      std::string out = expr(*sub.value, Prec::Atom) + "[";
      if (sub.slice->kind == NodeKind::TupleLiteral && !static_cast<const TupleLiteral&>(*sub.slice).elements.empty()) {
        const auto& elts = static_cast<const TupleLiteral&>(*sub.slice).elements;
        out += items(elts);
        if (elts.size() == 1) { out += ","; }
      } else {
        out += expr(*sub.slice, Prec::Test);
      }
      return out + "]";
    }
    case NodeKind::Slice: {
      const auto& slice = static_cast<const Slice&>(node);
      std::string out;
      if (slice.lower) { out += expr(*slice.lower, Prec::Test); }
      out += ":";
      if (slice.upper) { out += expr(*slice.upper, Prec::Test); }
      if (slice.step) { out += ":" + expr(*slice.step, Prec::Test); }
      return out;
    }
    case NodeKind::Starred: return "*" + expr(*static_cast<const Starred&>(node).value, Prec::Bor);
    case NodeKind::Call: return call(static_cast<const Call&>(node));
    case NodeKind::BinaryExpr: {
      const auto& bin = static_cast<const Binary&>(node);
      const Prec own = binaryPrec(bin.op);
      const bool rightAssoc = bin.op == BinaryOperator::Pow;
      if (bin.op == BinaryOperator::And || bin.op == BinaryOperator::Or) {
        // a left-nested chain prints as one operand list; each operand binds
        // one level tighter than the previous, so `a or (b and c)` keeps its
        // parentheses
        std::vector<const Expr*> operands;
        const Expr* cur = &node;
        while (cur->kind == NodeKind::BinaryExpr && static_cast<const Binary&>(*cur).op == bin.op) {
          operands.push_back(static_cast<const Binary&>(*cur).rhs.get());
          cur = static_cast<const Binary&>(*cur).lhs.get();
        }
        operands.push_back(cur);
        std::reverse(operands.begin(), operands.end());
        std::string text;
        Prec level = own;
        for (const Expr* operand : operands) {
          level = next(level);
          if (!text.empty()) { text += std::string(" ") + to_symbol(bin.op) + " "; }
          text += expr(*operand, level);
        }
        return wrap(text, own, context);
      }
      const std::string lhs = expr(*bin.lhs, rightAssoc ? next(own) : own);
      const std::string rhs = expr(*bin.rhs, rightAssoc ? own : next(own));
      return wrap(lhs + " " + to_symbol(bin.op) + " " + rhs, own, context);
    }
    case NodeKind::UnaryExpr: {
      const auto& un = static_cast<const Unary&>(node);
      if (un.op == UnaryOperator::Not) {
        return wrap("not " + expr(*un.operand, Prec::Not), Prec::Not, context);
      }
      const char* sym = un.op == UnaryOperator::Neg ? "-" : (un.op == UnaryOperator::Pos ? "+" : "~");
      return wrap(sym + expr(*un.operand, Prec::Factor), Prec::Factor, context);
    }
    case NodeKind::Compare: {
      const auto& cmp = static_cast<const Compare&>(node);
      std::string out = expr(*cmp.left, next(Prec::Cmp));
      for (size_t i = 0; i < cmp.ops.size() && i < cmp.comparators.size(); ++i) {
        out += std::string(" ") + to_symbol(cmp.ops[i]) + " " + expr(*cmp.comparators[i], next(Prec::Cmp));
      }
      return wrap(out, Prec::Cmp, context);
    }
    case NodeKind::IfExpr: {
      const auto& ife = static_cast<const IfExpr&>(node);
      const std::string out = expr(*ife.body, next(Prec::Test)) + " if " + expr(*ife.test, next(Prec::Test)) +
                              " else " + expr(*ife.orelse, Prec::Test);
      return wrap(out, Prec::Test, context);
    }
    case NodeKind::LambdaExpr: {
      const auto& lam = static_cast<const LambdaExpr&>(node);
      std::string out = "lambda";
      const std::string args = params(lam.params);
      if (!args.empty()) { out += " " + args; }
      out += ": " + expr(*lam.body, Prec::Test);
      return wrap(out, Prec::Test, context);
    }
    case NodeKind::NamedExpr: {
      const auto& named = static_cast<const NamedExpr&>(node);
      return wrap(expr(*named.target, Prec::Atom) + " := " + expr(*named.value, Prec::Atom), Prec::NamedExpr, context);
    }
    case NodeKind::AwaitExpr:
      return wrap("await " + expr(*static_cast<const AwaitExpr&>(node).value, Prec::Atom), Prec::Await, context);
    case NodeKind::YieldExpr: {
      const auto& yld = static_cast<const YieldExpr&>(node);
      std::string out = yld.isFrom ? "yield from" : "yield";
      if (yld.value) { out += " " + expr(*yld.value, Prec::Atom); }
      return wrap(out, Prec::Yield, context);
    }
    case NodeKind::TupleLiteral: {
      const auto& elts = static_cast<const TupleLiteral&>(node).elements;
      std::string out = items(elts);
      if (elts.size() == 1) { out += ","; }
      if (elts.empty() || static_cast<int>(context) > static_cast<int>(Prec::Tuple)) { return "(" + out + ")"; }
      return out;
    }
    case NodeKind::ListLiteral: return "[" + items(static_cast<const ListLiteral&>(node).elements) + "]";
    case NodeKind::SetLiteral: {
      const auto& elts = static_cast<const SetLiteral&>(node).elements;
      if (elts.empty()) { return "{*()}"; }
      return "{" + items(elts) + "}";
    }
    case NodeKind::DictLiteral: {
      std::string out = "{";
      bool first = true;
      for (const auto& item : static_cast<const DictLiteral&>(node).items) {
        if (!first) { out += ", "; }
        first = false;
        if (item.key) { out += expr(*item.key, Prec::Test) + ": " + expr(*item.value, Prec::Test); }
        else { out += "**" + expr(*item.value, Prec::Bor); }
      }
      return out + "}";
    }
    case NodeKind::ListComp: {
      const auto& comp = static_cast<const ListComp&>(node);
      return "[" + expr(*comp.elt, Prec::Test) + fors(comp.fors) + "]";
    }
    case NodeKind::SetComp: {
      const auto& comp = static_cast<const SetComp&>(node);
      return "{" + expr(*comp.elt, Prec::Test) + fors(comp.fors) + "}";
    }
    case NodeKind::DictComp: {
      const auto& comp = static_cast<const DictComp&>(node);
      return "{" + expr(*comp.key, Prec::Test) + ": " + expr(*comp.value, Prec::Test) + fors(comp.fors) + "}";
    }
    case NodeKind::GeneratorExpr: {
      const auto& comp = static_cast<const GeneratorExpr&>(node);
      return "(" + expr(*comp.elt, Prec::Test) + fors(comp.fors) + ")";
    }
    default: return "";
  }
}

} // namespace

std::string Unparse(const Expr& expr) {
  Printer printer;
  return printer.expr(expr, Prec::Test);
}

} // namespace pyspect::ast
