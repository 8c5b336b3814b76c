/***
 * Name: pyspect::introspect (docstrings impl)
 */
#include "introspect/Docstring.h"
#include "ast/Nodes.h"
#include "pyspect/support/text.h"

#include <algorithm>
#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace pyspect::introspect {

namespace {

constexpr std::size_t kTabSize = 8;

std::string expandTabs(std::string_view line) {
  std::string out;
  std::size_t col = 0;
  for (const char c : line) {
    if (c == '\t') {
      const std::size_t pad = kTabSize - (col % kTabSize);
      out.append(pad, ' ');
      col += pad;
      continue;
    }
    out += c;
    // continuation bytes do not advance the column
    if ((static_cast<unsigned char>(c) & 0xC0U) != 0x80U) { ++col; }
  }
  return out;
}

constexpr const char* kWhitespace = " \t\n\r\v\f";

} // namespace

std::optional<std::string> BodyDocstring(const std::vector<std::unique_ptr<ast::Stmt>>& body) {
  if (body.empty() || body.front()->kind != ast::NodeKind::ExprStmt) { return std::nullopt; }
  const auto& stmt = static_cast<const ast::ExprStmt&>(*body.front());
  if (!stmt.value || stmt.value->kind != ast::NodeKind::StringLiteral) { return std::nullopt; }
  return static_cast<const ast::StringLiteral&>(*stmt.value).value;
}

std::string CleanDoc(std::string_view doc) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  for (;;) {
    const std::size_t nl = doc.find('\n', start);
    lines.push_back(expandTabs(doc.substr(start, nl == std::string_view::npos ? std::string_view::npos : nl - start)));
    if (nl == std::string_view::npos) { break; }
    start = nl + 1;
  }

  std::size_t margin = std::numeric_limits<std::size_t>::max();
  for (std::size_t i = 1; i < lines.size(); ++i) {
    const std::string& line = lines[i];
    const std::size_t content = line.find_first_not_of(kWhitespace);
    if (content == std::string::npos) { continue; }
    margin = std::min(margin, content);
  }
  lines[0] = support::TrimLeft(lines[0]);
  if (margin != std::numeric_limits<std::size_t>::max()) {
    for (std::size_t i = 1; i < lines.size(); ++i) { lines[i].erase(0, std::min(margin, lines[i].size())); }
  }
  while (!lines.empty() && lines.back().empty()) { lines.pop_back(); }
  std::size_t first = 0;
  while (first < lines.size() && lines[first].empty()) { ++first; }

  std::string out;
  for (std::size_t i = first; i < lines.size(); ++i) {
    if (i != first) { out += '\n'; }
    out += lines[i];
  }
  return out;
}

std::optional<std::string> DescriptionFrom(const std::optional<std::string>& docstring) {
  if (!docstring || docstring->empty()) { return std::nullopt; }
  const std::size_t nl = docstring->find('\n');
  const std::string first = support::Trim(std::string_view(*docstring).substr(0, nl));
  if (first.empty() || support::StartsWith(first, "\"\"\"") || support::StartsWith(first, "'''")) { return std::nullopt; }
  return first;
}

} // namespace pyspect::introspect
