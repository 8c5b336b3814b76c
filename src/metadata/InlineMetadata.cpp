/***
 * Name: pyspect::metadata::ParseInlineMetadata (impl)
 * Purpose: Marker scan, un-prefixing and structured/heuristic extraction.
 */
#include "metadata/InlineMetadata.h"
#include "metadata/TomlReader.h"
#include "pyspect/exceptions/toml_error.h"
#include "pyspect/support/text.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pyspect::metadata {

namespace {

constexpr std::string_view kOpenMarker = "# /// script";
constexpr std::string_view kCloseMarker = "# ///";
constexpr std::string_view kDependencyAssign = "dependencies = ";

// Strip the leading '#' and at most one following space.
std::string unprefix(std::string_view line) {
  std::string_view body = support::TrimView(line);
  if (body.empty() || body.front() != '#') { return {}; }
  body.remove_prefix(1);
  if (!body.empty() && body.front() == ' ') { body.remove_prefix(1); }
  return std::string(body);
}

bool isCommentLine(std::string_view line) {
  const std::string_view trimmed = support::TrimView(line);
  return !trimmed.empty() && trimmed.front() == '#';
}

std::string join(const std::vector<std::string>& lines) {
  std::string out;
  for (const auto& line : lines) {
    out += line;
    out += '\n';
  }
  return out;
}

std::optional<InlineMetadataBlock> fromDocument(const ConfigValue& doc) {
  InlineMetadataBlock block;
  if (const ConfigValue* deps = doc.find("dependencies"); deps != nullptr) {
    if (!deps->isArray()) { return std::nullopt; }
    for (const auto& item : deps->items()) {
      if (!item.isString()) { return std::nullopt; }
      block.dependencies.push_back(item.asString());
    }
  }
  if (const ConfigValue* minPython = doc.find("requires-python"); minPython != nullptr && minPython->isString()) {
    block.minInterpreter = minPython->asString();
  }
  if (const ConfigValue* tool = doc.find("tool"); tool != nullptr && tool->isTable()) {
    block.toolConfig = *tool;
  }
  return block;
}

} // namespace

std::vector<std::string> ScanDependencyLine(const std::vector<std::string>& bodyLines) {
  std::vector<std::string> deps;
  for (const auto& raw : bodyLines) {
    const std::string line = support::Trim(raw);
    if (!support::StartsWith(line, kDependencyAssign)) { continue; }
    const std::string list = support::Trim(std::string_view(line).substr(kDependencyAssign.size()));
    if (list.size() < 2 || list.front() != '[' || list.back() != ']') { continue; }
    deps.clear();
    std::string_view inner = std::string_view(list).substr(1, list.size() - 2);
    while (!inner.empty()) {
      const std::size_t comma = inner.find(',');
      std::string_view item = inner.substr(0, comma);
      inner = comma == std::string_view::npos ? std::string_view() : inner.substr(comma + 1);
      // strip spaces and quotes from both ends
      while (!item.empty() && (item.front() == ' ' || item.front() == '"' || item.front() == '\'')) { item.remove_prefix(1); }
      while (!item.empty() && (item.back() == ' ' || item.back() == '"' || item.back() == '\'')) { item.remove_suffix(1); }
      if (!item.empty()) { deps.emplace_back(item); }
    }
  }
  return deps;
}

std::optional<InlineMetadataBlock> ParseInlineMetadata(std::string_view text) {
  const std::vector<std::string> lines = support::SplitLines(text);
  std::vector<std::string> body;
  bool inBlock = false;
  bool closed = false;
  for (const auto& line : lines) {
    const std::string_view trimmed = support::TrimView(line);
    if (!inBlock) {
      if (trimmed == kOpenMarker) { inBlock = true; }
      continue;
    }
    if (trimmed == kCloseMarker) {
      closed = true;
      break;
    }
    if (isCommentLine(line)) { body.push_back(unprefix(line)); }
  }
  if (!closed) { return std::nullopt; }
  bool blank = true;
  for (const auto& line : body) {
    if (!support::TrimView(line).empty()) { blank = false; }
  }
  if (blank) { return std::nullopt; }

  try {
    return fromDocument(ParseToml(join(body)));
  } catch (const exceptions::TomlError&) {
    // fall through to the line heuristic
  }
  std::vector<std::string> deps = ScanDependencyLine(body);
  if (deps.empty()) { return std::nullopt; }
  InlineMetadataBlock block;
  block.dependencies = std::move(deps);
  return block;
}

} // namespace pyspect::metadata
