/***
 * Name: pyspect::docgen (impl)
 */
#include "docgen/Documentation.h"
#include "pyspect/support/json_writer.h"
#include "pyspect/support/text.h"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace pyspect::docgen {

namespace {

std::u32string toCodePoints(std::string_view text) {
  std::u32string out;
  std::size_t pos = 0;
  while (pos < text.size()) {
    char32_t cp = 0;
    if (!support::DecodeUtf8(text, pos, cp)) {
      // Keep stray bytes as single units so nothing is lost.
      cp = static_cast<unsigned char>(text[pos]);
      ++pos;
    }
    out.push_back(cp);
  }
  return out;
}

std::string toUtf8(std::u32string_view cps) {
  std::string out;
  for (char32_t cp : cps) { support::AppendUtf8(out, cp); }
  return out;
}

bool isSpace(char32_t cp) {
  return cp < 0x80 && support::IsSpace(static_cast<char>(cp));
}

} // namespace

DocumentationRequest BuildRequest(std::string scriptContent, const introspect::ScriptMetadata& md,
                                  std::size_t maxLength) {
  DocumentationRequest req;
  req.scriptContent = std::move(scriptContent);
  req.entryPoint = md.entryPoints.empty() ? "Unknown" : introspect::to_string(md.entryPoints.front().kind);
  for (const auto& fn : md.functions) { req.functions.push_back(FunctionSummary{fn.name, fn.docstring}); }
  for (const auto& dep : md.dependencies) { req.dependencies.push_back(dep.name); }
  req.currentDescription = md.description;
  req.maxLength = maxLength;
  return req;
}

std::string SerializeRequest(const DocumentationRequest& request) {
  support::JsonWriter json;
  json.beginObject();
  json.key("script_content").str(request.scriptContent);
  json.key("entry_point").str(request.entryPoint);
  json.key("functions").beginArray();
  for (const auto& fn : request.functions) {
    json.beginObject();
    json.key("name").str(fn.name);
    json.key("docstring").optStr(fn.docstring);
    json.endObject();
  }
  json.endArray();
  json.key("dependencies").strArray(request.dependencies);
  json.key("current_description").str(request.currentDescription.value_or(""));
  json.key("max_length").integer(static_cast<std::int64_t>(request.maxLength));
  json.endObject();
  return json.text();
}

std::string TruncateDescription(std::string_view description, std::size_t maxLength) {
  const std::u32string text = toCodePoints(support::TrimView(description));
  if (text.size() <= maxLength) { return toUtf8(text); }

  std::u32string_view prefix(text.data(), maxLength);
  std::vector<std::u32string_view> words;
  std::size_t i = 0;
  while (i < prefix.size()) {
    while (i < prefix.size() && isSpace(prefix[i])) { ++i; }
    const std::size_t start = i;
    while (i < prefix.size() && !isSpace(prefix[i])) { ++i; }
    if (i > start) { words.push_back(prefix.substr(start, i - start)); }
  }

  if (words.size() > 1) {
    words.pop_back();
    std::u32string joined;
    for (std::size_t w = 0; w < words.size(); ++w) {
      if (w) { joined.push_back(U' '); }
      joined.append(words[w]);
    }
    return toUtf8(joined) + "...";
  }
  const std::size_t keep = maxLength >= 3 ? maxLength - 3 : 0;
  return toUtf8(std::u32string_view(text.data(), keep)) + "...";
}

void Accept(DocumentationResponse& response, std::size_t maxLength) {
  if (!response.success || !response.description) { return; }
  response.description = TruncateDescription(*response.description, maxLength);
}

} // namespace pyspect::docgen
