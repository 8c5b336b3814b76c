/***
 * Name: pyspect::introspect::ScriptSource (impl)
 */
#include "introspect/ScriptSource.h"
#include "pyspect/support/fs.h"

#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

namespace pyspect::introspect {

namespace {

std::string absolutePath(const std::string& path) {
  namespace fs = std::filesystem;
  std::error_code ec;
  fs::path abs = fs::absolute(fs::path(path), ec);
  if (ec) { return path; }
  return abs.lexically_normal().string();
}

} // namespace

bool LoadScript(const std::string& path, ScriptSource& out, std::string& err) {
  std::string bytes;
  if (!support::ReadFile(path, bytes, err)) { return false; }
  out = FromText(path, std::move(bytes));
  return true;
}

ScriptSource FromText(const std::string& path, std::string text) {
  ScriptSource src;
  src.path = absolutePath(path);
  src.name = std::filesystem::path(path).stem().string();
  src.bytes = std::move(text);
  return src;
}

} // namespace pyspect::introspect
