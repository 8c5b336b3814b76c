/***
 * Name: pyspect::introspect::DetectCliFramework (impl)
 */
#include "introspect/CliFrameworkDetector.h"

#include <array>
#include <functional>
#include <set>
#include <string>
#include <string_view>

namespace pyspect::introspect {

namespace {
constexpr std::array<std::string_view, 3> kFrameworks{"typer", "click", "argparse"};
} // namespace

std::optional<CliFrameworkInfo> DetectCliFramework(const std::vector<ImportInfo>& imports) {
  std::set<std::string, std::less<>> modules;
  for (const auto& imp : imports) { modules.insert(imp.module); }
  for (const auto name : kFrameworks) {
    if (modules.find(name) != modules.end()) {
      CliFrameworkInfo info;
      info.name = std::string(name);
      return info;
    }
  }
  return std::nullopt;
}

} // namespace pyspect::introspect
