/***
 * Name: pyspect::introspect::DependencyResolver (impl)
 */
#include "introspect/DependencyResolver.h"
#include "pyspect/support/text.h"

#include <algorithm>
#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace pyspect::introspect {

namespace {
constexpr std::array<std::string_view, 5> kVersionOperators{"==", ">=", "<=", ">", "<"};
} // namespace

DependencyInfo DependencyResolver::SplitSpecifier(std::string_view specifier) {
  std::size_t cut = specifier.size();
  for (const auto op : kVersionOperators) {
    cut = std::min(cut, specifier.find(op));
  }
  DependencyInfo dep;
  dep.name = support::Trim(specifier.substr(0, cut));
  const std::string rest = support::Trim(specifier.substr(cut));
  if (!rest.empty()) { dep.versionSpec = rest; }
  dep.provenance = Provenance::Declared;
  return dep;
}

std::vector<DependencyInfo> DependencyResolver::Resolve(const std::optional<metadata::InlineMetadataBlock>& block,
                                                        const std::vector<ImportInfo>& imports) {
  std::vector<DependencyInfo> out;
  if (block) {
    for (const auto& spec : block->dependencies) { out.push_back(SplitSpecifier(spec)); }
  }
  for (const auto& imp : imports) {
    if (imp.module.find('.') != std::string::npos) { continue; }
    DependencyInfo dep;
    dep.name = imp.module;
    dep.provenance = Provenance::Inferred;
    out.push_back(std::move(dep));
  }
  return out;
}

} // namespace pyspect::introspect
