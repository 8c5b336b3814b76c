/***
 * Name: test_dependency_resolver
 * Purpose: Declared specifiers split into name/version; imports inferred.
 */
#include <gtest/gtest.h>
#include "introspect/DependencyResolver.h"

using namespace pyspect;
using introspect::DependencyResolver;
using introspect::Provenance;

static introspect::ImportInfo importOf(const std::string& module) {
  introspect::ImportInfo info;
  info.module = module;
  return info;
}

TEST(DependencyResolver, SplitsAtFirstVersionOperator) {
  const auto dep = DependencyResolver::SplitSpecifier("requests>=2.31,<3");
  EXPECT_EQ(dep.name, "requests");
  EXPECT_EQ(dep.versionSpec.value_or(""), ">=2.31,<3");
  EXPECT_EQ(dep.provenance, Provenance::Declared);
}

TEST(DependencyResolver, BareNameHasNoVersion) {
  const auto dep = DependencyResolver::SplitSpecifier("  rich  ");
  EXPECT_EQ(dep.name, "rich");
  EXPECT_FALSE(dep.versionSpec.has_value());
}

TEST(DependencyResolver, PinnedAndLessThan) {
  EXPECT_EQ(DependencyResolver::SplitSpecifier("numpy==1.26").versionSpec.value_or(""), "==1.26");
  EXPECT_EQ(DependencyResolver::SplitSpecifier("attrs <24").name, "attrs");
  EXPECT_EQ(DependencyResolver::SplitSpecifier("attrs <24").versionSpec.value_or(""), "<24");
}

TEST(DependencyResolver, DeclaredComeFirstThenInferredTopLevelImports) {
  metadata::InlineMetadataBlock block;
  block.dependencies = {"requests<3"};
  const std::vector<introspect::ImportInfo> imports{importOf("os"), importOf("os.path"), importOf("a.b.c"), importOf("requests")};
  const auto deps = DependencyResolver::Resolve(block, imports);
  ASSERT_EQ(deps.size(), 3u);
  EXPECT_EQ(deps[0].name, "requests");
  EXPECT_EQ(deps[0].provenance, Provenance::Declared);
  EXPECT_EQ(deps[1].name, "os");
  EXPECT_EQ(deps[1].provenance, Provenance::Inferred);
  EXPECT_FALSE(deps[1].versionSpec.has_value());
  // no de-duplication between declared and inferred
  EXPECT_EQ(deps[2].name, "requests");
  EXPECT_EQ(deps[2].provenance, Provenance::Inferred);
}

TEST(DependencyResolver, BareRelativeImportInfersEmptyName) {
  // `from . import x` records an empty module, which has no dot
  const auto deps = DependencyResolver::Resolve(std::nullopt, {importOf(""), importOf("pkg")});
  ASSERT_EQ(deps.size(), 2u);
  EXPECT_EQ(deps[0].name, "");
  EXPECT_EQ(deps[0].provenance, Provenance::Inferred);
  EXPECT_EQ(deps[1].name, "pkg");
}

TEST(DependencyResolver, NoBlockMeansOnlyInferred) {
  const auto deps = DependencyResolver::Resolve(std::nullopt, {importOf("json")});
  ASSERT_EQ(deps.size(), 1u);
  EXPECT_EQ(deps[0].name, "json");
}
