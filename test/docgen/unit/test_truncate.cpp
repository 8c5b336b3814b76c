/***
 * Name: test_truncate
 * Purpose: Description clamping and documentation request assembly.
 */
#include <gtest/gtest.h>
#include "docgen/Documentation.h"

using namespace pyspect;

TEST(Truncate, ShortTextIsOnlyTrimmed) {
  EXPECT_EQ(docgen::TruncateDescription("  Backs up the db.  ", 80), "Backs up the db.");
  EXPECT_EQ(docgen::TruncateDescription("exact", 5), "exact");
}

TEST(Truncate, BreaksAtWordBoundary) {
  EXPECT_EQ(docgen::TruncateDescription("one two three four", 10), "one two...");
}

TEST(Truncate, SingleLongWordIsCut) {
  EXPECT_EQ(docgen::TruncateDescription("abcdefghijkl", 8), "abcde...");
}

TEST(Truncate, CountsCodePointsNotBytes) {
  EXPECT_EQ(docgen::TruncateDescription("\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9", 4), "\xC3\xA9...");
  EXPECT_EQ(docgen::TruncateDescription("caf\xC3\xA9", 4), "caf\xC3\xA9");
}

TEST(Truncate, AcceptOnlyTouchesSuccessfulResponses) {
  docgen::DocumentationResponse ok{true, std::string("alpha beta gamma"), std::nullopt};
  docgen::Accept(ok, 12);
  EXPECT_EQ(ok.description.value_or(""), "alpha beta...");

  docgen::DocumentationResponse failed{false, std::string("alpha beta gamma"), std::string("offline")};
  docgen::Accept(failed, 5);
  EXPECT_EQ(failed.description.value_or(""), "alpha beta gamma");
}

TEST(Request, BuiltFromMetadata) {
  introspect::ScriptMetadata md;
  md.description = "Old text";
  introspect::FunctionInfo fn;
  fn.name = "main";
  fn.docstring = "Entry.";
  md.functions.push_back(fn);
  md.entryPoints.push_back({"main", "main", std::nullopt, introspect::EntryPointKind::MainFunction});
  introspect::DependencyInfo dep;
  dep.name = "rich";
  md.dependencies.push_back(dep);

  const auto req = docgen::BuildRequest("print(1)\n", md, 60);
  EXPECT_EQ(req.entryPoint, "MainFunction");
  ASSERT_EQ(req.functions.size(), 1u);
  EXPECT_EQ(req.functions[0].docstring.value_or(""), "Entry.");
  EXPECT_EQ(req.dependencies, std::vector<std::string>{"rich"});
  EXPECT_EQ(req.maxLength, 60u);

  const auto json = docgen::SerializeRequest(req);
  EXPECT_NE(json.find("\"entry_point\": \"MainFunction\""), std::string::npos);
  EXPECT_NE(json.find("\"current_description\": \"Old text\""), std::string::npos);
  EXPECT_NE(json.find("\"max_length\": 60"), std::string::npos);
}

TEST(Request, UnknownEntryPointAndEmptyDescription) {
  const auto req = docgen::BuildRequest("", introspect::ScriptMetadata{});
  EXPECT_EQ(req.entryPoint, "Unknown");
  EXPECT_EQ(req.maxLength, docgen::kDefaultMaxLength);
  EXPECT_NE(docgen::SerializeRequest(req).find("\"current_description\": \"\""), std::string::npos);
}
