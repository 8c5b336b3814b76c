/***
 * Name: test_syntax_analyzer
 * Purpose: Fact extraction from parsed scripts: functions, classes, imports,
 *   docstrings and entry points.
 */
#include <gtest/gtest.h>
#include "introspect/SyntaxAnalyzer.h"

using namespace pyspect;
using introspect::SyntaxAnalyzer;

static introspect::SyntaxFacts factsOf(const std::string& src) {
  auto mod = SyntaxAnalyzer::Parse(src, "facts.py");
  return SyntaxAnalyzer::Extract(*mod);
}

TEST(SyntaxAnalyzer, ParametersDefaultsAndHints) {
  const auto facts = factsOf("def f(a, b: int = 1, c=2, *rest, d=3, **kw) -> list[str]:\n    pass\n");
  ASSERT_EQ(facts.functions.size(), 1u);
  const auto& fn = facts.functions[0];
  ASSERT_EQ(fn.parameters.size(), 3u);
  EXPECT_EQ(fn.parameters[0].name, "a");
  EXPECT_FALSE(fn.parameters[0].hasDefault);
  EXPECT_FALSE(fn.parameters[0].defaultValue.has_value());
  EXPECT_EQ(fn.parameters[1].typeHint.value_or(""), "int");
  EXPECT_EQ(fn.parameters[1].defaultValue.value_or(""), "1");
  EXPECT_TRUE(fn.parameters[1].hasDefault);
  EXPECT_EQ(fn.parameters[2].defaultValue.value_or(""), "2");
  EXPECT_EQ(fn.returns.value_or(""), "list[str]");
}

TEST(SyntaxAnalyzer, DefaultRendering) {
  const auto facts = factsOf("def f(a=..., b=None, c='x', d=(1, 2), e=-1, f=0x10, g=d.e):\n    pass\n");
  const auto& p = facts.functions[0].parameters;
  ASSERT_EQ(p.size(), 7u);
  EXPECT_EQ(*p[0].defaultValue, "Ellipsis");
  EXPECT_EQ(*p[1].defaultValue, "None");
  EXPECT_EQ(*p[2].defaultValue, "'x'");
  EXPECT_EQ(*p[3].defaultValue, "(1, 2)");
  EXPECT_EQ(*p[4].defaultValue, "-1");
  EXPECT_EQ(*p[5].defaultValue, "16");
  EXPECT_EQ(*p[6].defaultValue, "d.e");
}

TEST(SyntaxAnalyzer, DecoratorsAsyncAndDocstrings) {
  const auto facts = factsOf(
      "@app.command()\n"
      "async def serve(port: int):\n"
      "    \"\"\"Start the server.\n"
      "\n"
      "        Listens forever.\n"
      "    \"\"\"\n");
  ASSERT_EQ(facts.functions.size(), 1u);
  const auto& fn = facts.functions[0];
  EXPECT_EQ(fn.name, "serve");
  EXPECT_EQ(fn.line, 2);
  EXPECT_TRUE(fn.isAsync);
  ASSERT_EQ(fn.decorators.size(), 1u);
  EXPECT_EQ(fn.decorators[0], "app.command()");
  EXPECT_EQ(fn.docstring.value_or(""), "Start the server.\n\nListens forever.");
}

TEST(SyntaxAnalyzer, MainAndCommandEntryPoints) {
  const auto facts = factsOf(
      "import typer\n"
      "app = typer.Typer()\n"
      "@app.command\n"
      "def hello(): pass\n"
      "@cli.command('x')\n"
      "def main(): pass\n"
      "@other\n"
      "def plain(): pass\n");
  ASSERT_EQ(facts.entryPoints.size(), 2u);
  EXPECT_EQ(facts.entryPoints[0].name, "hello");
  EXPECT_EQ(facts.entryPoints[0].kind, introspect::EntryPointKind::CliCommand);
  EXPECT_EQ(facts.entryPoints[1].name, "main");
  EXPECT_EQ(facts.entryPoints[1].callable, "main");
  EXPECT_EQ(facts.entryPoints[1].kind, introspect::EntryPointKind::MainFunction);
  EXPECT_FALSE(facts.entryPoints[1].module.has_value());
}

TEST(SyntaxAnalyzer, ClassesCollectMethodsAndBases) {
  const auto facts = factsOf(
      "class Tool(Base, mixins.Loud, metaclass=Meta):\n"
      "    '''A tool.'''\n"
      "    def run(self, n=1): pass\n"
      "    async def stop(self): pass\n"
      "    x = 1\n");
  ASSERT_EQ(facts.classes.size(), 1u);
  const auto& cls = facts.classes[0];
  EXPECT_EQ(cls.name, "Tool");
  EXPECT_EQ(cls.line, 1);
  EXPECT_EQ(cls.docstring.value_or(""), "A tool.");
  const std::vector<std::string> bases{"Base", "mixins.Loud"};
  EXPECT_EQ(cls.baseClasses, bases);
  ASSERT_EQ(cls.methods.size(), 2u);
  EXPECT_EQ(cls.methods[0].parameters.size(), 2u);
  EXPECT_TRUE(cls.methods[1].isAsync);
  // methods are also listed among the script's functions, in source order
  ASSERT_EQ(facts.functions.size(), 2u);
  EXPECT_EQ(facts.functions[0].name, "run");
}

TEST(SyntaxAnalyzer, NestedDefinitionsAreVisitedInOrder) {
  const auto facts = factsOf(
      "def outer():\n"
      "    def inner(): pass\n"
      "if True:\n"
      "    import json\n"
      "def last(): pass\n");
  ASSERT_EQ(facts.functions.size(), 3u);
  EXPECT_EQ(facts.functions[0].name, "outer");
  EXPECT_EQ(facts.functions[1].name, "inner");
  EXPECT_EQ(facts.functions[2].name, "last");
  ASSERT_EQ(facts.imports.size(), 1u);
  EXPECT_EQ(facts.imports[0].line, 4);
}

TEST(SyntaxAnalyzer, ImportRecords) {
  const auto facts = factsOf(
      "import os, numpy as np\n"
      "from a.b import c, d as e\n"
      "from . import sibling\n"
      "from ..pkg import mod\n");
  ASSERT_EQ(facts.imports.size(), 5u);
  EXPECT_EQ(facts.imports[0].module, "os");
  EXPECT_FALSE(facts.imports[0].alias.has_value());
  EXPECT_FALSE(facts.imports[0].isFromImport);
  EXPECT_EQ(facts.imports[1].module, "numpy");
  EXPECT_EQ(facts.imports[1].alias.value_or(""), "np");
  EXPECT_EQ(facts.imports[2].module, "a.b");
  const std::vector<std::string> names{"c", "d"};
  EXPECT_EQ(facts.imports[2].names, names);
  EXPECT_TRUE(facts.imports[2].isFromImport);
  EXPECT_FALSE(facts.imports[2].alias.has_value());
  EXPECT_EQ(facts.imports[3].module, "");
  EXPECT_TRUE(facts.imports[3].isFromImport);
  EXPECT_EQ(facts.imports[4].module, "pkg");
  EXPECT_EQ(facts.imports[4].line, 4);
}

TEST(SyntaxAnalyzer, ModuleDocstringAndDescription) {
  const auto facts = factsOf("\"\"\"Fetch things.\n\nMore text here.\n\"\"\"\nx = 1\n");
  EXPECT_EQ(facts.docstring.value_or(""), "Fetch things.\n\nMore text here.\n");
  EXPECT_EQ(facts.description.value_or(""), "Fetch things.");
}

TEST(SyntaxAnalyzer, NoDocstringWhenFirstStatementIsNotAString) {
  const auto facts = factsOf("x = 1\n'not a docstring'\n");
  EXPECT_FALSE(facts.docstring.has_value());
  EXPECT_FALSE(facts.description.has_value());
}

TEST(SyntaxAnalyzer, EmptyScriptHasNoFacts) {
  const auto facts = factsOf("");
  EXPECT_FALSE(facts.docstring.has_value());
  EXPECT_TRUE(facts.functions.empty());
  EXPECT_TRUE(facts.imports.empty());
}

TEST(SyntaxAnalyzer, SyntaxErrorMessageNamesFileAndLine) {
  try {
    (void)SyntaxAnalyzer::Parse("def f(:\n", "bad.py");
    FAIL() << "expected ParseError";
  } catch (const exceptions::ParseError& e) {
    EXPECT_EQ(e.line(), 1);
    const auto text = SyntaxAnalyzer::FormatSyntaxError(e, "/tmp/bad.py");
    EXPECT_NE(text.find(" (/tmp/bad.py, line 1)"), std::string::npos);
  }
}

TEST(SyntaxAnalyzer, RejectsNullBytesAndBadUtf8) {
  try {
    (void)SyntaxAnalyzer::Parse(std::string("x = 1\ny\0 = 2\n", 13), "nul.py");
    FAIL() << "expected ParseError";
  } catch (const exceptions::ParseError& e) {
    EXPECT_STREQ(e.what(), "source code cannot contain null bytes");
    EXPECT_EQ(e.line(), 2);
  }
  try {
    (void)SyntaxAnalyzer::Parse("s = '\xff'\n", "bad.py");
    FAIL() << "expected ParseError";
  } catch (const exceptions::ParseError& e) {
    EXPECT_STREQ(e.what(), "(unicode error) 'utf-8' codec can't decode byte 0xff in position 5: invalid start byte");
  }
  try {
    (void)SyntaxAnalyzer::Parse("s = '\xc3('\n", "bad.py");
    FAIL() << "expected ParseError";
  } catch (const exceptions::ParseError& e) {
    EXPECT_NE(std::string(e.what()).find("invalid continuation byte"), std::string::npos);
  }
}

TEST(SyntaxAnalyzer, ParseTimesStagesWhenMetricsGiven) {
  obs::Metrics metrics;
  std::vector<lex::Token> tokens;
  (void)SyntaxAnalyzer::Parse("x = 1\n", "m.py", &tokens, &metrics);
  EXPECT_FALSE(tokens.empty());
  EXPECT_TRUE(metrics.hasDuration("Lex"));
  EXPECT_TRUE(metrics.hasDuration("Parse"));
}
