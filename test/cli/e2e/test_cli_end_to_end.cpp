/***
 * Name: test_cli_end_to_end
 * Purpose: Exercise the pyspect binary end-to-end: help, version, exit
 *   codes, output destinations, metrics and logs.
 */
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <sys/wait.h>
#include <system_error>

namespace fs = std::filesystem;

static fs::path testing_dir() {
  const fs::path dir = fs::temp_directory_path() / "pyspect_e2e";
  std::error_code ec;
  fs::create_directories(dir, ec);
  return dir;
}

static void write_file(const fs::path& path, const std::string& s) {
  std::ofstream out(path, std::ios::binary); out << s;
}

static std::string read_all(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  std::ostringstream ss; ss << in.rdbuf();
  return ss.str();
}

// Runs the binary with args; stdout and stderr are captured to files.
static int run_pyspect(const std::string& args, const std::string& tag) {
  const auto dir = testing_dir();
  const std::string cmd = std::string("\"") + PYSPECT_BIN_PATH + "\" " + args + " > \"" + (dir / (tag + ".out")).string() +
                          "\" 2> \"" + (dir / (tag + ".err")).string() + "\"";
  const int rc = std::system(cmd.c_str());
  return WIFEXITED(rc) ? WEXITSTATUS(rc) : -1;
}

static std::string out_of(const std::string& tag) { return read_all(testing_dir() / (tag + ".out")); }
static std::string err_of(const std::string& tag) { return read_all(testing_dir() / (tag + ".err")); }

static std::string hello_script() {
  const auto path = testing_dir() / "hello.py";
  write_file(path, "\"\"\"Simple hello script for container testing.\"\"\"\n\ndef main():\n    print('hi')\n");
  return path.string();
}

TEST(CLI_EndToEnd, HelpPrintsUsage) {
  ASSERT_EQ(run_pyspect("--help", "help"), 0);
  EXPECT_NE(out_of("help").find("pyspect [options] <script>"), std::string::npos);
  ASSERT_EQ(run_pyspect("-h", "help2"), 0);
  EXPECT_NE(out_of("help2").find("pyspect [options] <script>"), std::string::npos);
}

TEST(CLI_EndToEnd, VersionPrintsVersion) {
  ASSERT_EQ(run_pyspect("--version", "version"), 0);
  EXPECT_EQ(out_of("version").rfind("pyspect ", 0), 0u);
}

TEST(CLI_EndToEnd, ArgumentErrorsExitTwo) {
  EXPECT_EQ(run_pyspect("", "noargs"), 2);
  EXPECT_NE(err_of("noargs").find("pyspect: argument parse error"), std::string::npos);
  EXPECT_NE(err_of("noargs").find("pyspect [options] <script>"), std::string::npos);
  EXPECT_EQ(run_pyspect("--mode=bogus x.py", "badmode"), 2);
  EXPECT_NE(err_of("badmode").find("invalid value 'bogus' for '--mode'"), std::string::npos);
}

TEST(CLI_EndToEnd, MissingScriptExitsOne) {
  const auto missing = (testing_dir() / "does_not_exist.py").string();
  EXPECT_EQ(run_pyspect("\"" + missing + "\"", "missing"), 1);
  EXPECT_NE(err_of("missing").find("pyspect: error: script not found: " + missing), std::string::npos);
  EXPECT_TRUE(out_of("missing").empty());
}

TEST(CLI_EndToEnd, HelloScriptToStdout) {
  ASSERT_EQ(run_pyspect("\"" + hello_script() + "\"", "hello"), 0);
  const auto out = out_of("hello");
  ASSERT_FALSE(out.empty());
  EXPECT_EQ(out.front(), '{');
  EXPECT_EQ(out.back(), '\n');
  EXPECT_NE(out.find("\"schema_version\": \"1.0.0\""), std::string::npos);
  EXPECT_NE(out.find("\"description\": \"Simple hello script for container testing.\""), std::string::npos);
  EXPECT_NE(out.find("\"inline_metadata_block\": null"), std::string::npos);
  EXPECT_NE(out.find("\"kind\": \"MainFunction\""), std::string::npos);
  EXPECT_TRUE(err_of("hello").empty());
}

TEST(CLI_EndToEnd, OutputFileHasNoTrailingNewline) {
  const auto outPath = (testing_dir() / "hello.json").string();
  std::error_code ec;
  fs::remove(outPath, ec);
  ASSERT_EQ(run_pyspect("-o \"" + outPath + "\" \"" + hello_script() + "\"", "tofile"), 0);
  EXPECT_TRUE(out_of("tofile").empty());
  const auto json = read_all(outPath);
  ASSERT_FALSE(json.empty());
  EXPECT_EQ(json.back(), '}');
}

TEST(CLI_EndToEnd, SyntaxErrorStillProducesResult) {
  const auto path = testing_dir() / "broken.py";
  write_file(path, "def f(:\n    pass\n");
  ASSERT_EQ(run_pyspect("--color=never \"" + path.string() + "\"", "broken"), 0);
  EXPECT_NE(out_of("broken").find("\"kind\": \"SyntaxError\""), std::string::npos);
  const auto err = err_of("broken");
  EXPECT_NE(err.find("warning: SyntaxError: "), std::string::npos);
  EXPECT_EQ(err.find("\033["), std::string::npos);

  ASSERT_EQ(run_pyspect("-q \"" + path.string() + "\"", "broken_quiet"), 0);
  EXPECT_TRUE(err_of("broken_quiet").empty());
}

TEST(CLI_EndToEnd, MetricsTextAndJson) {
  const auto script = hello_script();
  ASSERT_EQ(run_pyspect("--metrics \"" + script + "\"", "metrics"), 0);
  const auto txt = err_of("metrics");
  EXPECT_NE(txt.find("== Metrics =="), std::string::npos);
  EXPECT_NE(txt.find("Lex"), std::string::npos);
  EXPECT_NE(txt.find("Parse"), std::string::npos);

  ASSERT_EQ(run_pyspect("--metrics-json \"" + script + "\"", "metrics_json"), 0);
  const auto js = err_of("metrics_json");
  EXPECT_NE(js.find("\"lex\""), std::string::npos);
  EXPECT_NE(js.find("\"parse\""), std::string::npos);
  EXPECT_NE(js.find("\"hash\""), std::string::npos);
  EXPECT_NE(js.find("\"read.bytes\""), std::string::npos);
  // stdout still carries only the result
  EXPECT_EQ(out_of("metrics_json").find("durations_ms"), std::string::npos);
}

TEST(CLI_EndToEnd, LexerAndAstLogsWritten) {
  const auto logDir = testing_dir() / "logs";
  std::error_code ec;
  fs::remove_all(logDir, ec);
  ASSERT_EQ(run_pyspect("--log-lexer --log-ast --log-path=\"" + logDir.string() + "\" \"" + hello_script() + "\"", "logs"), 0);
  bool sawLexer = false;
  bool sawAst = false;
  for (const auto& entry : fs::directory_iterator(logDir)) {
    const auto name = entry.path().filename().string();
    if (name.find("lexer.tokens.log") != std::string::npos) {
      sawLexer = true;
      EXPECT_NE(read_all(entry.path()).find(":3:1 def def"), std::string::npos);
    }
    if (name.find("ast.log") != std::string::npos) {
      sawAst = true;
      EXPECT_NE(read_all(entry.path()).find("FunctionDef @3:1 name=main"), std::string::npos);
    }
  }
  EXPECT_TRUE(sawLexer);
  EXPECT_TRUE(sawAst);
}

TEST(CLI_EndToEnd, ImportModeRuns) {
  ASSERT_EQ(run_pyspect("--mode import \"" + hello_script() + "\"", "import_mode"), 0);
  EXPECT_NE(out_of("import_mode").find("\"errors\": []"), std::string::npos);
}

TEST(CLI_EndToEnd, SafeModeNeverExecutesTheScript) {
  const auto marker = testing_dir() / "safe_marker";
  std::error_code ec;
  fs::remove(marker, ec);
  const auto path = testing_dir() / "side_effects.py";
  write_file(path,
             "\"\"\"Leaves a marker behind when run.\"\"\"\n"
             "import sys\n"
             "open(r'" + marker.string() + "', 'w').write('ran')\n"
             "raise SystemExit(3)\n"
             "def main():\n    pass\n");
  ASSERT_EQ(run_pyspect("--mode=safe \"" + path.string() + "\"", "safe_isolation"), 0);
  const auto out = out_of("safe_isolation");
  EXPECT_NE(out.find("\"schema_version\": \"1.0.0\""), std::string::npos);
  EXPECT_NE(out.find("\"description\": \"Leaves a marker behind when run.\""), std::string::npos);
  EXPECT_NE(out.find("\"errors\": []"), std::string::npos);
  EXPECT_FALSE(fs::exists(marker));
}

TEST(CLI_EndToEnd, DeeplyNestedScriptIsReportedNotFatal) {
  const auto path = testing_dir() / "deep.py";
  write_file(path, "x = " + std::string(100000, '(') + "1" + std::string(100000, ')') + "\n");
  ASSERT_EQ(run_pyspect("-q \"" + path.string() + "\"", "deep"), 0);
  const auto out = out_of("deep");
  EXPECT_NE(out.find("\"kind\": \"SyntaxError\""), std::string::npos);
  EXPECT_NE(out.find("too many nested parentheses"), std::string::npos);
}
