/***
 * Name: pyspect::Engine::run
 * Purpose: Execute one introspection run end-to-end.
 */
#include "engine/Engine.h"
#include "ast/Module.h"
#include "cli/ColorMode.h"
#include "cli/Options.h"
#include "engine/Diagnostic.h"
#include "introspect/Introspector.h"
#include "introspect/ResultAssembler.h"
#include "introspect/ResultWriter.h"
#include "introspect/ScriptSource.h"
#include "lexer/Token.h"
#include "observability/AstPrinter.h"
#include "observability/Metrics.h"
#include "pyspect/exceptions/file_read_error.h"
#include "pyspect/exceptions/file_write_error.h"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>
#include <unistd.h>
#include <utility>
#include <vector>

namespace pyspect {

namespace {

// "YYYYmmdd-HHMMSS-" prefix for log files of this run.
std::string timestamp_prefix() {
  auto tsNow = std::chrono::system_clock::now();
  const std::time_t tsTime = std::chrono::system_clock::to_time_t(tsNow);
  std::tm tmBuf{};
  localtime_r(&tsTime, &tmBuf);
  std::ostringstream timestampStream;
  timestampStream << std::put_time(&tmBuf, "%Y%m%d-%H%M%S");
  return timestampStream.str() + "-";
}

bool resolve_color(const cli::ColorMode mode) {
  if (mode == cli::ColorMode::Always) { return true; }
  if (mode == cli::ColorMode::Never) { return false; }
  constexpr int kStderrFd = 2;
  return (isatty(kStderrFd) != 0) || Engine::use_env_color();
}

// Create the log directory on demand; false disables file logging.
bool prepare_log_dir(const std::string& logDir) {
  namespace fs = std::filesystem;
  std::error_code errCode;
  if (fs::is_directory(logDir, errCode)) { return true; }
  if (!fs::create_directories(logDir, errCode) && !fs::is_directory(logDir, errCode)) {
    std::cerr << "pyspect: warning: failed to create log directory '" << logDir << "': " << errCode.message()
              << "; file logging disabled\n";
    return false;
  }
  return true;
}

} // namespace

int Engine::run(const cli::Options& opts) { // NOLINT(readability-function-size)
  if (opts.inputs.empty()) {
    std::cerr << "pyspect: no input script provided\n";
    return 2;
  }
  const std::string input = opts.inputs.front();

  {
    std::error_code errCode;
    if (!std::filesystem::exists(input, errCode)) {
      std::cerr << "pyspect: error: script not found: " << input << "\n";
      return 1;
    }
  }

  obs::Metrics metrics;
  introspect::ScriptSource source;
  {
    obs::ScopedTimer timer(metrics, "Read");
    std::string err;
    if (!introspect::LoadScript(input, source, err)) { throw exceptions::FileReadError(err); }
  }
  metrics.setGauge("read.bytes", static_cast<uint64_t>(source.bytes.size()));

  // Optional log directory
  const bool wantLogs = opts.logLexer || opts.logAst;
  const std::string logDir = opts.logPath.empty() ? std::string(".") : opts.logPath;
  const bool logsEnabled = wantLogs && prepare_log_dir(logDir);
  const std::string tsPrefix = timestamp_prefix();

  introspect::IntrospectorHooks hooks;
  hooks.metrics = &metrics;
  if (logsEnabled && opts.logLexer) {
    hooks.onTokens = [&](const std::vector<lex::Token>& tokens) {
      std::ofstream lexFile(logDir + "/" + tsPrefix + "lexer.tokens.log");
      for (const auto& tok : tokens) {
        lexFile << tok.file << ":" << tok.line << ":" << tok.col << " " << lex::to_string(tok.kind) << " " << tok.text
                << "\n";
      }
    };
  }
  if (logsEnabled && opts.logAst) {
    hooks.onAst = [&](const ast::Module& mod) {
      obs::AstPrinter printer; // NOLINT(misc-const-correctness)
      std::ofstream astFile(logDir + "/" + tsPrefix + "ast.log");
      astFile << printer.print(mod);
    };
  }

  introspect::Introspector introspector(opts.mode);
  introspector.setHooks(std::move(hooks));
  introspect::ScriptMetadata md = introspector.run(source);

  if (!opts.quiet && !md.errors.empty()) {
    const bool color = resolve_color(opts.color);
    for (const auto& rec : md.errors) {
      Diagnostic diag;
      diag.file = source.path;
      diag.line = rec.line.value_or(0);
      diag.col = rec.line ? rec.col : 0;
      diag.kind = introspect::to_string(rec.kind);
      diag.message = rec.message;
      print_diagnostic(diag, color, source.bytes);
    }
  }

  introspect::IntrospectionResult result;
  {
    obs::ScopedTimer timer(metrics, "Hash");
    result = introspect::AssembleResult(source, std::move(md));
  }

  {
    obs::ScopedTimer timer(metrics, "Serialize");
    std::string err;
    if (!introspect::WriteResult(result, opts.outputPath, std::cout, err)) { throw exceptions::FileWriteError(err); }
  }

  // Stdout carries the result; metrics go to stderr.
  if (opts.metricsJson) {
    std::cerr << metrics.summaryJson();
  } else if (opts.metrics) {
    std::cerr << metrics.summaryText();
  }
  return 0;
}

} // namespace pyspect
