#include "engine/Engine.h"
#include "cli/ParseArgs.h"
#include "cli/Usage.h"
#include "pyspect/exceptions/pyspect_exception.h"
#include "pyspect/version.h"
#include <exception>
#include <iostream>
/***
 * Name: pyspect::main
 * Purpose: CLI entry point for pyspect.
 * Inputs:
 *   - argv
 * Outputs:
 *   - Exit status
 * Theory of Operation:
 *   Parse args then invoke Engine::run. Exceptions that escape the engine
 *   are reported as `pyspect: <what>` with exit status 1.
 */
int main(const int argc, char** argv) {
  try {
    pyspect::cli::Options opts;
    if (!pyspect::cli::ParseArgs(argc, argv, opts)) {
      std::cerr << "pyspect: argument parse error\n";
      std::cerr << pyspect::cli::Usage();
      return 2;
    }
    if (opts.showHelp) {
      std::cout << pyspect::cli::Usage();
      return 0;
    }
    if (opts.showVersion) {
      std::cout << "pyspect " << pyspect::kVersion << "\n";
      return 0;
    }
    return pyspect::Engine::run(opts);
  } catch (const pyspect::exceptions::PyspectException& ex) {
    std::cerr << "pyspect: " << ex.what() << "\n";
    return 1;
  } catch (const std::exception& ex) {
    std::cerr << "pyspect: " << ex.what() << "\n";
    return 1;
  }
}
