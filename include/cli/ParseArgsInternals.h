/**
 * @file
 * @brief Declarations for pyspect CLI argument parsing helpers.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "cli/Options.h"
#include "cli/ColorMode.h"

namespace pyspect::cli::detail {

/** Outcome of offering one argument to a handler. */
enum class ArgResult {
    NotHandled,
    Handled,
    Error
};

/** Return true if `arg` exactly matches the `flag`. */
bool isFlag(std::string_view arg, std::string_view flag);

/** Parse `--color=<value>` to ColorMode with default fallback. */
ColorMode parseColorValue(std::string_view value);

/** Parse a `--mode` value; prints a diagnostic and returns false if invalid. */
bool parseModeValue(std::string_view value, Options& out);

/** Collect remaining argv items as input paths starting at index. */
void collectRemainingAsInputs(std::size_t startIndex, int argc, char** argv, Options& out);

/** Detect unknown option-like arguments beginning with '-' that aren't supported. */
bool isUnknownOptionArg(std::string_view arg);

/** Validate incompatible flags (--metrics with --metrics-json). */
bool hasConflictingMetrics(const Options& opts);

/** Handle boolean, flag-only options like -h, --metrics, --quiet, etc. */
bool applySimpleBoolFlags(std::string_view arg, Options& out);

/** Handle `--key=value` style options (mode, output, log-path, color). */
ArgResult applyPrefixedOptions(std::string_view arg, Options& out);

/** Handle `-o <file>`, `--output <file>` and `--mode <v>` by consuming the next argv item. */
ArgResult handleSeparateValueFlag(int& idx, int argc, char** argv, Options& out);

} // namespace pyspect::cli::detail
