/***
 * Name: pyspect::support (text)
 * Purpose: Small string helpers shared by the metadata and syntax components.
 * Theory of Operation: ASCII whitespace semantics, matching the way the
 *   script toolchain strips docstrings and comment lines.
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace pyspect::support {

/** True for space, tab, newline, carriage return, vertical tab and form feed. */
bool IsSpace(char chr);

std::string_view TrimView(std::string_view text);
std::string Trim(std::string_view text);
std::string TrimLeft(std::string_view text);

bool StartsWith(std::string_view text, std::string_view prefix);

/** Split on '\n'; a trailing '\r' on each piece is dropped. */
std::vector<std::string> SplitLines(std::string_view text);

/** Append the UTF-8 encoding of a code point. */
void AppendUtf8(std::string& out, char32_t codePoint);

/** Decode one UTF-8 sequence at `pos`; advances pos. Returns false if invalid. */
bool DecodeUtf8(std::string_view text, std::size_t& pos, char32_t& codePoint);

}  // namespace pyspect::support
