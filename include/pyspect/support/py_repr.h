/***
 * Name: pyspect::support (py_repr)
 * Purpose: Render literal values the way the script language's repr() does.
 * Inputs: Decoded literal values or numeric literal source text
 * Outputs: Display strings used for defaults, annotations and decorators
 * Theory of Operation:
 *   - Strings choose single quotes unless the text contains a single quote and
 *     no double quote; non-printable characters are escaped using ICU general
 *     categories to decide printability.
 *   - Floats use the shortest round-trip digits (std::to_chars) laid out in
 *     fixed notation for decimal exponents in [-4, 16) and scientific
 *     notation otherwise.
 *   - Integer literals in any base are normalized to decimal.
 */
#pragma once

#include <string>
#include <string_view>

namespace pyspect::support {

std::string ReprString(std::string_view utf8);
/**
 * Escape backslashes and non-printable characters the way the
 * "unicode_escape" codec does, without adding quotes. Newline and tab are
 * left alone unless escapeWhitespace is set.
 */
std::string EscapeUnprintable(std::string_view utf8, bool escapeWhitespace);
std::string ReprBytes(std::string_view bytes);
std::string ReprFloat(double value);

/** Normalize an integer literal token (e.g. "0x_ff", "1_000") to decimal text. */
std::string ReprIntLiteral(std::string_view text);
/** Render a float literal token via ReprFloat. */
std::string ReprFloatLiteral(std::string_view text);
/** Render an imaginary literal token (e.g. "1j", "2.50J") as repr() would. */
std::string ReprImagLiteral(std::string_view text);

}  // namespace pyspect::support
