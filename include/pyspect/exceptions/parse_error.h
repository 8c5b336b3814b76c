/***
 * Name: pyspect::exceptions::ParseError
 * Purpose: Exception for tokenizer and parser failures on script source.
 * Inputs: Error message, 1-based line and column of the offending token
 * Outputs: Exception object carrying the source location
 * Theory of Operation: The message is the bare parser message; callers format
 *   location suffixes themselves.
 */
#pragma once

#include "pyspect/exceptions/pyspect_exception.h"

namespace pyspect {
namespace exceptions {

class ParseError : public PyspectException {
 public:
  ParseError(std::string msg, int line, int col) noexcept;

  int line() const noexcept { return line_; }
  int col() const noexcept { return col_; }

 private:
  int line_{0};
  int col_{0};
};

}  // namespace exceptions
}  // namespace pyspect
