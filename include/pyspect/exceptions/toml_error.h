/***
 * Name: pyspect::exceptions::TomlError
 * Purpose: Exception for malformed inline metadata documents.
 * Inputs: Error message and 1-based line within the document
 * Outputs: Exception object
 */
#pragma once

#include "pyspect/exceptions/pyspect_exception.h"

namespace pyspect {
namespace exceptions {

class TomlError : public PyspectException {
 public:
  TomlError(std::string msg, int line) noexcept;

  int line() const noexcept { return line_; }

 private:
  int line_{0};
};

}  // namespace exceptions
}  // namespace pyspect
