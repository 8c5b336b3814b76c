/***
 * Name: pyspect::exceptions::FileReadError
 * Purpose: Exception for filesystem read failures.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from PyspectException.
 */
#pragma once

#include <string>
#include <utility>

#include "pyspect/exceptions/pyspect_exception.h"

namespace pyspect {
namespace exceptions {

class FileReadError : public PyspectException {
 public:
  explicit FileReadError(std::string msg) noexcept : PyspectException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pyspect
