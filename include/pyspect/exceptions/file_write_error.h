/***
 * Name: pyspect::exceptions::FileWriteError
 * Purpose: Exception for failures writing the result envelope.
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

class FileWriteError : public PyspectException {
 public:
  explicit FileWriteError(std::string msg) noexcept : PyspectException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pyspect
