/***
 * Name: pyspect::exceptions::EnhancementError
 * Purpose: Exception for failures inside the import-tier enhancement step.
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

class EnhancementError : public PyspectException {
 public:
  explicit EnhancementError(std::string msg) noexcept : PyspectException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pyspect
