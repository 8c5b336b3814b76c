/***
 * Name: pyspect::exceptions::DigestError
 * Purpose: Exception for content hash computation failures.
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

class DigestError : public PyspectException {
 public:
  explicit DigestError(std::string msg) noexcept : PyspectException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pyspect
