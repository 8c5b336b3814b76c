/***
 * Name: pyspect::exceptions::PyspectException
 * Purpose: Base class for all pyspect exceptions; component code throws only
 *   types derived from this base.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception so component boundaries can
 *   convert any failure into an error record with a single catch site.
 */
#pragma once

#include <exception>
#include <string>

namespace pyspect {
namespace exceptions {

class PyspectException : public std::exception {
 public:
  virtual ~PyspectException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  explicit PyspectException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace pyspect
