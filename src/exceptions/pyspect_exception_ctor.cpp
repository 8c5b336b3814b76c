/***
 * Name: pyspect::exceptions::PyspectException::PyspectException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 */
#include "pyspect/exceptions/pyspect_exception.h"

#include <utility>

namespace pyspect {
namespace exceptions {

PyspectException::PyspectException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace pyspect
