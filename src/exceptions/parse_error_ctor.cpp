/***
 * Name: pyspect::exceptions::ParseError::ParseError
 * Purpose: Construct a parse error tagged with its source location.
 */
#include "pyspect/exceptions/parse_error.h"

#include <utility>

namespace pyspect::exceptions {

ParseError::ParseError(std::string msg, const int line, const int col) noexcept
    : PyspectException(std::move(msg)), line_(line), col_(col) {}

}  // namespace pyspect::exceptions
