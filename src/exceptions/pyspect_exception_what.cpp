/***
 * Name: pyspect::exceptions::PyspectException::what
 * Purpose: Return the stored error message.
 * Outputs: C-string pointer valid for the lifetime of the exception
 */
#include "pyspect/exceptions/pyspect_exception.h"

namespace pyspect::exceptions {

const char* PyspectException::what() const noexcept { return message_.c_str(); }

}  // namespace pyspect::exceptions
