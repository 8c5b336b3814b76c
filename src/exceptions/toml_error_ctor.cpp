/***
 * Name: pyspect::exceptions::TomlError::TomlError
 * Purpose: Construct a metadata document error tagged with its line.
 */
#include "pyspect/exceptions/toml_error.h"

#include <utility>

namespace pyspect::exceptions {

TomlError::TomlError(std::string msg, const int line) noexcept
    : PyspectException(std::move(msg)), line_(line) {}

}  // namespace pyspect::exceptions
