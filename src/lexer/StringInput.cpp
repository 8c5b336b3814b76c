/***
 * Name: pyspect::lex::StringInput
 * Purpose: Serve lines out of an in-memory buffer without copying it per line.
 */
#include "lexer/StringInput.h"

#include <string>
#include <utility>

namespace pyspect::lex {

StringInput::StringInput(std::string text, std::string name)
  : text_(std::move(text)), name_(std::move(name)) {}

bool StringInput::getline(std::string& out) {
  if (done_ || offset_ > text_.size()) { return false; }
  if (offset_ == text_.size()) {
    // a trailing newline does not introduce an extra empty line
    done_ = true;
    return false;
  }
  const auto nl = text_.find('\n', offset_);
  if (nl == std::string::npos) {
    out.assign(text_, offset_, std::string::npos);
    done_ = true;
    return true;
  }
  out.assign(text_, offset_, nl - offset_);
  offset_ = nl + 1;
  return true;
}

} // namespace pyspect::lex
