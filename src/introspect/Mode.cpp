/***
 * Name: pyspect::introspect::Mode (impl)
 */
#include "introspect/Mode.h"

namespace pyspect::introspect {

const char* to_string(const Mode mode) { return mode == Mode::Import ? "import" : "safe"; }

bool ParseMode(std::string_view text, Mode& out) {
  if (text == "safe") { out = Mode::Safe; return true; }
  if (text == "import") { out = Mode::Import; return true; }
  return false;
}

} // namespace pyspect::introspect
