/***
 * Name: pyspect::support::ReadFile
 * Purpose: Read the full contents of a file into a string, byte for byte.
 * Inputs:
 *   - path: filesystem path to read
 * Outputs:
 *   - out: populated with file contents on success
 *   - err: error message on failure
 * Theory of Operation: Binary std::ifstream with exceptions disabled; checks
 *   the stream after draining so partial reads are reported.
 */
// NOLINTNEXTLINE(misc-include-cleaner) - include interface to ensure signature stays in sync
#include "pyspect/support/fs.h"

#include <fstream>
#include <ios>
#include <sstream>
#include <string>

namespace pyspect {
namespace support {

bool ReadFile(const std::string& path, std::string& out, std::string& err) {
  std::ifstream file_stream(path, std::ios::binary);
  if (!file_stream.good()) {
    err = "failed to open file: " + path;
    return false;
  }
  std::ostringstream stream;
  stream << file_stream.rdbuf();
  if (file_stream.bad()) {
    err = "failed to read file: " + path;
    return false;
  }
  out = stream.str();
  return true;
}

}  // namespace support
}  // namespace pyspect
