/***
 * Name: pyspect::introspect::ScriptSource
 * Purpose: The raw bytes of one target script plus its display identity.
 * Inputs:
 *   - Filesystem path (LoadScript) or in-memory text (FromText)
 * Outputs:
 *   - name (file stem), absolute path and the exact bytes read
 * Theory of Operation:
 *   The file is read once in binary mode; every later stage (hash, metadata
 *   block, parser) works from this buffer.
 */
#pragma once

#include <string>

namespace pyspect::introspect {

struct ScriptSource {
  std::string name;
  std::string path;
  std::string bytes;
};

// Returns false with err set when the file cannot be read.
bool LoadScript(const std::string& path, ScriptSource& out, std::string& err);

// Build a source from text already in memory (tests, embedding).
ScriptSource FromText(const std::string& path, std::string text);

} // namespace pyspect::introspect
