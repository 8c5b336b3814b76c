/***
 * Name: pyspect::support::JsonWriter
 * Purpose: Streaming pretty-printer for the result envelope and metrics JSON.
 * Inputs:
 *   - begin/end calls for objects and arrays, keys and scalar values
 * Outputs:
 *   - Indented JSON text (two spaces per level by default)
 * Theory of Operation:
 *   Tracks a stack of open containers and how many members each has, so
 *   separators and newlines are emitted lazily. Empty containers print as
 *   `[]` and `{}`. Strings are escaped with JsonEscape, which leaves UTF-8
 *   untouched and escapes only quotes, backslashes and control characters.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace pyspect::support {

std::string JsonEscape(std::string_view text);

class JsonWriter {
 public:
  explicit JsonWriter(int indent = 2) : indent_(indent) {}

  JsonWriter& beginObject();
  JsonWriter& endObject();
  JsonWriter& beginArray();
  JsonWriter& endArray();
  JsonWriter& key(std::string_view name);

  JsonWriter& str(std::string_view value);
  JsonWriter& boolean(bool value);
  JsonWriter& integer(std::int64_t value);
  JsonWriter& number(double value);
  JsonWriter& null();

  JsonWriter& optStr(const std::optional<std::string>& value);
  JsonWriter& optInteger(const std::optional<int>& value);
  JsonWriter& strArray(const std::vector<std::string>& values);

  std::string text() const { return out_.str(); }

 private:
  struct Frame {
    bool isObject{false};
    std::size_t count{0};
  };

  void beforeValue();
  void newlineIndent(std::size_t depth);
  JsonWriter& close(char closer);

  std::ostringstream out_{};
  std::vector<Frame> stack_{};
  bool afterKey_{false};
  int indent_{2};
};

}  // namespace pyspect::support
