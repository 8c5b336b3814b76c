/***
 * Name: pyspect::support::JsonWriter (impl)
 * Purpose: Emit indented JSON with lazily placed separators.
 */
#include "pyspect/support/json_writer.h"
#include "pyspect/support/py_repr.h"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <ios>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace pyspect::support {

std::string JsonEscape(std::string_view text) {
  std::ostringstream oss;
  for (const char chr : text) {
    switch (chr) {
      case '"': oss << "\\\""; break;
      case '\\': oss << "\\\\"; break;
      case '\n': oss << "\\n"; break;
      case '\r': oss << "\\r"; break;
      case '\t': oss << "\\t"; break;
      case '\b': oss << "\\b"; break;
      case '\f': oss << "\\f"; break;
      default:
        if (static_cast<unsigned char>(chr) < 0x20U) {
          oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
              << static_cast<int>(static_cast<unsigned char>(chr)) << std::dec;
        } else {
          oss << chr; // UTF-8 passes through untouched
        }
    }
  }
  return oss.str();
}

void JsonWriter::newlineIndent(const std::size_t depth) {
  out_ << '\n';
  for (std::size_t i = 0; i < depth * static_cast<std::size_t>(indent_); ++i) { out_ << ' '; }
}

void JsonWriter::beforeValue() {
  if (afterKey_) { afterKey_ = false; return; }
  if (stack_.empty()) { return; }
  Frame& top = stack_.back();
  if (top.count > 0) { out_ << ','; }
  ++top.count;
  newlineIndent(stack_.size());
}

JsonWriter& JsonWriter::beginObject() {
  beforeValue();
  out_ << '{';
  stack_.push_back(Frame{true, 0});
  return *this;
}

JsonWriter& JsonWriter::beginArray() {
  beforeValue();
  out_ << '[';
  stack_.push_back(Frame{false, 0});
  return *this;
}

JsonWriter& JsonWriter::close(const char closer) {
  if (stack_.empty()) { return *this; }
  const bool hadMembers = stack_.back().count > 0;
  stack_.pop_back();
  if (hadMembers) { newlineIndent(stack_.size()); }
  out_ << closer;
  return *this;
}

JsonWriter& JsonWriter::endObject() { return close('}'); }
JsonWriter& JsonWriter::endArray() { return close(']'); }

JsonWriter& JsonWriter::key(std::string_view name) {
  beforeValue();
  out_ << '"' << JsonEscape(name) << "\": ";
  afterKey_ = true;
  return *this;
}

JsonWriter& JsonWriter::str(std::string_view value) {
  beforeValue();
  out_ << '"' << JsonEscape(value) << '"';
  return *this;
}

JsonWriter& JsonWriter::boolean(const bool value) {
  beforeValue();
  out_ << (value ? "true" : "false");
  return *this;
}

JsonWriter& JsonWriter::integer(const std::int64_t value) {
  beforeValue();
  out_ << value;
  return *this;
}

JsonWriter& JsonWriter::number(const double value) {
  beforeValue();
  if (std::isnan(value)) { out_ << "NaN"; }
  else if (std::isinf(value)) { out_ << (value < 0 ? "-Infinity" : "Infinity"); }
  else { out_ << ReprFloat(value); }
  return *this;
}

JsonWriter& JsonWriter::null() {
  beforeValue();
  out_ << "null";
  return *this;
}

JsonWriter& JsonWriter::optStr(const std::optional<std::string>& value) {
  return value ? str(*value) : null();
}

JsonWriter& JsonWriter::optInteger(const std::optional<int>& value) {
  return value ? integer(*value) : null();
}

JsonWriter& JsonWriter::strArray(const std::vector<std::string>& values) {
  beginArray();
  for (const auto& item : values) { str(item); }
  return endArray();
}

} // namespace pyspect::support
