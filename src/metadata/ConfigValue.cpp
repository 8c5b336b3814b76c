/***
 * Name: pyspect::metadata::ConfigValue (impl)
 * Purpose: Factories, table lookup and JSON rendering.
 */
#include "metadata/ConfigValue.h"
#include "pyspect/support/json_writer.h"

#include <cstddef>
#include <string>
#include <utility>

namespace pyspect::metadata {

ConfigValue ConfigValue::makeString(std::string s) {
  ConfigValue v;
  v.kind_ = Kind::String;
  v.str_ = std::move(s);
  return v;
}

ConfigValue ConfigValue::makeInteger(const std::int64_t value) {
  ConfigValue v;
  v.kind_ = Kind::Integer;
  v.int_ = value;
  return v;
}

ConfigValue ConfigValue::makeFloat(const double value) {
  ConfigValue v;
  v.kind_ = Kind::Float;
  v.real_ = value;
  return v;
}

ConfigValue ConfigValue::makeBoolean(const bool value) {
  ConfigValue v;
  v.kind_ = Kind::Boolean;
  v.bool_ = value;
  return v;
}

ConfigValue ConfigValue::makeArray() {
  ConfigValue v;
  v.kind_ = Kind::Array;
  return v;
}

ConfigValue ConfigValue::makeTable() { return ConfigValue{}; }

const ConfigValue* ConfigValue::find(const std::string& key) const {
  for (std::size_t i = 0; i < keys_.size(); ++i) {
    if (keys_[i] == key) { return &items_[i]; }
  }
  return nullptr;
}

ConfigValue* ConfigValue::find(const std::string& key) {
  for (std::size_t i = 0; i < keys_.size(); ++i) {
    if (keys_[i] == key) { return &items_[i]; }
  }
  return nullptr;
}

ConfigValue* ConfigValue::insert(const std::string& key, ConfigValue v) {
  if (find(key) != nullptr) { return nullptr; }
  keys_.push_back(key);
  items_.push_back(std::move(v));
  return &items_.back();
}

void WriteConfigJson(support::JsonWriter& json, const ConfigValue& value) {
  switch (value.kind()) {
    case ConfigValue::Kind::String: json.str(value.asString()); break;
    case ConfigValue::Kind::Integer: json.integer(value.asInteger()); break;
    case ConfigValue::Kind::Float: json.number(value.asFloat()); break;
    case ConfigValue::Kind::Boolean: json.boolean(value.asBoolean()); break;
    case ConfigValue::Kind::Array:
      json.beginArray();
      for (const auto& item : value.items()) { WriteConfigJson(json, item); }
      json.endArray();
      break;
    case ConfigValue::Kind::Table: {
      json.beginObject();
      const auto& keys = value.keys();
      for (std::size_t i = 0; i < keys.size(); ++i) {
        json.key(keys[i]);
        WriteConfigJson(json, value.items()[i]);
      }
      json.endObject();
      break;
    }
  }
}

} // namespace pyspect::metadata
