/***
 * Name: pyspect::metadata::ConfigValue
 * Purpose: In-memory value tree for the inline metadata document.
 * Inputs:
 *   - Built by the TOML reader
 * Outputs:
 *   - Typed scalars, arrays and tables with insertion order preserved
 * Theory of Operation:
 *   A tagged value. Tables keep parallel key and value vectors so member order
 *   is the document order, which the result envelope reproduces.
 */
#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace pyspect::support { class JsonWriter; }

namespace pyspect::metadata {

class ConfigValue {
 public:
  enum class Kind { String, Integer, Float, Boolean, Array, Table };

  ConfigValue() = default;
  static ConfigValue makeString(std::string s);
  static ConfigValue makeInteger(std::int64_t v);
  static ConfigValue makeFloat(double v);
  static ConfigValue makeBoolean(bool v);
  static ConfigValue makeArray();
  static ConfigValue makeTable();

  Kind kind() const { return kind_; }
  bool isTable() const { return kind_ == Kind::Table; }
  bool isArray() const { return kind_ == Kind::Array; }
  bool isString() const { return kind_ == Kind::String; }

  const std::string& asString() const { return str_; }
  std::int64_t asInteger() const { return int_; }
  double asFloat() const { return real_; }
  bool asBoolean() const { return bool_; }

  // arrays
  const std::vector<ConfigValue>& items() const { return items_; }
  void push(ConfigValue v) { items_.push_back(std::move(v)); }
  ConfigValue& back() { return items_.back(); }

  // tables
  const std::vector<std::string>& keys() const { return keys_; }
  const ConfigValue* find(const std::string& key) const;
  ConfigValue* find(const std::string& key);
  // Inserts a member; returns nullptr when the key already exists.
  ConfigValue* insert(const std::string& key, ConfigValue v);

  // Explicitly defined via a [header] (as opposed to implied by a dotted key)
  bool defined() const { return defined_; }
  void markDefined() { defined_ = true; }
  // Inline tables and static arrays cannot be extended later
  bool sealed() const { return sealed_; }
  void seal() { sealed_ = true; }

 private:
  Kind kind_{Kind::Table};
  std::string str_{};
  std::int64_t int_{0};
  double real_{0.0};
  bool bool_{false};
  std::vector<ConfigValue> items_{};   // array items, or table values
  std::vector<std::string> keys_{};    // table keys, parallel to items_
  bool defined_{false};
  bool sealed_{false};
};

// Write a value as JSON (tables become objects in document order).
void WriteConfigJson(support::JsonWriter& json, const ConfigValue& value);

} // namespace pyspect::metadata
