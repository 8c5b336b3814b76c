/***
 * Name: pyspect::obs::Metrics (impl)
 * Purpose: Implement simple timing and formatting.
 */
#include "observability/Metrics.h"
#include "pyspect/support/json_writer.h"

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <ios>
#include <map>
#include <sstream>
#include <string>

namespace pyspect::obs {

namespace {
constexpr double kUsPerMs = 1000.0;
constexpr double kRound = 1000.0;

std::string to_lower_copy(std::string s) {
  for (auto& c : s) { if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a'); }
  return s;
}

void appendKeyValueObject(support::JsonWriter& json, const char* name, const std::map<std::string, uint64_t>& values) {
  if (values.empty()) { return; }
  json.key(name).beginObject();
  for (const auto& [key, val] : values) { json.key(key).integer(static_cast<std::int64_t>(val)); }
  json.endObject();
}
} // namespace

void Metrics::start(const std::string& name) {
  active_[name] = Clock::now();
}

void Metrics::stop(const std::string& name) {
  auto iter = active_.find(name);
  if (iter == active_.end()) { return; }
  auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - iter->second).count();
  durations_us_[name] += static_cast<uint64_t>(microseconds);
  active_.erase(iter);
}

std::string Metrics::summaryText() const {
  std::ostringstream oss;
  oss << "== Metrics ==\n";
  for (const auto& [key, val] : durations_us_) {
    const double millis = static_cast<double>(val) / kUsPerMs;
    oss << "  " << key << ": " << std::fixed << std::setprecision(3) << millis << " ms\n";
  }
  if (geom_) {
    oss << "  AST: nodes=" << geom_->nodes << ", max_depth=" << geom_->maxDepth << "\n";
  }
  for (const auto& [key, val] : counters_) { oss << "  " << key << ": " << val << "\n"; }
  for (const auto& [key, val] : gauges_) { oss << "  " << key << ": " << val << "\n"; }
  return oss.str();
}

std::string Metrics::summaryJson() const {
  support::JsonWriter json;
  json.beginObject();
  json.key("durations_ms").beginObject();
  for (const auto& [key, val] : durations_us_) {
    // JSON uses lowercase stage keys for stability (e2e contracts)
    const double millis = static_cast<double>(val) / kUsPerMs;
    json.key(to_lower_copy(key)).number(static_cast<double>(static_cast<uint64_t>(millis * kRound)) / kRound);
  }
  json.endObject();
  if (geom_) {
    json.key("ast").beginObject();
    json.key("nodes").integer(static_cast<std::int64_t>(geom_->nodes));
    json.key("max_depth").integer(static_cast<std::int64_t>(geom_->maxDepth));
    json.endObject();
  }
  appendKeyValueObject(json, "counters", counters_);
  appendKeyValueObject(json, "gauges", gauges_);
  json.endObject();
  return json.text() + "\n";
}

} // namespace pyspect::obs
