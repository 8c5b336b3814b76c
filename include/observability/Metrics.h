/***
 * Name: pyspect::obs::Metrics
 * Purpose: Collect per-stage timings, counters and AST geometry for one run.
 * Inputs:
 *   - Calls to start/stop timers for named stages (Read, Hash, Lex, ...).
 *   - Counters recorded by the introspection pipeline.
 *   - AST summary values (nodes, depth) recorded after parsing.
 * Outputs:
 *   - Human-readable text and JSON summaries (written to stderr by the engine).
 * Theory of Operation:
 *   Uses steady_clock timestamps to measure durations. Stores a map from
 *   stage names to microseconds. Geometry is a small struct. Formatting is
 *   performed on demand; ordered maps keep the summaries deterministic.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace pyspect::obs {

struct AstGeometry {
  uint64_t nodes{0};
  uint64_t maxDepth{0};
};

class Metrics {
 public:
  using Clock = std::chrono::steady_clock;

  void start(const std::string& name);
  void stop(const std::string& name);
  bool hasDuration(const std::string& name) const { return durations_us_.count(name) != 0; }

  void setAstGeometry(AstGeometry g) { geom_ = g; }
  const std::optional<AstGeometry>& astGeometry() const { return geom_; }

  void incCounter(const std::string& key, uint64_t delta = 1) { counters_[key] += delta; }
  void setCounter(const std::string& key, uint64_t value) { counters_[key] = value; }
  void setGauge(const std::string& key, uint64_t value) { gauges_[key] = value; }
  const auto& counters() const { return counters_; }
  const auto& gauges() const { return gauges_; }

  std::string summaryText() const;
  std::string summaryJson() const;

 private:
  std::map<std::string, Clock::time_point> active_{};
  std::map<std::string, uint64_t> durations_us_{};
  std::optional<AstGeometry> geom_{};
  std::map<std::string, uint64_t> counters_{};
  std::map<std::string, uint64_t> gauges_{};
};

// RAII stage timer
class ScopedTimer {
 public:
  ScopedTimer(Metrics& metrics, std::string name) : metrics_(metrics), name_(std::move(name)) { metrics_.start(name_); }
  ~ScopedTimer() { metrics_.stop(name_); }
  ScopedTimer(const ScopedTimer&) = delete;
  ScopedTimer& operator=(const ScopedTimer&) = delete;

 private:
  Metrics& metrics_;
  std::string name_;
};

} // namespace pyspect::obs
