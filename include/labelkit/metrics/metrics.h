/***
 * Name: labelkit::metrics::Metrics
 * Purpose: Static registry of labeling activity counters for observability.
 * Inputs: Counter increments from scope entry/exit and label generation
 * Outputs: A static registry accessible by the application for reporting.
 * Theory of Operation: All callers share one Registry and enabled flag; while
 *   disabled, increments are dropped.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>

namespace labelkit {

namespace metrics {

class Metrics {
 public:
  enum class Counter { ScopesEntered, ScopesExited, LabelsGenerated, GlobalFallbacks };
  static constexpr std::size_t kCounterCount = 4;

  struct Registry {
    bool enabled{false};
    std::array<std::uint64_t, kCounterCount> counters{};

    std::uint64_t Get(Counter counter) const { return counters[static_cast<std::size_t>(counter)]; }
  };

  static void Enable(bool on) { reg_.enabled = on; }
  static Registry& GetRegistry() { return reg_; }
  static void Increment(Counter counter) {
    if (reg_.enabled) ++reg_.counters[static_cast<std::size_t>(counter)];
  }
  static void Reset() { reg_.counters.fill(0); }

  static const char* CounterName(Counter counter);
  static void PrintMetrics(const Registry& reg, std::ostream& out);
  static void PrintMetricsJson(const Registry& reg, std::ostream& out);

 private:
  static Registry reg_;
};

}  // namespace metrics
}  // namespace labelkit
