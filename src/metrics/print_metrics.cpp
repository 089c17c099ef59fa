/***
 * Name: labelkit::metrics::PrintMetrics
 * Purpose: Pretty-print collected labeling counters.
 * Inputs:
 *   - reg: metrics registry
 *   - out: destination stream
 * Outputs: None
 * Theory of Operation: One "name: value" line per counter; nothing when disabled.
 */
#include "labelkit/metrics/metrics.h"

#include <cstddef>
#include <ostream>

namespace labelkit::metrics {

auto Metrics::PrintMetrics(const Registry& reg, std::ostream& out) -> void {
  if (!reg.enabled) {
    return;
  }
  out << "== Metrics ==\n";
  for (std::size_t i = 0; i < kCounterCount; ++i) {
    const auto counter = static_cast<Counter>(i);
    out << "  " << CounterName(counter) << ": " << reg.Get(counter) << "\n";
  }
}

}  // namespace labelkit::metrics
