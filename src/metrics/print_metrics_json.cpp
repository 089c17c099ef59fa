/***
 * Name: labelkit::metrics::PrintMetricsJson
 * Purpose: Print metrics in JSON for consumption by tools.
 * Inputs:
 *   - reg: metrics registry
 *   - out: destination stream
 * Outputs: None
 * Theory of Operation: Flat object under a "counters" key; keys are fixed
 *   identifiers so no escaping is required.
 */
#include "labelkit/metrics/metrics.h"

#include <cstddef>
#include <ostream>

namespace labelkit::metrics {

auto Metrics::PrintMetricsJson(const Registry& reg, std::ostream& out) -> void {
  if (!reg.enabled) {
    return;
  }
  out << "{\n  \"counters\": {";
  for (std::size_t i = 0; i < kCounterCount; ++i) {
    const auto counter = static_cast<Counter>(i);
    out << (i != 0U ? "," : "") << "\n    \"" << CounterName(counter) << "\": " << reg.Get(counter);
  }
  out << "\n  }\n}\n";
}

}  // namespace labelkit::metrics
