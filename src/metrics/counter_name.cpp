/***
 * Name: labelkit::metrics::Metrics::CounterName
 * Purpose: Stable snake_case key for each counter (text and JSON output).
 * Inputs: counter
 * Outputs: Static string
 */
#include "labelkit/metrics/metrics.h"

namespace labelkit::metrics {

auto Metrics::CounterName(Counter counter) -> const char* {
  switch (counter) {
    case Counter::ScopesEntered: return "scopes_entered";
    case Counter::ScopesExited: return "scopes_exited";
    case Counter::LabelsGenerated: return "labels_generated";
    case Counter::GlobalFallbacks: return "global_fallbacks";
  }
  return "unknown";
}

}  // namespace labelkit::metrics
