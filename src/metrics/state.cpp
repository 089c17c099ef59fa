/***
 * Name: labelkit::metrics::Metrics::reg_
 * Purpose: Define the static metrics registry storage.
 * Inputs: N/A
 * Outputs: Singleton-style storage for metrics across the library.
 * Theory of Operation: One definition for the static member.
 */
#include "labelkit/metrics/metrics.h"

namespace labelkit {
namespace metrics {

Metrics::Registry Metrics::reg_{};

}  // namespace metrics
}  // namespace labelkit
