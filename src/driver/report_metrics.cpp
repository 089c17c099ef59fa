/***
 * Name: labelkit::driver::ReportMetricsIfRequested
 * Purpose: Print the labeling counters after all scripts ran, when asked to.
 * Inputs:
 *   - opts: CLI options (metrics flag and format)
 *   - out: destination stream (stdout from main)
 * Outputs: None
 * Theory of Operation: Runs once per process, so the counters cover every
 *   script on the command line together.
 */
#include "labelkit/driver/app.h"

#include <ostream>

#include "labelkit/metrics/metrics.h"

namespace labelkit::driver {

auto ReportMetricsIfRequested(const CliOptions& opts, std::ostream& out) -> void {
  if (!opts.metrics) {
    return;
  }
  const metrics::Metrics::Registry& reg = metrics::Metrics::GetRegistry();
  switch (opts.metrics_format) {
    case CliOptions::MetricsFormat::Json:
      metrics::Metrics::PrintMetricsJson(reg, out);
      break;
    case CliOptions::MetricsFormat::Text:
      metrics::Metrics::PrintMetrics(reg, out);
      break;
  }
}

}  // namespace labelkit::driver
