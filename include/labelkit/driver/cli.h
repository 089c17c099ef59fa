/***
 * Name: labelkit::driver (cli)
 * Purpose: Declarations for CLI options, parsing, and usage printing.
 * Inputs: N/A (declarations only)
 * Outputs: Types and functions for CLI handling.
 * Theory of Operation: The CLI replays label scripts; options configure the
 *   labeling environment, logging and metrics. Definitions live in .cpp files.
 */
#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "labelkit/support/log.h"

namespace labelkit {
namespace driver {

/***
 * Name: labelkit::driver::CliOptions
 * Purpose: Hold parsed command-line options for a labelkit invocation.
 * Inputs: Values are populated by ParseCli.
 * Outputs: Consumed by the driver to configure environments and reporting.
 */
struct CliOptions {
  std::vector<std::string> inputs;          // Script files; "-" reads stdin
  bool show_help = false;                   // -h, --help
  bool strict_names = false;                // --strict-names
  bool fallback_warning = true;             // --no-fallback-warning clears
  support::LogLevel log_level = support::LogLevel::Warning;  // --log-level=<level>
  bool metrics = false;                     // --metrics
  enum class MetricsFormat { Text, Json };
  MetricsFormat metrics_format = MetricsFormat::Text;  // --metrics[=json|text]
};

/***
 * Name: labelkit::driver::detail::OptResult
 * Purpose: Tri-state result for option handlers.
 * Theory of Operation: Allows the main parser to remain simple while delegating
 *   specific option formats to small helpers.
 */
namespace detail {
enum class OptResult { NotMatched, Handled, Error };
}

/***
 * Name: labelkit::driver::ParseCli
 * Purpose: Parse command-line arguments into a CliOptions structure.
 * Inputs:
 *   - argc: Argument count
 *   - argv: Argument vector
 *   - dst: Output options structure to populate
 *   - err: Stream for diagnostics on parse errors
 * Outputs:
 *   - bool: true on successful parse, false if an error occurs
 * Theory of Operation: Iterates arguments left-to-right, handling known flags
 *   and collecting script paths. Unknown flags cause failure with a message.
 */
bool ParseCli(int argc, const char* const* argv, CliOptions& dst, std::ostream& err);

/***
 * Name: labelkit::driver::PrintUsage
 * Purpose: Print CLI usage information for labelkit.
 * Inputs:
 *   - out: Destination stream
 *   - argv0: Program name used in usage examples
 * Outputs: None
 */
void PrintUsage(std::ostream& out, const char* argv0);

}  // namespace driver
}  // namespace labelkit
