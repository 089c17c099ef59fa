/***
 * Name: labelkit::driver (app API)
 * Purpose: Declarations for top-level driver helpers used by main().
 * Inputs: CLI options and script paths
 * Outputs: Label options, status codes, metrics output
 * Theory of Operation: Keep main() minimal by factoring helpers into separate
 *   translation units.
 */
#pragma once

#include <iosfwd>
#include <string>

#include "labelkit/config/label_options.h"
#include "labelkit/driver/cli.h"

namespace labelkit {
namespace driver {

/***
 * Name: labelkit::driver::MakeLabelOptions
 * Purpose: Translate CLI switches into environment options.
 */
config::LabelOptions MakeLabelOptions(const CliOptions& opts);

/***
 * Name: labelkit::driver::RunScriptFile
 * Purpose: Read one label script and replay it in a fresh environment.
 * Inputs: opts (CLI options), input_path ("-" for stdin), out (label output)
 * Outputs: POSIX status code (0 success, 2 error with message on stderr)
 * Theory of Operation: Each script gets its own counter registry and context
 *   stack, so the printed labels depend only on the script's contents.
 */
int RunScriptFile(const CliOptions& opts, const std::string& input_path, std::ostream& out);

/***
 * Name: labelkit::driver::ReportMetricsIfRequested
 * Purpose: Emit metrics in the requested format to `out` if enabled.
 */
void ReportMetricsIfRequested(const CliOptions& opts, std::ostream& out);

}  // namespace driver
}  // namespace labelkit
