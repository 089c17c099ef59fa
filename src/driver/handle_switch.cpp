/***
 * Name: labelkit::driver::detail::HandleSwitch
 * Purpose: Handle simple boolean switches: --strict-names and --no-fallback-warning.
 * Inputs:
 *   - arg: current argument string
 *   - dst: CLI options destination
 * Outputs: OptResult indicating match and success/failure
 * Theory of Operation: Sets flags and returns Handled when a match occurs.
 */
#include "labelkit/driver/cli_parse.h"
#include "labelkit/driver/cli.h"  // direct use of CliOptions

#include <string>

namespace labelkit {
namespace driver {
namespace detail {

auto HandleSwitch(const std::string& arg, CliOptions& dst) -> OptResult {
  if (arg == "--strict-names") {
    dst.strict_names = true;
    return OptResult::Handled;
  }
  if (arg == "--no-fallback-warning") {
    dst.fallback_warning = false;
    return OptResult::Handled;
  }
  return OptResult::NotMatched;
}

}  // namespace detail
}  // namespace driver
}  // namespace labelkit
