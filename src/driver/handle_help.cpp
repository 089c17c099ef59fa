/***
 * Name: labelkit::driver::detail::HandleHelpArg
 * Purpose: Recognize -h/--help.
 * Inputs:
 *   - arg: current argument string
 *   - dst: CLI options destination
 * Outputs: OptResult indicating match
 * Theory of Operation: Sets show_help and returns Handled when matched.
 */
#include "labelkit/driver/cli_parse.h"
#include "labelkit/driver/cli.h"

#include <string>

namespace labelkit {
namespace driver {
namespace detail {

auto HandleHelpArg(const std::string& arg, CliOptions& dst) -> OptResult {
  if (arg == "-h" || arg == "--help") {
    dst.show_help = true;
    return OptResult::Handled;
  }
  return OptResult::NotMatched;
}

}  // namespace detail
}  // namespace driver
}  // namespace labelkit
