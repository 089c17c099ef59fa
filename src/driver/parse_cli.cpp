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
 * Theory of Operation:
 *   Normalizes argv, then dispatches each argument through RunHandlers.
 *   -h/--help short-circuits; otherwise at least one script is required.
 */
#include "labelkit/driver/cli.h"
#include "labelkit/driver/cli_parse.h"

#include <ostream>
#include <string>
#include <vector>

namespace labelkit::driver {

auto ParseCli(int argc, const char* const* argv, CliOptions& dst, std::ostream& err) -> bool {
  // Reset to defaults
  dst = CliOptions{};

  std::vector<std::string> args;
  detail::NormalizeArgv(argc, argv, args);
  for (int arg_index = 1; arg_index < argc; ++arg_index) {
    if (detail::RunHandlers(args, arg_index, argc, dst, err) == detail::OptResult::Error) {
      return false;
    }
    if (dst.show_help) {
      return true;
    }
  }

  if (dst.inputs.empty()) {
    err << "labelkit: error: no input scripts" << '\n';
    return false;
  }
  return true;
}

}  // namespace labelkit::driver
