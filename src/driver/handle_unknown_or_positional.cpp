/***
 * Name: labelkit::driver::detail::HandleUnknownOrPositional
 * Purpose: Reject unknown options and collect script paths.
 * Inputs: arg, dst, err
 * Outputs: OptResult
 * Theory of Operation: A lone "-" is a positional (stdin); any other argument
 *   starting with '-' is an unknown option.
 */
#include "labelkit/driver/cli_parse.h"
#include "labelkit/driver/cli.h"  // direct use of CliOptions

#include <ostream>
#include <string>

namespace labelkit {
namespace driver {
namespace detail {

auto HandleUnknownOrPositional(const std::string& arg, CliOptions& dst, std::ostream& err) -> OptResult {
  if (arg.size() > 1 && arg[0] == '-') {
    err << "labelkit: error: unknown option '" << arg << "'" << '\n';
    return OptResult::Error;
  }
  if (!arg.empty()) {
    dst.inputs.push_back(arg);
  }
  return OptResult::Handled;
}

}  // namespace detail
}  // namespace driver
}  // namespace labelkit
