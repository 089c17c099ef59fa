/***
 * Name: labelkit::driver::detail::HandleLogLevelArg
 * Purpose: Handle --log-level=debug|info|warning|error|off.
 * Inputs:
 *   - arg: current argument string
 *   - dst: CLI options destination
 *   - err: error stream
 * Outputs: OptResult indicating match and success/failure
 */
#include "labelkit/driver/cli_parse.h"
#include "labelkit/driver/cli.h"

#include <ostream>
#include <string>
#include <string_view>

#include "labelkit/support/log.h"

namespace labelkit {
namespace driver {
namespace detail {

auto HandleLogLevelArg(const std::string& arg, CliOptions& dst, std::ostream& err) -> OptResult {
  constexpr std::string_view kPrefix{"--log-level="};
  if (arg.rfind(kPrefix, 0) != 0U) {
    return OptResult::NotMatched;
  }
  const std::string value = arg.substr(kPrefix.size());
  if (!support::ParseLogLevel(value, dst.log_level)) {
    err << "labelkit: error: unknown log level '" << value
        << "' (expected debug, info, warning, error or off)" << '\n';
    return OptResult::Error;
  }
  return OptResult::Handled;
}

}  // namespace detail
}  // namespace driver
}  // namespace labelkit
