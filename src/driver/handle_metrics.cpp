/***
 * Name: labelkit::driver::detail::HandleMetricsArg
 * Purpose: Handle --metrics and --metrics=<format> for the labeling counters.
 * Inputs:
 *   - arg: current argument string
 *   - dst: CLI options destination
 *   - err: error stream
 * Outputs: OptResult indicating match and success/failure
 * Theory of Operation: Bare "--metrics" selects text. A value after '=' is
 *   looked up in the format table; anything else is an error naming the
 *   accepted formats.
 */
#include "labelkit/driver/cli_parse.h"
#include "labelkit/driver/cli.h"  // direct use of CliOptions

#include <array>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace labelkit {
namespace driver {
namespace detail {

namespace {

constexpr std::array<std::pair<std::string_view, CliOptions::MetricsFormat>, 2> kMetricsFormats{{
    {"text", CliOptions::MetricsFormat::Text},
    {"json", CliOptions::MetricsFormat::Json},
}};

}  // namespace

auto HandleMetricsArg(const std::string& arg, CliOptions& dst, std::ostream& err) -> OptResult {
  constexpr std::string_view kFlag{"--metrics"};
  if (arg == kFlag) {
    dst.metrics = true;
    dst.metrics_format = CliOptions::MetricsFormat::Text;
    return OptResult::Handled;
  }
  if (arg.size() <= kFlag.size() || arg.compare(0, kFlag.size(), kFlag) != 0 || arg[kFlag.size()] != '=') {
    return OptResult::NotMatched;
  }
  const std::string_view value = std::string_view(arg).substr(kFlag.size() + 1);
  for (const auto& [name, format] : kMetricsFormats) {
    if (value == name) {
      dst.metrics = true;
      dst.metrics_format = format;
      return OptResult::Handled;
    }
  }
  err << "labelkit: error: cannot report label metrics as '" << value << "'; use --metrics=text or --metrics=json"
      << '\n';
  return OptResult::Error;
}

}  // namespace detail
}  // namespace driver
}  // namespace labelkit
