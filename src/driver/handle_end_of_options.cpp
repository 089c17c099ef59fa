/***
 * Name: labelkit::driver::detail::HandleEndOfOptions
 * Purpose: Handle "--": every following argument is a script path.
 * Inputs: args, index (in/out), argc, dst
 * Outputs: OptResult
 */
#include "labelkit/driver/cli_parse.h"
#include "labelkit/driver/cli.h"  // direct use of CliOptions

#include <cstddef>
#include <string>
#include <vector>

namespace labelkit {
namespace driver {
namespace detail {

auto HandleEndOfOptions(const std::vector<std::string>& args,
                        int& index,
                        int argc,
                        CliOptions& dst) -> OptResult {
  const std::string& arg = args[static_cast<std::size_t>(index)];
  if (arg != "--") {
    return OptResult::NotMatched;
  }
  for (++index; index < argc; ++index) {
    dst.inputs.emplace_back(args[static_cast<std::size_t>(index)]);
  }
  return OptResult::Handled;
}

}  // namespace detail
}  // namespace driver
}  // namespace labelkit
