/***
 * Name: labelkit::driver::PrintUsage
 * Purpose: Print CLI usage information for labelkit.
 * Inputs:
 *   - out: Destination stream
 *   - argv0: Program name used in usage examples
 * Outputs: None
 * Theory of Operation: Renders the options and the label-script command set.
 */
#include "labelkit/driver/cli.h"

#include <cstring>
#include <ostream>
#include <string_view>

namespace labelkit::driver {

static std::string_view Basename(const char* path) {
  if (path == nullptr || *path == '\0') {
    return std::string_view{"labelkit"};
  }
  const char* last_slash = std::strrchr(path, '/');
  return std::string_view(last_slash != nullptr ? last_slash + 1 : path);
}

auto PrintUsage(std::ostream& out, const char* argv0) -> void {
  const std::string_view program_name = Basename(argv0);
  out << "Usage: " << program_name << " [options] script..." << '\n'
      << '\n'
      << "Options:" << '\n'
      << "  -h, --help              Print this help and exit" << '\n'
      << "  --strict-names          Also reject '_' in scope and label names" << '\n'
      << "  --no-fallback-warning   Do not warn when numbering falls back to 'global'" << '\n'
      << "  --log-level=<level>     debug, info, warning (default), error or off" << '\n'
      << "  --metrics[=json|text]   Print labeling counters after the run (default: text)" << '\n'
      << "  --                      End of options" << '\n'
      << '\n'
      << "Script commands (one per line, '#' starts a comment; '-' reads stdin):" << '\n'
      << "  scope [name]      enter a named or unnamed scope" << '\n'
      << "  end               exit the innermost scope" << '\n'
      << "  label [name]      print an automatic label" << '\n'
      << "  uid [namespace]   print the next counter value" << '\n'
      << "  reset [namespace] reset a counter" << '\n'
      << "  current           print the active scope" << '\n';
}

}  // namespace labelkit::driver
