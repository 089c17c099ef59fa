/***
 * Name: labelkit::support::Log
 * Purpose: Write one diagnostic line if `level` passes the threshold.
 * Inputs:
 *   - level: message severity (Off is never written)
 *   - message: text without trailing newline
 * Outputs: None
 * Theory of Operation: Formats "labelkit: <level>: <message>\n" to the
 *   configured stream, falling back to std::cerr.
 */
#include "labelkit/support/log.h"
#include "labelkit/support/detail/log_state.h"

#include <iostream>
#include <ostream>
#include <string_view>

namespace labelkit::support {

void Log(LogLevel level, std::string_view message) {
  if (level == LogLevel::Off || level < detail::LevelSlot()) {
    return;
  }
  std::ostream* out = detail::StreamSlot();
  if (out == nullptr) {
    out = &std::cerr;
  }
  *out << "labelkit: " << LogLevelName(level) << ": " << message << '\n';
}

}  // namespace labelkit::support
