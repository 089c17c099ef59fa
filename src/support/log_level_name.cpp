/***
 * Name: labelkit::support::LogLevelName / ParseLogLevel
 * Purpose: Convert between LogLevel values and their lowercase names.
 * Inputs: LogLevel or text
 * Outputs: Name string, or parsed level with success flag
 * Theory of Operation: Simple switch and comparison chain.
 */
#include "labelkit/support/log.h"

#include <initializer_list>
#include <string_view>

namespace labelkit::support {

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info: return "info";
    case LogLevel::Warning: return "warning";
    case LogLevel::Error: return "error";
    case LogLevel::Off: return "off";
  }
  return "unknown";
}

bool ParseLogLevel(std::string_view text, LogLevel& out) {
  for (const LogLevel level :
       {LogLevel::Debug, LogLevel::Info, LogLevel::Warning, LogLevel::Error, LogLevel::Off}) {
    if (text == LogLevelName(level)) {
      out = level;
      return true;
    }
  }
  return false;
}

}  // namespace labelkit::support
