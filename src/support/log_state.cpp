/***
 * Name: labelkit::support (log state)
 * Purpose: Hold the process-wide log threshold and destination stream.
 * Inputs: Level and stream setters
 * Outputs: Current level and stream for Log()
 * Theory of Operation: Function-local statics avoid static-initialization order
 *   issues when logging happens during other statics' construction.
 */
#include "labelkit/support/log.h"
#include "labelkit/support/detail/log_state.h"

#include <iostream>
#include <ostream>

namespace labelkit::support {

namespace detail {

LogLevel& LevelSlot() {
  static LogLevel level = LogLevel::Warning;
  return level;
}

std::ostream*& StreamSlot() {
  static std::ostream* stream = nullptr;
  return stream;
}

}  // namespace detail

void SetLogLevel(LogLevel level) { detail::LevelSlot() = level; }

LogLevel GetLogLevel() { return detail::LevelSlot(); }

void SetLogStream(std::ostream* out) { detail::StreamSlot() = out; }

}  // namespace labelkit::support
