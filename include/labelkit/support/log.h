/***
 * Name: labelkit::support (log)
 * Purpose: Leveled diagnostic logging for the labeling library and CLI.
 * Inputs: Severity level and message text
 * Outputs: Lines of the form "labelkit: <level>: <message>" on the log stream
 * Theory of Operation: A process-wide threshold and destination stream. Messages
 *   below the threshold are dropped. The stream defaults to std::cerr and can be
 *   redirected (tests capture it with an ostringstream).
 */
#pragma once

#include <iosfwd>
#include <string_view>

namespace labelkit {
namespace support {

enum class LogLevel { Debug, Info, Warning, Error, Off };

/*** SetLogLevel: Drop messages below `level`. Default: Warning. */
void SetLogLevel(LogLevel level);
LogLevel GetLogLevel();

/*** SetLogStream: Redirect output; nullptr restores std::cerr. */
void SetLogStream(std::ostream* out);

/*** LogLevelName: Lowercase name used in the line prefix and on the CLI. */
const char* LogLevelName(LogLevel level);

/*** ParseLogLevel: Map a lowercase level name; false when unknown. */
bool ParseLogLevel(std::string_view text, LogLevel& out);

void Log(LogLevel level, std::string_view message);

inline void LogDebug(std::string_view message) { Log(LogLevel::Debug, message); }
inline void LogInfo(std::string_view message) { Log(LogLevel::Info, message); }
inline void LogWarning(std::string_view message) { Log(LogLevel::Warning, message); }
inline void LogError(std::string_view message) { Log(LogLevel::Error, message); }

}  // namespace support
}  // namespace labelkit
