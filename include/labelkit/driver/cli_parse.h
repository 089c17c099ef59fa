/***
 * Name: labelkit::driver (cli_parse helpers)
 * Purpose: Declarations for small, single-purpose CLI option handlers used by ParseCli.
 * Inputs: Argument string(s), index into args, CLI options destination, error stream
 * Outputs: detail::OptResult (NotMatched, Handled, Error)
 * Theory of Operation: Each function recognizes one category of options, mutates state,
 *   and advances the index where necessary, keeping ParseCli simple and low complexity.
 */
#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "labelkit/driver/cli.h"

namespace labelkit {
namespace driver {
namespace detail {

/*** HandleHelpArg: Recognize -h/--help and set flag. */
OptResult HandleHelpArg(const std::string& arg, CliOptions& dst);

/*** HandleMetricsArg: Parse --metrics and --metrics=.. variants. */
OptResult HandleMetricsArg(const std::string& arg, CliOptions& dst, std::ostream& err);

/*** HandleLogLevelArg: Parse --log-level=<level>. */
OptResult HandleLogLevelArg(const std::string& arg, CliOptions& dst, std::ostream& err);

/*** HandleSwitch: Handle booleans --strict-names and --no-fallback-warning. */
OptResult HandleSwitch(const std::string& arg, CliOptions& dst);

/*** HandleEndOfOptions: Handle "--" and push remaining inputs. */
OptResult HandleEndOfOptions(const std::vector<std::string>& args,
                             int& index,
                             int argc,
                             CliOptions& dst);

/*** HandleUnknownOrPositional: Error on unknown '-' options; otherwise record input. */
OptResult HandleUnknownOrPositional(const std::string& arg, CliOptions& dst, std::ostream& err);

/*** NormalizeArgv: Convert argv into vector<string> with null safety. */
void NormalizeArgv(int argc, const char* const* argv, std::vector<std::string>& out);

/*** RunHandlers: Execute ordered handlers for current arg index. */
OptResult RunHandlers(const std::vector<std::string>& args,
                      int& index,
                      int argc,
                      CliOptions& dst,
                      std::ostream& err);

}  // namespace detail
}  // namespace driver
}  // namespace labelkit
