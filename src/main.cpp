/***
 * Name: labelkit::main
 * Purpose: Entry point for the labelkit CLI.
 * Inputs:
 *   - argc, argv: Standard process arguments.
 * Outputs:
 *   - int: POSIX process status code (0 on success, 2 on any error).
 * Theory of Operation:
 *   Parses flags, configures logging and metrics, then replays each script in
 *   order in its own labeling environment. Stops at the first failing script.
 */
#include <exception>
#include <iostream>
#include <string>

#include "labelkit/driver/app.h"
#include "labelkit/driver/cli.h"
#include "labelkit/exceptions/labelkit_exception.h"
#include "labelkit/metrics/metrics.h"
#include "labelkit/support/log.h"

using labelkit::driver::CliOptions;

int main(int argc, char** argv) {
  try {
    using labelkit::driver::ParseCli;
    using labelkit::driver::PrintUsage;
    CliOptions opts;
    if (!ParseCli(argc, (const char* const*)argv, opts, std::cerr)) {
      PrintUsage(std::cerr, argv[0]);  // NOLINT(*-pro-bounds-pointer-arithmetic)
      return 2;
    }
    if (opts.show_help) {
      PrintUsage(std::cout, argv[0]);  // NOLINT(*-pro-bounds-pointer-arithmetic)
      return 0;
    }
    labelkit::support::SetLogLevel(opts.log_level);
    labelkit::metrics::Metrics::Enable(opts.metrics);
    for (const auto& input : opts.inputs) {
      const int ret_code = labelkit::driver::RunScriptFile(opts, input, std::cout);
      if (ret_code != 0) {
        return ret_code;
      }
    }
    labelkit::driver::ReportMetricsIfRequested(opts, std::cout);
    return 0;
  } catch (const labelkit::exceptions::LabelkitException& ex) {
    std::cerr << "labelkit: " << ex.what() << '\n';
    return 2;
  } catch (const std::exception& ex) {
    std::cerr << "labelkit: internal error: " << ex.what() << '\n';
    return 2;
  }
}
