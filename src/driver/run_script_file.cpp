/***
 * Name: labelkit::driver::RunScriptFile
 * Purpose: Replay one label script (read -> parse -> run) in a fresh environment.
 * Inputs:
 *   - opts: CLI options
 *   - input_path: script path, or "-" for stdin
 *   - out: destination for printed labels
 * Outputs:
 *   - int: 0 on success; 2 on error with message printed
 * Theory of Operation: Library and script errors are reported with the script
 *   path and the line of the failing command.
 */
#include "labelkit/driver/app.h"

#include <iostream>
#include <ostream>
#include <string>

#include "labelkit/context/context_stack.h"
#include "labelkit/counter/counter_registry.h"
#include "labelkit/exceptions/labelkit_exception.h"
#include "labelkit/exceptions/script_error.h"
#include "labelkit/scope/label_environment.h"
#include "labelkit/script/script.h"
#include "labelkit/support/fs.h"

namespace labelkit::driver {

auto RunScriptFile(const CliOptions& opts, const std::string& input_path, std::ostream& out) -> int {
  std::string source_text;
  std::string error_message;
  const bool read_ok = input_path == "-" ? support::ReadStream(std::cin, source_text, error_message)
                                         : support::ReadFile(input_path, source_text, error_message);
  if (!read_ok) {
    std::cerr << "labelkit: " << error_message << '\n';
    return 2;
  }

  counter::CounterRegistry counters;
  context::ContextStack contexts;
  scope::LabelEnvironment env(counters, contexts, MakeLabelOptions(opts));
  script::ScriptRunner runner(env);
  try {
    runner.Run(script::ParseScript(source_text), out);
  } catch (const exceptions::ScriptError& ex) {
    std::cerr << "labelkit: " << input_path << ": " << ex.what() << '\n';
    return 2;
  } catch (const exceptions::LabelkitException& ex) {
    std::cerr << "labelkit: " << input_path << ": line " << runner.CurrentLine() << ": " << ex.what() << '\n';
    return 2;
  }
  return 0;
}

}  // namespace labelkit::driver
