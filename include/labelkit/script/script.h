/***
 * Name: labelkit::script (label scripts)
 * Purpose: Replay a textual sequence of scope and label operations.
 * Inputs: Script text, one command per line
 * Outputs: One output line per printing command (label, uid, current)
 * Theory of Operation:
 *   Commands (blank lines and '#' comments are ignored):
 *     scope [name]      enter a named or unnamed scope
 *     end               exit the innermost scope opened by the script
 *     label [name]      print AutoLabel(name)
 *     uid [namespace]   print the next counter value of namespace
 *     reset [namespace] reset the counter of namespace
 *     current           print the innermost active scope, or <none>
 *   ParseScript checks syntax only; ScriptRunner executes against one
 *   LabelEnvironment and closes scopes left open when it is destroyed.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "labelkit/scope/label_environment.h"
#include "labelkit/scope/label_scope.h"

namespace labelkit {
namespace script {

struct Command {
  enum class Kind { Scope, End, Label, Uid, Reset, Current };
  Kind kind{Kind::Label};
  std::optional<std::string> argument;
  int line{0};
};

/*** ParseScript: Tokenize script text; throws ScriptError on malformed lines. */
std::vector<Command> ParseScript(std::string_view text);

class ScriptRunner {
 public:
  explicit ScriptRunner(scope::LabelEnvironment& env) : env_(env) {}
  ~ScriptRunner();

  ScriptRunner(const ScriptRunner&) = delete;
  ScriptRunner& operator=(const ScriptRunner&) = delete;

  /*** Run: Execute commands in order, writing printed values to `out`. */
  void Run(const std::vector<Command>& commands, std::ostream& out);

  /*** CurrentLine: Line of the command being (or last) executed; 0 before Run. */
  int CurrentLine() const { return line_; }

  /*** Depth: Number of scopes the script currently holds open. */
  std::size_t Depth() const { return open_.size(); }

  /*** CloseAll: Exit every open scope, innermost first. */
  void CloseAll();

 private:
  struct OpenScope {
    std::unique_ptr<scope::LabelScope> scope;
    std::unique_ptr<scope::LabelScope::Guard> guard;
  };

  void Execute(const Command& command, std::ostream& out);

  scope::LabelEnvironment& env_;
  std::vector<OpenScope> open_;
  int line_{0};
};

}  // namespace script
}  // namespace labelkit
