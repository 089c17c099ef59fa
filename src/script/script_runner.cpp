/***
 * Name: labelkit::script::ScriptRunner (impl)
 * Purpose: Execute parsed label-script commands against one environment.
 * Inputs: Commands and an output stream
 * Outputs: Printed labels, counter values and scope names
 * Theory of Operation: Opened scopes are heap-pinned and held by a Guard so
 *   that `end`, CloseAll and exceptions all exit them through the same path.
 *   Library errors propagate unchanged; CurrentLine() tells the caller where.
 */
#include "labelkit/script/script.h"

#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "labelkit/counter/counter_registry.h"
#include "labelkit/exceptions/script_error.h"
#include "labelkit/label/auto_label.h"
#include "labelkit/support/log.h"

namespace labelkit::script {

namespace {

// LabelScope is not movable, so the named constructor's result is built in place.
std::unique_ptr<scope::LabelScope> NewScope(const Command& command, scope::LabelEnvironment& env) {
  if (command.argument) {
    return std::unique_ptr<scope::LabelScope>(
        new scope::LabelScope(scope::LabelScope::FromBasename(*command.argument, env)));
  }
  return std::unique_ptr<scope::LabelScope>(new scope::LabelScope(scope::LabelScope::Unnamed(env)));
}

}  // namespace

ScriptRunner::~ScriptRunner() { CloseAll(); }

void ScriptRunner::CloseAll() {
  while (!open_.empty()) {
    open_.pop_back();
  }
}

void ScriptRunner::Run(const std::vector<Command>& commands, std::ostream& out) {
  for (const auto& command : commands) {
    line_ = command.line;
    Execute(command, out);
  }
  if (!open_.empty()) {
    support::LogWarning(std::to_string(open_.size()) + " label scope(s) left open at end of script; closing");
    CloseAll();
  }
}

void ScriptRunner::Execute(const Command& command, std::ostream& out) {
  const std::string ns = command.argument.value_or(counter::kDefaultNamespace);
  switch (command.kind) {
    case Command::Kind::Scope: {
      OpenScope entry;
      entry.scope = NewScope(command, env_);
      entry.guard = std::make_unique<scope::LabelScope::Guard>(*entry.scope);
      open_.push_back(std::move(entry));
      break;
    }
    case Command::Kind::End:
      if (open_.empty()) {
        throw exceptions::ScriptError(command.line, "'end' without an open scope");
      }
      open_.pop_back();
      break;
    case Command::Kind::Label: {
      const label::LabelName name =
          command.argument ? label::LabelName{*command.argument} : label::LabelName{};
      out << label::AutoLabel(name, env_) << '\n';
      break;
    }
    case Command::Kind::Uid:
      out << env_.counters().Next(ns) << '\n';
      break;
    case Command::Kind::Reset:
      env_.counters().Reset(ns);
      break;
    case Command::Kind::Current: {
      const scope::LabelScope* current = scope::LabelScope::Current(env_);
      out << (current != nullptr ? current->Name() : std::string("<none>")) << '\n';
      break;
    }
  }
}

}  // namespace labelkit::script
