/***
 * Name: labelkit::script::ParseScript
 * Purpose: Turn label-script text into a command list.
 * Inputs:
 *   - text: whole script, '\n' separated ('\r' tolerated)
 * Outputs: Commands with 1-based line numbers
 * Theory of Operation: Whitespace tokenization per line; the first token names
 *   the command and at most one argument follows. Arguments are not validated
 *   here; label names are checked when the command runs.
 */
#include "labelkit/script/script.h"

#include <cstddef>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "labelkit/exceptions/script_error.h"

namespace labelkit::script {

namespace {

struct CommandSpec {
  std::string_view name;
  Command::Kind kind;
  bool takes_argument;
};

constexpr CommandSpec kCommands[] = {
    {"scope", Command::Kind::Scope, true},  {"end", Command::Kind::End, false},
    {"label", Command::Kind::Label, true},  {"uid", Command::Kind::Uid, true},
    {"reset", Command::Kind::Reset, true},  {"current", Command::Kind::Current, false},
};

const CommandSpec* FindCommand(std::string_view name) {
  for (const auto& entry : kCommands) {
    if (entry.name == name) {
      return &entry;
    }
  }
  return nullptr;
}

std::vector<std::string> Tokenize(const std::string& line) {
  std::istringstream stream(line);
  std::vector<std::string> tokens;
  std::string token;
  while (stream >> token) {
    tokens.push_back(token);
  }
  return tokens;
}

}  // namespace

std::vector<Command> ParseScript(std::string_view text) {
  std::vector<Command> commands;
  int line_no = 0;
  std::size_t start = 0;
  while (start <= text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    ++line_no;
    const std::vector<std::string> tokens = Tokenize(std::string(text.substr(start, end - start)));
    start = end + 1;
    if (tokens.empty() || tokens.front().front() == '#') {
      continue;
    }
    const CommandSpec* entry = FindCommand(tokens.front());
    if (entry == nullptr) {
      throw exceptions::ScriptError(line_no, "unknown command '" + tokens.front() + "'");
    }
    const std::size_t max_tokens = entry->takes_argument ? 2 : 1;
    if (tokens.size() > max_tokens) {
      throw exceptions::ScriptError(line_no, "too many arguments for '" + tokens.front() + "'");
    }
    Command command;
    command.kind = entry->kind;
    command.line = line_no;
    if (tokens.size() == 2) {
      command.argument = tokens[1];
    }
    commands.push_back(std::move(command));
  }
  return commands;
}

}  // namespace labelkit::script
