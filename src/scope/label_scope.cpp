/***
 * Name: labelkit::scope::LabelScope (construction and queries)
 * Purpose: Named constructors, current-scope lookup, naming and counters.
 * Inputs: Basenames, labels, other scopes, environments
 * Outputs: LabelScope values and their names
 * Theory of Operation: Construction never touches the context stack or the
 *   counter registry; only Enter/Exit/NextLabel do.
 */
#include "labelkit/scope/label_scope.h"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "labelkit/exceptions/unresolved_scope_error.h"
#include "labelkit/exceptions/validation_error.h"
#include "labelkit/label/label.h"
#include "labelkit/label/validate.h"

namespace labelkit::scope {

LabelScope::LabelScope(LabelEnvironment& env, std::optional<std::string> basename,
                       std::optional<std::vector<std::string>> path)
    : env_(&env), basename_(std::move(basename)), path_(std::move(path)) {
  if (path_) {
    if (path_->empty()) {
      throw exceptions::ValidationError("label scope path cannot be empty");
    }
    basename_ = path_->back();
  }
}

LabelScope LabelScope::FromBasename(std::string basename, LabelEnvironment& env) {
  label::ValidateLabelName(basename, env.options());
  return LabelScope(env, std::move(basename), std::nullopt);
}

LabelScope LabelScope::Unnamed(LabelEnvironment& env) { return LabelScope(env, std::nullopt, std::nullopt); }

LabelScope LabelScope::FromLabel(const label::Label& label, LabelEnvironment& env) {
  return LabelScope(env, std::nullopt, label.parts());
}

LabelScope LabelScope::FromExistingScope(const LabelScope& other) {
  other.CheckEntered();
  return LabelScope(*other.env_, std::nullopt, other.path_);
}

LabelScope LabelScope::Global(LabelEnvironment& env) {
  return LabelScope(env, std::nullopt, std::vector<std::string>{kGlobalScopeName});
}

LabelScope* LabelScope::Current(LabelEnvironment& env) {
  const auto& stack = env.contexts();
  if (stack.Empty(kLabelScopeContextKey)) {
    return nullptr;
  }
  return stack.PeekAs<LabelScope*>(kLabelScopeContextKey);
}

void LabelScope::CheckEntered() const {
  if (!path_) {
    throw exceptions::UnresolvedScopeError("label_scope \"" + basename_.value_or("<unnamed>") +
                                           "\" is not entered yet.");
  }
}

std::string LabelScope::Name() const {
  CheckEntered();
  return label::JoinParts(*path_);
}

std::uint64_t LabelScope::NextValue() { return env_->counters().Next(Name()); }

std::string LabelScope::NextLabel() { return std::to_string(NextValue()); }

std::string LabelScope::Repr() const {
  if (!path_) {
    return "label_scope(<unresolved " + basename_.value_or("unnamed") + ">)";
  }
  return "label_scope('" + Name() + "')";
}

std::ostream& operator<<(std::ostream& out, const LabelScope& scope) { return out << scope.Repr(); }

}  // namespace labelkit::scope
