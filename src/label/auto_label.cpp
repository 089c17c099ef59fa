/***
 * Name: labelkit::label::AutoLabel
 * Purpose: Label generation entry points (implicit and explicit scope).
 * Inputs: name variant; environment or explicit scope
 * Outputs: Label
 * Theory of Operation: See auto_label.h. The transient scope is held by a
 *   Guard, so it is popped even if resolution or labeling throws.
 */
#include "labelkit/label/auto_label.h"

#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "labelkit/label/validate.h"
#include "labelkit/metrics/metrics.h"

namespace labelkit::label {

namespace {

scope::LabelScope TransientScope(const std::string* basename, scope::LabelEnvironment& env) {
  if (basename != nullptr) {
    return scope::LabelScope::FromBasename(*basename, env);
  }
  return scope::LabelScope::Unnamed(env);
}

}  // namespace

Label AutoLabel(const LabelName& name, scope::LabelEnvironment& env) {
  if (const auto* existing = std::get_if<Label>(&name)) {
    return *existing;
  }
  scope::LabelScope transient = TransientScope(std::get_if<std::string>(&name), env);
  const scope::LabelScope::Guard entered(transient);
  metrics::Metrics::Increment(metrics::Metrics::Counter::LabelsGenerated);
  return Label(*transient.path());
}

Label AutoLabel(const LabelName& name, scope::LabelScope& scope) {
  if (const auto* existing = std::get_if<Label>(&name)) {
    return *existing;
  }
  scope.CheckEntered();
  std::string segment;
  if (const auto* text = std::get_if<std::string>(&name)) {
    ValidateLabelName(*text, scope.environment().options());
    segment = *text;
  } else {
    segment = scope.NextLabel();
  }
  std::vector<std::string> parts = *scope.path();
  parts.push_back(std::move(segment));
  metrics::Metrics::Increment(metrics::Metrics::Counter::LabelsGenerated);
  return Label(std::move(parts));
}

}  // namespace labelkit::label
