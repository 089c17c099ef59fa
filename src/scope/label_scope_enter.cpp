/***
 * Name: labelkit::scope::LabelScope::Enter
 * Purpose: Resolve the path on first entry, then activate the scope.
 * Inputs: none (uses the scope's environment)
 * Outputs: None
 * Theory of Operation:
 *   An already-resolved path is never recomputed, so the parent found at a
 *   later entry is not necessarily this scope's real parent; only this scope
 *   matters once resolved. Activation pushes `this` under the label-scope key
 *   and resets the counter named by the full path, so numbering inside the
 *   scope restarts at 1 on every entry.
 */
#include "labelkit/scope/label_scope.h"

#include <string>
#include <utility>
#include <vector>

#include "labelkit/metrics/metrics.h"
#include "labelkit/support/log.h"

namespace labelkit::scope {

void LabelScope::Resolve() {
  LabelScope* parent = Current(*env_);
  std::vector<std::string> prefix;
  if (parent != nullptr) {
    prefix = *parent->path_;
  }
  if (!basename_) {
    if (parent == nullptr) {
      if (env_->options().warn_on_global_fallback) {
        support::LogWarning(
            "Label is not provided, and label scope is also missing. Global numbering will be used. "
            "Note that we always recommend specifying the label manually.");
      }
      metrics::Metrics::Increment(metrics::Metrics::Counter::GlobalFallbacks);
      LabelScope global = Global(*env_);
      basename_ = global.NextLabel();
      prefix = *global.path_;
    } else {
      basename_ = parent->NextLabel();
    }
  }
  prefix.push_back(*basename_);
  path_ = std::move(prefix);
}

void LabelScope::Enter() {
  if (!path_) {
    Resolve();
  }
  const std::string name = Name();
  env_->contexts().Push(kLabelScopeContextKey, this);
  env_->counters().Reset(name);
  ++entries_;
  metrics::Metrics::Increment(metrics::Metrics::Counter::ScopesEntered);
  support::LogDebug("enter " + Repr());
}

}  // namespace labelkit::scope
