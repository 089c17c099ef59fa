/***
 * Name: labelkit::scope::LabelEnvironment
 * Purpose: Bind the state one labeling task works against: a counter registry,
 *   a context stack and the options.
 * Inputs: References to a CounterRegistry and a ContextStack; LabelOptions
 * Outputs: Accessors used by LabelScope and AutoLabel
 * Theory of Operation:
 *   The environment does not own the registry or the stack; they must outlive
 *   it. Default() binds the process-wide instances. Separate environments
 *   (with separate registries and stacks) never observe each other, which is
 *   the supported way to label from several independent tasks.
 */
#pragma once

#include "labelkit/config/label_options.h"
#include "labelkit/context/context_stack.h"
#include "labelkit/counter/counter_registry.h"

namespace labelkit {
namespace scope {

/*** Context key under which active label scopes are pushed. */
inline constexpr const char* kLabelScopeContextKey = "label_namespace";

/*** Name of the fallback scope used when neither scope nor name is known. */
inline constexpr const char* kGlobalScopeName = "global";

class LabelEnvironment {
 public:
  LabelEnvironment(counter::CounterRegistry& counters, context::ContextStack& contexts,
                   config::LabelOptions options = {})
      : counters_(&counters), contexts_(&contexts), options_(options) {}

  LabelEnvironment(const LabelEnvironment&) = delete;
  LabelEnvironment& operator=(const LabelEnvironment&) = delete;

  static LabelEnvironment& Default();

  counter::CounterRegistry& counters() const { return *counters_; }
  context::ContextStack& contexts() const { return *contexts_; }

  const config::LabelOptions& options() const { return options_; }
  void set_options(const config::LabelOptions& options) { options_ = options; }

  /*** Reset: Clear counters and context stack (test isolation). */
  void Reset() {
    counters_->Clear();
    contexts_->Clear();
  }

 private:
  counter::CounterRegistry* counters_;
  context::ContextStack* contexts_;
  config::LabelOptions options_;
};

}  // namespace scope
}  // namespace labelkit
