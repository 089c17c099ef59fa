/***
 * Name: labelkit::scope::LabelEnvironment::Default
 * Purpose: The environment bound to the process-wide registry and stack.
 * Inputs: none
 * Outputs: Reference valid for the process lifetime
 */
#include "labelkit/scope/label_environment.h"

namespace labelkit::scope {

LabelEnvironment& LabelEnvironment::Default() {
  static LabelEnvironment env(counter::CounterRegistry::Default(), context::ContextStack::Default());
  return env;
}

}  // namespace labelkit::scope
