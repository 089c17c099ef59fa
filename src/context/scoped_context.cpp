/***
 * Name: labelkit::context::ScopedContext (impl)
 * Purpose: RAII push/pop of one context value.
 * Inputs: stack, key, value
 * Outputs: None
 * Theory of Operation: The destructor must not throw; an already-empty key at
 *   destruction means someone popped our value behind our back, which is
 *   reported through the logger instead of escaping the destructor.
 */
#include "labelkit/context/context_stack.h"

#include <any>
#include <string>
#include <utility>

#include "labelkit/support/log.h"

namespace labelkit::context {

ScopedContext::ScopedContext(ContextStack& stack, std::string key, std::any value)
    : stack_(stack), key_(std::move(key)) {
  stack_.Push(key_, std::move(value));
}

ScopedContext::~ScopedContext() noexcept {
  if (stack_.Empty(key_)) {
    support::LogError("context with key " + key_ + " was already popped before its scope ended");
    return;
  }
  stack_.Pop(key_);
}

}  // namespace labelkit::context
