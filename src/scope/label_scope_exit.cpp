/***
 * Name: labelkit::scope::LabelScope::Exit / Release / ~LabelScope
 * Purpose: Deactivate a scope by popping it from the label-scope stack.
 * Inputs: none
 * Outputs: None
 * Theory of Operation:
 *   Exit checks that this scope is the innermost active one before popping and
 *   throws otherwise. Release is the Guard's non-throwing variant: a mismatch
 *   is logged and the stack is left alone, because popping someone else's
 *   entry would corrupt every later Current() lookup. The destructor is the last
 *   resort: a scope still referenced by the stack erases all of its entries,
 *   wherever they sit, so the stack never holds a dangling scope.
 */
#include "labelkit/scope/label_scope.h"

#include <any>
#include <cstddef>
#include <string>

#include "labelkit/exceptions/scope_order_error.h"
#include "labelkit/metrics/metrics.h"
#include "labelkit/support/log.h"

namespace labelkit::scope {

LabelScope::~LabelScope() {
  if (entries_ == 0) {
    return;
  }
  const std::size_t removed = env_->contexts().RemoveAll<LabelScope*>(kLabelScopeContextKey, this);
  if (removed != 0) {
    support::LogError(Repr() + " destroyed while active; removed " + std::to_string(removed) +
                      " entry(ies) from the label scope stack");
  }
}

void LabelScope::Exit() {
  auto& stack = env_->contexts();
  LabelScope* top = stack.PeekAs<LabelScope*>(kLabelScopeContextKey);
  if (top != this) {
    throw exceptions::ScopeOrderError(Repr() + " exited while " + top->Repr() + " is the innermost scope");
  }
  stack.Pop(kLabelScopeContextKey);
  --entries_;
  metrics::Metrics::Increment(metrics::Metrics::Counter::ScopesExited);
  support::LogDebug("exit " + Repr());
}

void LabelScope::Release() noexcept {
  auto& stack = env_->contexts();
  if (stack.Empty(kLabelScopeContextKey)) {
    support::LogError(Repr() + " released, but no label scope is active");
    return;
  }
  const auto& top = stack.Peek(kLabelScopeContextKey);
  auto* top_scope = std::any_cast<LabelScope*>(&top);
  if (top_scope == nullptr || *top_scope != this) {
    support::LogError(Repr() + " released out of order; label scope stack left unchanged");
    return;
  }
  stack.Pop(kLabelScopeContextKey);
  --entries_;
  metrics::Metrics::Increment(metrics::Metrics::Counter::ScopesExited);
  support::LogDebug("exit " + Repr());
}

}  // namespace labelkit::scope
