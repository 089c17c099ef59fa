/***
 * Name: labelkit::context::ContextStack (impl)
 * Purpose: Push/Pop/Peek/Snapshot over per-key vectors.
 * Inputs: Keys and values
 * Outputs: Values; NoContextError on empty keys
 * Theory of Operation: Lookups on unknown keys never insert, so read-only
 *   queries leave the map unchanged.
 */
#include "labelkit/context/context_stack.h"

#include <any>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "labelkit/exceptions/no_context_error.h"

namespace labelkit::context {

namespace {

[[noreturn]] void ThrowEmpty(const std::string& key) {
  throw exceptions::NoContextError("Context with key " + key + " is empty.");
}

}  // namespace

ContextStack& ContextStack::Default() {
  static ContextStack stack;
  return stack;
}

void ContextStack::Push(const std::string& key, std::any value) {
  stacks_[key].push_back(std::move(value));
}

std::any ContextStack::Pop(const std::string& key) {
  auto iter = stacks_.find(key);
  if (iter == stacks_.end() || iter->second.empty()) {
    ThrowEmpty(key);
  }
  std::any value = std::move(iter->second.back());
  iter->second.pop_back();
  return value;
}

const std::any& ContextStack::Peek(const std::string& key) const {
  auto iter = stacks_.find(key);
  if (iter == stacks_.end() || iter->second.empty()) {
    ThrowEmpty(key);
  }
  return iter->second.back();
}

std::vector<std::any> ContextStack::Snapshot(const std::string& key) const {
  auto iter = stacks_.find(key);
  if (iter == stacks_.end()) {
    return {};
  }
  return iter->second;
}

bool ContextStack::Empty(const std::string& key) const { return Size(key) == 0; }

std::size_t ContextStack::Size(const std::string& key) const {
  auto iter = stacks_.find(key);
  return iter == stacks_.end() ? 0 : iter->second.size();
}

const std::any& GetCurrentContext(const std::string& key) { return ContextStack::Default().Peek(key); }

}  // namespace labelkit::context
