/***
 * Name: labelkit::context::ContextStack
 * Purpose: Keyed last-in-first-out stacks of arbitrary values for scoped state.
 * Inputs: Context keys and type-erased values
 * Outputs: Most recently pushed value per key; snapshots for introspection
 * Theory of Operation:
 *   Each key owns an independent vector (back = top). Pop and Peek on an empty
 *   key throw NoContextError rather than returning a default. Values are held
 *   as std::any; PeekAs/PopAs check the stored type and throw ContextTypeError
 *   on mismatch. Callers implementing scopes must pair every Push with exactly
 *   one Pop on every exit path; ScopedContext does that with RAII.
 *   Not multi-thread or multi-process safe.
 */
#pragma once

#include <any>
#include <cstddef>
#include <string>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

#include "labelkit/exceptions/context_type_error.h"

namespace labelkit {
namespace context {

class ContextStack {
 public:
  ContextStack() = default;
  ContextStack(const ContextStack&) = delete;
  ContextStack& operator=(const ContextStack&) = delete;

  /*** Default: The process-wide instance. */
  static ContextStack& Default();

  void Push(const std::string& key, std::any value);

  /*** Pop: Remove and return the top value under `key`; throws NoContextError when empty. */
  std::any Pop(const std::string& key);

  /*** Peek: Return the top value under `key` without removing it; throws NoContextError when empty. */
  const std::any& Peek(const std::string& key) const;

  /*** Snapshot: Copy of the values under `key`, bottom to top. Introspection only. */
  std::vector<std::any> Snapshot(const std::string& key) const;

  bool Empty(const std::string& key) const;
  std::size_t Size(const std::string& key) const;

  /*** Clear: Drop every key. For test isolation. */
  void Clear() { stacks_.clear(); }

  template <typename T>
  T PeekAs(const std::string& key) const {
    return Cast<T>(key, Peek(key));
  }

  template <typename T>
  T PopAs(const std::string& key) {
    const std::any& top = Peek(key);
    T value = Cast<T>(key, top);
    Pop(key);
    return value;
  }

  /*** RemoveAll: Erase every value under `key` holding a T equal to `value`, at any depth. Returns the count. */
  template <typename T>
  std::size_t RemoveAll(const std::string& key, const T& value) {
    auto found = stacks_.find(key);
    if (found == stacks_.end()) {
      return 0;
    }
    return std::erase_if(found->second, [&value](const std::any& entry) {
      const T* held = std::any_cast<T>(&entry);
      return held != nullptr && *held == value;
    });
  }

 private:
  template <typename T>
  static T Cast(const std::string& key, const std::any& value) {
    if (value.type() != typeid(T)) {
      throw exceptions::ContextTypeError("Context with key " + key + " holds a value of another type.");
    }
    return std::any_cast<T>(value);
  }

  std::unordered_map<std::string, std::vector<std::any>> stacks_;
};

/***
 * Name: labelkit::context::ScopedContext
 * Purpose: Push a value for the lifetime of a block and pop it on every exit path.
 * Inputs: stack, key, value
 * Outputs: None
 * Theory of Operation: Push in the constructor, Pop in the destructor. Nested
 *   ScopedContext objects unwind in reverse order, so the popped value is
 *   always the one this object pushed.
 */
class ScopedContext {
 public:
  ScopedContext(ContextStack& stack, std::string key, std::any value);
  ScopedContext(std::string key, std::any value)
      : ScopedContext(ContextStack::Default(), std::move(key), std::move(value)) {}
  ~ScopedContext() noexcept;

  ScopedContext(const ScopedContext&) = delete;
  ScopedContext& operator=(const ScopedContext&) = delete;

  const std::string& key() const { return key_; }

 private:
  ContextStack& stack_;
  std::string key_;
};

/*** GetCurrentContext: Peek `key` on the default stack. */
const std::any& GetCurrentContext(const std::string& key);

}  // namespace context
}  // namespace labelkit
