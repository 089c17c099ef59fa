/***
 * Name: labelkit::counter::CounterRegistry
 * Purpose: Map namespace strings to monotonically increasing integers.
 * Inputs: Namespace keys
 * Outputs: Next counter values (first call per namespace returns 1)
 * Theory of Operation:
 *   Counters start at 0 and are created on first use. Reset() sets a counter
 *   back to 0 without removing it; Clear() drops every namespace and is meant
 *   for test isolation. Not safe for concurrent callers: serialize access per
 *   registry, or give each logical task its own registry.
 */
#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace labelkit {
namespace counter {

inline constexpr const char* kDefaultNamespace = "default";

class CounterRegistry {
 public:
  CounterRegistry() = default;
  CounterRegistry(const CounterRegistry&) = delete;
  CounterRegistry& operator=(const CounterRegistry&) = delete;

  /*** Default: The process-wide instance used by Uid/ResetUid. */
  static CounterRegistry& Default();

  /*** Next: Increment and return the counter for `ns`. */
  std::uint64_t Next(const std::string& ns);

  /*** Reset: Set the counter for `ns` back to 0; unknown namespaces are fine. */
  void Reset(const std::string& ns);

  /*** Peek: Last value handed out for `ns` (0 if never used or just reset). */
  std::uint64_t Peek(const std::string& ns) const;

  void Clear() { counters_.clear(); }
  std::size_t size() const { return counters_.size(); }

 private:
  std::unordered_map<std::string, std::uint64_t> counters_;
};

/*** Uid: Next value of `ns` in the default registry. Not thread-safe. */
std::uint64_t Uid(const std::string& ns = kDefaultNamespace);

/*** ResetUid: Reset `ns` in the default registry. */
void ResetUid(const std::string& ns = kDefaultNamespace);

}  // namespace counter
}  // namespace labelkit
