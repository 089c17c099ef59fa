/***
 * Name: labelkit::counter::CounterRegistry (impl)
 * Purpose: Counter storage and the process-wide default registry.
 */
#include "labelkit/counter/counter_registry.h"

#include <cstdint>
#include <string>

namespace labelkit::counter {

CounterRegistry& CounterRegistry::Default() {
  static CounterRegistry registry;
  return registry;
}

std::uint64_t CounterRegistry::Next(const std::string& ns) { return ++counters_[ns]; }

void CounterRegistry::Reset(const std::string& ns) { counters_[ns] = 0; }

std::uint64_t CounterRegistry::Peek(const std::string& ns) const {
  auto iter = counters_.find(ns);
  return iter == counters_.end() ? 0 : iter->second;
}

}  // namespace labelkit::counter
