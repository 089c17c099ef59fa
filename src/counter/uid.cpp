/***
 * Name: labelkit::counter::Uid / ResetUid
 * Purpose: Raw counter access on the default registry, independent of scopes.
 * Inputs: ns (defaults to "default")
 * Outputs: Next counter value (Uid)
 */
#include "labelkit/counter/counter_registry.h"

#include <cstdint>
#include <string>

namespace labelkit::counter {

std::uint64_t Uid(const std::string& ns) { return CounterRegistry::Default().Next(ns); }

void ResetUid(const std::string& ns) { CounterRegistry::Default().Reset(ns); }

}  // namespace labelkit::counter
