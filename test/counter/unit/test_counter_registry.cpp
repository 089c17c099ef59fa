/***
 * Name: test_counter_registry
 * Purpose: Validate per-namespace counting, reset, and the Uid/ResetUid defaults.
 */
#include <gtest/gtest.h>

#include <cstdint>

#include "labelkit/counter/counter_registry.h"

using namespace labelkit::counter;

TEST(CounterRegistry, CountsFromOne) {
  CounterRegistry reg;
  for (std::uint64_t expected = 1; expected <= 5; ++expected) {
    EXPECT_EQ(expected, reg.Next("ns"));
  }
  EXPECT_EQ(5U, reg.Peek("ns"));
}

TEST(CounterRegistry, NamespacesAreIndependent) {
  CounterRegistry reg;
  EXPECT_EQ(1U, reg.Next("a"));
  EXPECT_EQ(2U, reg.Next("a"));
  EXPECT_EQ(1U, reg.Next("b"));
  EXPECT_EQ(3U, reg.Next("a"));
  EXPECT_EQ(2U, reg.size());
}

TEST(CounterRegistry, ResetRestartsAtOne) {
  CounterRegistry reg;
  reg.Next("ns");
  reg.Next("ns");
  reg.Reset("ns");
  EXPECT_EQ(0U, reg.Peek("ns"));
  EXPECT_EQ(1U, reg.Next("ns"));
}

TEST(CounterRegistry, ResetUnknownNamespaceIsFine) {
  CounterRegistry reg;
  EXPECT_NO_THROW(reg.Reset("never-used"));
  EXPECT_EQ(1U, reg.Next("never-used"));
}

TEST(CounterRegistry, ClearDropsEverything) {
  CounterRegistry reg;
  reg.Next("a");
  reg.Next("b");
  reg.Clear();
  EXPECT_EQ(0U, reg.size());
  EXPECT_EQ(1U, reg.Next("a"));
}

TEST(CounterRegistry, UidUsesDefaultNamespaceOfDefaultRegistry) {
  CounterRegistry::Default().Clear();
  EXPECT_EQ(1U, Uid());
  EXPECT_EQ(2U, Uid());
  EXPECT_EQ(1U, Uid("other"));
  EXPECT_EQ(2U, CounterRegistry::Default().Peek(kDefaultNamespace));
  ResetUid();
  EXPECT_EQ(1U, Uid());
  ResetUid("other");
  EXPECT_EQ(1U, Uid("other"));
  CounterRegistry::Default().Clear();
}
