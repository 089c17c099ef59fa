/***
 * Name: test_context_stack
 * Purpose: Validate keyed LIFO behavior, empty-context errors and typed access.
 */
#include <gtest/gtest.h>

#include <any>
#include <string>

#include "labelkit/context/context_stack.h"
#include "labelkit/exceptions/context_type_error.h"
#include "labelkit/exceptions/no_context_error.h"

using namespace labelkit::context;
using labelkit::exceptions::ContextTypeError;
using labelkit::exceptions::NoContextError;

TEST(ContextStack, PopReturnsPushedValue) {
  ContextStack stack;
  stack.Push("k", 42);
  EXPECT_EQ(42, std::any_cast<int>(stack.Pop("k")));
  EXPECT_TRUE(stack.Empty("k"));
}

TEST(ContextStack, LastInFirstOutPerKey) {
  ContextStack stack;
  stack.Push("k", std::string("a"));
  stack.Push("k", std::string("b"));
  stack.Push("other", std::string("x"));
  EXPECT_EQ("b", stack.PeekAs<std::string>("k"));
  EXPECT_EQ(2U, stack.Size("k"));
  EXPECT_EQ("b", stack.PopAs<std::string>("k"));
  EXPECT_EQ("a", stack.PopAs<std::string>("k"));
  EXPECT_EQ("x", stack.PeekAs<std::string>("other"));
}

TEST(ContextStack, PopOnNeverPushedKeyFails) {
  ContextStack stack;
  EXPECT_THROW(stack.Pop("missing"), NoContextError);
  EXPECT_THROW(stack.Peek("missing"), NoContextError);
}

TEST(ContextStack, PopAfterDrainFails) {
  ContextStack stack;
  stack.Push("k", 1);
  stack.Pop("k");
  EXPECT_THROW(stack.Pop("k"), NoContextError);
}

TEST(ContextStack, EmptyErrorNamesKey) {
  ContextStack stack;
  try {
    stack.Peek("label_namespace");
    FAIL() << "expected NoContextError";
  } catch (const NoContextError& ex) {
    EXPECT_NE(std::string(ex.what()).find("label_namespace"), std::string::npos);
  }
}

TEST(ContextStack, WrongTypeFailsAndLeavesStack) {
  ContextStack stack;
  stack.Push("k", 7);
  EXPECT_THROW(stack.PeekAs<std::string>("k"), ContextTypeError);
  EXPECT_THROW(stack.PopAs<std::string>("k"), ContextTypeError);
  EXPECT_EQ(1U, stack.Size("k"));
}

TEST(ContextStack, SnapshotIsBottomToTopCopy) {
  ContextStack stack;
  stack.Push("k", 1);
  stack.Push("k", 2);
  auto snap = stack.Snapshot("k");
  ASSERT_EQ(2U, snap.size());
  EXPECT_EQ(1, std::any_cast<int>(snap[0]));
  EXPECT_EQ(2, std::any_cast<int>(snap[1]));
  stack.Pop("k");
  EXPECT_EQ(2U, snap.size());
  EXPECT_TRUE(stack.Snapshot("never").empty());
}

TEST(ContextStack, QueriesDoNotCreateKeys) {
  ContextStack stack;
  EXPECT_TRUE(stack.Empty("k"));
  EXPECT_EQ(0U, stack.Size("k"));
  EXPECT_THROW(stack.Pop("k"), NoContextError);
  EXPECT_TRUE(stack.Snapshot("k").empty());
}

TEST(ContextStack, ClearDropsAllKeys) {
  ContextStack stack;
  stack.Push("a", 1);
  stack.Push("b", 2);
  stack.Clear();
  EXPECT_TRUE(stack.Empty("a"));
  EXPECT_TRUE(stack.Empty("b"));
}
