#include <gtest/gtest.h>

#include "cantypes/CallbackArray.hh"

namespace {

using namespace CanTypesN;

TEST(CallbackArray, CallAndRemove) {
  CallbackArrayC<std::function<void (int)> > callbacks;
  int total = 0;
  CallbackHandleC first = callbacks.Add([&total](int value) { total += value; });
  CallbackHandleC second = callbacks.Add([&total](int value) { total += 10 * value; });
  EXPECT_EQ(callbacks.Size(), 2u);

  callbacks.Call(2);
  EXPECT_EQ(total, 22);

  first.Remove();
  EXPECT_FALSE(first.IsActive());
  EXPECT_EQ(callbacks.Size(), 1u);
  callbacks.Call(1);
  EXPECT_EQ(total, 32);

  // Removing twice has no effect.
  first.Remove();
  EXPECT_EQ(callbacks.Size(), 1u);
  EXPECT_TRUE(second.IsActive());
}

TEST(CallbackArray, RemovedHandleDoesNotAffectNewCallback) {
  CallbackArrayC<std::function<void ()> > callbacks;
  int count = 0;
  CallbackHandleC handle = callbacks.Add([&count]() { count++; });
  CallbackHandleC copy = handle;
  handle.Remove();
  callbacks.Add([&count]() { count += 2; });
  EXPECT_EQ(callbacks.Size(), 1u);

  // A copy of the removed handle must not reach the new entry.
  copy.Remove();
  EXPECT_EQ(callbacks.Size(), 1u);
  callbacks.Call();
  EXPECT_EQ(count, 2);
}

TEST(CallbackArray, HandlesAreStaleAfterClear) {
  CallbackArrayC<std::function<void (int)> > callbacks;
  int hitsA = 0;
  int hitsB = 0;
  CallbackHandleC first = callbacks.Add([&hitsA](int value) { hitsA += value; });
  callbacks.Clear();
  EXPECT_EQ(callbacks.Size(), 0u);
  callbacks.Call(1);
  EXPECT_EQ(hitsA, 0);

  callbacks.Add([&hitsB](int value) { hitsB += value; });
  first.Remove();
  EXPECT_EQ(callbacks.Size(), 1u);
  callbacks.Call(1);
  EXPECT_EQ(hitsB, 1);
  EXPECT_EQ(hitsA, 0);
}

TEST(CallbackArray, SetRemovesOnDestruction) {
  CallbackArrayC<std::function<void ()> > callbacks;
  {
    CallbackSetC set;
    set += callbacks.Add([]() {});
    set += callbacks.Add([]() {});
    EXPECT_EQ(callbacks.Size(), 2u);
  }
  EXPECT_EQ(callbacks.Size(), 0u);
}

}  // namespace
