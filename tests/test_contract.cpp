// Copyright (c) 2023-2025 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

// Misusing a listener terminates the program with a message.

#include "evl/detail/listener_state.hpp"
#include "evl/event.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using evl::detail::listener_state;

TEST(ListenerDeathTest, PollAfterConsumingTerminates) {
  GTEST_FLAG_SET(death_test_style, "threadsafe");
  evl_test::wake_counter counter;
  evl::event<> ev;
  evl::listener<> l = ev.listen();
  ev.notify(1);
  ASSERT_TRUE(l.poll(counter.as_waker()).has_value());
  EXPECT_DEATH((void)l.poll(counter.as_waker()), "never inserted");
}

TEST(ListenerDeathTest, PollAfterDiscardTerminates) {
  GTEST_FLAG_SET(death_test_style, "threadsafe");
  evl_test::wake_counter counter;
  evl::event<> ev;
  evl::listener<> l = ev.listen();
  EXPECT_FALSE(l.discard());
  EXPECT_DEATH((void)l.poll(counter.as_waker()), "never inserted");
}

#ifndef EVL_ASYNC_ONLY
TEST(ListenerDeathTest, WaitAfterConsumingTerminates) {
  GTEST_FLAG_SET(death_test_style, "threadsafe");
  evl::event<> ev;
  evl::listener<> l = ev.listen();
  ev.notify(1);
  l.wait();
  EXPECT_DEATH(l.wait(), "never inserted");
}
#endif

TEST(ListenerDeathTest, ReadingATakenTagTerminates) {
  auto state = listener_state<int>::notified(false, 3);
  EXPECT_EQ(state.take_tag(), 3);
  EXPECT_EQ(state.which(), listener_state<int>::kind::NOTIFIED_TAKEN);
  EXPECT_DEATH(
    (void)std::move(state).into_tag(), "already notified but taken"
  );
}

TEST(Event, ThrowingTagProducerLeavesListenersWaiting) {
  evl_test::wake_counter c1, c2;
  evl::event<int> ev;
  evl::listener<int> l1 = ev.listen();
  evl::listener<int> l2 = ev.listen();
  EXPECT_FALSE(l1.poll(c1.as_waker()).has_value());
  EXPECT_FALSE(l2.poll(c2.as_waker()).has_value());

  int calls = 0;
  auto failsSecond = [&calls]() -> int {
    if (++calls == 2) {
      throw std::runtime_error("no tag");
    }
    return calls;
  };
  EXPECT_THROW(
    ev.notify(evl::notification<>(2).tag_with(failsSecond)),
    std::runtime_error
  );

  // The first listener was notified; the second is still waiting with its
  // waker attached.
  EXPECT_EQ(c1.get(), 1u);
  EXPECT_EQ(c2.get(), 0u);
  EXPECT_EQ(l1.poll(c1.as_waker()), 1);

  ev.notify(evl::notification<>(1).tag(8));
  EXPECT_EQ(c2.get(), 1u);
  EXPECT_EQ(l2.poll(c2.as_waker()), 8);
}
