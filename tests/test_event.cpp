// Copyright (c) 2023-2025 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "evl/event.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

namespace {
template <typename T>
bool is_ready(evl::listener<T>& L, evl_test::wake_counter& Counter) {
  return L.poll(Counter.as_waker()).has_value();
}
} // namespace

TEST(Event, NotifyWithoutListenersIsNoop) {
  evl::event<> ev;
  ev.notify(10);
  ev.notify_additional(3);
  ev.notify_relaxed(1);
  ev.notify_additional_relaxed(1);
  EXPECT_EQ(ev.total_listeners(), 0u);

  // Nothing was stored for a listener created afterward.
  evl_test::wake_counter counter;
  evl::listener<> l = ev.listen();
  EXPECT_FALSE(is_ready(l, counter));
}

TEST(Event, NotifiesInCreationOrder) {
  evl_test::wake_counter counter;
  evl::event<> ev;
  evl::listener<> l1 = ev.listen();
  evl::listener<> l2 = ev.listen();
  evl::listener<> l3 = ev.listen();

  ev.notify(2);
  ev.notify(1);

  EXPECT_TRUE(is_ready(l1, counter));
  EXPECT_TRUE(is_ready(l2, counter));
  EXPECT_FALSE(is_ready(l3, counter));
}

TEST(Event, AdditionalNotificationsAccumulate) {
  evl_test::wake_counter c1, c2, c3;
  evl::event<> ev;
  evl::listener<> l1 = ev.listen();
  evl::listener<> l2 = ev.listen();
  evl::listener<> l3 = ev.listen();
  EXPECT_FALSE(is_ready(l1, c1));
  EXPECT_FALSE(is_ready(l2, c2));
  EXPECT_FALSE(is_ready(l3, c3));

  ev.notify_additional(1);
  EXPECT_EQ(c1.get(), 1u);
  EXPECT_EQ(c2.get(), 0u);

  ev.notify_additional(1);
  EXPECT_EQ(c2.get(), 1u);
  EXPECT_EQ(c3.get(), 0u);

  ev.notify(evl::notification<>(1).additional());
  EXPECT_EQ(c3.get(), 1u);

  EXPECT_TRUE(is_ready(l1, c1));
  EXPECT_TRUE(is_ready(l2, c2));
  EXPECT_TRUE(is_ready(l3, c3));
}

TEST(Event, RepeatedNotifyIsIdempotent) {
  evl_test::wake_counter counter;
  evl::event<> ev;
  evl::listener<> l1 = ev.listen();
  evl::listener<> l2 = ev.listen();
  evl::listener<> l3 = ev.listen();

  ev.notify(2);
  ev.notify(2);
  ev.notify(1);
  ev.notify(0);

  EXPECT_TRUE(is_ready(l1, counter));
  EXPECT_TRUE(is_ready(l2, counter));
  EXPECT_FALSE(is_ready(l3, counter));
}

TEST(Event, WakesRegisteredWaker) {
  evl_test::wake_counter counter;
  evl::event<> ev;
  evl::listener<> l = ev.listen();
  EXPECT_FALSE(is_ready(l, counter));
  EXPECT_EQ(counter.get(), 0u);

  ev.notify(1);
  EXPECT_EQ(counter.get(), 1u);
  EXPECT_TRUE(is_ready(l, counter));
  EXPECT_FALSE(l.is_listening());
}

TEST(Event, PreNotifiedListenerIsReadyWithoutWake) {
  evl_test::wake_counter counter;
  evl::event<> ev;
  evl::listener<> l = ev.listen();
  ev.notify(1);
  EXPECT_TRUE(is_ready(l, counter));
  EXPECT_EQ(counter.get(), 0u);
}

TEST(Event, OnlyTheLatestWakerIsWoken) {
  evl_test::wake_counter first, second;
  evl::event<> ev;
  evl::listener<> l = ev.listen();
  EXPECT_FALSE(is_ready(l, first));
  EXPECT_FALSE(is_ready(l, second));

  ev.notify(1);
  EXPECT_EQ(first.get(), 0u);
  EXPECT_EQ(second.get(), 1u);
}

TEST(Event, DiscardDoesNotPassTheNotificationOn) {
  evl::event<> ev;
  evl::listener<> l1 = ev.listen();
  evl::listener<> l2 = ev.listen();

  ev.notify(1);
  EXPECT_TRUE(l1.discard());
  EXPECT_FALSE(l2.discard());
  EXPECT_FALSE(l1.is_listening());
  EXPECT_FALSE(l2.is_listening());
}

TEST(Event, DroppingANotifiedListenerPassesItOn) {
  evl_test::wake_counter counter;
  evl::event<> ev;
  auto l1 = std::make_unique<evl::listener<>>(ev);
  evl::listener<> l2 = ev.listen();
  EXPECT_FALSE(is_ready(l2, counter));

  ev.notify(1);
  EXPECT_EQ(counter.get(), 0u);

  l1.reset();
  EXPECT_EQ(counter.get(), 1u);
  EXPECT_TRUE(is_ready(l2, counter));
}

TEST(Event, DroppingAnUnnotifiedListenerDoesNotNotify) {
  evl_test::wake_counter counter;
  evl::event<> ev;
  auto l1 = std::make_unique<evl::listener<>>(ev);
  evl::listener<> l2 = ev.listen();
  EXPECT_FALSE(is_ready(l2, counter));

  l1.reset();
  EXPECT_EQ(counter.get(), 0u);
  EXPECT_FALSE(is_ready(l2, counter));
  EXPECT_EQ(ev.total_listeners(), 1u);
}

TEST(Event, PassedOnNotificationRespectsTheTarget) {
  evl_test::wake_counter counter;
  evl::event<> ev;
  auto l1 = std::make_unique<evl::listener<>>(ev);
  evl::listener<> l2 = ev.listen();
  evl::listener<> l3 = ev.listen();

  // Two of three are notified; losing one still leaves one notified, which
  // meets a target of one.
  ev.notify(2);
  l1.reset();
  EXPECT_TRUE(is_ready(l2, counter));
  EXPECT_FALSE(is_ready(l3, counter));
}

TEST(Event, PassedOnAdditionalNotificationAlwaysPromotes) {
  evl_test::wake_counter counter;
  evl::event<> ev;
  auto l1 = std::make_unique<evl::listener<>>(ev);
  evl::listener<> l2 = ev.listen();
  evl::listener<> l3 = ev.listen();

  ev.notify_additional(2);
  l1.reset();
  EXPECT_TRUE(is_ready(l2, counter));
  EXPECT_TRUE(is_ready(l3, counter));
}

TEST(Event, TagIsDeliveredToEachListener) {
  evl_test::wake_counter counter;
  evl::event<std::string> ev;
  evl::listener<std::string> l1 = ev.listen();
  evl::listener<std::string> l2 = ev.listen();

  ev.notify(evl::notification<>(2).tag(std::string("go")));
  auto t1 = l1.poll(counter.as_waker());
  auto t2 = l2.poll(counter.as_waker());
  ASSERT_TRUE(t1.has_value());
  ASSERT_TRUE(t2.has_value());
  EXPECT_EQ(*t1, "go");
  EXPECT_EQ(*t2, "go");
}

TEST(Event, TagWithProducesOneTagPerListenerInOrder) {
  evl_test::wake_counter counter;
  evl::event<int> ev;
  evl::listener<int> l1 = ev.listen();
  evl::listener<int> l2 = ev.listen();
  evl::listener<int> l3 = ev.listen();

  int next = 100;
  ev.notify(evl::notification<>(3).tag_with([&next]() { return next++; }));
  EXPECT_EQ(l1.poll(counter.as_waker()), 100);
  EXPECT_EQ(l2.poll(counter.as_waker()), 101);
  EXPECT_EQ(l3.poll(counter.as_waker()), 102);
}

TEST(Event, PassedOnNotificationKeepsItsTag) {
  evl_test::wake_counter counter;
  evl::event<int> ev;
  auto l1 = std::make_unique<evl::listener<int>>(ev);
  evl::listener<int> l2 = ev.listen();

  ev.notify(evl::notification<>(1).tag(7));
  l1.reset();
  EXPECT_EQ(l2.poll(counter.as_waker()), 7);
}

TEST(Event, RelaxedNotifyStillNotifies) {
  evl_test::wake_counter counter;
  evl::event<> ev;
  evl::listener<> l = ev.listen();
  ev.notify_relaxed(1);
  EXPECT_TRUE(is_ready(l, counter));
}

TEST(Event, ListenerIdentity) {
  evl::event<> a;
  evl::event<> b;
  evl::listener<> la1 = a.listen();
  evl::listener<> la2 = a.listen();
  evl::listener<> lb = b.listen();

  EXPECT_TRUE(la1.listens_to(a));
  EXPECT_FALSE(la1.listens_to(b));
  EXPECT_TRUE(la1.same_event(la2));
  EXPECT_FALSE(la1.same_event(lb));

  evl::event<> never;
  EXPECT_FALSE(la1.listens_to(never));
}

TEST(Event, TotalListenersTracksTheList) {
  evl::event<> ev;
  EXPECT_EQ(ev.total_listeners(), 0u);
  {
    evl::listener<> l1 = ev.listen();
    EXPECT_EQ(ev.total_listeners(), 1u);
    evl::listener<> l2 = ev.listen();
    EXPECT_EQ(ev.total_listeners(), 2u);
    EXPECT_FALSE(l1.discard());
    EXPECT_EQ(ev.total_listeners(), 1u);
  }
  EXPECT_EQ(ev.total_listeners(), 0u);
}

TEST(Event, NotifyingAfterAllListenersLeftIsHarmless) {
  evl::event<> ev;
  {
    evl::listener<> l = ev.listen();
    ev.notify(1);
  }
  ev.notify(1);
  ev.notify_additional(1);

  evl_test::wake_counter counter;
  evl::listener<> late = ev.listen();
  EXPECT_FALSE(is_ready(late, counter));
}
