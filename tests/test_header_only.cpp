// Copyright (c) 2023-2025 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

// Built without the `evl` library target and without EVL_IMPL: every
// definition must come from the headers.

#include "evl/all_headers.hpp"

#include <gtest/gtest.h>

#include <chrono>

TEST(HeaderOnly, ParkerIsDefinedInline) {
  evl::parker p;
  EXPECT_TRUE(p.unparker().unpark());
  p.park();
  EXPECT_FALSE(p.park_for(std::chrono::milliseconds(1)));
}

TEST(HeaderOnly, BlockingWaitIsDefinedInline) {
  evl::event<> ev;
  evl::listener<> l = ev.listen();
  ev.notify(1);
  EXPECT_TRUE(l.wait_timeout(std::chrono::seconds(1)).has_value());
}
