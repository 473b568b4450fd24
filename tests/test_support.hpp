// Copyright (c) 2023-2025 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "evl/ex_any.hpp"
#include "evl/waker.hpp"

#include <atomic>
#include <coroutine>
#include <cstddef>
#include <deque>
#include <exception>
#include <mutex>

namespace evl_test {
/// Counts how many times a waker built from it was woken.
struct wake_counter {
  std::atomic<size_t> count{0};

  void wake() noexcept { count.fetch_add(1, std::memory_order_relaxed); }

  size_t get() const noexcept { return count.load(std::memory_order_relaxed); }

  evl::waker as_waker() noexcept { return evl::waker::borrowing(this); }
};

/// Queues posted work items until the test runs them.
class manual_executor {
  std::mutex lock;
  std::deque<evl::work_item> queue;

public:
  void post(evl::work_item&& Item, size_t) noexcept {
    std::lock_guard<std::mutex> lg(lock);
    queue.push_back(static_cast<evl::work_item&&>(Item));
  }

  size_t pending() {
    std::lock_guard<std::mutex> lg(lock);
    return queue.size();
  }

  /// Runs queued items, including any that they post, until none are left.
  size_t run_all() {
    size_t ran = 0;
    while (true) {
      evl::work_item item;
      {
        std::lock_guard<std::mutex> lg(lock);
        if (queue.empty()) {
          return ran;
        }
        item = queue.front();
        queue.pop_front();
      }
      item.resume();
      ++ran;
    }
  }
};

/// A coroutine that starts eagerly and destroys itself when it finishes.
struct detached_task {
  struct promise_type {
    detached_task get_return_object() noexcept { return {}; }
    std::suspend_never initial_suspend() noexcept { return {}; }
    std::suspend_never final_suspend() noexcept { return {}; }
    void return_void() noexcept {}
    void unhandled_exception() noexcept { std::terminate(); }
  };
};
} // namespace evl_test
