// Copyright (c) 2023-2025 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

// A simple blocking mutex, built from a non-blocking lock and an event.

#include "evl/detail/tiny_lock.hpp"
#include "evl/event.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <deque>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

template <typename T> class mutex {
  // Blocked lock operations.
  evl::event<> lock_ops;
  // The inner non-blocking lock.
  evl::tiny_lock data_lock;
  T data;

public:
  class [[nodiscard]] guard {
    mutex* parent;

    friend class mutex;

    inline guard(mutex* Parent) noexcept : parent(Parent) {}

  public:
    inline guard(guard&& Other) noexcept
        : parent(std::exchange(Other.parent, nullptr)) {}
    guard& operator=(guard&&) = delete;
    guard(guard const&) = delete;
    guard& operator=(guard const&) = delete;

    inline T& operator*() noexcept { return parent->data; }
    inline T* operator->() noexcept { return &parent->data; }

    inline ~guard() {
      if (parent != nullptr) {
        parent->data_lock.unlock();
        parent->lock_ops.notify(1);
      }
    }
  };

  template <typename... Args>
  mutex(Args&&... Arguments) : data(static_cast<Args&&>(Arguments)...) {}

  /// Attempts to acquire the lock without blocking.
  std::optional<guard> try_lock() noexcept {
    if (data_lock.try_lock()) {
      return guard(this);
    }
    return std::nullopt;
  }

  /// Blocks until the lock is acquired.
  guard lock() {
    while (true) {
      if (auto g = try_lock()) {
        return std::move(*g);
      }

      evl::listener<> l = lock_ops.listen();

      // The lock may have been released before the listener was created.
      if (auto g = try_lock()) {
        return std::move(*g);
      }

      l.wait();
    }
  }

  /// Blocks until the lock is acquired or the timeout elapses.
  template <typename Rep, typename Period>
  std::optional<guard> lock_timeout(std::chrono::duration<Rep, Period> Timeout
  ) {
    auto deadline = std::chrono::steady_clock::now() + Timeout;
    while (true) {
      if (auto g = try_lock()) {
        return g;
      }

      evl::listener<> l = lock_ops.listen();

      if (auto g = try_lock()) {
        return g;
      }

      if (!l.wait_deadline(deadline).has_value()) {
        return std::nullopt;
      }
    }
  }
};

int main() {
  size_t const countMax = 10000;
  size_t const threadCount =
    std::max<size_t>(std::thread::hardware_concurrency(), 1) * 4;
  size_t const threadLoop = countMax / threadCount;

  mutex<std::deque<size_t>> queue;
  std::vector<std::thread> threads;
  threads.reserve(threadCount);
  size_t countActual = 0;
  for (size_t t = 0; t < threadCount; ++t) {
    countActual += threadLoop;
    threads.emplace_back([&queue, threadLoop]() {
      for (size_t i = 0; i < threadLoop; ++i) {
        queue.lock()->push_back(i);
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  size_t len = queue.lock()->size();
  if (len != countActual) {
    std::printf("expected %zu items, found %zu\n", countActual, len);
    return 1;
  }

  {
    auto held = queue.lock();
    std::thread contender([&queue]() {
      auto g = queue.lock_timeout(std::chrono::milliseconds(20));
      std::printf("lock_timeout while held: %s\n", g ? "acquired" : "timed out");
    });
    contender.join();
  }

  std::printf("Done!\n");
  return 0;
}
