// Copyright (c) 2023-2025 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <coroutine>
#include <cstddef>
#include <utility>

namespace evl {
/// The unit of work that an executor runs. Listeners that are awaited by a
/// coroutine hand the suspended coroutine back to its executor through this.
using work_item = std::coroutine_handle<>;

/// A type-erased executor. evl does not schedule anything itself; any
/// scheduler that can accept a `work_item` may be adapted to this interface.
class ex_any {
public:
  // Pointers to the real executor and its function implementations.
  void* executor;
  void (*s_post)(void* Erased, work_item&& Item, size_t Priority) noexcept;

  /// Submits a single work item to the delegated executor.
  inline void post(work_item&& Item, size_t Priority = 0) noexcept {
    s_post(executor, static_cast<work_item&&>(Item), Priority);
  }

  /// A default constructor is offered so that other executors can initialize
  /// this with their own function pointers.
  ex_any() {}

  /// Adapts any executor exposing `post(work_item&&, size_t) noexcept`.
  template <typename T> ex_any(T* Executor) {
    executor = Executor;
    s_post = [](void* Erased, work_item&& Item, size_t Priority) noexcept {
      static_cast<T*>(Erased)->post(std::move(Item), Priority);
    };
  }
};
} // namespace evl
