// Copyright (c) 2023-2025 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "evl/parker.hpp"
#include "evl/waker.hpp"

#include <optional>
#include <utility>

namespace evl {
namespace detail {
/// Either a task waker or a thread unparker. Stored in the waiter registry for
/// each listener that is waiting, and invoked exactly once when the listener
/// is notified.
class wake_handle {
public:
  enum class kind : unsigned char { NONE, WAKER, UNPARKER };

private:
  kind k;
  evl::waker task;
#ifndef EVL_ASYNC_ONLY
  std::optional<evl::unparker> thread;
#endif

public:
  inline wake_handle() noexcept : k(kind::NONE) {}

  inline wake_handle(evl::waker const& Waker) noexcept
      : k(kind::WAKER), task(Waker) {}

#ifndef EVL_ASYNC_ONLY
  inline wake_handle(evl::unparker const& Unparker) noexcept
      : k(kind::UNPARKER), thread(Unparker) {}
#endif

  inline kind which() const noexcept { return k; }

  inline bool empty() const noexcept { return k == kind::NONE; }

  /// Returns true if waking this would certainly wake the same target as
  /// `Other`. Unparkers never compare equal, so a waiting thread always
  /// refreshes its handle.
  inline bool will_wake(wake_handle const& Other) const noexcept {
    return k == kind::WAKER && Other.k == kind::WAKER &&
           task.will_wake(Other.task);
  }

  /// Wakes the target and leaves this empty.
  inline void wake() noexcept {
    switch (k) {
    case kind::WAKER:
      task.wake();
      task = evl::waker();
      break;
#ifndef EVL_ASYNC_ONLY
    case kind::UNPARKER:
      thread->unpark();
      thread.reset();
      break;
#endif
    default:
      break;
    }
    k = kind::NONE;
  }
};
} // namespace detail
} // namespace evl
