// Copyright (c) 2023-2025 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "evl/detail/compat.hpp"
#include "evl/detail/waiter_list.hpp"
#include "evl/notification.hpp"

#include <atomic>
#include <cstddef>
#include <memory>

namespace evl {
namespace detail {
/// The state shared by an event and all of its listeners.
template <typename T>
class shared_state : public std::enable_shared_from_this<shared_state<T>> {
public:
  /// The number of notified listeners, or EVL_ALL_ONES if every listener is
  /// notified (including when there are none). Only changed by the registry
  /// lock holder.
  std::atomic<size_t> notified;
  /// The number of listeners in the primary store.
  std::atomic<size_t> listener_count;
  waiter_list<T> list;

  shared_state()
      : notified{EVL_ALL_ONES}, listener_count{0},
        list(notified, listener_count) {}

  /// Returns false only if a notification with this limit certainly has
  /// nothing to do.
  inline bool should_notify(size_t Limit) noexcept {
    if (notified.load(std::memory_order_acquire) < Limit) {
      return true;
    }
    // Operations sitting in the backlog (or being applied by the current lock
    // holder) are not reflected in `notified` yet. The backlog must be checked
    // before the lock: a drain empties the backlog while the lock is still
    // held.
    if (list.is_contended()) {
      return true;
    }
    return notified.load(std::memory_order_seq_cst) < Limit;
  }

  template <typename TagFn>
  inline size_t notify(notification<TagFn>& Notify) {
    if (!should_notify(Notify.limit())) {
      return 0;
    }
    return list.notify(Notify);
  }

  shared_state(shared_state const&) = delete;
  shared_state& operator=(shared_state const&) = delete;
};
} // namespace detail
} // namespace evl
