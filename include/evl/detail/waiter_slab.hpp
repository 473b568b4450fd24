// Copyright (c) 2023-2025 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "evl/detail/compat.hpp"
#include "evl/detail/listener_state.hpp"
#include "evl/detail/wake_handle.hpp"

#include <cassert>
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace evl {
namespace detail {
/// Identifies one slot in a waiter_slab. The generation changes every time the
/// slot is released, so a key held past its removal never matches again.
struct slot_key {
  size_t index;
  size_t generation;
};

/// The primary waiter store. Not thread-safe; owned by waiter_list, which
/// serializes access with its lock.
///
/// Entries live in an arena and are threaded into a doubly-linked list in
/// insertion order. `start` is the first entry that has not been notified;
/// every entry before it has been. Notifying walks forward from `start`,
/// which gives FIFO fairness.
template <typename T> class waiter_slab {
  static inline constexpr size_t NIL = EVL_ALL_ONES;

  struct entry {
    // Empty while the slot is on the free list.
    std::optional<listener_state<T>> state;
    size_t generation = 0;
    size_t prev = NIL;
    // Also links the free list.
    size_t next = NIL;
  };

  std::vector<entry> entries;
  size_t head;
  size_t tail;
  size_t start;
  size_t first_free;
  size_t len_;
  size_t notified_;

  // Wake handles displaced by a notification. The owner invokes them after
  // releasing its lock.
  std::vector<wake_handle> deferred;

  inline entry* find(slot_key Key) noexcept {
    if (Key.index >= entries.size()) {
      return nullptr;
    }
    entry& e = entries[Key.index];
    if (!e.state.has_value() || e.generation != Key.generation) {
      return nullptr;
    }
    return &e;
  }

public:
  waiter_slab()
      : head{NIL}, tail{NIL}, start{NIL}, first_free{NIL}, len_{0},
        notified_{0} {}

  /// The number of entries in the list.
  inline size_t len() const noexcept { return len_; }

  /// The number of entries that have been notified.
  inline size_t notified() const noexcept { return notified_; }

  /// Appends an entry at the tail.
  slot_key insert(listener_state<T>&& State) {
    size_t idx;
    if (first_free == NIL) {
      idx = entries.size();
      entries.emplace_back();
    } else {
      idx = first_free;
      first_free = entries[idx].next;
    }

    entry& e = entries[idx];
    e.state.emplace(static_cast<listener_state<T>&&>(State));
    e.prev = tail;
    e.next = NIL;
    if (tail != NIL) {
      entries[tail].next = idx;
    } else {
      head = idx;
    }
    tail = idx;

    // Everything before this entry may already be notified.
    if (start == NIL) {
      start = idx;
    }
    ++len_;
    return slot_key{idx, e.generation};
  }

  /// Unlinks an entry and returns its final state. Returns nullopt if the key
  /// is stale.
  ///
  /// If `Propagate` is true and the entry held an unconsumed notification,
  /// that notification is delivered again, to the next eligible entry, with
  /// the same tag and the same `additional` flag.
  std::optional<listener_state<T>> remove(slot_key Key, bool Propagate) {
    entry* e = find(Key);
    if (e == nullptr) {
      return std::nullopt;
    }

    if (e->prev != NIL) {
      entries[e->prev].next = e->next;
    } else {
      head = e->next;
    }
    if (e->next != NIL) {
      entries[e->next].prev = e->prev;
    } else {
      tail = e->prev;
    }
    if (start == Key.index) {
      start = e->next;
    }

    listener_state<T> state = static_cast<listener_state<T>&&>(*e->state);
    e->state.reset();
    ++e->generation;
    e->prev = NIL;
    e->next = first_free;
    first_free = Key.index;
    --len_;

    if (state.is_notified()) {
      if (notified_ > 0) {
        --notified_;
      }
      if (Propagate &&
          state.which() == listener_state<T>::kind::NOTIFIED) {
        bool additional = state.additional();
        std::optional<T> tag{state.take_tag()};
        notify(1, additional, [&tag]() -> T {
          return static_cast<T&&>(*tag);
        });
      }
    }
    return state;
  }

  /// Promotes up to `Count` entries starting at `start`. If `Additional` is
  /// false, `Count` is a target for the total number of notified entries and
  /// entries that are already notified count toward it.
  /// `Tags` is called once per promoted entry.
  /// Returns the number of entries promoted.
  template <typename TagFn>
  size_t notify(size_t Count, bool Additional, TagFn&& Tags) {
    size_t n = Count;
    if (!Additional) {
      if (n <= notified_) {
        return 0;
      }
      n -= notified_;
    }

    size_t promoted = 0;
    while (promoted < n && start != NIL) {
      entry& e = entries[start];
      assert(!e.state->is_notified());
      // The producer may throw; leave the entry untouched if it does.
      T tag = Tags();

      listener_state<T> old = static_cast<listener_state<T>&&>(*e.state);
      e.state.emplace(
        listener_state<T>::notified(Additional, static_cast<T&&>(tag))
      );
      start = e.next;
      if (old.which() == listener_state<T>::kind::TASK) {
        deferred.push_back(static_cast<wake_handle&&>(old.waiting_task()));
      }

      ++notified_;
      ++promoted;
    }
    return promoted;
  }

  /// Attaches a wake handle to an entry. If the entry was already notified,
  /// it is removed and its tag returned instead.
  register_result<T> register_task(slot_key Key, wake_handle&& Task) {
    entry* e = find(Key);
    if (e == nullptr) {
      return register_result<T>::never_inserted();
    }

    listener_state<T>& state = *e->state;
    switch (state.which()) {
    case listener_state<T>::kind::NOTIFIED: {
      T tag = state.take_tag();
      remove(Key, false);
      return register_result<T>::notified(static_cast<T&&>(tag));
    }
    case listener_state<T>::kind::TASK:
      // Only replace the handle if it wakes something else.
      if (!Task.will_wake(state.waiting_task())) {
        state.waiting_task() = static_cast<wake_handle&&>(Task);
      }
      return register_result<T>::registered();
    default:
      state = listener_state<T>::waiting(static_cast<wake_handle&&>(Task));
      return register_result<T>::registered();
    }
  }

  /// Moves out the wake handles collected since the last call.
  inline void take_deferred(std::vector<wake_handle>& Out) {
    if (Out.empty()) {
      Out.swap(deferred);
    } else {
      for (auto& w : deferred) {
        Out.push_back(static_cast<wake_handle&&>(w));
      }
      deferred.clear();
    }
  }
};
} // namespace detail
} // namespace evl
