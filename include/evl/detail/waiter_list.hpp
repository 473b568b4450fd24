// Copyright (c) 2023-2025 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "evl/detail/backlog.hpp"
#include "evl/detail/compat.hpp"
#include "evl/detail/listener_state.hpp"
#include "evl/detail/tiny_lock.hpp"
#include "evl/detail/wake_handle.hpp"
#include "evl/detail/waiter_slab.hpp"
#include "evl/notification.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#ifdef EVL_DEBUG_BACKLOG
#include <cstdio>
#endif

namespace evl {
namespace detail {
/// Shared between a listener whose insertion was deferred to the backlog and
/// the backlog operation that will perform it.
class queued_waiter {
  static inline constexpr size_t PENDING = 0;
  static inline constexpr size_t CANCELLED = EVL_ALL_ONES;

  // PENDING, CANCELLED, or (slot index + 1) once inserted.
  std::atomic<size_t> entry_id;
  // Written before entry_id is published.
  size_t generation;

  tiny_lock task_lock;
  wake_handle task;

  static inline slot_key to_key(size_t Id, size_t Generation) noexcept {
    return slot_key{Id - 1, Generation};
  }

public:
  queued_waiter() : entry_id{PENDING}, generation{0} {}

  /// Returns the slot key once the insertion has been applied.
  inline std::optional<slot_key> status() const noexcept {
    size_t id = entry_id.load(std::memory_order_acquire);
    if (id == PENDING || id == CANCELLED) {
      return std::nullopt;
    }
    return to_key(id, generation);
  }

  /// Stores the handle to wake once the insertion is applied. Returns false
  /// without storing it if the insertion has already been applied.
  inline bool try_register(wake_handle& Task) {
    tiny_lock_guard lg(task_lock);
    if (entry_id.load(std::memory_order_acquire) != PENDING) {
      return false;
    }
    task = static_cast<wake_handle&&>(Task);
    return true;
  }

  /// Prevents a pending insertion from taking effect. If the insertion has
  /// already been applied, returns its key; the caller must remove it.
  inline std::optional<slot_key> cancel() noexcept {
    size_t id = entry_id.exchange(CANCELLED, std::memory_order_acq_rel);
    if (id == PENDING || id == CANCELLED) {
      return std::nullopt;
    }
    return to_key(id, generation);
  }

  inline bool is_cancelled() const noexcept {
    return entry_id.load(std::memory_order_acquire) == CANCELLED;
  }

  /// Called by the lock holder after inserting the entry. Returns false if
  /// the listener cancelled in the meantime, in which case the entry must be
  /// removed again.
  inline bool publish(slot_key Key) noexcept {
    generation = Key.generation;
    size_t old = entry_id.exchange(Key.index + 1, std::memory_order_acq_rel);
    return old != CANCELLED;
  }

  inline wake_handle take_task() noexcept {
    tiny_lock_guard lg(task_lock);
    return std::exchange(task, wake_handle{});
  }
};

/// A listener's handle on its registry entry.
struct listener_slot {
  enum class kind : unsigned char {
    /// Not in the registry.
    NONE,
    /// In the primary store at `key`.
    HAS_NODE,
    /// Insertion is waiting in the backlog.
    QUEUED
  };

  kind k = kind::NONE;
  slot_key key{0, 0};
  std::shared_ptr<queued_waiter> queued;

  inline void reset() noexcept {
    k = kind::NONE;
    queued.reset();
  }
};

/// An operation deferred to the backlog.
template <typename T> struct backlog_op {
  enum class kind : unsigned char {
    ADD_LISTENER,
    NOTIFY,
    REMOVE_LISTENER,
    /// Wake a task once the lock holder is done, so that it registers again.
    WAITING
  };

  kind k;
  std::shared_ptr<queued_waiter> waiter;
  size_t count = 0;
  bool additional = false;
  std::function<T()> tags;
  slot_key key{0, 0};
  bool propagate = false;
  wake_handle task;

  static backlog_op add_listener(std::shared_ptr<queued_waiter> Waiter) {
    backlog_op op{kind::ADD_LISTENER};
    op.waiter = std::move(Waiter);
    return op;
  }

  static backlog_op
  notify(size_t Count, bool Additional, std::function<T()>&& Tags) {
    backlog_op op{kind::NOTIFY};
    op.count = Count;
    op.additional = Additional;
    op.tags = std::move(Tags);
    return op;
  }

  static backlog_op remove_listener(slot_key Key, bool Propagate) {
    backlog_op op{kind::REMOVE_LISTENER};
    op.key = Key;
    op.propagate = Propagate;
    return op;
  }

  static backlog_op waiting(wake_handle&& Task) {
    backlog_op op{kind::WAITING};
    op.task = std::move(Task);
    return op;
  }
};

/// How a listener leaves the registry.
enum class removal : unsigned char {
  /// The listener was destroyed. An unconsumed notification is passed on.
  DROPPED,
  /// discard() was called. Any notification is dropped with it.
  DISCARDED,
  /// A timed wait expired. If the removal is resolved immediately the caller
  /// receives any notification; if it has to be deferred, the notification is
  /// passed on instead.
  TIMED_OUT
};

/// The waiter registry.
///
/// The primary store (waiter_slab) is protected by a tiny_lock that is only
/// ever try-locked, never waited on. An operation that finds the lock taken
/// pushes itself onto the backlog; the lock holder applies the backlog before
/// releasing the lock, and the pusher retries the lock once after pushing in
/// case the holder had already left. Operations are therefore applied in
/// the order they were issued when uncontended, and eventually, in roughly
/// the order they were issued, when contended.
///
/// After every locked section, the number of notified entries (or
/// EVL_ALL_ONES if every entry is notified) and the number of entries are
/// published to the atomics given at construction.
template <typename T> class waiter_list {
  tiny_lock lock;
  waiter_slab<T> slab;
  backlog<backlog_op<T>> pending;
  std::atomic<size_t>& notified_out;
  std::atomic<size_t>& len_out;

  /// Holds the lock; releasing it drains the backlog first.
  class [[nodiscard]] list_guard {
    waiter_list& list;

  public:
    /// Precondition: the lock is already held.
    inline list_guard(waiter_list& List) noexcept : list(List) {}
    inline ~list_guard() { list.release(); }

    list_guard(list_guard const&) = delete;
    list_guard& operator=(list_guard const&) = delete;
  };

  void apply(backlog_op<T>&& Op, std::vector<wake_handle>& Wakes) {
    switch (Op.k) {
    case backlog_op<T>::kind::ADD_LISTENER: {
      auto& waiter = *Op.waiter;
      if (!waiter.is_cancelled()) {
        slot_key key = slab.insert(listener_state<T>::created());
        if (!waiter.publish(key)) {
          // Cancelled while we were inserting.
          slab.remove(key, false);
        }
      }
      wake_handle task = waiter.take_task();
      if (!task.empty()) {
        Wakes.push_back(std::move(task));
      }
      break;
    }
    case backlog_op<T>::kind::NOTIFY:
      slab.notify(Op.count, Op.additional, Op.tags);
      break;
    case backlog_op<T>::kind::REMOVE_LISTENER:
      slab.remove(Op.key, Op.propagate);
      break;
    case backlog_op<T>::kind::WAITING:
      Wakes.push_back(std::move(Op.task));
      break;
    }
  }

  /// Drains the backlog, publishes the counters and unlocks. If more work was
  /// pushed after the last drain and the lock can be retaken, repeats.
  /// Wake handles are invoked only after the lock is released.
  void release() noexcept {
    std::vector<wake_handle> wakes;
    while (true) {
      [[maybe_unused]] size_t applied =
        pending.drain([this, &wakes](backlog_op<T>&& Op) {
          apply(std::move(Op), wakes);
        });
#ifdef EVL_DEBUG_BACKLOG
      if (applied != 0) {
        std::printf(
          "evl waiter_list %p applied %zu backlog ops (len %zu, notified %zu)\n",
          static_cast<void*>(this), applied, slab.len(), slab.notified()
        );
      }
#endif
      slab.take_deferred(wakes);

      size_t notified = slab.notified();
      size_t len = slab.len();
      len_out.store(len, std::memory_order_release);
      notified_out.store(
        notified < len ? notified : EVL_ALL_ONES, std::memory_order_seq_cst
      );
      lock.unlock();

      // Anything pushed after the drain would otherwise wait for the next
      // operation to take the lock.
      if (pending.empty() || !lock.try_lock()) {
        break;
      }
    }

    for (auto& w : wakes) {
      w.wake();
    }
  }

  /// Pushes `Op` onto the backlog for the current lock holder. If the holder
  /// released the lock before the push landed, nobody else will apply it, so
  /// try to take the lock and apply it here.
  void defer(backlog_op<T>&& Op) {
    pending.push(std::move(Op));
    if (lock.try_lock()) {
      list_guard lg(*this);
    }
  }

public:
  waiter_list(std::atomic<size_t>& Notified, std::atomic<size_t>& Len)
      : notified_out(Notified), len_out(Len) {}

  /// Inserts a new entry in the CREATED state at the tail.
  void insert(listener_slot& Slot) {
    if (lock.try_lock()) {
      list_guard lg(*this);
      Slot.key = slab.insert(listener_state<T>::created());
      Slot.k = listener_slot::kind::HAS_NODE;
    } else {
      auto waiter = std::make_shared<queued_waiter>();
      defer(backlog_op<T>::add_listener(waiter));
      Slot.queued = std::move(waiter);
      Slot.k = listener_slot::kind::QUEUED;
    }
  }

  /// Removes the entry. Returns its final state, or nullopt if the listener
  /// was not in the list or the removal had to be deferred.
  std::optional<listener_state<T>> remove(listener_slot& Slot, removal How) {
    bool propagate = How == removal::DROPPED;
    bool propagateDeferred = How != removal::DISCARDED;

    slot_key key;
    switch (Slot.k) {
    case listener_slot::kind::HAS_NODE:
      key = Slot.key;
      Slot.reset();
      break;
    case listener_slot::kind::QUEUED: {
      auto k = Slot.queued->cancel();
      Slot.reset();
      if (!k.has_value()) {
        // Never inserted; the backlog will skip it.
        return std::nullopt;
      }
      key = *k;
      break;
    }
    default:
      return std::nullopt;
    }

    if (lock.try_lock()) {
      list_guard lg(*this);
      return slab.remove(key, propagate);
    }
    defer(backlog_op<T>::remove_listener(key, propagateDeferred));
    return std::nullopt;
  }

  /// Promotes listeners according to `Notify`. Returns the number promoted,
  /// or 0 if the notification had to be deferred.
  template <typename TagFn> size_t notify(notification<TagFn>& Notify) {
    if (lock.try_lock()) {
      list_guard lg(*this);
      return slab.notify(
        Notify.count(), Notify.is_additional(),
        [&Notify]() -> T { return Notify.template next_tag<T>(); }
      );
    }
    defer(backlog_op<T>::notify(
      Notify.count(), Notify.is_additional(),
      std::function<T()>([tags = Notify.tag_producer()]() mutable -> T {
        return tags.template make<T>();
      })
    ));
    return 0;
  }

  /// Attaches `Task` to the listener's entry, or returns its tag if it was
  /// already notified (in which case the entry is removed).
  register_result<T> register_task(listener_slot& Slot, wake_handle&& Task) {
    while (true) {
      switch (Slot.k) {
      case listener_slot::kind::HAS_NODE:
        if (lock.try_lock()) {
          list_guard lg(*this);
          auto result = slab.register_task(Slot.key, std::move(Task));
          if (result.which() != register_result<T>::kind::REGISTERED) {
            Slot.reset();
          }
          return result;
        }
        // Have the lock holder wake us once it is done, so that we come
        // back and register for real.
        defer(backlog_op<T>::waiting(std::move(Task)));
        return register_result<T>::registered();
      case listener_slot::kind::QUEUED:
        if (auto key = Slot.queued->status()) {
          Slot.queued.reset();
          Slot.key = *key;
          Slot.k = listener_slot::kind::HAS_NODE;
          continue;
        }
        if (Slot.queued->try_register(Task)) {
          return register_result<T>::registered();
        }
        // The insertion was applied concurrently; status() will have it.
        continue;
      default:
        return register_result<T>::never_inserted();
      }
    }
  }

  /// True if operations may be pending that the published counters do not
  /// reflect yet.
  inline bool is_contended() noexcept {
    return !pending.empty() || lock.is_locked();
  }

  /// Takes the lock, spinning if necessary. While held, every other operation
  /// goes to the backlog. Used to exercise the contended paths.
  inline void hold() noexcept { lock.spin_lock(); }

  /// Releases a lock taken by hold(), applying the backlog.
  inline void unhold() noexcept { release(); }

  waiter_list(waiter_list const&) = delete;
  waiter_list& operator=(waiter_list const&) = delete;
};
} // namespace detail
} // namespace evl
