// Copyright (c) 2023-2025 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "evl/detail/compat.hpp"
#include "evl/detail/listener_state.hpp"
#include "evl/detail/shared_state.hpp"
#include "evl/detail/thread_locals.hpp"
#include "evl/detail/waiter_list.hpp"
#include "evl/detail/wake_handle.hpp"
#include "evl/ex_any.hpp"
#include "evl/notification.hpp"
#include "evl/waker.hpp"

#ifndef EVL_ASYNC_ONLY
#include "evl/parker.hpp"
#endif

#include <atomic>
#include <chrono>
#include <coroutine>
#include <cstddef>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace evl {
template <typename T = no_tag> class event;
template <typename T = no_tag> class listener;
template <typename T = no_tag> class aw_listener;

namespace detail {
#ifndef EVL_ASYNC_ONLY
/// A parker and the wake handle that unparks it.
struct thread_parker {
  evl::parker park;
  wake_handle task;
  bool in_use;

  inline thread_parker() : task(park.unparker()), in_use(false) {}
};

namespace this_thread { // namespace reserved for thread_local variables
/// Reused by every blocking wait on this thread.
inline thread_local thread_parker cached_parker;
} // namespace this_thread
#endif

/// Drives an awaited listener. Owned jointly by the awaiter and by every waker
/// that the registry holds for it, so that a late wake never touches freed
/// memory.
template <typename T> class listener_poll_cell {
  // IDLE: registered, nobody is polling.
  // POLLING: a thread is polling the listener.
  // REPOLL: a wake arrived during POLLING; the poller must poll again.
  // DONE: the result is stored. Further wakes are ignored.
  static inline constexpr int IDLE = 0;
  static inline constexpr int POLLING = 1;
  static inline constexpr int REPOLL = 2;
  static inline constexpr int DONE = 3;

  std::atomic<size_t> refs;
  std::atomic<int> state;

  static void* clone(void* Data) noexcept {
    static_cast<listener_poll_cell*>(Data)->refs.fetch_add(
      1, std::memory_order_relaxed
    );
    return Data;
  }

  static void wake(void* Data) noexcept {
    static_cast<listener_poll_cell*>(Data)->on_wake();
  }

  static void drop(void* Data) noexcept {
    auto cell = static_cast<listener_poll_cell*>(Data);
    if (cell->refs.fetch_sub(1, std::memory_order_acq_rel) == 1) {
      delete cell;
    }
  }

  static inline constexpr waker_vtable table{&clone, &wake, &drop};

  inline void resume() noexcept {
    if (continuation_executor != nullptr) {
      continuation_executor->post(
        std::move(continuation), continuation_priority
      );
    } else {
      continuation.resume();
    }
  }

  void on_wake() noexcept {
    int s = state.load(std::memory_order_acquire);
    while (true) {
      switch (s) {
      case IDLE:
        if (state.compare_exchange_weak(
              s, POLLING, std::memory_order_acq_rel, std::memory_order_acquire
            )) {
          poll_loop(false);
          return;
        }
        break;
      case POLLING:
        if (state.compare_exchange_weak(
              s, REPOLL, std::memory_order_acq_rel, std::memory_order_acquire
            )) {
          return;
        }
        break;
      default:
        return;
      }
    }
  }

public:
  listener<T>* parent;
  std::coroutine_handle<> continuation;
  ex_any* continuation_executor;
  size_t continuation_priority;
  std::optional<T> result;

  inline listener_poll_cell(listener<T>& Parent) noexcept
      : refs{1}, state{POLLING}, parent(&Parent),
        continuation_executor(nullptr), continuation_priority(0) {}

  /// Returns a waker holding a new reference to this.
  inline waker make_waker() noexcept { return waker(clone(this), &table); }

  /// Releases the reference held by the awaiter.
  inline void release() noexcept { drop(this); }

  /// Polls until the listener is ready or a poll registers without any wake
  /// arriving in the meantime. The caller must have set the state to POLLING.
  /// If the listener becomes ready and `Inline` is true, returns true and
  /// leaves resumption to the caller; otherwise resumes the continuation.
  bool poll_loop(bool Inline) noexcept {
    while (true) {
      std::optional<T> tag = parent->poll(make_waker());
      if (tag.has_value()) {
        result = std::move(tag);
        state.store(DONE, std::memory_order_release);
        if (Inline) {
          return true;
        }
        resume();
        return false;
      }
      int expected = POLLING;
      if (state.compare_exchange_strong(
            expected, IDLE, std::memory_order_acq_rel, std::memory_order_acquire
          )) {
        return false;
      }
      // A wake arrived while polling.
      state.store(POLLING, std::memory_order_relaxed);
    }
  }
};
} // namespace detail

/// The awaitable returned by `co_await listener`. Resumes with the tag of the
/// notification that the listener received.
///
/// The awaiting coroutine is resumed by posting it to the executor it was
/// running on (`detail::this_thread::executor`), or inline on the notifying
/// thread if there is none. A coroutine suspended here must not be destroyed
/// before it is resumed.
template <typename T> class aw_listener {
  detail::listener_poll_cell<T>* cell;

  friend class listener<T>;

  inline aw_listener(listener<T>& Parent)
      : cell(new detail::listener_poll_cell<T>(Parent)) {}

public:
  inline bool await_ready() noexcept { return false; }

  inline bool await_suspend(std::coroutine_handle<> Outer) noexcept {
    cell->continuation = Outer;
    cell->continuation_executor = detail::this_thread::executor;
    cell->continuation_priority = detail::this_thread::prio;
    return !cell->poll_loop(true);
  }

  inline T await_resume() noexcept(std::is_nothrow_move_constructible_v<T>) {
    return std::move(*cell->result);
  }

  inline ~aw_listener() { cell->release(); }

  aw_listener(aw_listener const&) = delete;
  aw_listener& operator=(aw_listener const&) = delete;
  aw_listener(aw_listener&&) = delete;
  aw_listener& operator=(aw_listener&&) = delete;
};

/// A guard that waits for a notification from an `event`.
///
/// The listener enters the event's waiter list when it is constructed. It
/// leaves when it receives a notification through `wait`, `poll` or
/// `co_await`, when `discard()` is called, or when it is destroyed. If it is
/// destroyed while holding a notification that nobody consumed, that
/// notification is passed on to the next listener in line.
///
/// Listeners are notified in the order they were created.
template <typename T> class listener {
  std::shared_ptr<detail::shared_state<T>> inner;
  detail::listener_slot slot;

  friend class event<T>;

#ifndef EVL_ASYNC_ONLY
  inline std::optional<T> register_with(detail::thread_parker& Parker) {
    return inner->list
      .register_task(slot, detail::wake_handle(Parker.task))
      .into_tag();
  }

  std::optional<T> wait_with_parker(
    std::optional<std::chrono::steady_clock::time_point> Deadline,
    detail::thread_parker& Parker
  ) {
    if (auto tag = register_with(Parker)) {
      return tag;
    }

    while (true) {
      if (!Deadline.has_value()) {
        Parker.park.park();
      } else {
        if (std::chrono::steady_clock::now() >= *Deadline) {
          auto state = inner->list.remove(slot, detail::removal::TIMED_OUT);
          if (!state.has_value()) {
            return std::nullopt;
          }
          return std::move(*state).into_tag();
        }
        Parker.park.park_until(*Deadline);
      }

      // Either notified, timed out, or a spurious (stale token) wakeup.
      if (auto tag = register_with(Parker)) {
        return tag;
      }
    }
  }

  std::optional<T>
  wait_internal(std::optional<std::chrono::steady_clock::time_point> Deadline) {
    auto& cached = detail::this_thread::cached_parker;
    if (cached.in_use) {
      detail::thread_parker fresh;
      return wait_with_parker(Deadline, fresh);
    }

    struct in_use_scope {
      detail::thread_parker& p;
      in_use_scope(detail::thread_parker& P) : p(P) { p.in_use = true; }
      ~in_use_scope() { p.in_use = false; }
    } scope(cached);
    return wait_with_parker(Deadline, cached);
  }
#endif

public:
  /// Enters the waiter list of `Event`.
  explicit listener(event<T> const& Event) : inner(Event.acquire_inner()) {
    inner->list.insert(slot);
    // Pairs with the fence in notify(), so that a condition checked after this
    // point cannot miss a notification sent after it changed.
    detail::memory_barrier();
  }

#ifndef EVL_ASYNC_ONLY
  /// Blocks until a notification is received, then returns its tag.
  T wait() { return std::move(*wait_internal(std::nullopt)); }

  /// Blocks until a notification is received or `Timeout` elapses.
  /// Returns the tag, or nullopt on timeout. The listener leaves the waiter
  /// list in either case.
  template <typename Rep, typename Period>
  std::optional<T> wait_timeout(std::chrono::duration<Rep, Period> Timeout) {
    auto now = std::chrono::steady_clock::now();
    auto d =
      std::chrono::duration_cast<std::chrono::steady_clock::duration>(Timeout);
    if (d > std::chrono::steady_clock::time_point::max() - now) {
      // The deadline cannot be represented.
      return wait_internal(std::nullopt);
    }
    return wait_internal(now + d);
  }

  /// Blocks until a notification is received or `Deadline` passes.
  /// Returns the tag, or nullopt on timeout. The listener leaves the waiter
  /// list in either case.
  std::optional<T> wait_deadline(std::chrono::steady_clock::time_point Deadline
  ) {
    return wait_internal(Deadline);
  }
#endif

  /// Returns the tag if a notification was received. Otherwise, arranges for
  /// `Waker` to be woken when one arrives and returns nullopt. If several
  /// polls register different wakers, only the most recent one is woken.
  ///
  /// Calling this again after it has returned a tag, or after `discard()`,
  /// terminates the program.
  std::optional<T> poll(waker const& Waker) {
    return inner->list.register_task(slot, detail::wake_handle(Waker))
      .into_tag();
  }

  /// Leaves the waiter list without passing on a notification.
  /// Returns true if a notification had been received.
  bool discard() {
    auto state = inner->list.remove(slot, detail::removal::DISCARDED);
    return state.has_value() && state->is_notified();
  }

  /// Returns true if this listener is waiting on `Event`.
  bool listens_to(event<T> const& Event) const noexcept {
    return inner.get() == Event.inner.load(std::memory_order_acquire);
  }

  /// Returns true if both listeners are waiting on the same event.
  bool same_event(listener const& Other) const noexcept {
    return inner == Other.inner;
  }

  /// Returns true until the listener leaves the waiter list. A listener whose
  /// insertion is still in the backlog counts as listening.
  bool is_listening() const noexcept {
    return slot.k != detail::listener_slot::kind::NONE;
  }

  /// Suspends the coroutine until a notification is received. Resumes with
  /// its tag.
  inline aw_listener<T> operator co_await() { return aw_listener<T>(*this); }

  inline ~listener() { inner->list.remove(slot, detail::removal::DROPPED); }

  // Cannot be moved or copied; the waiter list refers to it
  listener(listener const&) = delete;
  listener& operator=(listener const&) = delete;
  listener(listener&&) = delete;
  listener& operator=(listener&&) = delete;
};

/// Notifies any number of waiting listeners.
///
/// An event carries no state of its own apart from the list of listeners. The
/// usual pattern is: check a condition, create a listener, check the condition
/// again, then wait. The producer changes the condition, then calls notify.
///
/// Listeners receive a value of type `T` with each notification (the "tag").
/// For `event<>` the tag is the empty `evl::no_tag`.
///
/// The waiter list is allocated by the first call to `listen()`. Notifying an
/// event that has never been listened to does nothing.
template <typename T> class event {
  mutable std::atomic<detail::shared_state<T>*> inner;
  mutable std::shared_ptr<detail::shared_state<T>> owner;

  friend class listener<T>;

  std::shared_ptr<detail::shared_state<T>> acquire_inner() const {
    auto p = inner.load(std::memory_order_acquire);
    if (p != nullptr) {
      return p->shared_from_this();
    }

    auto fresh = std::make_shared<detail::shared_state<T>>();
    detail::shared_state<T>* expected = nullptr;
    if (inner.compare_exchange_strong(
          expected, fresh.get(), std::memory_order_acq_rel,
          std::memory_order_acquire
        )) {
      owner = fresh;
      return fresh;
    }
    // Another thread won the race; ours is discarded.
    return expected->shared_from_this();
  }

  inline detail::shared_state<T>* try_inner() const noexcept {
    return inner.load(std::memory_order_acquire);
  }

public:
  /// Holds the waiter list's lock for as long as it lives. Every operation on
  /// the event from other threads (and from this one) goes to the backlog
  /// until it is destroyed, at which point the backlog is applied.
  class [[nodiscard]] registry_hold {
    detail::shared_state<T>* state;

    friend class event;

    inline registry_hold(detail::shared_state<T>* State) noexcept
        : state(State) {
      state->list.hold();
    }

  public:
    inline ~registry_hold() { state->list.unhold(); }

    registry_hold(registry_hold const&) = delete;
    registry_hold& operator=(registry_hold const&) = delete;
    registry_hold(registry_hold&&) = delete;
    registry_hold& operator=(registry_hold&&) = delete;
  };

  inline event() noexcept : inner{nullptr} {}

  /// Creates a listener for this event.
  [[nodiscard]] inline listener<T> listen() const {
    return listener<T>(*this);
  }

  /// Notifies listeners as described by `Notify`.
  ///
  /// Unless the notification is relaxed, this emits a SeqCst fence first, so
  /// that changes made before the call are visible to any listener created
  /// before it.
  template <typename TagFn> void notify(notification<TagFn> Notify) const {
    Notify.fence();
    auto p = try_inner();
    if (p == nullptr) {
      return;
    }
    p->notify(Notify);
  }

  /// Makes sure at least `Count` listeners are notified.
  inline void notify(size_t Count) const { notify(notification<>(Count)); }

  /// Like `notify(Count)`, without the fence.
  inline void notify_relaxed(size_t Count) const
    requires(std::is_same_v<T, no_tag>)
  {
    notify(notification<>(Count).relaxed());
  }

  /// Notifies `Count` more listeners, regardless of how many have already
  /// been notified.
  inline void notify_additional(size_t Count) const
    requires(std::is_same_v<T, no_tag>)
  {
    notify(notification<>(Count).additional());
  }

  inline void notify_additional_relaxed(size_t Count) const
    requires(std::is_same_v<T, no_tag>)
  {
    notify(notification<>(Count).additional().relaxed());
  }

  /// The number of listeners in the waiter list as of the last completed
  /// operation on it. Listeners still in the backlog are not counted.
  inline size_t total_listeners() const noexcept {
    auto p = try_inner();
    if (p == nullptr) {
      return 0;
    }
    return p->listener_count.load(std::memory_order_acquire);
  }

  /// Forces every operation on this event onto the backlog until the returned
  /// guard is destroyed.
  inline registry_hold lock_registry() const {
    return registry_hold(acquire_inner().get());
  }

  event(event const&) = delete;
  event& operator=(event const&) = delete;
  event(event&&) = delete;
  event& operator=(event&&) = delete;
};
} // namespace evl
