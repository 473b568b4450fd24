// Copyright (c) 2023-2025 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

// Thread parking. Not available when EVL_ASYNC_ONLY is defined.

#ifndef EVL_ASYNC_ONLY

#include "evl/detail/impl.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace evl {
namespace detail {
struct parker_inner {
  static inline constexpr int EMPTY = 0;
  static inline constexpr int PARKED = 1;
  static inline constexpr int NOTIFIED = 2;

  std::atomic<int> state{EMPTY};
  std::mutex lock;
  std::condition_variable cvar;

  void park() noexcept;
  bool park_until(std::chrono::steady_clock::time_point Deadline) noexcept;
  bool unpark() noexcept;
};
} // namespace detail

class parker;

/// Wakes the thread that owns the corresponding parker. Copies share state
/// with the parker and remain valid after the parker is destroyed.
class unparker {
  std::shared_ptr<detail::parker_inner> inner;

  friend class parker;

  inline unparker(std::shared_ptr<detail::parker_inner> Inner) noexcept
      : inner(std::move(Inner)) {}

public:
  /// Makes the parked thread (or its next `park` call) return.
  /// Returns true if this call made a token available; false if a token was
  /// already pending.
  inline bool unpark() const noexcept { return inner->unpark(); }

  /// Returns true if this unparker wakes the given parker.
  bool will_unpark(parker const& Parker) const noexcept;
};

/// Blocks the current thread until woken by an unparker. A wake token
/// delivered before the thread parks is not lost; the next park consumes it
/// and returns immediately.
class parker {
  std::shared_ptr<detail::parker_inner> inner;

  friend class unparker;

public:
  inline parker() : inner(std::make_shared<detail::parker_inner>()) {}

  /// Blocks until a wake token is available, then consumes it.
  inline void park() noexcept { inner->park(); }

  /// Blocks until a wake token is available or `Deadline` passes.
  /// Returns true if a token was consumed.
  inline bool park_until(std::chrono::steady_clock::time_point Deadline
  ) noexcept {
    return inner->park_until(Deadline);
  }

  /// Blocks until a wake token is available or `Timeout` elapses.
  /// Returns true if a token was consumed.
  template <typename Rep, typename Period>
  bool park_for(std::chrono::duration<Rep, Period> Timeout) noexcept {
    return inner->park_until(
      std::chrono::steady_clock::now() +
      std::chrono::duration_cast<std::chrono::steady_clock::duration>(Timeout)
    );
  }

  /// Makes a wake token available for this parker.
  inline bool unpark() noexcept { return inner->unpark(); }

  /// Returns a handle that can wake this parker from another thread.
  inline evl::unparker unparker() const noexcept {
    return evl::unparker(inner);
  }

  parker(parker const&) = delete;
  parker& operator=(parker const&) = delete;
};
} // namespace evl

#if defined(EVL_IMPL) || !defined(EVL_STANDALONE_COMPILATION)
#include "evl/detail/parker.ipp"
#endif

#endif // EVL_ASYNC_ONLY
