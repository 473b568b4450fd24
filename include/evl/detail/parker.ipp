// Copyright (c) 2023-2025 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

// Implementation definition file for evl::parker. This will be included
// anywhere EVL_IMPL is defined. If you prefer to manually separate compilation
// units, you can instead include this file directly in a CPP file.

#include "evl/parker.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <mutex>

namespace evl {
namespace detail {
EVL_DECL void parker_inner::park() noexcept {
  // Fast path: consume a pending token without touching the mutex.
  int expected = NOTIFIED;
  if (state.compare_exchange_strong(
        expected, EMPTY, std::memory_order_seq_cst
      )) {
    return;
  }

  std::unique_lock<std::mutex> lg(lock);
  expected = EMPTY;
  if (!state.compare_exchange_strong(
        expected, PARKED, std::memory_order_seq_cst
      )) {
    // A token arrived while we were taking the lock.
    assert(expected == NOTIFIED);
    state.exchange(EMPTY, std::memory_order_seq_cst);
    return;
  }

  while (true) {
    cvar.wait(lg);
    expected = NOTIFIED;
    if (state.compare_exchange_strong(
          expected, EMPTY, std::memory_order_seq_cst
        )) {
      return;
    }
    // Spurious wakeup - go back to sleep.
  }
}

EVL_DECL bool
parker_inner::park_until(std::chrono::steady_clock::time_point Deadline
) noexcept {
  int expected = NOTIFIED;
  if (state.compare_exchange_strong(
        expected, EMPTY, std::memory_order_seq_cst
      )) {
    return true;
  }
  if (std::chrono::steady_clock::now() >= Deadline) {
    return false;
  }

  std::unique_lock<std::mutex> lg(lock);
  expected = EMPTY;
  if (!state.compare_exchange_strong(
        expected, PARKED, std::memory_order_seq_cst
      )) {
    assert(expected == NOTIFIED);
    state.exchange(EMPTY, std::memory_order_seq_cst);
    return true;
  }

  while (true) {
    auto status = cvar.wait_until(lg, Deadline);
    expected = NOTIFIED;
    if (state.compare_exchange_strong(
          expected, EMPTY, std::memory_order_seq_cst
        )) {
      return true;
    }
    if (status == std::cv_status::timeout) {
      // We may still have been unparked between the timeout and reacquiring
      // the mutex.
      return state.exchange(EMPTY, std::memory_order_seq_cst) == NOTIFIED;
    }
  }
}

EVL_DECL bool parker_inner::unpark() noexcept {
  switch (state.exchange(NOTIFIED, std::memory_order_seq_cst)) {
  case EMPTY:
    return true;
  case NOTIFIED:
    return false;
  default:
    break;
  }

  // The parked thread checks the state while holding the mutex, so taking it
  // here orders the notify after the thread is actually waiting on cvar.
  { std::lock_guard<std::mutex> lg(lock); }
  cvar.notify_one();
  return true;
}
} // namespace detail

EVL_DECL bool unparker::will_unpark(parker const& Parker) const noexcept {
  return inner == Parker.inner;
}
} // namespace evl
