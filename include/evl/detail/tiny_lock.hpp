// Copyright (c) 2023-2025 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "evl/detail/compat.hpp"

#include <atomic>

namespace evl {
/// A tiny lock with no syscalls. Guards the primary waiter store; callers that
/// fail `try_lock()` divert their work to the backlog instead of waiting.
class tiny_lock {
  std::atomic_flag m_is_locked;

public:
  inline tiny_lock() { m_is_locked.clear(); }

  inline bool try_lock() {
    return !m_is_locked.test_and_set(std::memory_order_seq_cst);
  }

  inline void spin_lock() {
    while (m_is_locked.test_and_set(std::memory_order_seq_cst)) {
      do {
        EVL_CPU_PAUSE();
      } while (m_is_locked.test(std::memory_order_relaxed));
    }
  }

  inline void unlock() { m_is_locked.clear(std::memory_order_seq_cst); }

  inline bool is_locked() {
    return m_is_locked.test(std::memory_order_seq_cst);
  }

  tiny_lock(tiny_lock const&) = delete;
  tiny_lock& operator=(tiny_lock const&) = delete;
};

class [[nodiscard]] tiny_lock_guard {
  tiny_lock& lock;

public:
  [[nodiscard]] inline tiny_lock_guard(tiny_lock& Lock) : lock{Lock} {
    lock.spin_lock();
  }
  inline ~tiny_lock_guard() { lock.unlock(); }

  tiny_lock_guard(tiny_lock_guard const&) = delete;
  tiny_lock_guard& operator=(tiny_lock_guard const&) = delete;
};
} // namespace evl
