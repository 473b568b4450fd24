// Copyright (c) 2023-2025 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "evl/ex_any.hpp"

#include <cstddef>

namespace evl {
namespace detail {
namespace this_thread { // namespace reserved for thread_local variables
/// The executor currently running on this thread, if any. Executors set this
/// before running a work item, so that awaiting coroutines know where to
/// resume.
inline constinit thread_local ex_any* executor = nullptr;
inline constinit thread_local size_t prio = 0;
} // namespace this_thread

/// RAII helper for executors that drive evl awaitables: installs `Executor` as
/// the current thread's executor for the lifetime of this object.
class [[nodiscard]] executor_scope {
  ex_any* previous_executor;
  size_t previous_prio;

public:
  inline executor_scope(ex_any* Executor, size_t Priority = 0) noexcept
      : previous_executor(this_thread::executor),
        previous_prio(this_thread::prio) {
    this_thread::executor = Executor;
    this_thread::prio = Priority;
  }
  inline ~executor_scope() {
    this_thread::executor = previous_executor;
    this_thread::prio = previous_prio;
  }

  executor_scope(executor_scope const&) = delete;
  executor_scope& operator=(executor_scope const&) = delete;
};
} // namespace detail
} // namespace evl
