// Copyright (c) 2023-2025 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <atomic>
#include <cstddef>

#if defined(_MSC_VER)

#ifdef __has_cpp_attribute
#if __has_cpp_attribute(msvc::forceinline)
#define EVL_FORCE_INLINE [[msvc::forceinline]]
#else
#define EVL_FORCE_INLINE
#endif
#else // not __has_cpp_attribute
#define EVL_FORCE_INLINE [[msvc::forceinline]]
#endif

#else // not _MSC_VER
#define EVL_FORCE_INLINE __attribute__((always_inline))
#endif

#if defined(__x86_64__) || defined(_M_AMD64) || defined(i386) ||               \
  defined(__i386__) || defined(__i386) || defined(_M_IX86)
#include <immintrin.h>
#define EVL_CPU_X86
#define EVL_CPU_PAUSE _mm_pause
#elif defined(__arm__) || defined(_M_ARM) || defined(_M_ARM64) ||              \
  defined(__aarch64__) || defined(__ARM_ACLE)
#include <arm_acle.h>
#define EVL_CPU_ARM
#define EVL_CPU_PAUSE __yield
#else
#define EVL_CPU_PAUSE() std::atomic_signal_fence(std::memory_order_seq_cst)
#endif

namespace evl::detail {
/// A full (SeqCst) memory barrier. On x86 a locked RMW on a local is cheaper
/// than mfence and provides the same ordering guarantee.
EVL_FORCE_INLINE inline void memory_barrier() {
#ifdef EVL_CPU_X86
  std::atomic<size_t> locker;
  locker.fetch_add(0, std::memory_order_seq_cst);
#else
  std::atomic_thread_fence(std::memory_order_seq_cst);
#endif
}
} // namespace evl::detail

#define EVL_ALL_ONES static_cast<size_t>(-1)
