// Copyright (c) 2023-2025 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <utility>

namespace evl {
/// Function table behind a waker. `clone` returns the data pointer for a new
/// reference, `drop` releases one reference.
struct waker_vtable {
  void* (*clone)(void* Data) noexcept;
  void (*wake)(void* Data) noexcept;
  void (*drop)(void* Data) noexcept;
};

/// A type-erased handle that schedules a suspended task for re-polling.
///
/// Copies are made through the vtable, so a waker may keep its target alive
/// (reference counting) or may simply borrow it. The registry may hold on to
/// a copy, and may invoke it, after the listener that registered it has been
/// satisfied.
class waker {
  void* data;
  waker_vtable const* vtable;

  template <typename T> struct borrowed {
    static void* clone(void* Data) noexcept { return Data; }
    static void wake(void* Data) noexcept { static_cast<T*>(Data)->wake(); }
    static void drop(void*) noexcept {}
    static inline constexpr waker_vtable table{&clone, &wake, &drop};
  };

public:
  /// An empty waker. Waking it is a no-op.
  inline waker() noexcept : data(nullptr), vtable(nullptr) {}

  /// Adopts one reference to `Data`.
  inline waker(void* Data, waker_vtable const* VTable) noexcept
      : data(Data), vtable(VTable) {}

  /// Wakes by calling `Target->wake()`. Does not own `Target`, which must
  /// outlive every copy of this waker.
  template <typename T> static waker borrowing(T* Target) noexcept {
    return waker(Target, &borrowed<T>::table);
  }

  inline waker(waker const& Other) noexcept
      : data(Other.vtable != nullptr ? Other.vtable->clone(Other.data)
                                     : nullptr),
        vtable(Other.vtable) {}

  inline waker(waker&& Other) noexcept
      : data(std::exchange(Other.data, nullptr)),
        vtable(std::exchange(Other.vtable, nullptr)) {}

  inline waker& operator=(waker Other) noexcept {
    std::swap(data, Other.data);
    std::swap(vtable, Other.vtable);
    return *this;
  }

  inline ~waker() {
    if (vtable != nullptr) {
      vtable->drop(data);
    }
  }

  inline void wake() const noexcept {
    if (vtable != nullptr) {
      vtable->wake(data);
    }
  }

  /// Returns true if waking this and `Other` certainly reaches the same task.
  /// May return false for wakers that happen to reach the same task.
  inline bool will_wake(waker const& Other) const noexcept {
    return vtable != nullptr && data == Other.data && vtable == Other.vtable;
  }

  inline explicit operator bool() const noexcept { return vtable != nullptr; }
};
} // namespace evl
