// Copyright (c) 2023-2025 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "evl/detail/compat.hpp"

#include <cstddef>
#include <type_traits>
#include <utility>

namespace evl {
/// The tag type of an untagged event.
struct no_tag {
  friend constexpr bool operator==(no_tag, no_tag) noexcept { return true; }
};

namespace detail {
// Tag producers. `make<T>()` is called once for each listener that a
// notification promotes, in FIFO order.
struct default_tag {
  template <typename T> T make() { return T{}; }
};

template <typename V> struct copy_tag {
  V value;
  template <typename T> T make() { return T(value); }
};

template <typename F> struct fn_tag {
  F fn;
  template <typename T> T make() { return T(fn()); }
};
} // namespace detail

/// Describes what a call to `event::notify()` does.
///
/// The base count means "make sure at least this many listeners are
/// notified", counted against every listener notified so far. The modifiers
/// can be applied in any order:
/// - `additional()` notifies `count` more listeners that have not been
///   notified yet, regardless of how many already were.
/// - `relaxed()` skips the SeqCst fence that `notify` otherwise emits before
///   touching the listener list. The caller becomes responsible for ordering.
/// - `tag(value)` delivers a copy of `value` to each notified listener.
/// - `tag_with(fn)` delivers the result of calling `fn()` to each notified
///   listener.
template <typename TagFn = detail::default_tag> class notification {
  size_t n;
  bool is_additional_;
  bool is_relaxed_;
  TagFn tags;

  template <typename> friend class notification;

  inline notification(size_t Count, bool Additional, bool Relaxed, TagFn Tags)
      : n(Count), is_additional_(Additional), is_relaxed_(Relaxed),
        tags(std::move(Tags)) {}

public:
  inline explicit notification(size_t Count) noexcept
    requires(std::is_same_v<TagFn, detail::default_tag>)
      : n(Count), is_additional_(false), is_relaxed_(false), tags{} {}

  [[nodiscard]] inline notification additional() const& {
    return notification(n, true, is_relaxed_, tags);
  }
  [[nodiscard]] inline notification additional() && {
    return notification(n, true, is_relaxed_, std::move(tags));
  }

  [[nodiscard]] inline notification relaxed() const& {
    return notification(n, is_additional_, true, tags);
  }
  [[nodiscard]] inline notification relaxed() && {
    return notification(n, is_additional_, true, std::move(tags));
  }

  /// Each notified listener receives a copy of `Value`.
  template <typename V>
  [[nodiscard]] notification<detail::copy_tag<std::decay_t<V>>>
  tag(V&& Value) const {
    return notification<detail::copy_tag<std::decay_t<V>>>(
      n, is_additional_, is_relaxed_,
      detail::copy_tag<std::decay_t<V>>{static_cast<V&&>(Value)}
    );
  }

  /// Each notified listener receives the result of a separate call to `Fn`.
  template <typename F>
  [[nodiscard]] notification<detail::fn_tag<std::decay_t<F>>>
  tag_with(F&& Fn) const {
    return notification<detail::fn_tag<std::decay_t<F>>>(
      n, is_additional_, is_relaxed_,
      detail::fn_tag<std::decay_t<F>>{static_cast<F&&>(Fn)}
    );
  }

  inline size_t count() const noexcept { return n; }
  inline bool is_additional() const noexcept { return is_additional_; }
  inline bool is_relaxed() const noexcept { return is_relaxed_; }

  /// The notified-listener count at or above which this notification has no
  /// effect.
  inline size_t limit() const noexcept {
    return is_additional_ ? EVL_ALL_ONES : n;
  }

  /// Emits a SeqCst fence unless this notification is relaxed.
  inline void fence() const noexcept {
    if (!is_relaxed_) {
      evl::detail::memory_barrier();
    }
  }

  template <typename T> T next_tag() { return tags.template make<T>(); }

  /// Returns the tag producer, for deferring this notification.
  inline TagFn const& tag_producer() const& noexcept { return tags; }
};
} // namespace evl
