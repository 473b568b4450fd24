// Copyright (c) 2023-2025 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "evl/detail/wake_handle.hpp"

#include <cstdio>
#include <exception>
#include <optional>
#include <utility>

namespace evl {
namespace detail {
/// Misuse of a listener is a programming error, not a runtime condition.
[[noreturn]] inline void fatal(char const* Message) noexcept {
  std::fprintf(stderr, "evl: %s\n", Message);
  std::fflush(stderr);
  std::terminate();
}

/// The state of one entry in the waiter registry.
template <typename T> class listener_state {
public:
  enum class kind : unsigned char {
    /// Inserted; no wake handle attached yet.
    CREATED,
    /// A wake handle is attached and waiting for a notification.
    TASK,
    /// Promoted by a notify call. Holds the tag.
    NOTIFIED,
    /// The tag has been moved out.
    NOTIFIED_TAKEN
  };

private:
  kind k;
  bool was_additional;
  std::optional<T> tag;
  wake_handle task;

  inline listener_state(kind K) noexcept : k(K), was_additional(false) {}

public:
  static listener_state created() noexcept {
    return listener_state(kind::CREATED);
  }

  static listener_state waiting(wake_handle Task) noexcept {
    listener_state s(kind::TASK);
    s.task = std::move(Task);
    return s;
  }

  static listener_state notified(bool Additional, T&& Tag) {
    listener_state s(kind::NOTIFIED);
    s.was_additional = Additional;
    s.tag.emplace(static_cast<T&&>(Tag));
    return s;
  }

  inline kind which() const noexcept { return k; }

  inline bool is_notified() const noexcept {
    return k == kind::NOTIFIED || k == kind::NOTIFIED_TAKEN;
  }

  /// Whether the notification that promoted this entry was "additional".
  inline bool additional() const noexcept { return was_additional; }

  /// Only valid in TASK state.
  inline wake_handle& waiting_task() noexcept { return task; }

  /// Moves the tag out. Only valid in NOTIFIED state.
  inline T take_tag() {
    T t = static_cast<T&&>(*tag);
    tag.reset();
    k = kind::NOTIFIED_TAKEN;
    return t;
  }

  /// If this state was notified, returns the tag associated with the
  /// notification.
  std::optional<T> into_tag() && {
    switch (k) {
    case kind::NOTIFIED:
      return take_tag();
    case kind::NOTIFIED_TAKEN:
      fatal("listener was already notified but taken");
    default:
      return std::nullopt;
    }
  }
};

/// The result of registering a wake handle for a listener.
template <typename T> class register_result {
public:
  enum class kind : unsigned char { NOTIFIED, REGISTERED, NEVER_INSERTED };

private:
  kind k;
  std::optional<T> tag;

  inline register_result(kind K) noexcept : k(K) {}

public:
  static register_result notified(T&& Tag) {
    register_result r(kind::NOTIFIED);
    r.tag.emplace(static_cast<T&&>(Tag));
    return r;
  }
  static register_result registered() noexcept {
    return register_result(kind::REGISTERED);
  }
  static register_result never_inserted() noexcept {
    return register_result(kind::NEVER_INSERTED);
  }

  inline kind which() const noexcept { return k; }

  /// Returns the tag if the listener was notified. Terminates if the listener
  /// was never inserted into the list.
  std::optional<T> into_tag() && {
    switch (k) {
    case kind::NOTIFIED:
      return static_cast<std::optional<T>&&>(tag);
    case kind::REGISTERED:
      return std::nullopt;
    default:
      fatal("listener was never inserted into the list");
    }
  }
};
} // namespace detail
} // namespace evl
