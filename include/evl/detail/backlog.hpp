// Copyright (c) 2023-2025 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <atomic>
#include <cstddef>

namespace evl {
namespace detail {
/// An unbounded multi-producer, single-consumer queue of operations that could
/// not be applied immediately because the primary store was locked.
///
/// Producers push onto a lock-free stack. The consumer takes the whole stack
/// at once and reverses it, so operations are applied in the order they were
/// pushed. Only the current lock holder may call `drain()`.
template <typename Op> class backlog {
  struct node {
    node* next;
    Op op;
  };

  std::atomic<node*> head;

public:
  backlog() : head{nullptr} {}

  /// Thread-safe.
  void push(Op&& Operation) {
    node* n = new node{nullptr, static_cast<Op&&>(Operation)};
    auto h = head.load(std::memory_order_acquire);
    do {
      n->next = h;
    } while (!head.compare_exchange_strong(
      h, n, std::memory_order_seq_cst, std::memory_order_acquire
    ));
  }

  /// Thread-safe.
  inline bool empty() const noexcept {
    return head.load(std::memory_order_seq_cst) == nullptr;
  }

  /// Applies every operation that was pushed before this call, oldest first.
  /// Returns the number of operations applied.
  /// Not thread-safe with respect to other callers of drain().
  template <typename Apply> size_t drain(Apply&& Fn) {
    node* curr = head.exchange(nullptr, std::memory_order_acq_rel);

    node* fifo = nullptr;
    while (curr != nullptr) {
      node* next = curr->next;
      curr->next = fifo;
      fifo = curr;
      curr = next;
    }

    size_t count = 0;
    while (fifo != nullptr) {
      node* next = fifo->next;
      Fn(static_cast<Op&&>(fifo->op));
      delete fifo;
      fifo = next;
      ++count;
    }
    return count;
  }

  ~backlog() {
    node* curr = head.load(std::memory_order_acquire);
    while (curr != nullptr) {
      node* next = curr->next;
      delete curr;
      curr = next;
    }
  }

  backlog(backlog const&) = delete;
  backlog& operator=(backlog const&) = delete;
};
} // namespace detail
} // namespace evl
