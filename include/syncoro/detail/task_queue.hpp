#pragma once

#include <syncoro/detail/ring_queue.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>

namespace syncoro::detail {

/// Thread-safe FIFO channel between submitters and the worker thread.
///
/// Contract:
/// - Any number of producers may push() concurrently; exactly one consumer pops.
/// - Items come out in push order (no priorities, no reordering).
/// - Unbounded: push() never blocks and never fails while the queue is open.
///
/// Shutdown:
/// - close() marks the queue closed and wakes the consumer.
/// - push() on a closed queue returns false and leaves the item with the caller.
/// - pop_for() keeps returning the remaining items after close(); once the queue is closed
///   AND empty it returns std::nullopt without waiting.
///
/// The closed flag and the items are guarded by the same mutex, so "check closed" and
/// "append" are a single step: nothing can be appended after the consumer has observed
/// closed-and-empty.
template <typename T>
class task_queue {
 public:
  task_queue() = default;

  task_queue(task_queue const&) = delete;
  auto operator=(task_queue const&) -> task_queue& = delete;

  task_queue(task_queue&&) = delete;
  auto operator=(task_queue&&) -> task_queue& = delete;

  /// Append an item. Non-blocking.
  /// Returns false (and does not move from `item`) if the queue is closed.
  [[nodiscard]] auto push(T&& item) -> bool;

  /// Wait up to `timeout` for an item.
  /// Returns std::nullopt on timeout, or immediately when closed and drained.
  [[nodiscard]] auto pop_for(std::chrono::milliseconds timeout) -> std::optional<T>;

  /// Stop accepting items. Idempotent.
  auto close() -> void;

  [[nodiscard]] auto closed() const -> bool;
  [[nodiscard]] auto size() const -> std::size_t;
  [[nodiscard]] auto empty() const -> bool;

 private:
  mutable std::mutex mutex_{};
  std::condition_variable cv_{};
  ring_queue<T> items_{};
  bool closed_{false};
};

}  // namespace syncoro::detail

#include <syncoro/detail/impl/task_queue.ipp>
