#pragma once

#include <syncoro/config.hpp>
#include <syncoro/detail/task_queue.hpp>
#include <syncoro/detail/work_item.hpp>
#include <syncoro/error_info.hpp>
#include <syncoro/tracing.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace syncoro::detail {

/// The dedicated thread that owns every call into the underlying resource.
///
/// Loop (runs until terminated):
/// 1. pop_for(poll_interval) so the running flag is re-checked even when idle.
/// 2. Nothing popped, not running, queue empty: exit.
/// 3. Item popped: invoke() it synchronously, then complete() or fail() it.
///    A throwing operation fails its own item only; the loop keeps going.
///    An exception while handing the outcome over is logged at error level, nothing more.
/// 4. After stop() the loop still drains everything already queued, so every item gets an
///    outcome before the thread exits.
///
/// "running" is the open state of the task queue: stop() closes the queue, which also makes
/// any later post() fail fast instead of landing in a queue nobody will drain.
///
/// Ownership:
/// - The worker owns its thread. Destruction stops and joins it (after draining).
/// - The worker must not be destroyed from its own thread.
class worker {
 public:
  using item_ptr = std::unique_ptr<work_item>;

  explicit worker(config const& cfg);
  ~worker();

  worker(worker const&) = delete;
  auto operator=(worker const&) -> worker& = delete;

  /// Start the thread. Throws std::system_error if the thread cannot be created.
  /// Calling it again is a no-op.
  auto start() -> void;

  /// Queue an item. Returns false (leaving `item` untouched) once stop() was called.
  [[nodiscard]] auto post(item_ptr&& item) -> bool;

  /// Clear the running flag. Idempotent; the thread exits after draining.
  auto stop() -> void;

  /// Wait for the thread to exit. Safe to call from several threads at once.
  /// No-op if it was never started, already joined, or called from the worker thread.
  auto join() -> void;

  /// Started and still accepting items.
  [[nodiscard]] auto running() const -> bool {
    return started_.load(std::memory_order_acquire) && !queue_.closed();
  }
  [[nodiscard]] auto pending() const -> std::size_t { return queue_.size(); }

  [[nodiscard]] auto on_worker_thread() const noexcept -> bool {
    return thread_id_.load(std::memory_order_acquire) == std::this_thread::get_id();
  }

 private:
  auto run() -> void;
  auto run_one(work_item& item) -> void;
  auto report(work_item& item, std::exception_ptr failure, error_info err) noexcept -> void;

  auto trace_start(work_item const& item, std::chrono::nanoseconds queued) noexcept -> void;
  auto trace_finish(operation_trace_finish const& evt) noexcept -> void;

  std::string name_;
  std::chrono::milliseconds poll_interval_;
  operation_trace_hooks hooks_;

  task_queue<item_ptr> queue_{};

  std::mutex thread_mutex_{};  // start() vs. join()
  std::thread thread_{};
  std::atomic<std::thread::id> thread_id_{};
  std::atomic<bool> started_{false};
};

}  // namespace syncoro::detail

#include <syncoro/detail/impl/worker.ipp>
