#pragma once

#include <syncoro/assert.hpp>
#include <syncoro/detail/worker.hpp>
#include <syncoro/error.hpp>
#include <syncoro/logger.hpp>

#include <exception>
#include <utility>

namespace syncoro::detail {

inline worker::worker(config const& cfg)
    : name_(cfg.name), poll_interval_(cfg.poll_interval), hooks_(cfg.trace_hooks) {
  if (poll_interval_ <= std::chrono::milliseconds::zero()) {
    poll_interval_ = std::chrono::milliseconds{1};
  }
}

inline worker::~worker() {
  stop();
  SYNCORO_ENSURE(!on_worker_thread(), "worker destroyed from its own thread");
  join();
}

inline auto worker::start() -> void {
  std::lock_guard lk{thread_mutex_};
  if (started_.load(std::memory_order_relaxed)) {
    return;
  }
  thread_ = std::thread([this] { run(); });
  started_.store(true, std::memory_order_release);
}

inline auto worker::post(item_ptr&& item) -> bool {
  return queue_.push(std::move(item));
}

inline auto worker::stop() -> void {
  queue_.close();
}

inline auto worker::join() -> void {
  if (on_worker_thread()) {
    // Joining itself would deadlock; the loop exits on its own once drained.
    SYNCORO_LOG_WARNING_FOR(name_, "join() called from the worker thread; ignored");
    return;
  }
  std::lock_guard lk{thread_mutex_};
  if (thread_.joinable()) {
    thread_.join();
  }
}

inline auto worker::run() -> void {
  thread_id_.store(std::this_thread::get_id(), std::memory_order_release);
  SYNCORO_LOG_DEBUG_FOR(name_, "worker loop start");

  for (;;) {
    auto item = queue_.pop_for(poll_interval_);
    if (!item) {
      // Keep draining until the queue is both closed and empty, so nobody is left hanging.
      if (queue_.closed() && queue_.empty()) {
        break;
      }
      continue;
    }

    run_one(**item);
  }

  SYNCORO_LOG_DEBUG_FOR(name_, "worker loop stop");
}

inline auto worker::run_one(work_item& item) -> void {
  using clock = work_item::clock;

  auto const started = clock::now();
  auto const queued = std::chrono::duration_cast<std::chrono::nanoseconds>(
    started - item.enqueued_at());
  auto const traced = item.traced() && hooks_.enabled();

  if (traced) {
    trace_start(item, queued);
  }

  SYNCORO_LOG_DEBUG_FOR(name_, "executing {} operation #{}", to_string(item.info().kind),
                        item.info().id);

  std::exception_ptr failure{};
  try {
    item.invoke();
  } catch (...) {
    failure = std::current_exception();
  }

  auto err = failure ? error_info::from_exception(error::operation_failed, failure)
                     : error_info{};

  if (failure) {
    SYNCORO_LOG_DEBUG_FOR(name_, "operation #{} raised: {}", item.info().id, err.detail);
  } else {
    SYNCORO_LOG_DEBUG_FOR(name_, "operation #{} completed", item.info().id);
  }

  if (traced) {
    trace_finish(operation_trace_finish{
      .info = item.info(),
      .queued = queued,
      .duration = std::chrono::duration_cast<std::chrono::nanoseconds>(clock::now() - started),
      .ok = !failure,
      .error = err.code,
      .error_detail = err.detail,
    });
  }

  report(item, failure, std::move(err));
}

inline auto worker::report(work_item& item, std::exception_ptr failure, error_info err) noexcept
  -> void {
  // Handing the outcome over allocates and posts; a failure there must not end the loop.
  try {
    if (failure) {
      item.fail(std::move(err));
    } else {
      item.complete();
    }
  } catch (std::exception const& e) {
    SYNCORO_LOG_ERROR_FOR(name_, "operation #{} outcome could not be delivered: {}",
                          item.info().id, e.what());
  } catch (...) {
    SYNCORO_LOG_ERROR_FOR(name_, "operation #{} outcome could not be delivered", item.info().id);
  }
}

inline auto worker::trace_start(work_item const& item, std::chrono::nanoseconds queued) noexcept
  -> void {
  if (hooks_.on_start == nullptr) {
    return;
  }
  try {
    hooks_.on_start(hooks_.user_data, operation_trace_start{.info = item.info(), .queued = queued});
  } catch (...) {
    SYNCORO_LOG_WARNING_FOR(name_, "trace on_start hook threw; ignored");
  }
}

inline auto worker::trace_finish(operation_trace_finish const& evt) noexcept -> void {
  if (hooks_.on_finish == nullptr) {
    return;
  }
  try {
    hooks_.on_finish(hooks_.user_data, evt);
  } catch (...) {
    SYNCORO_LOG_WARNING_FOR(name_, "trace on_finish hook threw; ignored");
  }
}

}  // namespace syncoro::detail
