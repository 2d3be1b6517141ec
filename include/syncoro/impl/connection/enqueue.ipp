#pragma once

#include <syncoro/assert.hpp>
#include <syncoro/detail/connection.hpp>

#include <iocoro/this_coro.hpp>

namespace syncoro::detail {

template <typename Resource>
template <typename F>
auto connection<Resource>::enqueue(iocoro::any_executor ex, F fn)
  -> std::shared_ptr<pending_result<operation_result_t<F>>> {
  using result_t = operation_result_t<F>;

  std::lock_guard lk{mutex_};
  if (auto rejected = check_submit_locked()) {
    // Precondition failure: resolved in place, nothing queued.
    auto handle = std::make_shared<pending_result<result_t>>(std::move(ex));
    (void)handle->resolve(unexpected(std::move(*rejected)));
    return handle;
  }
  SYNCORO_ASSERT(worker_.running() && "OPEN without a running worker");
  return push_locked(std::move(ex), std::move(fn), operation_kind::user);
}

template <typename Resource>
template <typename F>
auto connection<Resource>::submit(F fn)
  -> iocoro::awaitable<expected<operation_result_t<F>, error_info>> {
  auto ex = iocoro::any_executor{co_await iocoro::this_coro::executor};
  auto handle = enqueue(std::move(ex), std::move(fn));
  co_return co_await handle->wait();
}

template <typename Resource>
template <typename F>
auto connection<Resource>::push_locked(iocoro::any_executor ex, F fn, operation_kind kind)
  -> std::shared_ptr<pending_result<operation_result_t<F>>> {
  using result_t = operation_result_t<F>;

  auto handle = std::make_shared<pending_result<result_t>>(std::move(ex));
  auto const info = next_trace_info_locked(kind);
  auto item = make_work_item(std::move(fn), handle, info, traced(kind));

  if (!worker_.post(std::move(item))) {
    // The worker stopped accepting items; the item never reached the queue.
    (void)handle->resolve(unexpected(error_info{error::connection_closed, "worker stopped"}));
    return handle;
  }

  SYNCORO_LOG_DEBUG_FOR(cfg_.name, "queued {} operation #{} (pending={})", to_string(kind),
                        info.id, worker_.pending());
  return handle;
}

template <typename Resource>
template <typename F, typename Done>
auto connection<Resource>::post_lifecycle_locked(operation_kind kind, F fn, Done done) -> bool {
  auto const info = next_trace_info_locked(kind);
  auto item = make_lifecycle_work_item(std::move(fn), std::move(done), info, traced(kind));
  if (!worker_.post(std::move(item))) {
    return false;
  }

  SYNCORO_LOG_DEBUG_FOR(cfg_.name, "queued {} operation #{}", to_string(kind), info.id);
  return true;
}

}  // namespace syncoro::detail
