#pragma once

#include <syncoro/assert.hpp>
#include <syncoro/detail/pending_result.hpp>

#include <utility>

namespace syncoro::detail {

template <typename T>
struct pending_result<T>::awaiter {
  pending_result* self;

  auto await_ready() const noexcept -> bool {
    return false;
  }

  auto await_suspend(std::coroutine_handle<> h) -> bool {
    std::lock_guard lk{self->mutex_};
    if (self->result_.has_value()) {
      return false;  // already resolved, continue inline
    }
    SYNCORO_ASSERT(!self->awaiting_.has_value() && "wait() called twice");
    self->awaiting_ = h;
    return true;
  }

  auto await_resume() const noexcept -> void {}
};

template <typename T>
auto pending_result<T>::complete(result_type r) -> void {
  // The posted handler may be copied by the executor; box the outcome so move-only values
  // survive the trip.
  auto box = std::make_shared<result_type>(std::move(r));
  executor_.post([self = this->shared_from_this(), box]() mutable {
    (void)self->resolve(std::move(*box));
  });
}

template <typename T>
auto pending_result<T>::resolve(result_type r) -> bool {
  std::optional<std::coroutine_handle<>> to_resume{};
  {
    std::lock_guard lk{mutex_};
    if (result_.has_value()) {
      return false;
    }
    result_.emplace(std::move(r));
    to_resume.swap(awaiting_);
  }

  // Already on the bound executor: resume through this message, never from the worker.
  if (to_resume) {
    to_resume->resume();
  }
  return true;
}

template <typename T>
auto pending_result<T>::is_complete() const -> bool {
  std::lock_guard lk{mutex_};
  return result_.has_value();
}

template <typename T>
auto pending_result<T>::wait() -> iocoro::awaitable<result_type> {
  co_await awaiter{this};

  std::optional<result_type> out{};
  {
    std::lock_guard lk{mutex_};
    SYNCORO_ASSERT(result_.has_value());
    out.swap(result_);
    // Keep the slot marked resolved so a late resolve() stays a no-op.
    result_.emplace(unexpected(error_info{error::internal_error, "result already consumed"}));
  }
  co_return std::move(*out);
}

}  // namespace syncoro::detail
