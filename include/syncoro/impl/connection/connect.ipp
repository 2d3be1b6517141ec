#pragma once

#include <syncoro/detail/connection.hpp>

#include <iocoro/this_coro.hpp>

namespace syncoro::detail {

template <typename Resource>
auto connection<Resource>::connect() -> iocoro::awaitable<expected<void, error_info>> {
  auto ex = iocoro::any_executor{co_await iocoro::this_coro::executor};

  std::optional<expected<void, error_info>> immediate{};
  std::shared_ptr<void_result> waiter{};
  std::optional<error_info> start_failure{};
  {
    std::lock_guard lk{mutex_};
    switch (state_) {
      case connection_state::OPEN:
        immediate.emplace();
        break;
      case connection_state::CLOSING:
      case connection_state::CLOSED:
        immediate.emplace(unexpected(error_info{error::connection_closed}));
        break;
      case connection_state::CONNECTING:
        // Somebody else is bootstrapping: share their outcome.
        waiter = add_waiter(connect_waiters_, ex);
        break;
      case connection_state::UNCONNECTED:
        (void)set_state_locked(connection_state::CONNECTING);
        waiter = add_waiter(connect_waiters_, ex);
        start_failure = start_locked();
        break;
    }
  }

  if (immediate) {
    co_return std::move(*immediate);
  }

  if (start_failure) {
    SYNCORO_LOG_ERROR_FOR(cfg_.name, "{}", start_failure->to_string());
    finish_closed(std::move(start_failure));
  }

  // OPEN (or CLOSED) is written by the bootstrap item itself; this only observes it.
  auto r = co_await waiter->wait();
  if (!r) {
    // A failed bootstrap leaves no worker behind.
    worker_.join();
  }
  co_return r;
}

}  // namespace syncoro::detail
