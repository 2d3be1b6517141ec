#pragma once

#include <syncoro/detail/connection.hpp>

#include <iocoro/this_coro.hpp>

namespace syncoro::detail {

template <typename Resource>
auto connection<Resource>::close() -> iocoro::awaitable<expected<void, error_info>> {
  auto ex = iocoro::any_executor{co_await iocoro::this_coro::executor};

  for (;;) {
    std::shared_ptr<void_result> connect_waiter{};
    std::shared_ptr<void_result> close_waiter{};
    std::optional<error_info> post_failure{};
    bool closed_now = false;
    {
      std::lock_guard lk{mutex_};
      switch (state_) {
        case connection_state::CLOSED:
          break;
        case connection_state::UNCONNECTED:
          // Never connected: no worker, no resource.
          (void)set_state_locked(connection_state::CLOSED);
          closed_now = true;
          break;
        case connection_state::CONNECTING:
          connect_waiter = add_waiter(connect_waiters_, ex);
          break;
        case connection_state::CLOSING:
          close_waiter = add_waiter(close_waiters_, ex);
          break;
        case connection_state::OPEN:
          // Same critical section as every enqueue(): no user item can land behind this one.
          (void)set_state_locked(connection_state::CLOSING);
          close_waiter = add_waiter(close_waiters_, ex);
          if (!post_lifecycle_locked(
                operation_kind::teardown, [this] { teardown(); },
                [this](expected<void, error_info> r) { on_teardown_done(std::move(r)); })) {
            post_failure = error_info{error::internal_error, "worker refused the teardown"};
          }
          break;
      }
    }

    if (closed_now) {
      emit_connection_event(connection_event{
        .kind = connection_event_kind::closed,
        .from_state = static_cast<std::int32_t>(connection_state::UNCONNECTED),
        .to_state = static_cast<std::int32_t>(connection_state::CLOSED),
      });
      co_return expected<void, error_info>{};
    }

    if (connect_waiter) {
      // Let the bootstrap finish first; its outcome decides what there is to close.
      (void)co_await connect_waiter->wait();
      continue;
    }

    if (post_failure) {
      SYNCORO_LOG_ERROR_FOR(cfg_.name, "{}", post_failure->to_string());
      finish_closed(std::move(post_failure));
    }

    if (!close_waiter) {
      // CLOSED already; the worker may still be on its way out.
      worker_.join();
      co_return expected<void, error_info>{};
    }

    // CLOSED is written by the teardown item itself; every caller just waits for it.
    auto r = co_await close_waiter->wait();
    worker_.join();
    co_return r;
  }
}

}  // namespace syncoro::detail
