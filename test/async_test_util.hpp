#pragma once

#include <iocoro/co_spawn.hpp>
#include <iocoro/expected.hpp>
#include <iocoro/io_context.hpp>
#include <iocoro/work_guard.hpp>

#include <gtest/gtest.h>

#include <exception>
#include <memory>
#include <utility>

namespace syncoro::test_util {

inline void fail_on_exception(std::exception_ptr eptr) {
  if (!eptr) {
    return;
  }
  try {
    std::rethrow_exception(eptr);
  } catch (std::exception const& e) {
    ADD_FAILURE() << "Unhandled exception in spawned coroutine: " << e.what();
  } catch (...) {
    ADD_FAILURE() << "Unhandled unknown exception in spawned coroutine";
  }
}

/// Spawn a coroutine on `ctx` without running the context.
///
/// - Exceptions escaping the coroutine are reported as test failures
/// - `on_done` runs on the context after the coroutine finished (with or without error)
template <class Factory, class Done>
inline void spawn_async(iocoro::io_context& ctx, Factory&& factory, Done&& on_done) {
  iocoro::co_spawn(
      ctx.get_executor(),
      [f = std::forward<Factory>(factory)]() mutable -> iocoro::awaitable<void> { co_await f(); },
      [d = std::forward<Done>(on_done)](iocoro::expected<void, std::exception_ptr> r) mutable {
        if (!r) {
          fail_on_exception(r.error());
        }
        d();
      });
}

/// Run a coroutine on the given io_context until completion.
template <class Factory>
inline void run_async(iocoro::io_context& ctx, Factory&& factory) {
  auto guard = std::make_shared<iocoro::work_guard<iocoro::executor>>(ctx.get_executor());
  spawn_async(ctx, std::forward<Factory>(factory), [guard]() { guard->reset(); });
  ctx.run();
}

}  // namespace syncoro::test_util
