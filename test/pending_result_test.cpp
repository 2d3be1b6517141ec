#include <gtest/gtest.h>

#include <syncoro/detail/pending_result.hpp>
#include <syncoro/error.hpp>

#include <iocoro/iocoro.hpp>

#include "async_test_util.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <thread>

using namespace std::chrono_literals;
using syncoro::detail::pending_result;
using syncoro::test_util::run_async;

TEST(pending_result_test, resolved_before_wait_does_not_suspend) {
  iocoro::io_context ctx;
  auto handle = std::make_shared<pending_result<int>>(iocoro::any_executor{ctx.get_executor()});

  EXPECT_TRUE(handle->resolve(42));
  EXPECT_TRUE(handle->is_complete());

  int got = 0;
  run_async(ctx, [&]() -> iocoro::awaitable<void> {
    auto r = co_await handle->wait();
    EXPECT_TRUE(r.has_value());
    got = r ? *r : -1;
  });

  EXPECT_EQ(got, 42);
}

TEST(pending_result_test, first_resolution_wins) {
  iocoro::io_context ctx;
  auto handle = std::make_shared<pending_result<std::string>>(
    iocoro::any_executor{ctx.get_executor()});

  EXPECT_TRUE(handle->resolve(std::string{"first"}));
  EXPECT_FALSE(handle->resolve(std::string{"second"}));
  EXPECT_FALSE(handle->resolve(
    syncoro::unexpected(syncoro::error_info{syncoro::error::operation_failed})));

  std::string got;
  run_async(ctx, [&]() -> iocoro::awaitable<void> {
    auto r = co_await handle->wait();
    EXPECT_TRUE(r.has_value());
    if (r) {
      got = *r;
    }
  });

  EXPECT_EQ(got, "first");
}

TEST(pending_result_test, completion_from_other_thread_resumes_on_bound_executor) {
  iocoro::io_context ctx;
  auto handle = std::make_shared<pending_result<int>>(iocoro::any_executor{ctx.get_executor()});

  std::thread::id executor_thread{};
  std::thread::id resumed_thread{};
  std::thread::id completer_thread{};
  int got = 0;

  std::thread completer([&]() {
    completer_thread = std::this_thread::get_id();
    std::this_thread::sleep_for(5ms);
    handle->complete(7);
  });

  run_async(ctx, [&]() -> iocoro::awaitable<void> {
    executor_thread = std::this_thread::get_id();
    auto r = co_await handle->wait();
    resumed_thread = std::this_thread::get_id();
    got = r ? *r : -1;
  });
  completer.join();

  EXPECT_EQ(got, 7);
  EXPECT_EQ(executor_thread, resumed_thread);
  EXPECT_NE(resumed_thread, completer_thread);
}

TEST(pending_result_test, complete_is_deferred_to_the_executor) {
  iocoro::io_context ctx;
  auto handle = std::make_shared<pending_result<int>>(iocoro::any_executor{ctx.get_executor()});

  handle->complete(1);
  // Nothing runs the executor yet: the slot is still empty.
  EXPECT_FALSE(handle->is_complete());

  ctx.run();
  EXPECT_TRUE(handle->is_complete());
}

TEST(pending_result_test, abandoned_handle_is_kept_alive_until_resolved) {
  iocoro::io_context ctx;
  auto handle = std::make_shared<pending_result<int>>(iocoro::any_executor{ctx.get_executor()});
  std::weak_ptr<pending_result<int>> weak = handle;

  handle->complete(3);
  handle.reset();

  // The posted resolution message still owns the slot.
  EXPECT_FALSE(weak.expired());
  ctx.run();
  EXPECT_TRUE(weak.expired());
}

TEST(pending_result_test, carries_move_only_values_and_errors) {
  iocoro::io_context ctx;
  auto ex = iocoro::any_executor{ctx.get_executor()};
  auto value = std::make_shared<pending_result<std::unique_ptr<int>>>(ex);
  auto failure = std::make_shared<pending_result<void>>(ex);

  std::thread worker([&]() {
    value->complete(std::make_unique<int>(11));
    failure->complete(syncoro::unexpected(
      syncoro::error_info{syncoro::error::operation_failed, "boom"}));
  });

  run_async(ctx, [&]() -> iocoro::awaitable<void> {
    auto v = co_await value->wait();
    EXPECT_TRUE(v.has_value());
    if (v) {
      EXPECT_EQ(**v, 11);
    }

    auto f = co_await failure->wait();
    EXPECT_FALSE(f.has_value());
    if (!f) {
      EXPECT_EQ(f.error().code, syncoro::error::operation_failed);
      EXPECT_EQ(f.error().detail, "boom");
    }
  });
  worker.join();
}
