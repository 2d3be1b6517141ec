#pragma once

#include <syncoro/assert.hpp>
#include <syncoro/detail/pending_result.hpp>
#include <syncoro/error_info.hpp>
#include <syncoro/tracing.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace syncoro::detail {

/// Value type produced by invoking an operation; references are returned by copy.
template <typename F>
using operation_result_t = std::remove_cvref_t<std::invoke_result_t<std::decay_t<F>&>>;

/// One queued unit of work plus the means to report its outcome.
///
/// Protocol (driven by the worker, in this order):
/// - invoke(): run the operation on the worker thread. May throw; the worker catches.
/// - complete(): hand the kept value to the completion handle (after a successful invoke()).
/// - fail(err): hand a failure to the completion handle instead.
///
/// Exactly one of complete()/fail() is called per item by the worker.
class work_item {
 public:
  using clock = std::chrono::steady_clock;

  work_item(operation_trace_info info, bool traced)
      : info_(info), traced_(traced), enqueued_at_(clock::now()) {}

  virtual ~work_item() = default;

  work_item(work_item const&) = delete;
  auto operator=(work_item const&) -> work_item& = delete;

  virtual auto invoke() -> void = 0;
  virtual auto complete() -> void = 0;
  virtual auto fail(error_info err) -> void = 0;

  [[nodiscard]] auto info() const noexcept -> operation_trace_info const& { return info_; }
  [[nodiscard]] auto traced() const noexcept -> bool { return traced_; }
  [[nodiscard]] auto enqueued_at() const noexcept -> clock::time_point { return enqueued_at_; }

 private:
  operation_trace_info info_;
  bool traced_;
  clock::time_point enqueued_at_;
};

/// Work item whose outcome is reported through a pending_result<R>.
template <typename F, typename R>
class basic_work_item final : public work_item {
 public:
  basic_work_item(F fn, std::shared_ptr<pending_result<R>> handle, operation_trace_info info,
                  bool traced)
      : work_item(info, traced), fn_(std::move(fn)), handle_(std::move(handle)) {}

  auto invoke() -> void override {
    if constexpr (std::is_void_v<R>) {
      std::invoke(fn_);
      result_.emplace();
    } else {
      result_.emplace(std::invoke(fn_));
    }
  }

  auto complete() -> void override {
    SYNCORO_ASSERT(result_.has_value() && "complete() without a successful invoke()");
    handle_->complete(std::move(*result_));
  }

  auto fail(error_info err) -> void override {
    handle_->complete(unexpected(std::move(err)));
  }

 private:
  F fn_;
  std::shared_ptr<pending_result<R>> handle_;
  std::optional<expected<R, error_info>> result_{};
};

/// Work item owned by the connection itself (bootstrap, teardown).
///
/// The outcome goes to `done(expected<void, error_info>)`, called on the worker thread right
/// after the operation, so the lifecycle transition it drives does not depend on any caller
/// still awaiting.
template <typename F, typename Done>
class lifecycle_work_item final : public work_item {
 public:
  lifecycle_work_item(F fn, Done done, operation_trace_info info, bool traced)
      : work_item(info, traced), fn_(std::move(fn)), done_(std::move(done)) {}

  auto invoke() -> void override { std::invoke(fn_); }

  auto complete() -> void override { done_(expected<void, error_info>{}); }

  auto fail(error_info err) -> void override { done_(unexpected(std::move(err))); }

 private:
  F fn_;
  Done done_;
};

template <typename F>
[[nodiscard]] auto make_work_item(F&& fn,
                                  std::shared_ptr<pending_result<operation_result_t<F>>> handle,
                                  operation_trace_info info, bool traced)
  -> std::unique_ptr<work_item> {
  using item_type = basic_work_item<std::decay_t<F>, operation_result_t<F>>;
  return std::make_unique<item_type>(std::forward<F>(fn), std::move(handle), info, traced);
}

template <typename F, typename Done>
[[nodiscard]] auto make_lifecycle_work_item(F&& fn, Done&& done, operation_trace_info info,
                                            bool traced) -> std::unique_ptr<work_item> {
  using item_type = lifecycle_work_item<std::decay_t<F>, std::decay_t<Done>>;
  return std::make_unique<item_type>(std::forward<F>(fn), std::forward<Done>(done), info,
                                     traced);
}

}  // namespace syncoro::detail
