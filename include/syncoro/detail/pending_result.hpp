#pragma once

#include <syncoro/error_info.hpp>
#include <syncoro/expected.hpp>

#include <iocoro/any_executor.hpp>
#include <iocoro/awaitable.hpp>

#include <coroutine>
#include <memory>
#include <mutex>
#include <optional>

namespace syncoro::detail {

/// Single-assignment result slot bound to the executor of the caller that created it.
///
/// This is the completion handle of one submitted operation.
///
/// Resolution protocol (CRITICAL):
/// - complete() may be called from ANY thread (normally the worker thread).
/// - complete() never touches the slot directly. It posts a resolution message to the bound
///   executor; the slot is written and the waiter resumed from inside that message.
/// - resolve() is the message body. It MUST run on the bound executor, or before anybody
///   waits (precondition failures are resolved in place by the submitting caller).
///
/// At-most-once (MUST hold):
/// - The first resolve() wins and returns true.
/// - Every later resolve() is a no-op returning false, never an error. Late resolutions
///   happen during shutdown races and when a caller abandons the handle.
///
/// Waiting:
/// - wait() may be called once, from a coroutine running on the bound executor.
/// - If the slot is already resolved, wait() does not suspend.
/// - Otherwise the "check slot + register waiter + suspend" decision is one step under the
///   mutex, so a resolution can never slip between the check and the registration.
///
/// Abandonment:
/// - Dropping the shared_ptr without waiting is allowed. The posted message keeps the slot
///   alive until it runs; the operation itself still executes.
template <typename T>
class pending_result : public std::enable_shared_from_this<pending_result<T>> {
 public:
  using value_type = T;
  using result_type = expected<T, error_info>;

  explicit pending_result(iocoro::any_executor ex) : executor_(std::move(ex)) {}

  pending_result(pending_result const&) = delete;
  auto operator=(pending_result const&) -> pending_result& = delete;

  /// Post the outcome to the bound executor. Thread-safe.
  auto complete(result_type r) -> void;

  /// Write the outcome and resume the waiter inline.
  /// Returns false if the slot was already resolved.
  auto resolve(result_type r) -> bool;

  [[nodiscard]] auto is_complete() const -> bool;

  /// Suspend until resolved; returns the outcome (moved out of the slot).
  auto wait() -> iocoro::awaitable<result_type>;

  [[nodiscard]] auto executor() const noexcept -> iocoro::any_executor const& { return executor_; }

 private:
  struct awaiter;

  iocoro::any_executor executor_;

  mutable std::mutex mutex_{};
  std::optional<result_type> result_{};
  std::optional<std::coroutine_handle<>> awaiting_{};
};

}  // namespace syncoro::detail

#include <syncoro/detail/impl/pending_result.ipp>
