#pragma once

#include <syncoro/config.hpp>
#include <syncoro/detail/connection_state.hpp>
#include <syncoro/detail/pending_result.hpp>
#include <syncoro/detail/work_item.hpp>
#include <syncoro/detail/worker.hpp>
#include <syncoro/error.hpp>
#include <syncoro/error_info.hpp>
#include <syncoro/expected.hpp>
#include <syncoro/logger.hpp>
#include <syncoro/tracing.hpp>

#include <iocoro/any_executor.hpp>
#include <iocoro/awaitable.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace syncoro::detail {

/// Execution bridge between coroutine callers and one single-threaded resource.
///
/// High-level model:
/// - One worker thread (`worker_`) executes every operation, in FIFO order, and is the only
///   thread that ever touches `resource_`.
/// - Callers on any executor submit operations; each submission gets a pending_result bound
///   to the caller's executor and is resumed there.
/// - The lifecycle (see connection_state.hpp) gates submission. The resource itself is
///   constructed by a bootstrap operation and released by a teardown operation, both routed
///   through the same queue.
/// - CONNECTING -> OPEN and CLOSING -> CLOSED are made by those two operations when they
///   finish, on the worker thread. connect()/close() callers, the first one included, only
///   wait for the outcome, so a caller that stops awaiting leaves the lifecycle intact.
///
/// Concurrency notes:
/// - `mutex_` guards state_, the waiter lists and the "check state + push" step of every
///   enqueue. It is never held while waiting for the worker.
/// - `resource_` has no lock: it is only accessed on the worker thread.
/// - connect()/close()/submit() can be called from any executor.
template <typename Resource>
class connection {
 public:
  using resource_type = Resource;
  using connector_type = std::function<Resource()>;
  using closer_type = std::function<void(Resource&)>;

  connection(config cfg, connector_type connector, closer_type closer = {});

  /// Destroying an open connection releases the resource on the worker thread (closer
  /// included), drains the queue and joins the worker. Prefer close() to observe failures.
  ~connection() noexcept;

  connection(connection const&) = delete;
  auto operator=(connection const&) -> connection& = delete;

  /// Open the underlying resource.
  ///
  /// Contract:
  /// - First call: UNCONNECTED -> CONNECTING, start the worker, run the connector on it.
  ///   Success -> OPEN. Failure -> CLOSED with error::bootstrap_failed (the connector's
  ///   exception attached); the worker is joined before the failure is returned.
  /// - While CONNECTING: waits for the same bootstrap outcome.
  /// - While OPEN: succeeds immediately.
  /// - While CLOSING/CLOSED: error::connection_closed.
  auto connect() -> iocoro::awaitable<expected<void, error_info>>;

  /// Release the underlying resource and stop the worker.
  ///
  /// Behavior:
  /// - Queues the teardown operation behind all accepted operations (they all run first).
  /// - Whatever the teardown outcome: stop the worker and write CLOSED (on the worker
  ///   thread), then join it before returning.
  /// - A teardown failure is logged and returned as error::teardown_failed.
  /// - Idempotent; concurrent callers share the first caller's outcome. Closing a
  ///   never-connected connection succeeds without starting a worker.
  auto close() -> iocoro::awaitable<expected<void, error_info>>;

  /// Queue `fn` and return its completion handle, bound to `ex`, without suspending.
  ///
  /// Precondition failures (not OPEN) are resolved into the handle before it is returned;
  /// nothing is queued in that case. The handle may be awaited later or dropped.
  template <typename F>
  auto enqueue(iocoro::any_executor ex, F fn)
    -> std::shared_ptr<pending_result<operation_result_t<F>>>;

  /// Run `fn` on the worker thread and resume the caller on its own executor with the
  /// value returned by `fn`, or with error::operation_failed carrying its exception.
  template <typename F>
  auto submit(F fn) -> iocoro::awaitable<expected<operation_result_t<F>, error_info>>;

  /// Live resource. Worker thread only (i.e. from inside a submitted operation).
  /// Throws std::system_error(error::not_connected) when there is no resource.
  auto resource() -> Resource&;

  [[nodiscard]] auto state() const noexcept -> connection_state {
    return state_snapshot_.load(std::memory_order_acquire);
  }

  /// Items queued but not yet picked up by the worker.
  [[nodiscard]] auto pending() const -> std::size_t { return worker_.pending(); }

  /// Last bootstrap or teardown failure (for diagnostics).
  [[nodiscard]] auto last_error() const -> std::optional<error_info>;

 private:
  using void_result = pending_result<void>;

  /// Rejection for a user submission in the current state, if any. Requires mutex_.
  [[nodiscard]] auto check_submit_locked() const -> std::optional<error_info>;

  /// Build and queue an item. Requires mutex_.
  /// If the worker refuses it (already stopped), the handle is failed with connection_closed.
  template <typename F>
  auto push_locked(iocoro::any_executor ex, F fn, operation_kind kind)
    -> std::shared_ptr<pending_result<operation_result_t<F>>>;

  /// Queue a bootstrap/teardown item whose outcome goes to `done` on the worker thread.
  /// Requires mutex_. Returns false if the worker refused it.
  template <typename F, typename Done>
  [[nodiscard]] auto post_lifecycle_locked(operation_kind kind, F fn, Done done) -> bool;

  /// Start the worker and queue the bootstrap. Requires mutex_.
  [[nodiscard]] auto start_locked() -> std::optional<error_info>;

  [[nodiscard]] auto next_trace_info_locked(operation_kind kind) -> operation_trace_info;
  [[nodiscard]] auto traced(operation_kind kind) const noexcept -> bool;

  auto bootstrap() -> void;
  auto teardown() -> void;

  // Worker thread: outcome of the bootstrap/teardown item.
  auto on_bootstrap_done(expected<void, error_info> r) -> void;
  auto on_teardown_done(expected<void, error_info> r) -> void;

  /// Stop the worker, write CLOSED and resolve every waiter. Never joins, so it may run on
  /// the worker thread. Called outside mutex_.
  auto finish_closed(std::optional<error_info> err) -> void;

  auto set_state_locked(connection_state next) -> connection_state;
  auto emit_connection_event(connection_event evt) noexcept -> void;

  static auto add_waiter(std::vector<std::shared_ptr<void_result>>& waiters,
                         iocoro::any_executor ex) -> std::shared_ptr<void_result>;
  static auto resolve_all(std::vector<std::shared_ptr<void_result>>& waiters,
                          expected<void, error_info> const& r) -> void;

 private:
  config cfg_;
  connector_type connector_;
  closer_type closer_;

  // Worker thread only.
  std::optional<Resource> resource_{};

  mutable std::mutex mutex_{};
  connection_state state_{connection_state::UNCONNECTED};
  std::atomic<connection_state> state_snapshot_{connection_state::UNCONNECTED};
  std::vector<std::shared_ptr<void_result>> connect_waiters_{};
  std::vector<std::shared_ptr<void_result>> close_waiters_{};
  std::optional<error_info> last_error_{};
  std::uint64_t next_operation_id_{1};

  // Declared last: destroyed (stopped + joined) before anything the items may touch.
  worker worker_;
};

}  // namespace syncoro::detail

#include <syncoro/impl/connection/core.ipp>
#include <syncoro/impl/connection/connect.ipp>
#include <syncoro/impl/connection/close.ipp>
#include <syncoro/impl/connection/enqueue.ipp>
