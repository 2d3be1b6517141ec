#pragma once

#include <syncoro/config.hpp>
#include <syncoro/detail/connection.hpp>
#include <syncoro/error_info.hpp>
#include <syncoro/expected.hpp>

#include <iocoro/any_executor.hpp>
#include <iocoro/awaitable.hpp>

#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace syncoro {

/// Coroutine front end for a synchronous, non-thread-safe resource.
///
/// Responsibilities:
/// - Manage the connection lifecycle (connect/close)
/// - Provide the user-facing async API
/// - Forward operations to the connection's worker thread
///
/// NOT responsible for:
/// - Executing operations (delegated to the connection's worker)
/// - Knowing anything about the resource beyond how to open and release it
///
/// Thread safety:
/// - All methods can be called from any executor, from any thread
/// - Results are delivered on the executor of the awaiting coroutine
///
/// Lifetime:
/// - The client must outlive every coroutine awaiting one of its operations.
/// - Results are posted to the caller's executor from the worker thread. The caller's
///   io_context must keep running (e.g. hold a work guard) until they arrive.
///
/// Usage:
///   client<kv_store> c{[] { return kv_store{"data.db"}; }};
///   co_await c.connect();
///   auto n = co_await c.exec([](kv_store& db) { return db.size(); });
///   co_await c.close();
template <typename Resource>
class client {
 public:
  using resource_type = Resource;
  using connection_type = detail::connection<Resource>;
  using connector_type = typename connection_type::connector_type;
  using closer_type = typename connection_type::closer_type;

  /// Value produced by `fn(resource)`; references are returned by copy.
  template <typename F>
  using exec_result_t = std::remove_cvref_t<std::invoke_result_t<F&, Resource&>>;

  /// `connector` builds the resource; it runs on the worker thread during connect().
  /// `closer`, if set, runs on the worker thread during close(), before the resource is
  /// destroyed.
  explicit client(connector_type connector, closer_type closer = {}, config cfg = {})
      : conn_(std::make_unique<connection_type>(std::move(cfg), std::move(connector),
                                                std::move(closer))) {}

  client(client const&) = delete;
  auto operator=(client const&) -> client& = delete;

  client(client&&) noexcept = default;
  auto operator=(client&&) noexcept -> client& = default;

  /// Open the resource on the worker thread.
  ///
  /// Returns:
  /// - expected<void, error_info>{} on success (or when already open)
  /// - unexpected(error_info) with error::bootstrap_failed when the connector threw; the
  ///   connector's exception is attached and the client is closed for good
  auto connect() -> iocoro::awaitable<expected<void, error_info>> {
    co_return co_await conn_->connect();
  }

  /// Release the resource after every accepted operation has run, then stop the worker.
  /// The client is CLOSED afterwards, even when this reports error::teardown_failed.
  auto close() -> iocoro::awaitable<expected<void, error_info>> {
    co_return co_await conn_->close();
  }

  /// Run a nullary operation on the worker thread.
  template <typename F>
  auto submit(F fn) -> iocoro::awaitable<expected<detail::operation_result_t<F>, error_info>> {
    co_return co_await conn_->submit(std::move(fn));
  }

  /// Run `fn(resource)` on the worker thread.
  ///
  ///   auto v = co_await c.exec([](kv_store& db) { return db.get("k"); });
  template <typename F>
    requires std::invocable<F&, Resource&>
  auto exec(F fn) -> iocoro::awaitable<expected<exec_result_t<F>, error_info>> {
    co_return co_await conn_->submit(bind_resource(std::move(fn)));
  }

  /// Queue `fn(resource)` without suspending; the handle resolves on `ex`.
  /// The handle may be awaited later (`co_await h->wait()`) or dropped.
  template <typename F>
    requires std::invocable<F&, Resource&>
  auto enqueue(iocoro::any_executor ex, F fn) {
    return conn_->enqueue(std::move(ex), bind_resource(std::move(fn)));
  }

  /// Check if the client is open.
  [[nodiscard]] bool is_connected() const noexcept {
    return conn_->state() == detail::connection_state::OPEN;
  }

  /// Get current connection state (for diagnostics).
  [[nodiscard]] auto state() const noexcept -> detail::connection_state { return conn_->state(); }

  /// Operations queued but not started yet.
  [[nodiscard]] auto pending() const -> std::size_t { return conn_->pending(); }

  /// Get the last bootstrap/teardown error (for diagnostics).
  [[nodiscard]] auto last_error() const -> std::optional<error_info> {
    return conn_->last_error();
  }

 private:
  template <typename F>
  auto bind_resource(F fn) {
    // The connection outlives its worker, so a raw pointer is enough here.
    return [conn = conn_.get(), fn = std::move(fn)]() mutable -> exec_result_t<F> {
      return std::invoke(fn, conn->resource());
    };
  }

  std::unique_ptr<connection_type> conn_;
};

}  // namespace syncoro
