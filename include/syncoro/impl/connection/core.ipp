#pragma once

#include <syncoro/assert.hpp>
#include <syncoro/detail/connection.hpp>

#include <exception>
#include <system_error>

namespace syncoro::detail {

template <typename Resource>
connection<Resource>::connection(config cfg, connector_type connector, closer_type closer)
    : cfg_(std::move(cfg)),
      connector_(std::move(connector)),
      closer_(std::move(closer)),
      worker_(cfg_) {
  SYNCORO_ENSURE(static_cast<bool>(connector_), "connection requires a connector");
}

template <typename Resource>
connection<Resource>::~connection() noexcept {
  {
    std::lock_guard lk{mutex_};
    if (state_ == connection_state::OPEN || state_ == connection_state::CONNECTING) {
      (void)set_state_locked(connection_state::CLOSING);
      // Nobody can observe the outcome any more: release the resource with an item nobody
      // waits for, so it still happens on the worker thread, behind everything queued.
      try {
        auto queued = post_lifecycle_locked(
          operation_kind::teardown, [this] { teardown(); },
          [this](expected<void, error_info> r) {
            if (!r) {
              SYNCORO_LOG_WARNING_FOR(cfg_.name, "teardown on destruction failed: {}",
                                      r.error().to_string());
            }
          });
        if (!queued) {
          SYNCORO_LOG_WARNING_FOR(cfg_.name, "worker already stopped; resource not released");
        }
      } catch (std::exception const& e) {
        SYNCORO_LOG_ERROR_FOR(cfg_.name, "failed to queue teardown on destruction: {}",
                              e.what());
      }
    }
  }

  worker_.stop();
  worker_.join();
}

template <typename Resource>
auto connection<Resource>::resource() -> Resource& {
  SYNCORO_ASSERT(worker_.on_worker_thread() && "resource() outside the worker thread");
  if (!resource_.has_value()) {
    throw std::system_error(make_error_code(error::not_connected), "no live resource");
  }
  return *resource_;
}

template <typename Resource>
auto connection<Resource>::last_error() const -> std::optional<error_info> {
  std::lock_guard lk{mutex_};
  return last_error_;
}

template <typename Resource>
auto connection<Resource>::check_submit_locked() const -> std::optional<error_info> {
  switch (state_) {
    case connection_state::OPEN:
      return std::nullopt;
    case connection_state::UNCONNECTED:
    case connection_state::CONNECTING:
      return error_info{error::not_connected};
    case connection_state::CLOSING:
    case connection_state::CLOSED:
      return error_info{error::connection_closed};
  }
  SYNCORO_UNREACHABLE();
}

template <typename Resource>
auto connection<Resource>::next_trace_info_locked(operation_kind kind) -> operation_trace_info {
  return operation_trace_info{.id = next_operation_id_++, .kind = kind};
}

template <typename Resource>
auto connection<Resource>::traced(operation_kind kind) const noexcept -> bool {
  if (!cfg_.trace_hooks.enabled()) {
    return false;
  }
  return kind == operation_kind::user || cfg_.trace_lifecycle;
}

template <typename Resource>
auto connection<Resource>::start_locked() -> std::optional<error_info> {
  try {
    worker_.start();
  } catch (std::system_error const& e) {
    error_info err{error::internal_error, "failed to start worker:"};
    err.append_detail(e.what()).set_cause(e.code());
    return err;
  }

  auto queued = post_lifecycle_locked(
    operation_kind::bootstrap, [this] { bootstrap(); },
    [this](expected<void, error_info> r) { on_bootstrap_done(std::move(r)); });
  if (!queued) {
    return error_info{error::internal_error, "worker refused the bootstrap"};
  }
  return std::nullopt;
}

template <typename Resource>
auto connection<Resource>::bootstrap() -> void {
  SYNCORO_ASSERT(!resource_.has_value());
  resource_.emplace(connector_());
}

template <typename Resource>
auto connection<Resource>::teardown() -> void {
  if (!resource_.has_value()) {
    return;
  }

  // Take the resource out first: it is gone afterwards even if the closer throws.
  std::optional<Resource> res{std::move(resource_)};
  resource_.reset();
  if (closer_) {
    closer_(*res);
  }
}

template <typename Resource>
auto connection<Resource>::on_bootstrap_done(expected<void, error_info> r) -> void {
  if (!r) {
    // Keep the connector's exception, but report it as a bootstrap failure.
    auto err = std::move(r.error());
    err.code = make_error_code(error::bootstrap_failed);
    SYNCORO_LOG_WARNING_FOR(cfg_.name, "bootstrap failed: {}", err.to_string());
    finish_closed(std::move(err));
    return;
  }

  std::vector<std::shared_ptr<void_result>> waiters{};
  bool opened = false;
  {
    std::lock_guard lk{mutex_};
    // Anything but CONNECTING means the connection is being destroyed; the teardown queued
    // by the destructor releases what was just built.
    if (state_ == connection_state::CONNECTING) {
      (void)set_state_locked(connection_state::OPEN);
      opened = true;
    }
    waiters.swap(connect_waiters_);
  }

  if (!opened) {
    resolve_all(waiters, unexpected(error_info{error::connection_closed}));
    return;
  }

  emit_connection_event(connection_event{
    .kind = connection_event_kind::connected,
    .from_state = static_cast<std::int32_t>(connection_state::CONNECTING),
    .to_state = static_cast<std::int32_t>(connection_state::OPEN),
  });
  resolve_all(waiters, expected<void, error_info>{});
}

template <typename Resource>
auto connection<Resource>::on_teardown_done(expected<void, error_info> r) -> void {
  std::optional<error_info> err{};
  if (!r) {
    err = std::move(r.error());
    err->code = make_error_code(error::teardown_failed);
    SYNCORO_LOG_INFO_FOR(cfg_.name, "teardown failed: {}", err->to_string());
  }
  finish_closed(std::move(err));
}

template <typename Resource>
auto connection<Resource>::finish_closed(std::optional<error_info> err) -> void {
  std::vector<std::shared_ptr<void_result>> connect_waiters{};
  std::vector<std::shared_ptr<void_result>> close_waiters{};
  connection_state prev{};
  {
    std::lock_guard lk{mutex_};
    // Under the same lock as every push, so nothing can land behind the last item.
    worker_.stop();
    prev = set_state_locked(connection_state::CLOSED);
    connect_waiters.swap(connect_waiters_);
    close_waiters.swap(close_waiters_);
    if (err) {
      last_error_ = *err;
    }
  }

  if (err) {
    emit_connection_event(connection_event{
      .kind = connection_event_kind::disconnected,
      .from_state = static_cast<std::int32_t>(prev),
      .to_state = static_cast<std::int32_t>(connection_state::CLOSED),
      .error = *err,
    });
  }
  emit_connection_event(connection_event{
    .kind = connection_event_kind::closed,
    .from_state = static_cast<std::int32_t>(prev),
    .to_state = static_cast<std::int32_t>(connection_state::CLOSED),
  });

  auto const r = err ? expected<void, error_info>{unexpected(*err)} : expected<void, error_info>{};
  resolve_all(connect_waiters, r);
  resolve_all(close_waiters, r);
}

template <typename Resource>
auto connection<Resource>::set_state_locked(connection_state next) -> connection_state {
  auto const prev = state_;
  if (prev == next) {
    return prev;
  }
  SYNCORO_ASSERT(prev != connection_state::CLOSED && "CLOSED is terminal");
  state_ = next;
  state_snapshot_.store(next, std::memory_order_release);
  SYNCORO_LOG_INFO_FOR(cfg_.name, "state {} -> {}", to_string(prev), to_string(next));
  return prev;
}

template <typename Resource>
auto connection<Resource>::emit_connection_event(connection_event evt) noexcept -> void {
  auto const& hooks = cfg_.connection_hooks;
  if (!hooks.enabled()) {
    return;
  }
  evt.timestamp = std::chrono::steady_clock::now();
  try {
    hooks.on_event(hooks.user_data, evt);
  } catch (...) {
    SYNCORO_LOG_WARNING_FOR(cfg_.name, "connection event hook threw; ignored");
  }
}

template <typename Resource>
auto connection<Resource>::add_waiter(std::vector<std::shared_ptr<void_result>>& waiters,
                                      iocoro::any_executor ex) -> std::shared_ptr<void_result> {
  auto w = std::make_shared<void_result>(std::move(ex));
  waiters.push_back(w);
  return w;
}

template <typename Resource>
auto connection<Resource>::resolve_all(std::vector<std::shared_ptr<void_result>>& waiters,
                                       expected<void, error_info> const& r) -> void {
  for (auto& w : waiters) {
    w->complete(r);
  }
  waiters.clear();
}

}  // namespace syncoro::detail
