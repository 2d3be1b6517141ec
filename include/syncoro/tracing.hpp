#pragma once

#include <syncoro/error_info.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>
#include <system_error>

namespace syncoro {

/// Classify the origin of an operation for tracing.
enum class operation_kind : std::uint8_t {
  user = 0,
  bootstrap = 1,
  teardown = 2,
};

constexpr auto to_string(operation_kind kind) noexcept -> char const* {
  switch (kind) {
    case operation_kind::user:
      return "user";
    case operation_kind::bootstrap:
      return "bootstrap";
    case operation_kind::teardown:
      return "teardown";
  }
  return "unknown";
}

/// Minimal operation metadata for tracing callbacks.
struct operation_trace_info {
  std::uint64_t id{};
  operation_kind kind{operation_kind::user};
};

struct operation_trace_start {
  operation_trace_info info{};

  // Time spent in the task queue before the worker picked the operation up.
  std::chrono::nanoseconds queued{};
};

struct operation_trace_finish {
  operation_trace_info info{};
  std::chrono::nanoseconds queued{};

  // Execution time on the worker thread only.
  std::chrono::nanoseconds duration{};

  bool ok{true};

  /// Default constructed on success.
  std::error_code error{};

  /// Lifetime: valid only during the callback.
  std::string_view error_detail{};
};

/// Lightweight per-operation hooks.
///
/// Threading contract:
/// - Callbacks are invoked on the worker thread, around the operation.
/// - Implementations MUST be non-blocking and MUST NOT throw (exceptions are swallowed).
struct operation_trace_hooks {
  using on_start_fn = void (*)(void*, operation_trace_start const&);
  using on_finish_fn = void (*)(void*, operation_trace_finish const&);

  void* user_data{};
  on_start_fn on_start{};
  on_finish_fn on_finish{};

  [[nodiscard]] constexpr bool enabled() const noexcept {
    return on_start != nullptr || on_finish != nullptr;
  }
};

/// Connection-level lifecycle events.
enum class connection_event_kind : std::uint8_t {
  connected = 1,
  disconnected,
  closed,
};

struct connection_event {
  connection_event_kind kind{connection_event_kind::connected};
  std::chrono::steady_clock::time_point timestamp{};

  // detail::connection_state numeric values.
  std::optional<std::int32_t> from_state{};
  std::optional<std::int32_t> to_state{};

  // Set for disconnected events.
  error_info error{};
};

/// Lightweight connection lifecycle hooks.
///
/// Threading contract:
/// - Invoked on the worker thread when the bootstrap/teardown operation completes the
///   transition, and on the caller's thread for close() before connect().
/// - Implementations MUST be non-blocking and MUST NOT throw (exceptions are logged and
///   dropped).
struct connection_event_hooks {
  using on_event_fn = void (*)(void*, connection_event const&);

  void* user_data{};
  on_event_fn on_event{};

  [[nodiscard]] constexpr bool enabled() const noexcept { return on_event != nullptr; }
};

}  // namespace syncoro
