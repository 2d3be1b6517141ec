#pragma once

#include <system_error>
#include <type_traits>

namespace syncoro {

enum class error {
  /// The connection is not open yet (UNCONNECTED or CONNECTING), or an operation asked for
  /// the resource while none exists.
  not_connected = 1,

  /// The connection is closing or closed.
  /// Either close() was called, or the initial connect() failed.
  connection_closed,

  /// The connector threw while constructing the underlying resource.
  /// Reported to every connect() awaiter; the connection ends up CLOSED.
  bootstrap_failed,

  /// A submitted operation threw.
  /// The original exception travels with the error_info.
  operation_failed,

  /// Releasing the underlying resource threw during close().
  /// The connection still ends up CLOSED.
  teardown_failed,

  /// A bridge invariant failed (for example the worker thread could not be started).
  internal_error,
};

auto make_error_code(error e) -> std::error_code;

auto error_category() noexcept -> std::error_category const&;

}  // namespace syncoro

namespace std {

template <>
struct is_error_code_enum<syncoro::error> : std::true_type {};

}  // namespace std
