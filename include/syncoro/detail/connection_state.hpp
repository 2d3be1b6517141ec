#pragma once

#include <cstdint>

namespace syncoro::detail {

/// Connection lifecycle state machine.
///
/// State diagram:
///
///   UNCONNECTED --------------------+
///    |                              |
///    | connect()                    | close()
///    v                              |
///   CONNECTING ---(bootstrap fails)-+
///    |                              |
///    | (bootstrap ok)               |
///    v                              |
///   OPEN                            |
///    |                              |
///    | close()                      |
///    v                              v
///   CLOSING --(teardown done)---> CLOSED
///
/// State transitions:
/// - UNCONNECTED -> CONNECTING: first connect(); starts the worker and queues the bootstrap
///   operation. Happens at most once per connection.
/// - CONNECTING -> OPEN: the bootstrap operation constructed the resource. Written by the
///   bootstrap item on the worker thread, not by a connect() caller.
/// - CONNECTING -> CLOSED: the bootstrap operation threw. The worker is stopped; connect()
///   callers join it before returning. There is no FAILED state and no retry.
/// - UNCONNECTED -> CLOSED: close() before connect(); no worker was ever started.
/// - OPEN -> CLOSING: close() queues the teardown operation behind every accepted item.
/// - CLOSING -> CLOSED: the teardown item finished (success OR failure) and wrote CLOSED on
///   the worker thread; close() callers join the worker before returning. No caller has to
///   stay around for this, so CLOSING is never a dead end.
///
/// Submission policy (IMPORTANT):
/// - Only OPEN accepts user operations.
/// - UNCONNECTED/CONNECTING reject with not_connected.
/// - CLOSING/CLOSED reject with connection_closed.
/// - Rejections happen before any work item exists; nothing reaches the queue.
/// - The bootstrap operation is the single exception (queued while CONNECTING); the teardown
///   operation is queued by close() itself while switching to CLOSING.
///
/// State write authority:
/// - All transitions happen under the connection's lifecycle mutex, together with the
///   state check and push of every enqueue(). Therefore no user item can be queued behind
///   the teardown operation.
///
/// Resource invariant:
/// - The resource exists only between a successful bootstrap and the teardown, and it is
///   only ever touched on the worker thread.
///
/// CLOSED is terminal.
enum class connection_state : std::int32_t {
  UNCONNECTED = 1,
  CONNECTING,
  OPEN,
  CLOSING,
  CLOSED,
};

constexpr auto to_string(connection_state s) noexcept -> char const* {
  switch (s) {
    case connection_state::UNCONNECTED:
      return "UNCONNECTED";
    case connection_state::CONNECTING:
      return "CONNECTING";
    case connection_state::OPEN:
      return "OPEN";
    case connection_state::CLOSING:
      return "CLOSING";
    case connection_state::CLOSED:
      return "CLOSED";
  }
  return "UNKNOWN";
}

}  // namespace syncoro::detail
