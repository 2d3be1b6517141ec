#pragma once

#include <syncoro/tracing.hpp>

#include <chrono>
#include <string>

namespace syncoro {

/// Connection configuration.
struct config {
  /// Label for this connection in log lines.
  std::string name = "syncoro";

  /// Bounded wait of the worker's dequeue.
  ///
  /// The worker re-checks its running flag at least this often while idle. Shorter
  /// intervals make shutdown of an idle worker faster at the cost of more wakeups.
  std::chrono::milliseconds poll_interval{100};

  // Tracing hooks (operation-level instrumentation).
  operation_trace_hooks trace_hooks{};

  // Whether the bootstrap and teardown operations are traced too. Default off to avoid noise.
  bool trace_lifecycle{false};

  // Connection lifecycle hooks (connected/disconnected/closed instrumentation).
  connection_event_hooks connection_hooks{};
};

}  // namespace syncoro
