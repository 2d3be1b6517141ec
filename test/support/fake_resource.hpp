#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace syncoro::test_support {

/// Shared observation point for a fake_resource.
///
/// Outlives the resource itself, so tests can inspect what happened after close().
struct probe {
  mutable std::mutex mu;
  std::vector<std::string> trace;

  std::atomic<int> active{0};
  std::atomic<bool> overlapped{false};
  std::atomic<int> opened{0};
  std::atomic<int> released{0};

  std::thread::id opened_on{};
  std::thread::id released_on{};
  std::vector<std::thread::id> used_on;

  auto record(std::string entry) -> void {
    std::lock_guard lock(mu);
    trace.push_back(std::move(entry));
    used_on.push_back(std::this_thread::get_id());
  }

  [[nodiscard]] auto snapshot() const -> std::vector<std::string> {
    std::lock_guard lock(mu);
    return trace;
  }

  [[nodiscard]] auto threads() const -> std::vector<std::thread::id> {
    std::lock_guard lock(mu);
    return used_on;
  }
};

/// A non-thread-safe synchronous "handle".
///
/// Every call marks itself active for its whole duration; two calls running at the same
/// time set `probe::overlapped`.
class fake_resource {
 public:
  explicit fake_resource(std::shared_ptr<probe> p) : probe_(std::move(p)) {
    probe_->opened.fetch_add(1);
    probe_->opened_on = std::this_thread::get_id();
    probe_->record("open");
  }

  fake_resource(fake_resource&&) noexcept = default;
  auto operator=(fake_resource&&) noexcept -> fake_resource& = default;

  fake_resource(fake_resource const&) = delete;
  auto operator=(fake_resource const&) -> fake_resource& = delete;

  ~fake_resource() {
    if (probe_) {
      probe_->released_on = std::this_thread::get_id();
      probe_->released.fetch_add(1);
      probe_->record("release");
    }
  }

  /// Record `label`, holding the resource for `hold`.
  auto apply(std::string label, std::chrono::microseconds hold = {}) -> void {
    enter();
    probe_->record(std::move(label));
    if (hold.count() > 0) {
      std::this_thread::sleep_for(hold);
    }
    leave();
  }

  /// Read-modify-write with a pause in between; loses updates if calls ever overlap.
  auto increment(std::chrono::microseconds hold = std::chrono::microseconds{200}) -> int {
    enter();
    auto v = counter_;
    std::this_thread::sleep_for(hold);
    counter_ = v + 1;
    leave();
    return counter_;
  }

  [[noreturn]] auto fail(std::string const& what) -> void {
    probe_->record("fail");
    throw std::runtime_error(what);
  }

  [[nodiscard]] auto counter() const noexcept -> int { return counter_; }

 private:
  auto enter() -> void {
    if (probe_->active.fetch_add(1) != 0) {
      probe_->overlapped.store(true);
    }
  }

  auto leave() -> void { probe_->active.fetch_sub(1); }

  std::shared_ptr<probe> probe_;
  int counter_{0};
};

}  // namespace syncoro::test_support
