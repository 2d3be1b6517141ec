#pragma once

#include <syncoro/detail/task_queue.hpp>

#include <utility>

namespace syncoro::detail {

template <typename T>
auto task_queue<T>::push(T&& item) -> bool {
  {
    std::lock_guard lk{mutex_};
    if (closed_) {
      return false;
    }
    items_.push_back(std::move(item));
  }
  cv_.notify_one();
  return true;
}

template <typename T>
auto task_queue<T>::pop_for(std::chrono::milliseconds timeout) -> std::optional<T> {
  std::unique_lock lk{mutex_};
  if (!cv_.wait_for(lk, timeout, [this] { return !items_.empty() || closed_; })) {
    return std::nullopt;
  }
  if (items_.empty()) {
    // Closed and drained.
    return std::nullopt;
  }
  return items_.take_front();
}

template <typename T>
auto task_queue<T>::close() -> void {
  {
    std::lock_guard lk{mutex_};
    closed_ = true;
  }
  cv_.notify_all();
}

template <typename T>
auto task_queue<T>::closed() const -> bool {
  std::lock_guard lk{mutex_};
  return closed_;
}

template <typename T>
auto task_queue<T>::size() const -> std::size_t {
  std::lock_guard lk{mutex_};
  return items_.size();
}

template <typename T>
auto task_queue<T>::empty() const -> bool {
  std::lock_guard lk{mutex_};
  return items_.empty();
}

}  // namespace syncoro::detail
