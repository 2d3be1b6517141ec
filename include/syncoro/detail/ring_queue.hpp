#pragma once

#include <syncoro/assert.hpp>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace syncoro::detail {

// FIFO storage backed by a growable ring of optional slots.
//
// - push_back/pop_front/front only; no random access.
// - Not thread-safe; task_queue wraps it with a mutex.
// - Move-only types are supported.
template <typename T>
class ring_queue {
 public:
  using value_type = T;

  ring_queue() = default;
  ring_queue(ring_queue const&) = delete;
  auto operator=(ring_queue const&) -> ring_queue& = delete;

  ring_queue(ring_queue&& other) noexcept
      : slots_(std::move(other.slots_)), head_(other.head_), size_(other.size_) {
    other.slots_.clear();
    other.head_ = 0;
    other.size_ = 0;
  }

  auto operator=(ring_queue&& other) noexcept -> ring_queue& {
    if (this != &other) {
      slots_ = std::move(other.slots_);
      head_ = other.head_;
      size_ = other.size_;
      other.slots_.clear();
      other.head_ = 0;
      other.size_ = 0;
    }
    return *this;
  }

  ~ring_queue() = default;

  [[nodiscard]] bool empty() const noexcept { return size_ == 0; }
  [[nodiscard]] std::size_t size() const noexcept { return size_; }
  [[nodiscard]] std::size_t capacity() const noexcept { return slots_.size(); }

  [[nodiscard]] auto front() -> T& {
    SYNCORO_ASSERT(size_ > 0);
    return *slots_[head_];
  }

  [[nodiscard]] auto front() const -> T const& {
    SYNCORO_ASSERT(size_ > 0);
    return *slots_[head_];
  }

  auto pop_front() -> void {
    SYNCORO_ASSERT(size_ > 0);
    slots_[head_].reset();
    head_ = (head_ + 1) % slots_.size();
    size_ -= 1;
    if (size_ == 0) {
      head_ = 0;
    }
  }

  /// Move the front element out and drop its slot.
  [[nodiscard]] auto take_front() -> T {
    SYNCORO_ASSERT(size_ > 0);
    T out = std::move(*slots_[head_]);
    pop_front();
    return out;
  }

  template <typename... Args>
  auto emplace_back(Args&&... args) -> T& {
    grow_if_full();
    auto& slot = slots_[(head_ + size_) % slots_.size()];
    slot.emplace(std::forward<Args>(args)...);
    size_ += 1;
    return *slot;
  }

  auto push_back(T const& v) -> void { emplace_back(v); }
  auto push_back(T&& v) -> void { emplace_back(std::move(v)); }

  auto clear() noexcept -> void {
    while (size_ > 0) {
      pop_front();
    }
    head_ = 0;
  }

 private:
  auto grow_if_full() -> void {
    if (size_ < slots_.size()) {
      return;
    }

    // Unwrap into a fresh ring so the live range starts at index 0.
    std::vector<std::optional<T>> next(std::max<std::size_t>(8, slots_.size() * 2));
    for (std::size_t i = 0; i < size_; ++i) {
      next[i] = std::move(slots_[(head_ + i) % slots_.size()]);
    }
    slots_ = std::move(next);
    head_ = 0;
  }

  std::vector<std::optional<T>> slots_{};
  std::size_t head_{0};
  std::size_t size_{0};
};

}  // namespace syncoro::detail
