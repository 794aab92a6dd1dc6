#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace settlecore {
namespace common {

// Bounded multi-producer / single-consumer FIFO. Producers block while the
// ring is full, the consumer blocks while it is empty. Closing wakes everyone:
// further pushes fail, pops keep draining until the ring is empty.
template <typename T>
class BoundedChannel {
 public:
  explicit BoundedChannel(std::size_t capacity_power_of_two)
      : buffer_(capacity_power_of_two), mask_(capacity_power_of_two - 1) {
    if (capacity_power_of_two == 0 || (capacity_power_of_two & mask_) != 0) {
      throw std::invalid_argument("BoundedChannel capacity must be power of two");
    }
  }

  BoundedChannel(const BoundedChannel&) = delete;
  BoundedChannel& operator=(const BoundedChannel&) = delete;

  bool push(T value) {
    std::unique_lock lock(mutex_);
    not_full_.wait(lock, [this] { return closed_ || size_ < buffer_.size(); });
    if (closed_) {
      return false;
    }
    buffer_[head_] = std::move(value);
    head_ = (head_ + 1) & mask_;
    ++size_;
    lock.unlock();
    not_empty_.notify_one();
    return true;
  }

  bool try_push(T value) {
    {
      std::scoped_lock lock(mutex_);
      if (closed_ || size_ == buffer_.size()) {
        return false;
      }
      buffer_[head_] = std::move(value);
      head_ = (head_ + 1) & mask_;
      ++size_;
    }
    not_empty_.notify_one();
    return true;
  }

  // Returns false only once the channel is closed and fully drained.
  bool pop(T& out) {
    std::unique_lock lock(mutex_);
    not_empty_.wait(lock, [this] { return closed_ || size_ > 0; });
    if (size_ == 0) {
      return false;
    }
    out = std::move(*buffer_[tail_]);
    buffer_[tail_].reset();
    tail_ = (tail_ + 1) & mask_;
    --size_;
    lock.unlock();
    not_full_.notify_one();
    return true;
  }

  void close() {
    {
      std::scoped_lock lock(mutex_);
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  [[nodiscard]] bool closed() const {
    std::scoped_lock lock(mutex_);
    return closed_;
  }

  [[nodiscard]] std::size_t size() const {
    std::scoped_lock lock(mutex_);
    return size_;
  }

  [[nodiscard]] std::size_t capacity() const noexcept { return buffer_.size(); }

 private:
  std::vector<std::optional<T>> buffer_;
  const std::size_t mask_;
  std::size_t head_{0};
  std::size_t tail_{0};
  std::size_t size_{0};
  bool closed_{false};

  mutable std::mutex mutex_;
  std::condition_variable not_full_;
  std::condition_variable not_empty_;
};

}  // namespace common
}  // namespace settlecore
