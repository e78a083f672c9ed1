#pragma once

// proofarm/channel.hpp — Bounded multi-producer / single-consumer channel.
//
// Carries JobResults from workers to the ResultCollector.
//
// SEMANTICS:
//   - push() blocks while the channel holds capacity() items. Nothing is
//     ever dropped: backpressure is the only overflow policy.
//   - push() after close() returns false and discards the item; the caller
//     still owns the decision of what to log.
//   - pop() blocks until an item is available or the channel is closed and
//     drained, in which case it returns nullopt.
//   - close() wakes every blocked producer and consumer.

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace proofarm {

template <typename T>
class BoundedChannel {
 public:
  explicit BoundedChannel(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

  BoundedChannel(const BoundedChannel&) = delete;
  BoundedChannel& operator=(const BoundedChannel&) = delete;

  bool push(T item) {
    std::unique_lock<std::mutex> lock(mu_);
    cv_capacity_.wait(lock, [&] { return closed_ || items_.size() < capacity_; });
    if (closed_) return false;
    items_.push_back(std::move(item));
    lock.unlock();
    cv_.notify_one();
    return true;
  }

  std::optional<T> pop() {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [&] { return closed_ || !items_.empty(); });
    if (items_.empty()) return std::nullopt;
    T item = std::move(items_.front());
    items_.pop_front();
    lock.unlock();
    cv_capacity_.notify_one();
    return item;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      closed_ = true;
    }
    cv_.notify_all();
    cv_capacity_.notify_all();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return items_.size();
  }

  size_t capacity() const { return capacity_; }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return closed_;
  }

 private:
  const size_t capacity_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable cv_capacity_;
  std::deque<T> items_;
  bool closed_{false};
};

}  // namespace proofarm
