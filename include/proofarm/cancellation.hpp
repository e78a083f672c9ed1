#pragma once

// proofarm/cancellation.hpp — Explicit stop signal shared by the pool and
// its workers.
//
// A StopSource owns the flag; StopTokens are cheap copies that observe it.
// Workers call wait_for() instead of sleeping, so request_stop() ends every
// idle wait immediately instead of after the full interval.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace proofarm {

namespace detail {

struct StopState {
  std::atomic<bool> stopped{false};
  std::mutex mu;
  std::condition_variable cv;
};

}  // namespace detail

class StopToken {
 public:
  StopToken() = default;

  bool stop_requested() const {
    return state_ && state_->stopped.load(std::memory_order_acquire);
  }

  // Sleeps up to d. Returns true if stop was requested (before or during).
  template <typename Rep, typename Period>
  bool wait_for(std::chrono::duration<Rep, Period> d) const {
    if (!state_) return false;
    std::unique_lock<std::mutex> lock(state_->mu);
    return state_->cv.wait_for(lock, d, [&] { return state_->stopped.load(std::memory_order_acquire); });
  }

 private:
  friend class StopSource;
  explicit StopToken(std::shared_ptr<detail::StopState> s) : state_(std::move(s)) {}
  std::shared_ptr<detail::StopState> state_;
};

class StopSource {
 public:
  StopSource() : state_(std::make_shared<detail::StopState>()) {}

  StopToken token() const { return StopToken(state_); }

  void request_stop() {
    {
      std::lock_guard<std::mutex> lock(state_->mu);
      state_->stopped.store(true, std::memory_order_release);
    }
    state_->cv.notify_all();
  }

  bool stop_requested() const { return state_->stopped.load(std::memory_order_acquire); }

 private:
  std::shared_ptr<detail::StopState> state_;
};

}  // namespace proofarm
