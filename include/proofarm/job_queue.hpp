#pragma once

// proofarm/job_queue.hpp — Priority-ordered, capacity-bounded job queue.
//
// ORDERING CONTRACT:
//   dequeue() returns the highest-priority pending job. Among equal
//   priorities the earliest enqueued job wins. Ties are broken by a
//   monotonically increasing insertion sequence, never by job id or time.
//
// CAPACITY:
//   enqueue() refuses with ErrorCode::queue_full when size() >= max_size.
//   A refused enqueue leaves the queue untouched.
//
// THREAD SAFETY:
//   All operations take one mutex. The pool and every producer share a single
//   instance through std::shared_ptr; the queue is never copied.

#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

#include "proofarm/types.hpp"

namespace proofarm {

class JobQueue {
 public:
  explicit JobQueue(size_t max_size);

  JobQueue(const JobQueue&) = delete;
  JobQueue& operator=(const JobQueue&) = delete;

  // ErrorCode::none on success, ErrorCode::queue_full otherwise.
  ErrorCode enqueue(Job job);

  std::optional<Job> dequeue();

  size_t size() const;
  bool empty() const;
  size_t max_size() const { return max_size_; }

  // Removes every pending job and returns how many were dropped.
  size_t clear();

 private:
  struct Entry {
    JobPriority priority;
    std::uint64_t seq;
    Job job;
  };
  struct EntryOrder {
    // std::priority_queue pops the "largest" element: higher priority first,
    // then lower sequence number.
    bool operator()(const Entry& a, const Entry& b) const {
      if (a.priority != b.priority) return a.priority < b.priority;
      return a.seq > b.seq;
    }
  };

  const size_t max_size_;
  mutable std::mutex mu_;
  std::priority_queue<Entry, std::vector<Entry>, EntryOrder> heap_;
  std::uint64_t next_seq_{0};
};

}  // namespace proofarm
