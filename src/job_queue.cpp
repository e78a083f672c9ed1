#include "proofarm/job_queue.hpp"

namespace proofarm {

JobQueue::JobQueue(size_t max_size) : max_size_(max_size) {}

ErrorCode JobQueue::enqueue(Job job) {
  std::lock_guard<std::mutex> lock(mu_);
  if (heap_.size() >= max_size_) {
    return ErrorCode::queue_full;
  }
  const JobPriority p = job.priority;
  heap_.push(Entry{p, next_seq_++, std::move(job)});
  return ErrorCode::none;
}

std::optional<Job> JobQueue::dequeue() {
  std::lock_guard<std::mutex> lock(mu_);
  if (heap_.empty()) return std::nullopt;
  // priority_queue::top() is const; the entry is popped immediately after,
  // so moving out of it is safe.
  Job job = std::move(const_cast<Entry&>(heap_.top()).job);
  heap_.pop();
  return job;
}

size_t JobQueue::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return heap_.size();
}

bool JobQueue::empty() const {
  std::lock_guard<std::mutex> lock(mu_);
  return heap_.empty();
}

size_t JobQueue::clear() {
  std::lock_guard<std::mutex> lock(mu_);
  const size_t n = heap_.size();
  heap_ = {};
  return n;
}

}  // namespace proofarm
