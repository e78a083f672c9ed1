#pragma once

// proofarm/worker_pool.hpp — Fixed set of workers draining one shared JobQueue.
//
// WORKER LOOP:
//   until stop is requested:
//     dequeue; if empty, idle-wait on the stop token (wakes at once on stop)
//     deadline already passed   -> deadline_exceeded, no sandbox touched
//     download the code bundle  -> bundle_download_failed on error
//     run the sandbox pipeline under the per-job timeout
//     on success upload the artifact (an upload error is logged only)
//     push the JobResult into the result channel (blocks while full)
//
// STARTUP GATE:
//   start() runs SecurityValidator::validate() itself and refuses to spawn a
//   single worker unless the result is ok. There is no way to start the pool
//   on a result produced elsewhere.
//
// SHUTDOWN:
//   stop() raises the StopSource shared by every worker. Idle workers exit
//   immediately; busy workers finish their current job first. stop() joins
//   all workers before returning.
//
// COUNTERS:
//   active_worker_count()  live worker threads
//   busy_worker_count()    workers currently processing a job

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "proofarm/artifact_store.hpp"
#include "proofarm/cancellation.hpp"
#include "proofarm/executor.hpp"
#include "proofarm/job_queue.hpp"
#include "proofarm/result_collector.hpp"
#include "proofarm/security.hpp"

namespace proofarm {

struct WorkerPoolOptions {
  std::uint32_t worker_count{10};
  std::chrono::seconds max_job_duration{300};
  std::chrono::milliseconds idle_wait{100};
  std::string key_prefix{"proofs"};
};

class WorkerPool {
 public:
  WorkerPool(WorkerPoolOptions options, std::shared_ptr<JobQueue> queue,
             std::shared_ptr<SandboxExecutor> executor, std::shared_ptr<IArtifactStore> store,
             std::shared_ptr<ResultChannel> results);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // Returns the validation result. When validation passed but the pool still
  // cannot start, the result is not ok, with check "pool" and
  // ErrorCode::config_invalid. Calling start() on a running pool is a no-op
  // returning an ok result.
  SecurityValidationResult start(const SecurityValidator& validator);
  void stop();

  ErrorCode submit(Job job);

  // Runs one job to completion on the calling thread.
  JobResult process_job(const Job& job, int worker_index);

  size_t current_queue_depth() const { return queue_->size(); }
  size_t active_worker_count() const { return live_workers_.load(std::memory_order_acquire); }
  size_t busy_worker_count() const { return busy_workers_.load(std::memory_order_acquire); }
  bool is_running() const { return running_.load(std::memory_order_acquire); }
  std::uint64_t jobs_started() const { return jobs_started_.load(std::memory_order_relaxed); }

  const WorkerPoolOptions& options() const { return options_; }
  std::string health_to_json() const;

 private:
  void worker_loop(int index, StopToken token);

  WorkerPoolOptions options_;
  std::shared_ptr<JobQueue> queue_;
  std::shared_ptr<SandboxExecutor> executor_;
  std::shared_ptr<IArtifactStore> store_;
  std::shared_ptr<ResultChannel> results_;

  std::mutex lifecycle_mu_;
  std::unique_ptr<StopSource> stop_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
  std::atomic<size_t> live_workers_{0};
  std::atomic<size_t> busy_workers_{0};
  std::atomic<std::uint64_t> jobs_started_{0};
};

}  // namespace proofarm
