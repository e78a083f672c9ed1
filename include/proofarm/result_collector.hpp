#pragma once

// proofarm/result_collector.hpp — Single consumer of the worker result channel.
//
// For every JobResult, in channel order:
//   1. log the outcome,
//   2. update FarmStats,
//   3. emit one JobEvent,
//   4. persist through IArtifactStore::store_job_result().
// A failed persist is logged and counted in FarmStats::persist_failures; the
// result is never dropped without a trace.
//
// stop() closes the channel and drains whatever is still buffered before
// joining, so every result pushed before stop() is collected.

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "proofarm/artifact_store.hpp"
#include "proofarm/channel.hpp"
#include "proofarm/observability.hpp"
#include "proofarm/types.hpp"

namespace proofarm {

using ResultChannel = BoundedChannel<JobResult>;

class ResultCollector {
 public:
  ResultCollector(std::shared_ptr<ResultChannel> channel, std::shared_ptr<IArtifactStore> store,
                  std::shared_ptr<FarmStats> stats);
  ~ResultCollector();

  ResultCollector(const ResultCollector&) = delete;
  ResultCollector& operator=(const ResultCollector&) = delete;

  void start();
  void stop();

  // Processes one result synchronously on the calling thread.
  void collect(const JobResult& result);

  std::uint64_t processed() const;
  bool wait_for_processed(std::uint64_t n, std::chrono::milliseconds timeout) const;

 private:
  void run();

  std::shared_ptr<ResultChannel> channel_;
  std::shared_ptr<IArtifactStore> store_;
  std::shared_ptr<FarmStats> stats_;
  std::thread thread_;
  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  std::uint64_t processed_{0};
};

}  // namespace proofarm
