#pragma once

// proofarm/farm.hpp — Wires queue, pool, executor, collector and store.
//
// LIFECYCLE:
//   Farm farm(config, deps);
//   auto v = farm.start();        // config check, security gate, collector, pool
//   if (!v.ok) -> nothing was started
//   farm.submit(job) ...
//   farm.stop();                  // pool first, then collector drains
//
// Dependencies left null in FarmDependencies are built from the config:
//   runtime   NamespaceSandboxRuntime over sandbox.work_root
//   compiler  PassthroughTheoremCompiler
//   store     LocalArtifactStore over storage.root
//   scanner   CommandVulnerabilityScanner when security.scanning.command is set
//   runtime_info  detect_runtime_info(), after setting NoNewPrivs on this
//                 process unless security.allow_privilege_escalation is set

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "proofarm/artifact_store.hpp"
#include "proofarm/config.hpp"
#include "proofarm/executor.hpp"
#include "proofarm/job_queue.hpp"
#include "proofarm/observability.hpp"
#include "proofarm/result_collector.hpp"
#include "proofarm/sandbox.hpp"
#include "proofarm/security.hpp"
#include "proofarm/worker_pool.hpp"

namespace proofarm {

struct FarmDependencies {
  std::shared_ptr<SandboxRuntime> runtime;
  std::shared_ptr<TheoremCompiler> compiler;
  std::shared_ptr<IArtifactStore> store;
  std::shared_ptr<IVulnerabilityScanner> scanner;
  std::optional<RuntimeInfo> runtime_info;
};

class Farm {
 public:
  Farm(FarmConfig config, FarmDependencies deps);
  ~Farm();

  Farm(const Farm&) = delete;
  Farm& operator=(const Farm&) = delete;

  // Runs every startup check. On failure nothing is started and the result
  // names the failing check.
  SecurityValidationResult start();
  void stop();

  // Per-job limits are clamped to the farm limits when the job runs.
  ErrorCode submit(Job job);

  // Blocks until n results have been collected or timeout elapses.
  bool wait_for_results(std::uint64_t n, std::chrono::milliseconds timeout) const;

  std::string health_to_json() const;

  const FarmConfig& config() const { return config_; }
  const FarmStats& stats() const { return *stats_; }
  WorkerPool& pool() { return *pool_; }
  const WorkerPool& pool() const { return *pool_; }
  SandboxExecutor& executor() { return *executor_; }
  ResultCollector& collector() { return *collector_; }

 private:
  FarmConfig config_;
  FarmDependencies deps_;
  std::shared_ptr<FarmStats> stats_;
  std::shared_ptr<JobQueue> queue_;
  std::shared_ptr<ResultChannel> results_;
  std::shared_ptr<SandboxExecutor> executor_;
  std::unique_ptr<ResultCollector> collector_;
  std::unique_ptr<WorkerPool> pool_;
  bool started_{false};
};

ExecutorOptions executor_options_from_config(const FarmConfig& config);
NamespaceSandboxOptions sandbox_options_from_config(const FarmConfig& config);

}  // namespace proofarm
