#include "proofarm/worker_pool.hpp"

#include <algorithm>

#include "proofarm/jsonlite.hpp"
#include "proofarm/log.hpp"

namespace proofarm {

WorkerPool::WorkerPool(WorkerPoolOptions options, std::shared_ptr<JobQueue> queue,
                       std::shared_ptr<SandboxExecutor> executor, std::shared_ptr<IArtifactStore> store,
                       std::shared_ptr<ResultChannel> results)
    : options_(std::move(options)),
      queue_(std::move(queue)),
      executor_(std::move(executor)),
      store_(std::move(store)),
      results_(std::move(results)) {}

WorkerPool::~WorkerPool() { stop(); }

SecurityValidationResult WorkerPool::start(const SecurityValidator& validator) {
  std::lock_guard<std::mutex> lk(lifecycle_mu_);
  if (running_.load(std::memory_order_acquire)) {
    SecurityValidationResult already;
    already.ok = true;
    return already;
  }
  SecurityValidationResult v = validator.validate();
  if (!v.ok) {
    log_error("pool", "refusing to start: security validation failed (" + v.check + "): " + v.message);
    return v;
  }
  if (options_.worker_count == 0) {
    v.ok = false;
    v.code = ErrorCode::config_invalid;
    v.check = "pool";
    v.message = "worker_count must be greater than 0";
    log_error("pool", "refusing to start: " + v.message);
    return v;
  }

  stop_ = std::make_unique<StopSource>();
  running_.store(true, std::memory_order_release);
  workers_.reserve(options_.worker_count);
  for (std::uint32_t i = 0; i < options_.worker_count; ++i) {
    live_workers_.fetch_add(1, std::memory_order_acq_rel);
    workers_.emplace_back([this, i, token = stop_->token()] { worker_loop(static_cast<int>(i), token); });
  }
  log_info("pool", "started " + std::to_string(options_.worker_count) + " workers");
  return v;
}

void WorkerPool::stop() {
  std::lock_guard<std::mutex> lk(lifecycle_mu_);
  if (!stop_) return;
  stop_->request_stop();
  for (auto& t : workers_) {
    if (t.joinable()) t.join();
  }
  workers_.clear();
  stop_.reset();
  running_.store(false, std::memory_order_release);
  log_info("pool", "all workers stopped");
}

ErrorCode WorkerPool::submit(Job job) {
  const std::string id = job.id;
  const ErrorCode rc = queue_->enqueue(std::move(job));
  if (rc != ErrorCode::none) {
    log_warn("pool", "rejected job " + id + ": " + to_string(rc));
  }
  return rc;
}

void WorkerPool::worker_loop(int index, StopToken token) {
  log_debug("pool", "worker " + std::to_string(index) + " started");
  while (!token.stop_requested()) {
    auto job = queue_->dequeue();
    if (!job) {
      if (token.wait_for(options_.idle_wait)) break;
      continue;
    }

    busy_workers_.fetch_add(1, std::memory_order_acq_rel);
    jobs_started_.fetch_add(1, std::memory_order_relaxed);
    JobResult result = process_job(*job, index);
    busy_workers_.fetch_sub(1, std::memory_order_acq_rel);

    const std::string job_id = result.job_id;
    if (!results_->push(std::move(result))) {
      log_error("pool", "result channel closed; result for job " + job_id + " not collected");
    }
  }
  live_workers_.fetch_sub(1, std::memory_order_acq_rel);
  log_debug("pool", "worker " + std::to_string(index) + " exiting");
}

JobResult WorkerPool::process_job(const Job& job, int worker_index) {
  const auto started = std::chrono::steady_clock::now();
  JobResult r;
  r.job_id = job.id;
  r.theorem_id = job.theorem.id;
  r.priority = job.priority;
  r.worker_index = worker_index;
  auto finish = [&]() -> JobResult {
    r.duration_ms = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count());
    return r;
  };
  auto fail = [&](ErrorCode code, const std::string& message) -> JobResult {
    r.success = false;
    r.error_code = code;
    r.error_message = message;
    return finish();
  };

  log_info("pool", "worker " + std::to_string(worker_index) + " processing job " + job.id +
                       " (priority=" + to_string(job.priority) + ")");

  if (job.deadline && started > *job.deadline) {
    return fail(ErrorCode::deadline_exceeded, "Job deadline exceeded");
  }

  std::string err;
  const auto bundle = store_->download_code_bundle(bundle_key(options_.key_prefix, job.theorem), &err);
  if (!bundle) {
    return fail(ErrorCode::bundle_download_failed, err);
  }

  auto budget = options_.max_job_duration;
  if (job.options.timeout_seconds > 0) {
    budget = std::min(budget, std::chrono::seconds(job.options.timeout_seconds));
  }
  PipelineOutcome outcome = executor_->run_pipeline(job, *bundle, started + budget);

  r.resource_usage = outcome.usage;
  r.proof_artifact = std::move(outcome.artifact);
  if (!outcome.success) {
    return fail(outcome.error_code, outcome.error_message);
  }

  r.success = true;
  r.error_code = ErrorCode::none;
  if (r.proof_artifact) {
    std::string upload_err;
    const std::string key = artifact_key(options_.key_prefix, *r.proof_artifact);
    if (!store_->upload_artifact(key, proof_artifact_to_json(*r.proof_artifact), &upload_err)) {
      log_warn("pool", "failed to upload artifact " + key + ": " + upload_err);
    }
  }
  return finish();
}

std::string WorkerPool::health_to_json() const {
  jsonlite::Object o;
  o["running"] = is_running();
  o["worker_count"] = static_cast<std::uint64_t>(options_.worker_count);
  o["active_workers"] = static_cast<std::uint64_t>(active_worker_count());
  o["busy_workers"] = static_cast<std::uint64_t>(busy_worker_count());
  o["queue_depth"] = static_cast<std::uint64_t>(current_queue_depth());
  o["queue_capacity"] = static_cast<std::uint64_t>(queue_->max_size());
  o["jobs_started"] = jobs_started();
  return jsonlite::to_json(o);
}

}  // namespace proofarm
