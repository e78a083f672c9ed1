#include "proofarm/farm.hpp"

#include <filesystem>

#include "proofarm/jsonlite.hpp"
#include "proofarm/log.hpp"

namespace proofarm {

ExecutorOptions executor_options_from_config(const FarmConfig& config) {
  ExecutorOptions o;
  o.image = config.sandbox.image;
  o.code_mount_path = config.sandbox.code_mount_path;
  o.limit_ceiling = clamp_resource_limits(config.resource_limits, config.security.resource_limits);
  o.build_timeout = std::chrono::seconds(config.sandbox.build_timeout_seconds);
  std::error_code ec;
  const auto tmp = std::filesystem::temp_directory_path(ec);
  if (!ec) o.staging_dir = tmp.string();
  return o;
}

NamespaceSandboxOptions sandbox_options_from_config(const FarmConfig& config) {
  NamespaceSandboxOptions o;
  o.work_root = config.sandbox.work_root;
  o.run_as_user = config.security.run_as_user;
  o.run_as_group = config.security.run_as_group;
  o.network_isolation = config.security.network_isolation;
  o.read_only_root = config.security.read_only_root_filesystem;
  o.tmp_size_bytes = config.sandbox.tmp_size_bytes;
  o.scratch_size_bytes = config.sandbox.scratch_size_bytes;
  o.workdir = config.sandbox.code_mount_path;
  return o;
}

Farm::Farm(FarmConfig config, FarmDependencies deps)
    : config_(std::move(config)), deps_(std::move(deps)), stats_(std::make_shared<FarmStats>()) {
  if (!deps_.runtime) deps_.runtime = std::make_shared<NamespaceSandboxRuntime>(sandbox_options_from_config(config_));
  if (!deps_.compiler) deps_.compiler = std::make_shared<PassthroughTheoremCompiler>();
  if (!deps_.store) deps_.store = std::make_shared<LocalArtifactStore>(config_.storage);
  if (!deps_.scanner && !config_.security.scanning.command.empty()) {
    deps_.scanner = std::make_shared<CommandVulnerabilityScanner>(config_.security.scanning.command);
  }

  queue_ = std::make_shared<JobQueue>(config_.max_queue_size);
  results_ = std::make_shared<ResultChannel>(config_.result_channel_capacity);
  executor_ = std::make_shared<SandboxExecutor>(deps_.runtime, deps_.compiler, executor_options_from_config(config_));
  collector_ = std::make_unique<ResultCollector>(results_, deps_.store, stats_);

  WorkerPoolOptions po;
  po.worker_count = config_.worker_count;
  po.max_job_duration = std::chrono::seconds(config_.max_job_duration_seconds);
  po.idle_wait = std::chrono::milliseconds(config_.idle_wait_ms);
  po.key_prefix = config_.storage.key_prefix;
  pool_ = std::make_unique<WorkerPool>(po, queue_, executor_, deps_.store, results_);
}

Farm::~Farm() { stop(); }

SecurityValidationResult Farm::start() {
  if (started_) {
    SecurityValidationResult ok;
    ok.ok = true;
    return ok;
  }

  const ConfigValidationResult cv = validate_farm_config(config_);
  for (const auto& w : cv.warnings) log_warn("farm", "config: " + w);
  if (!cv.ok) {
    SecurityValidationResult r;
    r.code = ErrorCode::config_invalid;
    r.check = "config";
    r.message = cv.errors.empty() ? "invalid configuration" : cv.errors.front();
    log_error("farm", "configuration rejected: " + r.message);
    return r;
  }

  if (!deps_.runtime_info && !config_.security.allow_privilege_escalation) {
    std::string nnp_err;
    if (!set_no_new_privs(&nnp_err)) log_warn("farm", nnp_err);
  }
  const RuntimeInfo info = deps_.runtime_info ? *deps_.runtime_info : detect_runtime_info();
  const SecurityValidator validator(config_.security, info, deps_.scanner);

  collector_->start();
  SecurityValidationResult v = pool_->start(validator);
  if (!v.ok) {
    collector_->stop();
    return v;
  }
  started_ = true;
  log_info("farm", "farm started with " + std::to_string(config_.worker_count) + " workers");
  return v;
}

void Farm::stop() {
  if (!started_) return;
  pool_->stop();
  collector_->stop();
  const size_t dropped = queue_->clear();
  if (dropped > 0) log_warn("farm", std::to_string(dropped) + " queued jobs discarded at shutdown");
  started_ = false;
  log_info("farm", "farm stopped");
}

ErrorCode Farm::submit(Job job) { return pool_->submit(std::move(job)); }

bool Farm::wait_for_results(std::uint64_t n, std::chrono::milliseconds timeout) const {
  return collector_->wait_for_processed(n, timeout);
}

std::string Farm::health_to_json() const {
  jsonlite::Object o;
  o["live_sandboxes"] = static_cast<std::uint64_t>(executor_->live_sandboxes());
  o["results_buffered"] = static_cast<std::uint64_t>(results_->size());
  o["results_collected"] = collector_->processed();
  return "{\"farm\":" + jsonlite::to_json(o) + ",\"pool\":" + pool_->health_to_json() +
         ",\"stats\":" + stats_->to_json() + "}";
}

}  // namespace proofarm
