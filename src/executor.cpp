#include "proofarm/executor.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <thread>

#include "proofarm/hash.hpp"
#include "proofarm/jsonlite.hpp"
#include "proofarm/log.hpp"

namespace fs = std::filesystem;

namespace proofarm {

namespace {

// Fires a callback once at the deadline unless disarmed first. The
// destructor disarms and joins, so the callback never outlives its scope.
class DeadlineWatchdog {
 public:
  DeadlineWatchdog(std::chrono::steady_clock::time_point deadline, std::function<void()> on_fire)
      : on_fire_(std::move(on_fire)) {
    thread_ = std::thread([this, deadline] {
      std::unique_lock<std::mutex> lk(mu_);
      if (cv_.wait_until(lk, deadline, [this] { return disarmed_; })) return;
      fired_.store(true, std::memory_order_release);
      lk.unlock();
      on_fire_();
    });
  }

  ~DeadlineWatchdog() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      disarmed_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
  }

  DeadlineWatchdog(const DeadlineWatchdog&) = delete;
  DeadlineWatchdog& operator=(const DeadlineWatchdog&) = delete;

  bool fired() const { return fired_.load(std::memory_order_acquire); }

 private:
  std::function<void()> on_fire_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool disarmed_{false};
  std::atomic<bool> fired_{false};
  std::thread thread_;
};

std::chrono::milliseconds remaining(std::chrono::steady_clock::time_point deadline) {
  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
  return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

std::string join(const std::vector<std::string>& items) {
  std::string out;
  for (const auto& s : items) {
    if (!out.empty()) out += ",";
    out += s;
  }
  return out;
}

std::string first_line(const std::string& text) {
  const auto nl = text.find('\n');
  return nl == std::string::npos ? text : text.substr(0, nl);
}

void stop_and_remove(SandboxRuntime& runtime, const std::string& id) {
  std::string err;
  if (!runtime.stop(id, &err)) {
    log_warn("executor", "stop " + id + " failed: " + err);
  }
  err.clear();
  if (!runtime.remove(id, &err)) {
    log_warn("executor", "remove " + id + " failed: " + err);
  }
}

struct CopyOutcome {
  bool ok{false};
  std::string error;
};

}  // namespace

std::string to_string(SandboxState state) {
  switch (state) {
    case SandboxState::created: return "created";
    case SandboxState::code_mounted: return "code_mounted";
    case SandboxState::built: return "built";
    case SandboxState::executed: return "executed";
    case SandboxState::failed: return "failed";
    case SandboxState::cleaned_up: return "cleaned_up";
  }
  return "failed";
}

std::optional<GeneratedProof> PassthroughTheoremCompiler::generate_proof(const Theorem& theorem,
                                                                         const ProofOptions& options,
                                                                         const StopToken& stop, std::string* error) {
  (void)options;
  (void)stop;
  if (theorem.lean_code.empty()) {
    if (error) *error = "theorem " + theorem.id + " has no Lean code";
    return std::nullopt;
  }
  GeneratedProof proof;
  proof.code = theorem.lean_code;
  return proof;
}

SandboxExecutor::SandboxExecutor(std::shared_ptr<SandboxRuntime> runtime,
                                 std::shared_ptr<TheoremCompiler> compiler,
                                 ExecutorOptions options)
    : runtime_(std::move(runtime)), compiler_(std::move(compiler)), options_(std::move(options)) {}

SandboxExecutor::~SandboxExecutor() {
  const size_t pending = pending_helpers();
  if (pending > 0) log_info("executor", "waiting for " + std::to_string(pending) + " late helper(s)");
  reap_helpers(true);
}

bool SandboxExecutor::run_before(Deadline deadline, std::function<void()> work, std::function<void()> on_late) {
  reap_helpers(false);
  if (deadline == Deadline::max()) {
    work();
    return true;
  }
  if (std::chrono::steady_clock::now() >= deadline) return false;

  struct Call {
    std::mutex mu;
    std::condition_variable cv;
    bool done{false};
    bool abandoned{false};
  };
  auto call = std::make_shared<Call>();
  auto finished = std::make_shared<std::atomic<bool>>(false);
  std::thread helper([call, finished, work = std::move(work), on_late = std::move(on_late)] {
    work();
    bool late = false;
    {
      std::lock_guard<std::mutex> lk(call->mu);
      call->done = true;
      late = call->abandoned;
    }
    call->cv.notify_all();
    if (late && on_late) on_late();
    finished->store(true, std::memory_order_release);
  });

  bool in_time = false;
  {
    std::unique_lock<std::mutex> lk(call->mu);
    in_time = call->cv.wait_until(lk, deadline, [&] { return call->done; });
    if (!in_time) call->abandoned = true;
  }
  if (in_time) {
    helper.join();
    return true;
  }
  std::lock_guard<std::mutex> lk(helpers_mu_);
  helpers_.push_back(Helper{std::move(helper), std::move(finished)});
  return false;
}

void SandboxExecutor::reap_helpers(bool wait_all) {
  std::vector<Helper> joinable;
  {
    std::lock_guard<std::mutex> lk(helpers_mu_);
    for (auto it = helpers_.begin(); it != helpers_.end();) {
      if (wait_all || it->finished->load(std::memory_order_acquire)) {
        joinable.push_back(std::move(*it));
        it = helpers_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& h : joinable) {
    if (h.thread.joinable()) h.thread.join();
  }
}

size_t SandboxExecutor::pending_helpers() const {
  std::lock_guard<std::mutex> lk(helpers_mu_);
  return static_cast<size_t>(std::count_if(helpers_.begin(), helpers_.end(), [](const Helper& h) {
    return !h.finished->load(std::memory_order_acquire);
  }));
}

void SandboxExecutor::set_state(const std::string& id, SandboxState s) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = states_.find(id);
  if (it != states_.end()) it->second = s;
}

std::optional<SandboxState> SandboxExecutor::state(const std::string& id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = states_.find(id);
  if (it == states_.end()) return std::nullopt;
  return it->second;
}

size_t SandboxExecutor::live_sandboxes() const {
  std::lock_guard<std::mutex> lk(mu_);
  return states_.size();
}

std::string SandboxExecutor::create(const ResourceLimits& limits, std::string* error, Deadline deadline) {
  struct Created {
    std::string id;
    std::string error;
  };
  auto created = std::make_shared<Created>();
  auto runtime = runtime_;
  const std::string image = options_.image;
  const bool in_time = run_before(
      deadline,
      [created, runtime, image, limits] { created->id = runtime->create(image, limits, {}, &created->error); },
      [created, runtime] {
        if (created->id.empty()) return;
        log_warn("executor", "sandbox " + created->id + " appeared after its job deadline, removing it");
        stop_and_remove(*runtime, created->id);
      });
  if (!in_time) {
    if (error) *error = "Failed to create sandbox: job deadline reached";
    return {};
  }
  if (created->id.empty()) {
    if (error) *error = "Failed to create sandbox: " + created->error;
    return {};
  }
  {
    std::lock_guard<std::mutex> lk(mu_);
    states_[created->id] = SandboxState::created;
  }
  log_info("executor", "created sandbox " + created->id + " (" + options_.image + ")");
  return created->id;
}

bool SandboxExecutor::mount_code(const std::string& id, const std::string& bundle_path, std::string* error,
                                 Deadline deadline) {
  std::error_code ec;
  std::string dest = options_.code_mount_path;
  if (!fs::is_directory(bundle_path, ec)) {
    dest += "/" + fs::path(bundle_path).filename().string();
  }
  auto copied = std::make_shared<CopyOutcome>();
  auto runtime = runtime_;
  const bool in_time = run_before(
      deadline,
      [copied, runtime, id, bundle_path, dest] { copied->ok = runtime->copy_into(id, bundle_path, dest, &copied->error); },
      nullptr);
  if (!in_time || !copied->ok) {
    set_state(id, SandboxState::failed);
    if (error) *error = "Failed to mount code bundle: " + (in_time ? copied->error : std::string("job deadline reached"));
    return false;
  }
  set_state(id, SandboxState::code_mounted);
  log_debug("executor", "mounted " + bundle_path + " into " + id + ":" + dest);
  return true;
}

BuildResult SandboxExecutor::build(const std::string& id, std::chrono::milliseconds timeout) {
  BuildResult br;
  const ExecResult r = runtime_->exec(id, options_.build_command, timeout);
  br.output = r.stdout_text;
  br.success = r.error_message.empty() && !r.timed_out && !r.killed && r.exit_code == 0;
  if (!br.success) {
    if (r.timed_out) {
      br.error_message = "build timed out after " + std::to_string(timeout.count()) + "ms";
    } else if (!r.error_message.empty()) {
      br.error_message = r.error_message;
    } else if (r.killed) {
      br.error_message = "build stopped";
    } else {
      br.error_message = r.stderr_text.empty() ? "build exited with code " + std::to_string(r.exit_code)
                                               : r.stderr_text;
    }
  }
  set_state(id, br.success ? SandboxState::built : SandboxState::failed);
  return br;
}

ProofArtifact SandboxExecutor::execute_proof(const std::string& id, const Theorem& theorem,
                                             const ProofOptions& options, std::chrono::milliseconds timeout,
                                             const StopToken& stop, ErrorCode* code, std::string* error) {
  ProofArtifact a;
  a.theorem_id = theorem.id;
  a.invariant_id = theorem.source_invariant_id;
  a.proof_strategy = options.proof_strategy;
  a.metadata = options.metadata;
  a.attempted_at = std::chrono::system_clock::now();
  a.status = ProofStatus::failed;
  a.id = "proof-" + blake3_hex(id + ":" + theorem.id + ":" +
                               std::to_string(a.attempted_at.time_since_epoch().count())).substr(0, 24);
  a.metadata["sandbox_id"] = id;
  a.metadata["image"] = options_.image;
  const auto started = std::chrono::steady_clock::now();
  const Deadline deadline = started + timeout;
  auto finish = [&](ErrorCode c, const std::string& msg) {
    a.duration_ms = static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count());
    if (code) *code = c;
    if (error) *error = msg;
    set_state(id, c == ErrorCode::none ? SandboxState::executed : SandboxState::failed);
    return a;
  };

  struct Generated {
    std::optional<GeneratedProof> proof;
    std::string error;
  };
  const std::uint32_t attempts = std::max<std::uint32_t>(options.max_attempts, 1);
  std::optional<GeneratedProof> proof;
  std::string gen_err;
  std::uint32_t attempt = 0;
  while (!proof && attempt < attempts) {
    if (stop.stop_requested() || std::chrono::steady_clock::now() >= deadline) {
      return finish(ErrorCode::timeout, "proof generation did not finish before the job deadline");
    }
    ++attempt;
    a.metadata["generation_attempts"] = std::to_string(attempt);
    auto gen = std::make_shared<Generated>();
    const bool in_time = run_before(
        deadline,
        [gen, compiler = compiler_, theorem, options, stop] {
          try {
            gen->proof = compiler->generate_proof(theorem, options, stop, &gen->error);
          } catch (const std::exception& e) {
            gen->proof.reset();
            gen->error = e.what();
          }
        },
        nullptr);
    if (!in_time) {
      return finish(ErrorCode::timeout, "proof generation did not finish before the job deadline");
    }
    if (!gen->proof) {
      gen_err = gen->error;
    } else if (gen->proof->confidence < options.confidence_threshold) {
      gen_err = "confidence " + jsonlite::format_double(gen->proof->confidence) + " below threshold " +
                jsonlite::format_double(options.confidence_threshold);
    } else {
      proof = std::move(gen->proof);
      break;
    }
    log_warn("executor", "generation attempt " + std::to_string(attempt) + "/" + std::to_string(attempts) +
                             " for " + theorem.id + " rejected: " + gen_err);
  }
  if (!proof) {
    return finish(ErrorCode::proof_generation_failed, "Proof generation failed after " + std::to_string(attempt) +
                                                          " attempt(s): " + gen_err);
  }
  a.content_digest = artifact_content_hash(proof->code);

  const fs::path staged = fs::path(options_.staging_dir) / ("proofarm-" + id + "-" + options_.proof_file_name);
  {
    std::ofstream ofs(staged, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      return finish(ErrorCode::proof_execution_failed, "cannot stage proof file: " + staged.string());
    }
    ofs.write(proof->code.data(), static_cast<std::streamsize>(proof->code.size()));
  }
  const std::string proof_path = options_.code_mount_path + "/" + options_.proof_file_name;
  auto copied = std::make_shared<CopyOutcome>();
  const bool copied_in_time = run_before(
      deadline,
      [copied, runtime = runtime_, id, staged, proof_path] {
        copied->ok = runtime->copy_into(id, staged.string(), proof_path, &copied->error);
        std::error_code ec;
        fs::remove(staged, ec);
      },
      nullptr);
  if (!copied_in_time) {
    return finish(ErrorCode::timeout, "copying the proof into the sandbox did not finish before the job deadline");
  }
  if (!copied->ok) {
    return finish(ErrorCode::proof_execution_failed, "cannot copy proof into sandbox: " + copied->error);
  }

  std::vector<std::string> cmd = options_.proof_command;
  cmd.push_back(proof_path);
  const ExecResult r = runtime_->exec(id, cmd, remaining(deadline));

  a.exit_code = r.exit_code;
  a.output = r.stdout_text;
  if (!r.stderr_text.empty()) a.logs.push_back(r.stderr_text);
  a.resource_usage = r.usage;
  if (!r.enforced_capabilities.empty()) a.metadata["isolation_enforced"] = join(r.enforced_capabilities);
  if (!r.failed_capabilities.empty()) a.metadata["isolation_failed"] = join(r.failed_capabilities);

  if (!r.error_message.empty()) {
    return finish(ErrorCode::proof_execution_failed, "Proof execution failed: " + r.error_message);
  }
  if (r.timed_out || r.killed) {
    return finish(ErrorCode::timeout, r.timed_out ? "proof execution timed out" : "proof execution stopped");
  }
  if (r.exit_code != 0) {
    const std::string detail = r.stderr_text.empty() ? "" : ": " + first_line(r.stderr_text);
    return finish(ErrorCode::proof_execution_failed,
                  "Proof execution failed with exit code " + std::to_string(r.exit_code) + detail);
  }
  a.status = ProofStatus::success;
  a.confidence_score = proof->confidence;
  return finish(ErrorCode::none, "");
}

bool SandboxExecutor::cleanup(const std::string& id) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = states_.find(id);
    if (it == states_.end()) {
      log_debug("executor", "cleanup of " + id + " skipped: not live");
      return false;
    }
    states_.erase(it);
  }
  stop_and_remove(*runtime_, id);
  log_info("executor", "cleaned up sandbox " + id);
  return true;
}

PipelineOutcome SandboxExecutor::run_pipeline(const Job& job, const std::string& bundle_path, Deadline deadline) {
  PipelineOutcome out;
  const auto total_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now()).count();
  auto report_timeout = [&] {
    out.success = false;
    out.error_code = ErrorCode::timeout;
    out.error_message = "Job timeout after " + std::to_string(std::max<long long>(total_ms, 0)) + "ms";
  };

  bool clamped = false;
  const ResourceLimits limits = clamp_resource_limits(job.options.resource_limits, options_.limit_ceiling, &clamped);
  if (clamped) {
    log_warn("executor", "job " + job.id + " asked for more than the farm allows; using " +
                             resource_limits_to_json(limits));
  }
  std::string err;
  const std::string id = create(limits, &err, deadline);
  if (id.empty()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      report_timeout();
      return out;
    }
    out.error_code = ErrorCode::sandbox_creation_failed;
    out.error_message = err;
    return out;
  }
  out.sandbox_id = id;

  // Declared after the lease so it is disarmed and joined before cleanup.
  SandboxLease lease(*this, id);
  StopSource stop;
  DeadlineWatchdog watchdog(deadline, [this, id, &stop] {
    log_warn("executor", "deadline reached, stopping sandbox " + id);
    stop.request_stop();
    std::string stop_err;
    if (!runtime_->stop(id, &stop_err)) {
      log_warn("executor", "stop " + id + " failed: " + stop_err);
    }
  });

  auto timed_out = [&]() -> bool {
    if (!watchdog.fired() && std::chrono::steady_clock::now() < deadline) return false;
    set_state(id, SandboxState::failed);
    report_timeout();
    return true;
  };

  if (!mount_code(id, bundle_path, &err, deadline)) {
    if (timed_out()) return out;
    out.error_code = ErrorCode::mount_failed;
    out.error_message = err;
    return out;
  }
  if (timed_out()) return out;

  const auto build_budget = std::min<std::chrono::milliseconds>(options_.build_timeout, remaining(deadline));
  const BuildResult br = build(id, build_budget);
  if (timed_out()) return out;
  if (!br.success) {
    out.error_code = ErrorCode::build_failed;
    out.error_message = "Lean compilation failed: " + br.error_message;
    return out;
  }

  ErrorCode code = ErrorCode::none;
  std::string proof_err;
  ProofArtifact artifact =
      execute_proof(id, job.theorem, job.options, remaining(deadline), stop.token(), &code, &proof_err);
  out.usage = artifact.resource_usage;
  out.artifact = std::move(artifact);
  if (timed_out()) return out;
  out.error_code = code;
  out.error_message = proof_err;
  out.success = (code == ErrorCode::none);
  return out;
}

}  // namespace proofarm
