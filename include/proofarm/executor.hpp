#pragma once

// proofarm/executor.hpp — Per-job sandbox lifecycle.
//
// STATE MACHINE (per sandbox id):
//
//   created -> code_mounted -> built -> executed -> cleaned_up
//       \            \            \          \
//        +------------+------------+----------+--> failed -> cleaned_up
//
//   cleaned_up is terminal on every path. Once cleaned up the id is
//   forgotten; a second cleanup() is a logged no-op.
//
// CLEANUP GUARANTEE:
//   run_pipeline() holds a SandboxLease for the sandbox it creates. The lease
//   calls cleanup() from its destructor unless cleanup already ran, so every
//   create() is paired with exactly one stop+remove on success, build failure,
//   execution failure, timeout, and exception unwinding.
//
// DEADLINE:
//   run_pipeline() arms a watchdog thread for the job deadline. When it
//   fires, the watchdog calls SandboxRuntime::stop() on the live sandbox, so
//   the blocked exec() returns promptly and the sandboxed process is killed
//   rather than abandoned. It also raises the StopToken handed to the
//   TheoremCompiler.
//
//   Steps that stop() cannot interrupt (create, copy_into, proof generation)
//   run on a helper thread that the pipeline waits on only until the
//   deadline. A helper still running at the deadline is left to finish on its
//   own and joined later; a sandbox it creates late is removed at once.
//   Either way the pipeline reports ErrorCode::timeout at the deadline.
//
// LIMITS:
//   Per-job ResourceLimits pass through clamp_resource_limits() against
//   ExecutorOptions::limit_ceiling before they reach SandboxRuntime::create.

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "proofarm/cancellation.hpp"
#include "proofarm/sandbox.hpp"
#include "proofarm/types.hpp"

namespace proofarm {

enum class SandboxState {
  created,
  code_mounted,
  built,
  executed,
  failed,
  cleaned_up,
};

std::string to_string(SandboxState state);

// ---------------------------------------------------------------------------
// TheoremCompiler — proof code generation seam
// ---------------------------------------------------------------------------
struct GeneratedProof {
  std::string code;
  double confidence{1.0};   // 0..1, compared against ProofOptions::confidence_threshold
};

// One call is one attempt. SandboxExecutor makes up to
// ProofOptions::max_attempts attempts and discards proofs whose confidence is
// below the threshold. Implementations should return early once stop is
// requested; the executor stops waiting at the deadline regardless.
class TheoremCompiler {
 public:
  virtual ~TheoremCompiler() = default;
  virtual std::optional<GeneratedProof> generate_proof(const Theorem& theorem, const ProofOptions& options,
                                                       const StopToken& stop, std::string* error) = 0;
};

// Uses the theorem's own Lean source as the proof file, at confidence 1.
class PassthroughTheoremCompiler : public TheoremCompiler {
 public:
  std::optional<GeneratedProof> generate_proof(const Theorem& theorem, const ProofOptions& options,
                                               const StopToken& stop, std::string* error) override;
};

// ---------------------------------------------------------------------------
// SandboxExecutor
// ---------------------------------------------------------------------------

struct ExecutorOptions {
  std::string image{"leanprover/lean4:4.7.0"};
  std::string code_mount_path{"/var/lean-farm/code"};
  std::vector<std::string> build_command{"lake", "build"};
  std::vector<std::string> proof_command{"lean", "--run"};
  std::string proof_file_name{"proof.lean"};
  std::chrono::seconds build_timeout{300};
  std::string staging_dir{"/tmp"};   // host directory for generated proof files
  ResourceLimits limit_ceiling;      // upper bound for per-job limits
};

struct PipelineOutcome {
  bool success{false};
  ErrorCode error_code{ErrorCode::none};
  std::string error_message;
  std::optional<ProofArtifact> artifact;
  ResourceUsage usage;
  std::string sandbox_id;
};

class SandboxExecutor {
 public:
  SandboxExecutor(std::shared_ptr<SandboxRuntime> runtime,
                  std::shared_ptr<TheoremCompiler> compiler,
                  ExecutorOptions options);

  ~SandboxExecutor();

  SandboxExecutor(const SandboxExecutor&) = delete;
  SandboxExecutor& operator=(const SandboxExecutor&) = delete;

  using Deadline = std::chrono::steady_clock::time_point;

  // Returns the sandbox id, or empty with *error set. Past the deadline the
  // call returns empty and a late sandbox is removed when it appears.
  std::string create(const ResourceLimits& limits, std::string* error, Deadline deadline = Deadline::max());

  bool mount_code(const std::string& id, const std::string& bundle_path, std::string* error,
                  Deadline deadline = Deadline::max());

  BuildResult build(const std::string& id, std::chrono::milliseconds timeout);

  // Always returns an artifact describing the attempt. *code is
  // ErrorCode::none only when the proof ran and exited 0. Generation and the
  // proof run share the timeout.
  ProofArtifact execute_proof(const std::string& id, const Theorem& theorem,
                              const ProofOptions& options, std::chrono::milliseconds timeout,
                              const StopToken& stop, ErrorCode* code, std::string* error);

  // Stop + remove. Best-effort: failures are logged, never returned as job
  // errors. Returns true when this call performed the cleanup, false when the
  // id was already cleaned up or never existed.
  bool cleanup(const std::string& id);

  PipelineOutcome run_pipeline(const Job& job, const std::string& bundle_path, Deadline deadline);

  std::optional<SandboxState> state(const std::string& id) const;
  size_t live_sandboxes() const;
  // Helper threads still finishing a step their pipeline stopped waiting for.
  size_t pending_helpers() const;

  const ExecutorOptions& options() const { return options_; }

 private:
  struct Helper {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> finished;
  };

  void set_state(const std::string& id, SandboxState s);

  // Runs work on a helper thread and waits for it until the deadline. Returns
  // true when work finished in time. Otherwise the helper keeps running, calls
  // on_late after work returns, and is joined later. Neither callable may
  // refer to the caller's stack.
  bool run_before(Deadline deadline, std::function<void()> work, std::function<void()> on_late);
  void reap_helpers(bool wait_all);

  std::shared_ptr<SandboxRuntime> runtime_;
  std::shared_ptr<TheoremCompiler> compiler_;
  ExecutorOptions options_;
  mutable std::mutex mu_;
  std::map<std::string, SandboxState> states_;
  mutable std::mutex helpers_mu_;
  std::vector<Helper> helpers_;
};

// Scoped ownership of one sandbox: cleanup() runs exactly once, on
// destruction at the latest.
class SandboxLease {
 public:
  SandboxLease(SandboxExecutor& executor, std::string id) : executor_(executor), id_(std::move(id)) {}
  ~SandboxLease() { release(); }

  SandboxLease(const SandboxLease&) = delete;
  SandboxLease& operator=(const SandboxLease&) = delete;

  const std::string& id() const { return id_; }

  void release() {
    if (!released_) {
      released_ = true;
      executor_.cleanup(id_);
    }
  }

 private:
  SandboxExecutor& executor_;
  std::string id_;
  bool released_{false};
};

}  // namespace proofarm
