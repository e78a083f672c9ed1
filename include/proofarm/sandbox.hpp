#pragma once

// proofarm/sandbox.hpp — Isolated process execution and the sandbox runtime
// seam.
//
// Two layers:
//
//   run_process()        One child process, optionally isolated (namespaces,
//                        mounts, rlimits, seccomp-BPF, uid/gid drop). Used for
//                        every sandboxed command and for the vulnerability
//                        scanner.
//
//   SandboxRuntime       The lifecycle seam SandboxExecutor drives:
//                        create / exec / copy_into / stop / remove.
//                        NamespaceSandboxRuntime is the native Linux backend;
//                        tests substitute an in-memory fake.
//
// CAPABILITY REPORTING:
//   Isolation is applied best-effort inside the child. The child reports
//   what it actually applied back to the parent over a close-on-exec pipe
//   before execve(). ProcessResult::enforced_capabilities lists what took
//   effect, failed_capabilities lists what was requested and did not. Nothing
//   is ever reported as enforced on the strength of having been requested.
//
// STOP:
//   A ProcessHandle lets another thread kill the running child's whole
//   process group. run_process() then returns with killed=true and
//   exit_code 137. Deadline expiry inside run_process() reports
//   timed_out=true and exit_code 124.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "proofarm/types.hpp"

namespace proofarm {

// ---------------------------------------------------------------------------
// Process execution
// ---------------------------------------------------------------------------

struct IsolationSpec {
  bool enabled{false};
  bool network{true};             // private network namespace (no interfaces but lo)
  bool ipc_uts{true};             // private IPC and UTS namespaces
  bool read_only_root{true};      // remount "/" read-only in a private mount namespace
  std::vector<std::string> writable_paths;                       // bind-mounted writable
  std::vector<std::pair<std::string, std::uint64_t>> tmpfs_mounts;  // path, size; noexec,nosuid
  bool seccomp{true};
  bool no_new_privs{true};
  bool drop_capabilities{true};
  std::uint32_t run_as_user{1000};   // applied only when started as root
  std::uint32_t run_as_group{1000};
};

struct ProcessSpec {
  std::string command;                 // absolute path; see resolve_executable()
  std::vector<std::string> argv;       // arguments after argv[0]
  std::map<std::string, std::string> env;
  std::string cwd;
  std::uint64_t timeout_ms{5000};
  std::size_t max_output_bytes{1u << 20};
  std::uint64_t max_memory_bytes{0};     // 0 = unlimited
  std::uint64_t max_file_descriptors{0};
  std::uint64_t max_processes{0};
  std::uint64_t max_file_size_bytes{0};
  std::uint64_t cpu_seconds_limit{0};    // 0 = derive from timeout_ms
  IsolationSpec isolation;
};

struct ProcessResult {
  int exit_code{0};
  bool timed_out{false};
  bool killed{false};                  // stopped through a ProcessHandle
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::string stdout_text;
  std::string stderr_text;
  std::string error_message;           // non-empty when the child never ran
  std::uint64_t duration_ms{0};
  ResourceUsage usage;
  std::vector<std::string> enforced_capabilities;
  std::vector<std::string> failed_capabilities;
};

// Lets another thread stop a running child. One handle per run_process call.
class ProcessHandle {
 public:
  // Kills the child's process group if running; otherwise makes the next
  // run_process() using this handle refuse to spawn.
  void request_kill();
  bool kill_requested() const { return kill_requested_.load(std::memory_order_acquire); }

 private:
  friend ProcessResult run_process(const ProcessSpec& spec, ProcessHandle* handle);
  std::atomic<int> pid_{0};
  std::atomic<bool> kill_requested_{false};
};

ProcessResult run_process(const ProcessSpec& spec, ProcessHandle* handle = nullptr);

// Absolute paths are returned unchanged. Otherwise searches PATH and returns
// the first executable match, or an empty string.
std::string resolve_executable(const std::string& name);

// Sets PR_SET_NO_NEW_PRIVS on the calling process. It is inherited by every
// child and cannot be cleared again.
bool set_no_new_privs(std::string* error);

// ---------------------------------------------------------------------------
// SandboxRuntime
// ---------------------------------------------------------------------------

struct SandboxMount {
  std::string host_path;
  std::string sandbox_path;
  bool read_only{true};
};

using ExecResult = ProcessResult;

class SandboxRuntime {
 public:
  virtual ~SandboxRuntime() = default;

  // Returns the new sandbox id, or an empty string with *error set.
  virtual std::string create(const std::string& image, const ResourceLimits& limits,
                             const std::vector<SandboxMount>& mounts, std::string* error) = 0;

  virtual ExecResult exec(const std::string& id, const std::vector<std::string>& command,
                          std::chrono::milliseconds timeout) = 0;

  // Copies a host file or directory tree to dest (a sandbox path).
  virtual bool copy_into(const std::string& id, const std::string& host_path,
                         const std::string& dest, std::string* error) = 0;

  // Kills anything running in the sandbox. Safe to call from any thread,
  // including while exec() is blocked on the same id.
  virtual bool stop(const std::string& id, std::string* error) = 0;

  virtual bool remove(const std::string& id, std::string* error) = 0;
};

// ---------------------------------------------------------------------------
// NamespaceSandboxRuntime — native Linux backend
// ---------------------------------------------------------------------------
// Each sandbox is a directory <work_root>/<id>/fs that stands in for the
// sandbox filesystem: the sandbox path /var/lean-farm/code maps to
// <work_root>/<id>/fs/var/lean-farm/code. Command arguments that name a
// sandbox path are rewritten to the host path before exec. Every command runs
// through run_process() with full isolation.
//
// The image name is recorded and exported as PROOFARM_SANDBOX_IMAGE; the
// toolchain itself is resolved from the host PATH.
struct NamespaceSandboxOptions {
  std::string work_root{"/var/lib/proofarm/sandboxes"};
  std::uint32_t run_as_user{1000};
  std::uint32_t run_as_group{1000};
  bool network_isolation{true};
  bool read_only_root{true};
  std::string tmp_path{"/tmp"};
  std::uint64_t tmp_size_bytes{1ull * 1024 * 1024 * 1024};
  std::string scratch_path{"/var/lean-farm"};
  std::uint64_t scratch_size_bytes{2ull * 1024 * 1024 * 1024};
  std::string workdir{"/var/lean-farm/code"};   // cwd for exec; scratch if absent
  std::map<std::string, std::string> env;
};

class NamespaceSandboxRuntime : public SandboxRuntime {
 public:
  explicit NamespaceSandboxRuntime(NamespaceSandboxOptions options);
  ~NamespaceSandboxRuntime() override;

  std::string create(const std::string& image, const ResourceLimits& limits,
                     const std::vector<SandboxMount>& mounts, std::string* error) override;
  ExecResult exec(const std::string& id, const std::vector<std::string>& command,
                  std::chrono::milliseconds timeout) override;
  bool copy_into(const std::string& id, const std::string& host_path,
                 const std::string& dest, std::string* error) override;
  bool stop(const std::string& id, std::string* error) override;
  bool remove(const std::string& id, std::string* error) override;

  // Host directory backing a sandbox path; empty if id is unknown.
  std::string host_path_for(const std::string& id, const std::string& sandbox_path) const;

  size_t live_sandboxes() const;

 private:
  struct Sandbox {
    std::string id;
    std::string image;
    ResourceLimits limits;
    std::string root;            // <work_root>/<id>
    std::vector<SandboxMount> mounts;
    bool stopped{false};
    std::shared_ptr<ProcessHandle> active;
  };

  std::string map_path(const Sandbox& sb, const std::string& sandbox_path) const;
  std::vector<std::string> sandbox_prefixes(const Sandbox& sb) const;

  NamespaceSandboxOptions options_;
  mutable std::mutex mu_;
  std::map<std::string, std::shared_ptr<Sandbox>> sandboxes_;
  std::uint64_t next_id_{0};
};

}  // namespace proofarm
