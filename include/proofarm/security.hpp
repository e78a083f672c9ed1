#pragma once

// proofarm/security.hpp — Startup security gate.
//
// SecurityValidator runs once before the worker pool accepts jobs. Checks run
// in a fixed order and the first failure wins:
//
//   1. runtime      required isolation runtime present, process not root,
//                   seccomp available
//   2. config       run_as_user != 0, all capabilities dropped and the
//                   detected CapEff empty, no privilege escalation and
//                   NoNewPrivs set on this process, not privileged
//   3. limits       every ResourceLimits field > 0
//   4. scan         external vulnerability scan under its own timeout,
//                   compared against max_critical / max_high
//
// Every failure is ErrorCode::security_validation_failed with `check` naming
// the step. The farm refuses to start and the CLI exits non-zero.
//
// RuntimeInfo is detected from the live process (/proc/self/status, euid,
// RUNSC_ROOT_DIR, /proc/version, /proc/{self,1}/ns/net) or injected by the
// caller. The bounding set and the network namespace of the farm process are
// reported and logged, not gated on: each sandboxed command drops its
// bounding set and unshares its network namespace on its own.

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "proofarm/config.hpp"
#include "proofarm/types.hpp"

namespace proofarm {

struct RuntimeInfo {
  std::string isolation_runtime{"native"};   // "gvisor" or "native"
  bool is_rootless{false};
  int seccomp_mode{-1};                      // /proc/self/status Seccomp:, -1 unknown
  bool seccomp_available{false};             // kernel supports seccomp filters
  std::uint64_t effective_capabilities{0};   // CapEff bitmask
  bool no_new_privs{false};
  bool bounding_sys_admin{false};            // CapBnd holds CAP_SYS_ADMIN
  bool network_isolated{false};              // net namespace differs from pid 1
};

// Parses the Seccomp, CapEff, CapBnd and NoNewPrivs lines of
// /proc/<pid>/status text into base.
RuntimeInfo parse_proc_status(const std::string& status_text, RuntimeInfo base);

// PROOFARM_ISOLATION_RUNTIME overrides runtime detection.
RuntimeInfo detect_runtime_info();

std::string runtime_info_to_json(const RuntimeInfo& info);

// ---------------------------------------------------------------------------
// Vulnerability scanning
// ---------------------------------------------------------------------------

struct ScanReport {
  std::uint32_t critical{0};
  std::uint32_t high{0};
  std::uint32_t medium{0};
  std::uint32_t low{0};
  std::uint64_t duration_ms{0};
};

class IVulnerabilityScanner {
 public:
  virtual ~IVulnerabilityScanner() = default;
  // Returns nullopt and sets *error when the scan could not complete,
  // including when it ran past timeout.
  virtual std::optional<ScanReport> scan(std::chrono::seconds timeout, std::string* error) = 0;
};

// Runs an external scanner that prints {"critical":N,"high":N,"medium":N,"low":N}
// on stdout and exits 0.
class CommandVulnerabilityScanner : public IVulnerabilityScanner {
 public:
  explicit CommandVulnerabilityScanner(std::vector<std::string> command) : command_(std::move(command)) {}
  std::optional<ScanReport> scan(std::chrono::seconds timeout, std::string* error) override;

 private:
  std::vector<std::string> command_;
};

std::optional<ScanReport> parse_scan_report(const std::string& json, std::string* error);

// ---------------------------------------------------------------------------
// SecurityValidator
// ---------------------------------------------------------------------------

struct SecurityValidationResult {
  bool ok{false};
  ErrorCode code{ErrorCode::none};
  std::string check;     // runtime | config | resource_limits | vulnerability_scan
  std::string message;
  std::optional<ScanReport> scan;
};

std::string security_validation_to_json(const SecurityValidationResult& result);

class SecurityValidator {
 public:
  SecurityValidator(SecurityConfig config, RuntimeInfo runtime,
                    std::shared_ptr<IVulnerabilityScanner> scanner = nullptr);

  SecurityValidationResult validate() const;

  const RuntimeInfo& runtime_info() const { return runtime_; }
  const SecurityConfig& config() const { return config_; }

 private:
  std::optional<std::string> check_runtime() const;
  std::optional<std::string> check_config() const;
  std::optional<std::string> check_resource_limits() const;

  SecurityConfig config_;
  RuntimeInfo runtime_;
  std::shared_ptr<IVulnerabilityScanner> scanner_;
};

}  // namespace proofarm
