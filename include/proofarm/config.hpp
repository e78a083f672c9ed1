#pragma once

// proofarm/config.hpp — Farm configuration: JSON file + PROOFARM_* overrides.
//
// Precedence (lowest to highest): built-in defaults, config file, environment.
// Loading never throws. Malformed JSON is reported through the error
// out-param; semantic problems are reported by validate_farm_config().
//
// Environment overrides:
//   PROOFARM_WORKER_COUNT, PROOFARM_MAX_JOB_DURATION_SECONDS,
//   PROOFARM_MAX_QUEUE_SIZE, PROOFARM_STORE_ROOT, PROOFARM_SANDBOX_ROOT,
//   PROOFARM_REQUIRED_RUNTIME, LEAN_VERSION (image tag), LAKE_BUILD_TIMEOUT.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "proofarm/jsonlite.hpp"
#include "proofarm/types.hpp"

namespace proofarm {

struct VulnerabilityScanConfig {
  bool enabled{true};
  std::uint32_t max_critical{0};
  std::uint32_t max_high{5};
  std::uint32_t timeout_seconds{300};
  // argv of an external scanner that prints {"critical":N,"high":N,...}.
  // Empty means scanning is requested but no scanner is installed.
  std::vector<std::string> command;
};

struct SecurityConfig {
  std::string required_isolation_runtime{"gvisor"};   // "none" disables the check
  std::string seccomp_profile{"runtime/default"};
  bool run_as_non_root{true};
  std::uint32_t run_as_user{1000};
  std::uint32_t run_as_group{1000};
  bool read_only_root_filesystem{true};
  bool drop_all_capabilities{true};
  bool allow_privilege_escalation{false};
  bool privileged{false};
  bool network_isolation{true};
  ResourceLimits resource_limits;
  VulnerabilityScanConfig scanning;
};

struct SandboxConfig {
  std::string image{"leanprover/lean4:4.7.0"};
  std::string work_root{"/var/lib/proofarm/sandboxes"};
  std::string code_mount_path{"/var/lean-farm/code"};
  std::uint32_t build_timeout_seconds{300};
  std::uint64_t tmp_size_bytes{1ull * 1024 * 1024 * 1024};
  std::uint64_t scratch_size_bytes{2ull * 1024 * 1024 * 1024};
};

struct StorageConfig {
  std::string root{"/var/lib/proofarm/store"};
  std::string key_prefix{"proofs"};
  bool compress_artifacts{true};
};

struct FarmConfig {
  std::uint32_t worker_count{10};
  std::uint32_t max_job_duration_seconds{300};
  std::uint64_t max_queue_size{1000};
  std::uint32_t idle_wait_ms{100};
  std::uint64_t result_channel_capacity{100};
  ResourceLimits resource_limits;      // per-sandbox default, overridable per job
  SecurityConfig security;
  SandboxConfig sandbox;
  StorageConfig storage;
  std::vector<std::string> unknown_keys;   // top-level keys the loader ignored
};

struct ConfigValidationResult {
  bool ok{false};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

// Missing keys keep their defaults. On malformed JSON returns defaults and
// sets *error.
FarmConfig farm_config_from_json(const std::string& json, std::string* error);

// Reads the file, parses it, then applies environment overrides.
std::optional<FarmConfig> load_farm_config(const std::string& path, std::string* error);

void apply_env_overrides(FarmConfig& config);

ConfigValidationResult validate_farm_config(const FarmConfig& config);

std::string farm_config_to_json(const FarmConfig& config);
std::string config_validation_to_json(const ConfigValidationResult& result);

// Shared with job description parsing.
ResourceLimits resource_limits_from_object(const jsonlite::Object& obj, const ResourceLimits& defaults);

// Job description file:
//   {"id": "...", "priority": "high" | 0..3, "deadline_ms": <relative>,
//    "theorem": {"id", "name", "lean_code", "content_digest", "source_invariant_id"},
//    "options": {"max_attempts", "timeout_seconds", "proof_strategy",
//                "confidence_threshold", "resource_limits": {...}, "metadata": {...}}}
// "id" and "theorem.id" are required. deadline_ms is measured from the call.
std::optional<Job> job_from_json(const std::string& json, std::string* error);

}  // namespace proofarm
