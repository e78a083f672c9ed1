#pragma once

// proofarm/types.hpp — Core data structures for the proof job execution engine.
//
// OWNERSHIP:
//   - Job is a move-only value in practice: JobQueue owns it until dequeue(),
//     then the dequeuing worker owns it until its JobResult is emitted.
//   - JobResult is created exactly once per job and never mutated after it
//     enters the result channel.
//   - All string members are value-owned. No borrowed references.
//
// CLOCKS:
//   - created_at / attempted_at use system_clock (wall time, serialized).
//   - deadline uses steady_clock. Deadlines are compared against
//     steady_clock::now() only, so wall-clock jumps never expire a job early.

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace proofarm {

enum class ErrorCode {
  none,
  queue_full,
  deadline_exceeded,
  bundle_download_failed,
  sandbox_creation_failed,
  mount_failed,
  build_failed,
  proof_generation_failed,
  proof_execution_failed,
  timeout,
  artifact_upload_failed,
  security_validation_failed,
  config_invalid,
};

std::string to_string(ErrorCode code);

enum class JobPriority : std::uint8_t {
  low = 0,
  normal = 1,
  high = 2,
  critical = 3,
};

std::string to_string(JobPriority priority);

// Accepts 0..3 and the names low/normal/high/critical (any case). Anything
// else is nullopt.
std::optional<JobPriority> priority_from_int(std::int64_t value);
std::optional<JobPriority> priority_from_string(const std::string& name);

struct ResourceLimits {
  double cpu_cores{2.0};
  std::uint64_t memory_bytes{4ull * 1024 * 1024 * 1024};
  std::uint64_t disk_bytes{10ull * 1024 * 1024 * 1024};
  std::uint64_t network_bytes_per_second{100ull * 1024 * 1024};
  std::uint32_t process_limit{100};
  std::uint32_t file_descriptor_limit{1024};
};

// Effective per-sandbox limits for a job. A missing request or a zero field
// takes the ceiling value; every other field is capped at the ceiling.
// *clamped is set when the request asked for more than the ceiling allows.
ResourceLimits clamp_resource_limits(const std::optional<ResourceLimits>& requested,
                                     const ResourceLimits& ceiling, bool* clamped = nullptr);

struct ResourceUsage {
  double cpu_seconds{0.0};
  std::uint64_t memory_bytes{0};
  std::uint64_t disk_bytes{0};
  std::uint64_t network_bytes{0};
};

struct Theorem {
  std::string id;
  std::string name;
  std::string lean_code;
  std::string content_digest;       // key of the code bundle in the artifact store
  std::string source_invariant_id;
};

struct ProofOptions {
  std::uint32_t max_attempts{3};
  std::uint32_t timeout_seconds{300};
  std::string proof_strategy{"auto"};
  double confidence_threshold{0.8};
  std::optional<ResourceLimits> resource_limits;  // overrides farm defaults
  std::map<std::string, std::string> metadata;
};

struct Job {
  std::string id;
  Theorem theorem;
  ProofOptions options;
  JobPriority priority{JobPriority::normal};
  std::chrono::system_clock::time_point created_at{std::chrono::system_clock::now()};
  std::optional<std::chrono::steady_clock::time_point> deadline;
};

enum class ProofStatus {
  unknown,
  success,
  failed,
};

std::string to_string(ProofStatus status);

struct ProofArtifact {
  std::string id;
  std::string content_digest;   // BLAKE3 of the generated proof code
  std::string theorem_id;
  std::string invariant_id;
  ProofStatus status{ProofStatus::unknown};
  std::chrono::system_clock::time_point attempted_at{};
  std::uint64_t duration_ms{0};
  int exit_code{0};
  std::string output;
  std::vector<std::string> logs;
  ResourceUsage resource_usage;
  std::string proof_strategy;
  double confidence_score{0.0};
  std::map<std::string, std::string> metadata;
};

struct BuildResult {
  bool success{false};
  std::string error_message;
  std::string output;
};

struct JobResult {
  std::string job_id;
  std::string theorem_id;
  bool success{false};
  std::uint64_t duration_ms{0};
  ErrorCode error_code{ErrorCode::none};
  std::optional<std::string> error_message;
  ResourceUsage resource_usage;
  std::optional<ProofArtifact> proof_artifact;
  JobPriority priority{JobPriority::normal};
  int worker_index{-1};
};

// Compact single-line JSON, suitable for NDJSON append.
std::string resource_limits_to_json(const ResourceLimits& limits);
std::string proof_artifact_to_json(const ProofArtifact& artifact);
std::string job_result_to_json(const JobResult& result);

}  // namespace proofarm
