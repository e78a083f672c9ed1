#include "proofarm/types.hpp"

#include "proofarm/jsonlite.hpp"

#include <cctype>
#include <sstream>

namespace proofarm {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::queue_full: return "queue_full";
    case ErrorCode::deadline_exceeded: return "deadline_exceeded";
    case ErrorCode::bundle_download_failed: return "bundle_download_failed";
    case ErrorCode::sandbox_creation_failed: return "sandbox_creation_failed";
    case ErrorCode::mount_failed: return "mount_failed";
    case ErrorCode::build_failed: return "build_failed";
    case ErrorCode::proof_generation_failed: return "proof_generation_failed";
    case ErrorCode::proof_execution_failed: return "proof_execution_failed";
    case ErrorCode::timeout: return "timeout";
    case ErrorCode::artifact_upload_failed: return "artifact_upload_failed";
    case ErrorCode::security_validation_failed: return "security_validation_failed";
    case ErrorCode::config_invalid: return "config_invalid";
  }
  return "";
}

std::string to_string(JobPriority priority) {
  switch (priority) {
    case JobPriority::low: return "low";
    case JobPriority::normal: return "normal";
    case JobPriority::high: return "high";
    case JobPriority::critical: return "critical";
  }
  return "normal";
}

std::optional<JobPriority> priority_from_int(std::int64_t value) {
  switch (value) {
    case 0: return JobPriority::low;
    case 1: return JobPriority::normal;
    case 2: return JobPriority::high;
    case 3: return JobPriority::critical;
    default: return std::nullopt;
  }
}

std::optional<JobPriority> priority_from_string(const std::string& name) {
  std::string lower;
  lower.reserve(name.size());
  for (char c : name) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (lower == "low") return JobPriority::low;
  if (lower == "normal") return JobPriority::normal;
  if (lower == "high") return JobPriority::high;
  if (lower == "critical") return JobPriority::critical;
  return std::nullopt;
}

ResourceLimits clamp_resource_limits(const std::optional<ResourceLimits>& requested, const ResourceLimits& ceiling,
                                     bool* clamped) {
  if (clamped) *clamped = false;
  if (!requested) return ceiling;
  auto cap = [clamped](auto asked, auto limit) {
    if (!(asked > 0)) return limit;
    if (asked > limit) {
      if (clamped) *clamped = true;
      return limit;
    }
    return asked;
  };
  ResourceLimits l;
  l.cpu_cores = cap(requested->cpu_cores, ceiling.cpu_cores);
  l.memory_bytes = cap(requested->memory_bytes, ceiling.memory_bytes);
  l.disk_bytes = cap(requested->disk_bytes, ceiling.disk_bytes);
  l.network_bytes_per_second = cap(requested->network_bytes_per_second, ceiling.network_bytes_per_second);
  l.process_limit = cap(requested->process_limit, ceiling.process_limit);
  l.file_descriptor_limit = cap(requested->file_descriptor_limit, ceiling.file_descriptor_limit);
  return l;
}

std::string to_string(ProofStatus status) {
  switch (status) {
    case ProofStatus::unknown: return "unknown";
    case ProofStatus::success: return "success";
    case ProofStatus::failed: return "failed";
  }
  return "unknown";
}

namespace {

std::uint64_t epoch_ms(std::chrono::system_clock::time_point tp) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
  return ms < 0 ? 0 : static_cast<std::uint64_t>(ms);
}

void write_usage(std::ostringstream& oss, const ResourceUsage& u) {
  oss << "{\"cpu_seconds\":" << jsonlite::format_double(u.cpu_seconds)
      << ",\"disk_bytes\":" << u.disk_bytes
      << ",\"memory_bytes\":" << u.memory_bytes
      << ",\"network_bytes\":" << u.network_bytes << "}";
}

void write_string_map(std::ostringstream& oss, const std::map<std::string, std::string>& m) {
  oss << "{";
  bool first = true;
  for (const auto& [k, v] : m) {
    if (!first) oss << ",";
    first = false;
    oss << "\"" << jsonlite::escape(k) << "\":\"" << jsonlite::escape(v) << "\"";
  }
  oss << "}";
}

}  // namespace

std::string resource_limits_to_json(const ResourceLimits& limits) {
  std::ostringstream oss;
  oss << "{\"cpu_cores\":" << jsonlite::format_double(limits.cpu_cores)
      << ",\"disk_bytes\":" << limits.disk_bytes
      << ",\"file_descriptor_limit\":" << limits.file_descriptor_limit
      << ",\"memory_bytes\":" << limits.memory_bytes
      << ",\"network_bytes_per_second\":" << limits.network_bytes_per_second
      << ",\"process_limit\":" << limits.process_limit << "}";
  return oss.str();
}

// Keys are emitted in sorted order to match jsonlite::to_json, so a record
// re-serialized after parsing hashes identically.
std::string proof_artifact_to_json(const ProofArtifact& a) {
  std::ostringstream oss;
  oss << "{\"attempted_at_ms\":" << epoch_ms(a.attempted_at)
      << ",\"confidence_score\":" << jsonlite::format_double(a.confidence_score)
      << ",\"content_digest\":\"" << jsonlite::escape(a.content_digest) << "\""
      << ",\"duration_ms\":" << a.duration_ms
      << ",\"exit_code\":" << a.exit_code
      << ",\"id\":\"" << jsonlite::escape(a.id) << "\""
      << ",\"invariant_id\":\"" << jsonlite::escape(a.invariant_id) << "\""
      << ",\"logs\":[";
  for (size_t i = 0; i < a.logs.size(); ++i) {
    if (i > 0) oss << ",";
    oss << "\"" << jsonlite::escape(a.logs[i]) << "\"";
  }
  oss << "],\"metadata\":";
  write_string_map(oss, a.metadata);
  oss << ",\"output\":\"" << jsonlite::escape(a.output) << "\""
      << ",\"proof_strategy\":\"" << jsonlite::escape(a.proof_strategy) << "\""
      << ",\"resource_usage\":";
  write_usage(oss, a.resource_usage);
  oss << ",\"status\":\"" << to_string(a.status) << "\""
      << ",\"theorem_id\":\"" << jsonlite::escape(a.theorem_id) << "\"}";
  return oss.str();
}

std::string job_result_to_json(const JobResult& r) {
  std::ostringstream oss;
  oss << "{\"duration_ms\":" << r.duration_ms
      << ",\"error_code\":\"" << to_string(r.error_code) << "\""
      << ",\"error_message\":";
  if (r.error_message) {
    oss << "\"" << jsonlite::escape(*r.error_message) << "\"";
  } else {
    oss << "null";
  }
  oss << ",\"job_id\":\"" << jsonlite::escape(r.job_id) << "\""
      << ",\"proof_artifact\":";
  if (r.proof_artifact) {
    oss << proof_artifact_to_json(*r.proof_artifact);
  } else {
    oss << "null";
  }
  oss << ",\"resource_usage\":";
  write_usage(oss, r.resource_usage);
  oss << ",\"success\":" << (r.success ? "true" : "false")
      << ",\"theorem_id\":\"" << jsonlite::escape(r.theorem_id) << "\"}";
  return oss.str();
}

}  // namespace proofarm
