#include "proofarm/config.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

namespace proofarm {

namespace {

std::uint32_t clamp_u32(unsigned long long v) {
  return v > 0xFFFFFFFFull ? 0xFFFFFFFFu : static_cast<std::uint32_t>(v);
}

// Env value parsed as unsigned integer; nullopt when unset or not a number.
std::optional<unsigned long long> env_u64(const char* name) {
  const char* e = std::getenv(name);
  if (!e || !e[0]) return std::nullopt;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(e, &end, 10);
  if (end == e || *end != '\0') return std::nullopt;
  return v;
}

std::optional<std::string> env_str(const char* name) {
  const char* e = std::getenv(name);
  if (!e || !e[0]) return std::nullopt;
  return std::string(e);
}

jsonlite::Object limits_object(const ResourceLimits& l) {
  jsonlite::Object o;
  o["cpu_cores"] = l.cpu_cores;
  o["memory_bytes"] = static_cast<std::uint64_t>(l.memory_bytes);
  o["disk_bytes"] = static_cast<std::uint64_t>(l.disk_bytes);
  o["network_bytes_per_second"] = static_cast<std::uint64_t>(l.network_bytes_per_second);
  o["process_limit"] = static_cast<std::uint64_t>(l.process_limit);
  o["file_descriptor_limit"] = static_cast<std::uint64_t>(l.file_descriptor_limit);
  return o;
}

void check_limits(const ResourceLimits& l, const std::string& where, ConfigValidationResult& r) {
  if (l.cpu_cores <= 0.0) r.errors.push_back(where + ".cpu_cores must be greater than 0");
  if (l.memory_bytes == 0) r.errors.push_back(where + ".memory_bytes must be greater than 0");
  if (l.disk_bytes == 0) r.errors.push_back(where + ".disk_bytes must be greater than 0");
  if (l.network_bytes_per_second == 0) r.errors.push_back(where + ".network_bytes_per_second must be greater than 0");
  if (l.process_limit == 0) r.errors.push_back(where + ".process_limit must be greater than 0");
  if (l.file_descriptor_limit == 0) r.errors.push_back(where + ".file_descriptor_limit must be greater than 0");
}

const std::set<std::string> kTopLevelKeys = {
    "worker_count", "max_job_duration_seconds", "max_queue_size", "idle_wait_ms",
    "result_channel_capacity", "resource_limits", "security", "sandbox", "storage",
};

}  // namespace

ResourceLimits resource_limits_from_object(const jsonlite::Object& obj, const ResourceLimits& defaults) {
  ResourceLimits l = defaults;
  l.cpu_cores = jsonlite::get_double(obj, "cpu_cores", defaults.cpu_cores);
  l.memory_bytes = jsonlite::get_u64(obj, "memory_bytes", defaults.memory_bytes);
  l.disk_bytes = jsonlite::get_u64(obj, "disk_bytes", defaults.disk_bytes);
  l.network_bytes_per_second = jsonlite::get_u64(obj, "network_bytes_per_second", defaults.network_bytes_per_second);
  l.process_limit = clamp_u32(jsonlite::get_u64(obj, "process_limit", defaults.process_limit));
  l.file_descriptor_limit = clamp_u32(jsonlite::get_u64(obj, "file_descriptor_limit", defaults.file_descriptor_limit));
  return l;
}

FarmConfig farm_config_from_json(const std::string& json, std::string* error) {
  FarmConfig c;
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object root = jsonlite::parse(json, &err);
  if (err) {
    if (error) *error = err->code + ": " + err->message;
    return c;
  }

  c.worker_count = clamp_u32(jsonlite::get_u64(root, "worker_count", c.worker_count));
  c.max_job_duration_seconds = clamp_u32(jsonlite::get_u64(root, "max_job_duration_seconds", c.max_job_duration_seconds));
  c.max_queue_size = jsonlite::get_u64(root, "max_queue_size", c.max_queue_size);
  c.idle_wait_ms = clamp_u32(jsonlite::get_u64(root, "idle_wait_ms", c.idle_wait_ms));
  c.result_channel_capacity = jsonlite::get_u64(root, "result_channel_capacity", c.result_channel_capacity);

  if (auto sec = jsonlite::get_object(root, "security")) {
    SecurityConfig& s = c.security;
    s.required_isolation_runtime = jsonlite::get_string(*sec, "required_isolation_runtime", s.required_isolation_runtime);
    // Accept the boolean form too: use_gvisor=false means no runtime requirement.
    if (jsonlite::has_key(*sec, "use_gvisor") && !jsonlite::has_key(*sec, "required_isolation_runtime")) {
      s.required_isolation_runtime = jsonlite::get_bool(*sec, "use_gvisor", true) ? "gvisor" : "none";
    }
    s.seccomp_profile = jsonlite::get_string(*sec, "seccomp_profile", s.seccomp_profile);
    s.run_as_non_root = jsonlite::get_bool(*sec, "run_as_non_root", s.run_as_non_root);
    s.run_as_user = clamp_u32(jsonlite::get_u64(*sec, "run_as_user", s.run_as_user));
    s.run_as_group = clamp_u32(jsonlite::get_u64(*sec, "run_as_group", s.run_as_group));
    s.read_only_root_filesystem = jsonlite::get_bool(*sec, "read_only_root_filesystem", s.read_only_root_filesystem);
    s.drop_all_capabilities = jsonlite::get_bool(*sec, "drop_all_capabilities", s.drop_all_capabilities);
    s.allow_privilege_escalation = jsonlite::get_bool(*sec, "allow_privilege_escalation", s.allow_privilege_escalation);
    s.privileged = jsonlite::get_bool(*sec, "privileged", s.privileged);
    s.network_isolation = jsonlite::get_bool(*sec, "network_isolation", s.network_isolation);
    if (auto rl = jsonlite::get_object(*sec, "resource_limits")) {
      s.resource_limits = resource_limits_from_object(*rl, s.resource_limits);
    }
    if (auto scan = jsonlite::get_object(*sec, "scanning")) {
      VulnerabilityScanConfig& v = s.scanning;
      v.enabled = jsonlite::get_bool(*scan, "enabled", v.enabled);
      v.max_critical = clamp_u32(jsonlite::get_u64(*scan, "max_critical", v.max_critical));
      v.max_high = clamp_u32(jsonlite::get_u64(*scan, "max_high", v.max_high));
      v.timeout_seconds = clamp_u32(jsonlite::get_u64(*scan, "timeout_seconds", v.timeout_seconds));
      v.command = jsonlite::get_string_array(*scan, "command");
    }
  }

  // Sandbox defaults follow the security limits unless given explicitly.
  c.resource_limits = c.security.resource_limits;
  if (auto rl = jsonlite::get_object(root, "resource_limits")) {
    c.resource_limits = resource_limits_from_object(*rl, c.resource_limits);
  }

  if (auto sb = jsonlite::get_object(root, "sandbox")) {
    SandboxConfig& s = c.sandbox;
    s.image = jsonlite::get_string(*sb, "image", s.image);
    s.work_root = jsonlite::get_string(*sb, "work_root", s.work_root);
    s.code_mount_path = jsonlite::get_string(*sb, "code_mount_path", s.code_mount_path);
    s.build_timeout_seconds = clamp_u32(jsonlite::get_u64(*sb, "build_timeout_seconds", s.build_timeout_seconds));
    s.tmp_size_bytes = jsonlite::get_u64(*sb, "tmp_size_bytes", s.tmp_size_bytes);
    s.scratch_size_bytes = jsonlite::get_u64(*sb, "scratch_size_bytes", s.scratch_size_bytes);
  }

  if (auto st = jsonlite::get_object(root, "storage")) {
    StorageConfig& s = c.storage;
    s.root = jsonlite::get_string(*st, "root", s.root);
    s.key_prefix = jsonlite::get_string(*st, "key_prefix", s.key_prefix);
    s.compress_artifacts = jsonlite::get_bool(*st, "compress_artifacts", s.compress_artifacts);
  }

  for (const auto& [k, v] : root) {
    (void)v;
    if (!kTopLevelKeys.contains(k)) c.unknown_keys.push_back(k);
  }
  return c;
}

void apply_env_overrides(FarmConfig& c) {
  if (auto v = env_u64("PROOFARM_WORKER_COUNT")) c.worker_count = clamp_u32(*v);
  if (auto v = env_u64("PROOFARM_MAX_JOB_DURATION_SECONDS")) c.max_job_duration_seconds = clamp_u32(*v);
  if (auto v = env_u64("PROOFARM_MAX_QUEUE_SIZE")) c.max_queue_size = *v;
  if (auto v = env_str("PROOFARM_STORE_ROOT")) c.storage.root = *v;
  if (auto v = env_str("PROOFARM_SANDBOX_ROOT")) c.sandbox.work_root = *v;
  if (auto v = env_str("PROOFARM_REQUIRED_RUNTIME")) c.security.required_isolation_runtime = *v;
  if (auto v = env_u64("LAKE_BUILD_TIMEOUT")) c.sandbox.build_timeout_seconds = clamp_u32(*v);
  if (auto v = env_str("LEAN_VERSION")) c.sandbox.image = "leanprover/lean4:" + *v;
}

std::optional<FarmConfig> load_farm_config(const std::string& path, std::string* error) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    if (error) *error = "cannot open config file: " + path;
    return std::nullopt;
  }
  std::stringstream ss;
  ss << ifs.rdbuf();
  std::string parse_error;
  FarmConfig c = farm_config_from_json(ss.str(), &parse_error);
  if (!parse_error.empty()) {
    if (error) *error = parse_error;
    return std::nullopt;
  }
  apply_env_overrides(c);
  return c;
}

ConfigValidationResult validate_farm_config(const FarmConfig& c) {
  ConfigValidationResult r;
  if (c.worker_count == 0) r.errors.push_back("worker_count must be greater than 0");
  if (c.max_job_duration_seconds == 0) r.errors.push_back("max_job_duration_seconds must be greater than 0");
  if (c.max_queue_size == 0) r.errors.push_back("max_queue_size must be greater than 0");
  if (c.result_channel_capacity == 0) r.errors.push_back("result_channel_capacity must be greater than 0");
  for (const auto& k : c.unknown_keys) r.warnings.push_back("unknown config key: " + k);
  if (c.idle_wait_ms == 0) r.warnings.push_back("idle_wait_ms is 0: idle workers will spin");
  if (c.worker_count > 256) r.warnings.push_back("worker_count above 256 is unusual");
  if (c.sandbox.build_timeout_seconds > c.max_job_duration_seconds) {
    r.warnings.push_back("sandbox.build_timeout_seconds exceeds max_job_duration_seconds; the job timeout wins");
  }
  if (c.storage.root.empty()) r.errors.push_back("storage.root must not be empty");
  if (c.sandbox.work_root.empty()) r.errors.push_back("sandbox.work_root must not be empty");
  check_limits(c.resource_limits, "resource_limits", r);
  check_limits(c.security.resource_limits, "security.resource_limits", r);
  if (c.security.run_as_user == 0) r.warnings.push_back("security.run_as_user is 0; security validation will refuse to start");
  if (c.security.scanning.enabled && c.security.scanning.command.empty()) {
    r.warnings.push_back("security.scanning.enabled without security.scanning.command; the scan step will fail");
  }
  r.ok = r.errors.empty();
  return r;
}

std::string farm_config_to_json(const FarmConfig& c) {
  jsonlite::Object scan;
  scan["enabled"] = c.security.scanning.enabled;
  scan["max_critical"] = static_cast<std::uint64_t>(c.security.scanning.max_critical);
  scan["max_high"] = static_cast<std::uint64_t>(c.security.scanning.max_high);
  scan["timeout_seconds"] = static_cast<std::uint64_t>(c.security.scanning.timeout_seconds);
  jsonlite::Array cmd;
  for (const auto& a : c.security.scanning.command) cmd.emplace_back(a);
  scan["command"] = std::move(cmd);

  jsonlite::Object sec;
  sec["required_isolation_runtime"] = c.security.required_isolation_runtime;
  sec["seccomp_profile"] = c.security.seccomp_profile;
  sec["run_as_non_root"] = c.security.run_as_non_root;
  sec["run_as_user"] = static_cast<std::uint64_t>(c.security.run_as_user);
  sec["run_as_group"] = static_cast<std::uint64_t>(c.security.run_as_group);
  sec["read_only_root_filesystem"] = c.security.read_only_root_filesystem;
  sec["drop_all_capabilities"] = c.security.drop_all_capabilities;
  sec["allow_privilege_escalation"] = c.security.allow_privilege_escalation;
  sec["privileged"] = c.security.privileged;
  sec["network_isolation"] = c.security.network_isolation;
  sec["resource_limits"] = limits_object(c.security.resource_limits);
  sec["scanning"] = std::move(scan);

  jsonlite::Object sb;
  sb["image"] = c.sandbox.image;
  sb["work_root"] = c.sandbox.work_root;
  sb["code_mount_path"] = c.sandbox.code_mount_path;
  sb["build_timeout_seconds"] = static_cast<std::uint64_t>(c.sandbox.build_timeout_seconds);
  sb["tmp_size_bytes"] = static_cast<std::uint64_t>(c.sandbox.tmp_size_bytes);
  sb["scratch_size_bytes"] = static_cast<std::uint64_t>(c.sandbox.scratch_size_bytes);

  jsonlite::Object st;
  st["root"] = c.storage.root;
  st["key_prefix"] = c.storage.key_prefix;
  st["compress_artifacts"] = c.storage.compress_artifacts;

  jsonlite::Object root;
  root["worker_count"] = static_cast<std::uint64_t>(c.worker_count);
  root["max_job_duration_seconds"] = static_cast<std::uint64_t>(c.max_job_duration_seconds);
  root["max_queue_size"] = static_cast<std::uint64_t>(c.max_queue_size);
  root["idle_wait_ms"] = static_cast<std::uint64_t>(c.idle_wait_ms);
  root["result_channel_capacity"] = static_cast<std::uint64_t>(c.result_channel_capacity);
  root["resource_limits"] = limits_object(c.resource_limits);
  root["security"] = std::move(sec);
  root["sandbox"] = std::move(sb);
  root["storage"] = std::move(st);
  return jsonlite::to_json(jsonlite::Value{std::move(root)});
}

std::string config_validation_to_json(const ConfigValidationResult& r) {
  jsonlite::Object o;
  o["ok"] = r.ok;
  jsonlite::Array errs;
  for (const auto& e : r.errors) errs.emplace_back(e);
  jsonlite::Array warns;
  for (const auto& w : r.warnings) warns.emplace_back(w);
  o["errors"] = std::move(errs);
  o["warnings"] = std::move(warns);
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

std::optional<Job> job_from_json(const std::string& json, std::string* error) {
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object root = jsonlite::parse(json, &err);
  if (err) {
    if (error) *error = err->code + ": " + err->message;
    return std::nullopt;
  }
  Job job;
  job.id = jsonlite::get_string(root, "id");
  if (job.id.empty()) {
    if (error) *error = "job description lacks \"id\"";
    return std::nullopt;
  }
  const auto theorem = jsonlite::get_object(root, "theorem");
  if (!theorem || jsonlite::get_string(*theorem, "id").empty()) {
    if (error) *error = "job " + job.id + " lacks theorem.id";
    return std::nullopt;
  }
  job.theorem.id = jsonlite::get_string(*theorem, "id");
  job.theorem.name = jsonlite::get_string(*theorem, "name", job.theorem.id);
  job.theorem.lean_code = jsonlite::get_string(*theorem, "lean_code");
  job.theorem.content_digest = jsonlite::get_string(*theorem, "content_digest");
  job.theorem.source_invariant_id = jsonlite::get_string(*theorem, "source_invariant_id");

  const auto pit = root.find("priority");
  if (pit != root.end()) {
    std::optional<JobPriority> priority;
    std::string shown = "of the wrong type";
    if (std::holds_alternative<std::uint64_t>(pit->second.v)) {
      const std::uint64_t n = std::get<std::uint64_t>(pit->second.v);
      shown = std::to_string(n);
      if (n <= 3) priority = priority_from_int(static_cast<std::int64_t>(n));
    } else if (std::holds_alternative<std::string>(pit->second.v)) {
      shown = "\"" + std::get<std::string>(pit->second.v) + "\"";
      priority = priority_from_string(std::get<std::string>(pit->second.v));
    }
    if (!priority) {
      if (error) *error = "job " + job.id + " has unknown priority " + shown + " (expected low, normal, high or critical)";
      return std::nullopt;
    }
    job.priority = *priority;
  }

  if (auto opts = jsonlite::get_object(root, "options")) {
    ProofOptions& o = job.options;
    o.max_attempts = clamp_u32(jsonlite::get_u64(*opts, "max_attempts", o.max_attempts));
    o.timeout_seconds = clamp_u32(jsonlite::get_u64(*opts, "timeout_seconds", o.timeout_seconds));
    o.proof_strategy = jsonlite::get_string(*opts, "proof_strategy", o.proof_strategy);
    o.confidence_threshold = jsonlite::get_double(*opts, "confidence_threshold", o.confidence_threshold);
    if (auto rl = jsonlite::get_object(*opts, "resource_limits")) {
      o.resource_limits = resource_limits_from_object(*rl, ResourceLimits{});
    }
    o.metadata = jsonlite::get_string_map(*opts, "metadata");
  }

  if (jsonlite::has_key(root, "deadline_ms")) {
    job.deadline = std::chrono::steady_clock::now() +
                   std::chrono::milliseconds(jsonlite::get_u64(root, "deadline_ms"));
  }
  return job;
}

}  // namespace proofarm
