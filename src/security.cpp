#include "proofarm/security.hpp"

#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "proofarm/jsonlite.hpp"
#include "proofarm/log.hpp"
#include "proofarm/sandbox.hpp"

namespace proofarm {

namespace {

std::string read_text(const char* path) {
  std::ifstream ifs(path);
  if (!ifs) return {};
  std::ostringstream ss;
  ss << ifs.rdbuf();
  return ss.str();
}

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

std::string lower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

std::uint32_t clamp_u32(unsigned long long v) {
  return v > 0xffffffffull ? 0xffffffffu : static_cast<std::uint32_t>(v);
}

constexpr std::uint64_t kCapSysAdminBit = 1ull << 21;

std::string read_link(const char* path) {
  std::error_code ec;
  const auto target = std::filesystem::read_symlink(path, ec);
  return ec ? std::string() : target.string();
}

std::string hex_mask(std::uint64_t v) {
  std::ostringstream ss;
  ss << "0x" << std::hex << v;
  return ss.str();
}

}  // namespace

RuntimeInfo parse_proc_status(const std::string& status_text, RuntimeInfo base) {
  std::istringstream in(status_text);
  std::string line;
  while (std::getline(in, line)) {
    const auto colon = line.find(':');
    if (colon == std::string::npos) continue;
    const std::string key = line.substr(0, colon);
    const std::string val = trim(line.substr(colon + 1));
    if (key == "Seccomp") {
      base.seccomp_available = true;
      base.seccomp_mode = std::atoi(val.c_str());
    } else if (key == "CapEff") {
      base.effective_capabilities = std::strtoull(val.c_str(), nullptr, 16);
    } else if (key == "CapBnd") {
      base.bounding_sys_admin = (std::strtoull(val.c_str(), nullptr, 16) & kCapSysAdminBit) != 0;
    } else if (key == "NoNewPrivs") {
      base.no_new_privs = (val == "1");
    }
  }
  return base;
}

RuntimeInfo detect_runtime_info() {
  RuntimeInfo info;
  info.is_rootless = (geteuid() != 0);
  info = parse_proc_status(read_text("/proc/self/status"), info);
  const std::string own_net = read_link("/proc/self/ns/net");
  const std::string init_net = read_link("/proc/1/ns/net");
  info.network_isolated = !own_net.empty() && !init_net.empty() && own_net != init_net;

  if (const char* forced = std::getenv("PROOFARM_ISOLATION_RUNTIME"); forced && *forced) {
    info.isolation_runtime = lower(forced);
  } else if (std::getenv("RUNSC_ROOT_DIR") != nullptr ||
             read_text("/proc/version").find("gVisor") != std::string::npos) {
    info.isolation_runtime = "gvisor";
  } else {
    info.isolation_runtime = "native";
  }
  return info;
}

std::string runtime_info_to_json(const RuntimeInfo& info) {
  jsonlite::Object o;
  o["isolation_runtime"] = info.isolation_runtime;
  o["is_rootless"] = info.is_rootless;
  o["seccomp_mode"] = info.seccomp_mode < 0 ? jsonlite::Value(nullptr)
                                            : jsonlite::Value(static_cast<std::uint64_t>(info.seccomp_mode));
  o["seccomp_available"] = info.seccomp_available;
  o["effective_capabilities"] = static_cast<std::uint64_t>(info.effective_capabilities);
  o["no_new_privs"] = info.no_new_privs;
  o["bounding_sys_admin"] = info.bounding_sys_admin;
  o["network_isolated"] = info.network_isolated;
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// Scanning
// ---------------------------------------------------------------------------

std::optional<ScanReport> parse_scan_report(const std::string& json, std::string* error) {
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(json, &err);
  if (err) {
    if (error) *error = "scanner output is not JSON: " + err->message;
    return std::nullopt;
  }
  if (!jsonlite::has_key(obj, "critical") || !jsonlite::has_key(obj, "high")) {
    if (error) *error = "scanner output lacks critical/high counts";
    return std::nullopt;
  }
  ScanReport r;
  r.critical = clamp_u32(jsonlite::get_u64(obj, "critical"));
  r.high = clamp_u32(jsonlite::get_u64(obj, "high"));
  r.medium = clamp_u32(jsonlite::get_u64(obj, "medium"));
  r.low = clamp_u32(jsonlite::get_u64(obj, "low"));
  return r;
}

std::optional<ScanReport> CommandVulnerabilityScanner::scan(std::chrono::seconds timeout, std::string* error) {
  if (command_.empty()) {
    if (error) *error = "no scanner command configured";
    return std::nullopt;
  }
  ProcessSpec spec;
  spec.command = resolve_executable(command_.front());
  if (spec.command.empty()) {
    if (error) *error = "scanner not found: " + command_.front();
    return std::nullopt;
  }
  spec.argv.assign(command_.begin() + 1, command_.end());
  spec.timeout_ms = static_cast<std::uint64_t>(timeout.count()) * 1000;
  const char* path = std::getenv("PATH");
  spec.env["PATH"] = path ? path : "/usr/local/bin:/usr/bin:/bin";

  const ProcessResult pr = run_process(spec);
  if (pr.timed_out) {
    if (error) *error = "Security scan timed out";
    return std::nullopt;
  }
  if (!pr.error_message.empty()) {
    if (error) *error = pr.error_message;
    return std::nullopt;
  }
  if (pr.exit_code != 0) {
    if (error) *error = "scanner exited with code " + std::to_string(pr.exit_code);
    return std::nullopt;
  }
  auto report = parse_scan_report(pr.stdout_text, error);
  if (report) report->duration_ms = pr.duration_ms;
  return report;
}

// ---------------------------------------------------------------------------
// SecurityValidator
// ---------------------------------------------------------------------------

std::string security_validation_to_json(const SecurityValidationResult& result) {
  jsonlite::Object o;
  o["ok"] = result.ok;
  o["error_code"] = to_string(result.code);
  o["check"] = result.check;
  o["message"] = result.message;
  if (result.scan) {
    jsonlite::Object s;
    s["critical"] = static_cast<std::uint64_t>(result.scan->critical);
    s["high"] = static_cast<std::uint64_t>(result.scan->high);
    s["medium"] = static_cast<std::uint64_t>(result.scan->medium);
    s["low"] = static_cast<std::uint64_t>(result.scan->low);
    s["duration_ms"] = static_cast<std::uint64_t>(result.scan->duration_ms);
    o["scan"] = std::move(s);
  } else {
    o["scan"] = nullptr;
  }
  return jsonlite::to_json(o);
}

SecurityValidator::SecurityValidator(SecurityConfig config, RuntimeInfo runtime,
                                     std::shared_ptr<IVulnerabilityScanner> scanner)
    : config_(std::move(config)), runtime_(std::move(runtime)), scanner_(std::move(scanner)) {}

std::optional<std::string> SecurityValidator::check_runtime() const {
  const std::string required = lower(config_.required_isolation_runtime);
  if (required != "none" && !required.empty() && runtime_.isolation_runtime != required) {
    if (required == "gvisor") return std::string("gVisor runtime is required but not detected");
    return required + " runtime is required but not detected (found " + runtime_.isolation_runtime + ")";
  }
  if (config_.run_as_non_root && !runtime_.is_rootless) {
    return std::string("Rootless execution is required but not detected");
  }
  const bool filtered = runtime_.seccomp_mode == 2;
  const bool can_filter = runtime_.seccomp_available && lower(config_.seccomp_profile) != "unconfined";
  if (!filtered && !can_filter) {
    return std::string("Seccomp profile is required but not enabled");
  }
  return std::nullopt;
}

std::optional<std::string> SecurityValidator::check_config() const {
  if (config_.run_as_user == 0) return std::string("Cannot run as root user (UID 0)");
  if (!config_.drop_all_capabilities) return std::string("All capabilities must be dropped for security");
  if (runtime_.effective_capabilities != 0) {
    return "All capabilities must be dropped for security (effective set " +
           hex_mask(runtime_.effective_capabilities) + ")";
  }
  if (config_.allow_privilege_escalation) return std::string("Privilege escalation must be disabled");
  if (!runtime_.no_new_privs) return std::string("Privilege escalation must be disabled (NoNewPrivs is not set)");
  if (config_.privileged) return std::string("Privileged mode must be disabled");
  return std::nullopt;
}

std::optional<std::string> SecurityValidator::check_resource_limits() const {
  const ResourceLimits& l = config_.resource_limits;
  if (!(l.cpu_cores > 0.0)) return std::string("CPU limit must be greater than 0");
  if (l.memory_bytes == 0) return std::string("Memory limit must be greater than 0");
  if (l.disk_bytes == 0) return std::string("Disk limit must be greater than 0");
  if (l.network_bytes_per_second == 0) return std::string("Network limit must be greater than 0");
  if (l.process_limit == 0) return std::string("Process limit must be greater than 0");
  if (l.file_descriptor_limit == 0) return std::string("File descriptor limit must be greater than 0");
  return std::nullopt;
}

SecurityValidationResult SecurityValidator::validate() const {
  SecurityValidationResult r;
  auto fail = [&](const char* check, const std::string& message) {
    r.ok = false;
    r.code = ErrorCode::security_validation_failed;
    r.check = check;
    r.message = message;
    log_error("security", std::string(check) + ": " + message);
    return r;
  };

  log_info("security", "validating security environment (runtime=" + runtime_.isolation_runtime + ")");
  if (auto m = check_runtime()) return fail("runtime", *m);
  if (auto m = check_config()) return fail("config", *m);
  if (runtime_.bounding_sys_admin) {
    log_warn("security", "bounding set of the farm process holds CAP_SYS_ADMIN; sandboxes drop it per command");
  }
  if (config_.network_isolation && !runtime_.network_isolated) {
    log_debug("security", "farm process shares the host network namespace; sandboxes unshare their own");
  }
  if (auto m = check_resource_limits()) return fail("resource_limits", *m);

  const VulnerabilityScanConfig& sc = config_.scanning;
  if (sc.enabled) {
    if (!scanner_) {
      return fail("vulnerability_scan", "vulnerability scanning is enabled but no scanner is configured");
    }
    std::string err;
    const auto report = scanner_->scan(std::chrono::seconds(sc.timeout_seconds), &err);
    if (!report) return fail("vulnerability_scan", "Security scan failed: " + err);
    r.scan = report;
    if (report->critical > sc.max_critical) {
      return fail("vulnerability_scan", "Too many critical vulnerabilities: " + std::to_string(report->critical) +
                                            " (max: " + std::to_string(sc.max_critical) + ")");
    }
    if (report->high > sc.max_high) {
      return fail("vulnerability_scan", "Too many high vulnerabilities: " + std::to_string(report->high) +
                                            " (max: " + std::to_string(sc.max_high) + ")");
    }
    log_info("security", "scan passed: " + std::to_string(report->critical) + " critical, " +
                             std::to_string(report->high) + " high");
  }

  r.ok = true;
  r.code = ErrorCode::none;
  log_info("security", "security validation passed");
  return r;
}

}  // namespace proofarm
