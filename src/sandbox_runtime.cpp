#include "proofarm/sandbox.hpp"

#include <unistd.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <random>

#include "proofarm/hash.hpp"
#include "proofarm/log.hpp"

namespace fs = std::filesystem;

namespace proofarm {

namespace {

std::string make_sandbox_id(std::uint64_t seq) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  const std::string seed = std::to_string(seq) + ":" + std::to_string(getpid()) + ":" +
                           std::to_string(rng()) + ":" +
                           std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
  return "pf-" + blake3_hex(seed).substr(0, 16);
}

bool has_path_prefix(const std::string& path, const std::string& prefix) {
  if (prefix.empty() || path.compare(0, prefix.size(), prefix) != 0) return false;
  return path.size() == prefix.size() || path[prefix.size()] == '/' || prefix.back() == '/';
}

std::uint64_t directory_bytes(const fs::path& root) {
  std::uint64_t total = 0;
  std::error_code ec;
  for (fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec), end;
       !ec && it != end; it.increment(ec)) {
    std::error_code fec;
    if (it->is_regular_file(fec) && !fec) {
      const auto sz = it->file_size(fec);
      if (!fec) total += sz;
    }
  }
  return total;
}

bool copy_tree(const fs::path& from, const fs::path& to, std::string* error) {
  std::error_code ec;
  if (!fs::exists(from, ec)) {
    if (error) *error = "source does not exist: " + from.string();
    return false;
  }
  if (fs::is_directory(from, ec)) {
    fs::create_directories(to, ec);
    if (ec) {
      if (error) *error = "create " + to.string() + ": " + ec.message();
      return false;
    }
    fs::copy(from, to, fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
  } else {
    fs::create_directories(to.parent_path(), ec);
    if (ec) {
      if (error) *error = "create " + to.parent_path().string() + ": " + ec.message();
      return false;
    }
    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  }
  if (ec) {
    if (error) *error = "copy " + from.string() + " -> " + to.string() + ": " + ec.message();
    return false;
  }
  return true;
}

// Hands the tree to the sandbox uid so a dropped-privilege child can write.
void chown_tree(const fs::path& root, std::uint32_t uid, std::uint32_t gid) {
  if (geteuid() != 0) return;
  std::error_code ec;
  if (lchown(root.c_str(), uid, gid) != 0) return;
  for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
    if (lchown(it->path().c_str(), uid, gid) != 0) {
      log_debug("sandbox", "lchown failed: " + it->path().string());
    }
  }
}

}  // namespace

NamespaceSandboxRuntime::NamespaceSandboxRuntime(NamespaceSandboxOptions options)
    : options_(std::move(options)) {}

NamespaceSandboxRuntime::~NamespaceSandboxRuntime() {
  std::vector<std::string> ids;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [id, sb] : sandboxes_) ids.push_back(id);
  }
  for (const auto& id : ids) {
    std::string err;
    if (!remove(id, &err)) {
      log_warn("sandbox", "teardown of " + id + " failed: " + err);
    }
  }
}

std::string NamespaceSandboxRuntime::map_path(const Sandbox& sb, const std::string& sandbox_path) const {
  fs::path rel = fs::path(sandbox_path).relative_path();
  return (fs::path(sb.root) / "fs" / rel).lexically_normal().string();
}

std::vector<std::string> NamespaceSandboxRuntime::sandbox_prefixes(const Sandbox& sb) const {
  std::vector<std::string> prefixes = {options_.scratch_path, options_.tmp_path};
  for (const auto& m : sb.mounts) prefixes.push_back(m.sandbox_path);
  return prefixes;
}

std::string NamespaceSandboxRuntime::host_path_for(const std::string& id, const std::string& sandbox_path) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = sandboxes_.find(id);
  if (it == sandboxes_.end()) return {};
  return map_path(*it->second, sandbox_path);
}

size_t NamespaceSandboxRuntime::live_sandboxes() const {
  std::lock_guard<std::mutex> lk(mu_);
  return sandboxes_.size();
}

std::string NamespaceSandboxRuntime::create(const std::string& image, const ResourceLimits& limits,
                                            const std::vector<SandboxMount>& mounts, std::string* error) {
  auto sb = std::make_shared<Sandbox>();
  {
    std::lock_guard<std::mutex> lk(mu_);
    sb->id = make_sandbox_id(next_id_++);
  }
  sb->image = image;
  sb->limits = limits;
  sb->mounts = mounts;
  sb->root = (fs::path(options_.work_root) / sb->id).string();

  std::error_code ec;
  fs::create_directories(fs::path(map_path(*sb, options_.scratch_path)), ec);
  if (!ec) fs::create_directories(fs::path(map_path(*sb, options_.tmp_path)), ec);
  if (ec) {
    if (error) *error = "cannot create sandbox root " + sb->root + ": " + ec.message();
    fs::remove_all(sb->root, ec);
    return {};
  }

  for (const auto& m : mounts) {
    std::string copy_err;
    if (!copy_tree(m.host_path, map_path(*sb, m.sandbox_path), &copy_err)) {
      if (error) *error = "mount " + m.sandbox_path + ": " + copy_err;
      fs::remove_all(sb->root, ec);
      return {};
    }
  }
  chown_tree(fs::path(sb->root) / "fs", options_.run_as_user, options_.run_as_group);

  {
    std::lock_guard<std::mutex> lk(mu_);
    sandboxes_[sb->id] = sb;
  }
  log_debug("sandbox", "created " + sb->id + " image=" + image + " root=" + sb->root);
  return sb->id;
}

ExecResult NamespaceSandboxRuntime::exec(const std::string& id, const std::vector<std::string>& command,
                                         std::chrono::milliseconds timeout) {
  std::shared_ptr<Sandbox> sb;
  auto handle = std::make_shared<ProcessHandle>();
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sandboxes_.find(id);
    if (it != sandboxes_.end()) {
      sb = it->second;
      if (!sb->stopped) sb->active = handle;
    }
  }
  ExecResult refused;
  if (!sb) {
    refused.exit_code = 127;
    refused.error_message = "unknown sandbox: " + id;
    return refused;
  }
  if (command.empty()) {
    refused.exit_code = 127;
    refused.error_message = "empty command";
    return refused;
  }
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (sb->stopped) {
      refused.exit_code = 137;
      refused.killed = true;
      refused.error_message = "sandbox stopped: " + id;
      return refused;
    }
  }

  const auto prefixes = sandbox_prefixes(*sb);
  auto translate = [&](const std::string& arg) {
    for (const auto& p : prefixes) {
      if (has_path_prefix(arg, p)) return map_path(*sb, arg);
    }
    return arg;
  };

  ProcessSpec spec;
  spec.command = resolve_executable(translate(command.front()));
  for (size_t i = 1; i < command.size(); ++i) spec.argv.push_back(translate(command[i]));
  spec.cwd = map_path(*sb, options_.workdir);
  std::error_code ec;
  if (!fs::is_directory(spec.cwd, ec)) spec.cwd = map_path(*sb, options_.scratch_path);

  spec.env = options_.env;
  if (!spec.env.contains("PATH")) {
    const char* path = std::getenv("PATH");
    spec.env["PATH"] = path ? path : "/usr/local/bin:/usr/bin:/bin";
  }
  spec.env["HOME"] = map_path(*sb, options_.scratch_path);
  spec.env["TMPDIR"] = map_path(*sb, options_.tmp_path);
  spec.env["PROOFARM_SANDBOX_ID"] = sb->id;
  spec.env["PROOFARM_SANDBOX_IMAGE"] = sb->image;

  spec.timeout_ms = static_cast<std::uint64_t>(timeout.count());
  spec.max_memory_bytes = sb->limits.memory_bytes;
  spec.max_file_descriptors = sb->limits.file_descriptor_limit;
  spec.max_processes = sb->limits.process_limit;
  spec.max_file_size_bytes = std::min(sb->limits.disk_bytes, options_.scratch_size_bytes);
  const double cores = sb->limits.cpu_cores > 0.0 ? sb->limits.cpu_cores : 1.0;
  spec.cpu_seconds_limit = static_cast<std::uint64_t>(
      static_cast<double>((spec.timeout_ms + 999) / 1000) * cores) + 1;

  spec.isolation.enabled = true;
  spec.isolation.network = options_.network_isolation;
  spec.isolation.read_only_root = options_.read_only_root;
  spec.isolation.writable_paths = {map_path(*sb, options_.scratch_path)};
  spec.isolation.tmpfs_mounts = {{map_path(*sb, options_.tmp_path), options_.tmp_size_bytes}};
  spec.isolation.run_as_user = options_.run_as_user;
  spec.isolation.run_as_group = options_.run_as_group;

  if (spec.command.empty()) {
    ExecResult missing;
    missing.exit_code = 127;
    missing.error_message = "command not found: " + command.front();
    return missing;
  }

  ExecResult r = run_process(spec, handle.get());
  r.usage.disk_bytes = directory_bytes(fs::path(sb->root) / "fs");
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (sb->active == handle) sb->active.reset();
  }
  if (!r.failed_capabilities.empty()) {
    std::string failed;
    for (const auto& c : r.failed_capabilities) failed += (failed.empty() ? "" : ",") + c;
    log_debug("sandbox", id + " isolation not applied: " + failed);
  }
  return r;
}

bool NamespaceSandboxRuntime::copy_into(const std::string& id, const std::string& host_path,
                                        const std::string& dest, std::string* error) {
  std::shared_ptr<Sandbox> sb;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sandboxes_.find(id);
    if (it != sandboxes_.end()) sb = it->second;
  }
  if (!sb) {
    if (error) *error = "unknown sandbox: " + id;
    return false;
  }
  const fs::path target = map_path(*sb, dest);
  if (!copy_tree(host_path, target, error)) return false;
  chown_tree(target, options_.run_as_user, options_.run_as_group);
  return true;
}

bool NamespaceSandboxRuntime::stop(const std::string& id, std::string* error) {
  std::shared_ptr<ProcessHandle> active;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sandboxes_.find(id);
    if (it == sandboxes_.end()) {
      if (error) *error = "unknown sandbox: " + id;
      return false;
    }
    it->second->stopped = true;
    active = it->second->active;
  }
  if (active) active->request_kill();
  log_debug("sandbox", "stopped " + id);
  return true;
}

bool NamespaceSandboxRuntime::remove(const std::string& id, std::string* error) {
  std::shared_ptr<Sandbox> sb;
  std::shared_ptr<ProcessHandle> active;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sandboxes_.find(id);
    if (it == sandboxes_.end()) {
      if (error) *error = "unknown sandbox: " + id;
      return false;
    }
    sb = it->second;
    sb->stopped = true;
    active = sb->active;
    sandboxes_.erase(it);
  }
  if (active) active->request_kill();
  std::error_code ec;
  fs::remove_all(sb->root, ec);
  if (ec) {
    if (error) *error = "remove " + sb->root + ": " + ec.message();
    return false;
  }
  log_debug("sandbox", "removed " + id);
  return true;
}

}  // namespace proofarm
