#include "proofarm/sandbox.hpp"

// Isolated child process execution (Linux).
//
// CHILD SETUP ORDER (each step best-effort, recorded in a capability mask):
//   1. setsid()                      own process group, killable as a unit
//   2. user namespace                only when not root; maps uid/gid 1:1
//   3. net / ipc+uts / mount ns
//   4. mounts                        private propagation, writable binds,
//                                    tmpfs scratch, read-only "/" remount
//   5. rlimits
//   6. stdio, cwd
//   7. capability bounding set drop, then uid/gid drop (root only)
//   8. PR_SET_NO_NEW_PRIVS
//   9. seccomp-BPF deny filter
//  10. report mask to parent, execve
//
// Everything the child touches after fork() is prepared by the parent first:
// the child only makes raw syscalls, so it is safe to fork from a
// multithreaded process.

#include <errno.h>
#include <fcntl.h>
#include <grp.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <linux/audit.h>
#include <linux/capability.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <sys/syscall.h>

#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <thread>

namespace proofarm {

namespace {

enum CapBit : std::uint32_t {
  kCapNetNs = 1u << 0,
  kCapIpcUts = 1u << 1,
  kCapUserNs = 1u << 2,
  kCapMountNs = 1u << 3,
  kCapReadOnlyRoot = 1u << 4,
  kCapTmpfs = 1u << 5,
  kCapWritableBinds = 1u << 6,
  kCapRlimits = 1u << 7,
  kCapNoNewPrivs = 1u << 8,
  kCapSeccomp = 1u << 9,
  kCapCapsDropped = 1u << 10,
  kCapUidDrop = 1u << 11,
};

struct CapName {
  std::uint32_t bit;
  const char* name;
};

constexpr CapName kCapNames[] = {
    {kCapNetNs, "network_namespace"},
    {kCapIpcUts, "ipc_uts_namespace"},
    {kCapUserNs, "user_namespace"},
    {kCapMountNs, "mount_namespace"},
    {kCapReadOnlyRoot, "read_only_root"},
    {kCapTmpfs, "tmpfs_scratch"},
    {kCapWritableBinds, "writable_binds"},
    {kCapRlimits, "rlimits"},
    {kCapNoNewPrivs, "no_new_privs"},
    {kCapSeccomp, "seccomp_bpf"},
    {kCapCapsDropped, "capabilities_dropped"},
    {kCapUidDrop, "non_root_uid"},
};

#if defined(__x86_64__)
constexpr std::uint32_t kAuditArch = AUDIT_ARCH_X86_64;
constexpr bool kSeccompArchSupported = true;
#elif defined(__aarch64__)
constexpr std::uint32_t kAuditArch = AUDIT_ARCH_AARCH64;
constexpr bool kSeccompArchSupported = true;
#else
constexpr std::uint32_t kAuditArch = 0;
constexpr bool kSeccompArchSupported = false;
#endif

#ifndef SECCOMP_RET_KILL_PROCESS
#define SECCOMP_RET_KILL_PROCESS SECCOMP_RET_KILL
#endif

void append_limited(std::string& dst, const char* src, ssize_t n,
                    std::size_t limit, bool& truncated) {
  if (n <= 0) return;
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const std::size_t take = std::min<std::size_t>(static_cast<std::size_t>(n), avail);
  dst.append(src, take);
  if (take < static_cast<std::size_t>(n) || dst.size() >= limit) {
    truncated = true;
  }
}

sock_filter bpf_stmt(std::uint16_t code, std::uint32_t k) {
  sock_filter f{};
  f.code = code;
  f.k = k;
  return f;
}

sock_filter bpf_jump(std::uint16_t code, std::uint32_t k, std::uint8_t jt, std::uint8_t jf) {
  sock_filter f{};
  f.code = code;
  f.jt = jt;
  f.jf = jf;
  f.k = k;
  return f;
}

// Syscalls a proof build never needs and an escape attempt usually does.
std::vector<int> denied_syscalls() {
  std::vector<int> nrs;
#ifdef __NR_mount
  nrs.push_back(__NR_mount);
#endif
#ifdef __NR_umount2
  nrs.push_back(__NR_umount2);
#endif
#ifdef __NR_pivot_root
  nrs.push_back(__NR_pivot_root);
#endif
#ifdef __NR_chroot
  nrs.push_back(__NR_chroot);
#endif
#ifdef __NR_ptrace
  nrs.push_back(__NR_ptrace);
#endif
#ifdef __NR_process_vm_readv
  nrs.push_back(__NR_process_vm_readv);
#endif
#ifdef __NR_process_vm_writev
  nrs.push_back(__NR_process_vm_writev);
#endif
#ifdef __NR_kexec_load
  nrs.push_back(__NR_kexec_load);
#endif
#ifdef __NR_kexec_file_load
  nrs.push_back(__NR_kexec_file_load);
#endif
#ifdef __NR_init_module
  nrs.push_back(__NR_init_module);
#endif
#ifdef __NR_finit_module
  nrs.push_back(__NR_finit_module);
#endif
#ifdef __NR_delete_module
  nrs.push_back(__NR_delete_module);
#endif
#ifdef __NR_reboot
  nrs.push_back(__NR_reboot);
#endif
#ifdef __NR_swapon
  nrs.push_back(__NR_swapon);
#endif
#ifdef __NR_swapoff
  nrs.push_back(__NR_swapoff);
#endif
#ifdef __NR_setns
  nrs.push_back(__NR_setns);
#endif
#ifdef __NR_unshare
  nrs.push_back(__NR_unshare);
#endif
#ifdef __NR_bpf
  nrs.push_back(__NR_bpf);
#endif
#ifdef __NR_perf_event_open
  nrs.push_back(__NR_perf_event_open);
#endif
#ifdef __NR_keyctl
  nrs.push_back(__NR_keyctl);
#endif
#ifdef __NR_add_key
  nrs.push_back(__NR_add_key);
#endif
#ifdef __NR_request_key
  nrs.push_back(__NR_request_key);
#endif
#ifdef __NR_userfaultfd
  nrs.push_back(__NR_userfaultfd);
#endif
#ifdef __NR_open_by_handle_at
  nrs.push_back(__NR_open_by_handle_at);
#endif
#ifdef __NR_acct
  nrs.push_back(__NR_acct);
#endif
#ifdef __NR_settimeofday
  nrs.push_back(__NR_settimeofday);
#endif
#ifdef __NR_clock_settime
  nrs.push_back(__NR_clock_settime);
#endif
#ifdef __NR_quotactl
  nrs.push_back(__NR_quotactl);
#endif
  return nrs;
}

std::vector<sock_filter> build_deny_filter() {
  std::vector<sock_filter> f;
  f.push_back(bpf_stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch)));
  f.push_back(bpf_jump(BPF_JMP | BPF_JEQ | BPF_K, kAuditArch, 1, 0));
  f.push_back(bpf_stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
  f.push_back(bpf_stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr)));
  for (int nr : denied_syscalls()) {
    f.push_back(bpf_jump(BPF_JMP | BPF_JEQ | BPF_K, static_cast<std::uint32_t>(nr), 0, 1));
    f.push_back(bpf_stmt(BPF_RET | BPF_K, SECCOMP_RET_ERRNO | (EPERM & SECCOMP_RET_DATA)));
  }
  f.push_back(bpf_stmt(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));
  return f;
}

// Raw-syscall file write for /proc/self/{setgroups,uid_map,gid_map}.
bool write_proc_file(const char* path, const std::string& content) {
  const int fd = open(path, O_WRONLY | O_CLOEXEC);
  if (fd < 0) return false;
  const ssize_t n = write(fd, content.data(), content.size());
  close(fd);
  return n == static_cast<ssize_t>(content.size());
}

bool set_limit(int resource, std::uint64_t value) {
  struct rlimit rl;
  rl.rlim_cur = value;
  rl.rlim_max = value;
  return setrlimit(resource, &rl) == 0;
}

// Everything the child needs, built before fork().
struct ChildPlan {
  std::vector<std::string> args;
  std::vector<char*> argv;
  std::vector<std::string> envs;
  std::vector<char*> envp;
  std::string uid_map;
  std::string gid_map;
  std::vector<std::string> tmpfs_options;
  std::vector<sock_filter> filter;
  sock_fprog prog{};
  std::uint64_t cpu_seconds{0};
  bool is_root{false};
};

[[noreturn]] void run_child(const ProcessSpec& spec, ChildPlan& plan,
                            int out_fd, int err_fd, int report_fd) {
  const IsolationSpec& iso = spec.isolation;
  std::uint32_t mask = 0;
  std::uint32_t requested_rlimits_ok = 1;

  setsid();

  if (iso.enabled) {
    bool have_ns_caps = plan.is_root;
    if (!plan.is_root) {
      if (unshare(CLONE_NEWUSER) == 0) {
        write_proc_file("/proc/self/setgroups", "deny");
        if (write_proc_file("/proc/self/uid_map", plan.uid_map) &&
            write_proc_file("/proc/self/gid_map", plan.gid_map)) {
          mask |= kCapUserNs;
          have_ns_caps = true;
        }
      }
    }
    if (have_ns_caps) {
      if (iso.network && unshare(CLONE_NEWNET) == 0) mask |= kCapNetNs;
      if (iso.ipc_uts && unshare(CLONE_NEWIPC | CLONE_NEWUTS) == 0) mask |= kCapIpcUts;
      if (unshare(CLONE_NEWNS) == 0) {
        mask |= kCapMountNs;
        if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) == 0) {
          bool binds_ok = true;
          for (const auto& p : iso.writable_paths) {
            if (mount(p.c_str(), p.c_str(), nullptr, MS_BIND | MS_REC, nullptr) != 0) binds_ok = false;
          }
          if (binds_ok && !iso.writable_paths.empty()) mask |= kCapWritableBinds;

          bool tmpfs_ok = true;
          for (size_t i = 0; i < iso.tmpfs_mounts.size(); ++i) {
            if (mount("tmpfs", iso.tmpfs_mounts[i].first.c_str(), "tmpfs",
                      MS_NOSUID | MS_NODEV | MS_NOEXEC, plan.tmpfs_options[i].c_str()) != 0) {
              tmpfs_ok = false;
            }
          }
          if (tmpfs_ok && !iso.tmpfs_mounts.empty()) mask |= kCapTmpfs;

          if (iso.read_only_root &&
              mount(nullptr, "/", nullptr, MS_REMOUNT | MS_BIND | MS_RDONLY, nullptr) == 0) {
            mask |= kCapReadOnlyRoot;
          }
        }
      }
    }
  }

  if (spec.max_memory_bytes > 0 && !set_limit(RLIMIT_AS, spec.max_memory_bytes)) requested_rlimits_ok = 0;
  if (spec.max_file_descriptors > 0 && !set_limit(RLIMIT_NOFILE, spec.max_file_descriptors)) requested_rlimits_ok = 0;
  if (spec.max_processes > 0 && !set_limit(RLIMIT_NPROC, spec.max_processes)) requested_rlimits_ok = 0;
  if (spec.max_file_size_bytes > 0 && !set_limit(RLIMIT_FSIZE, spec.max_file_size_bytes)) requested_rlimits_ok = 0;
  if (plan.cpu_seconds > 0) {
    struct rlimit rl;
    rl.rlim_cur = plan.cpu_seconds;
    rl.rlim_max = plan.cpu_seconds + 1;
    if (setrlimit(RLIMIT_CPU, &rl) != 0) requested_rlimits_ok = 0;
  }
  if (requested_rlimits_ok) mask |= kCapRlimits;

  dup2(out_fd, STDOUT_FILENO);
  dup2(err_fd, STDERR_FILENO);
  const int devnull = open("/dev/null", O_RDONLY);
  if (devnull >= 0) {
    dup2(devnull, STDIN_FILENO);
    close(devnull);
  }

  if (!spec.cwd.empty() && chdir(spec.cwd.c_str()) != 0) {
    _exit(127);
  }

  if (iso.enabled) {
    if (iso.drop_capabilities) {
      bool all_dropped = true;
      for (int cap = 0; cap <= CAP_LAST_CAP; ++cap) {
        if (prctl(PR_CAPBSET_DROP, cap, 0, 0, 0) != 0 && errno != EINVAL) all_dropped = false;
      }
      // A non-root uid loses its permitted set at execve.
      if (all_dropped || !plan.is_root) mask |= kCapCapsDropped;
    }
    if (plan.is_root) {
      const gid_t g = iso.run_as_group;
      const uid_t u = iso.run_as_user;
      if (u != 0 && setgroups(0, nullptr) == 0 && setresgid(g, g, g) == 0 && setresuid(u, u, u) == 0) {
        mask |= kCapUidDrop;
      }
    } else {
      mask |= kCapUidDrop;
    }
    if (iso.no_new_privs && prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) == 0) {
      mask |= kCapNoNewPrivs;
    }
    if (iso.seccomp && kSeccompArchSupported && (mask & kCapNoNewPrivs) &&
        prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &plan.prog, 0, 0) == 0) {
      mask |= kCapSeccomp;
    }
  }

  const ssize_t wn = write(report_fd, &mask, sizeof(mask));
  (void)wn;
  execve(spec.command.c_str(), plan.argv.data(), plan.envp.data());
  _exit(127);
}

std::uint32_t read_report(int fd) {
  std::uint32_t mask = 0;
  std::size_t got = 0;
  auto* p = reinterpret_cast<char*>(&mask);
  while (got < sizeof(mask)) {
    const ssize_t n = read(fd, p + got, sizeof(mask) - got);
    if (n > 0) {
      got += static_cast<std::size_t>(n);
    } else if (n < 0 && errno == EINTR) {
      continue;
    } else {
      break;
    }
  }
  return got == sizeof(mask) ? mask : 0;
}

std::uint32_t requested_mask(const ProcessSpec& spec, bool is_root) {
  std::uint32_t m = 0;
  if (spec.max_memory_bytes || spec.max_file_descriptors || spec.max_processes ||
      spec.max_file_size_bytes || spec.timeout_ms || spec.cpu_seconds_limit) {
    m |= kCapRlimits;
  }
  const IsolationSpec& iso = spec.isolation;
  if (!iso.enabled) return m;
  if (!is_root) m |= kCapUserNs;
  if (iso.network) m |= kCapNetNs;
  if (iso.ipc_uts) m |= kCapIpcUts;
  m |= kCapMountNs;
  if (iso.read_only_root) m |= kCapReadOnlyRoot;
  if (!iso.tmpfs_mounts.empty()) m |= kCapTmpfs;
  if (!iso.writable_paths.empty()) m |= kCapWritableBinds;
  if (iso.no_new_privs) m |= kCapNoNewPrivs;
  if (iso.seccomp) m |= kCapSeccomp;
  if (iso.drop_capabilities) m |= kCapCapsDropped;
  m |= kCapUidDrop;
  return m;
}

}  // namespace

void ProcessHandle::request_kill() {
  kill_requested_.store(true, std::memory_order_release);
  const int pid = pid_.load(std::memory_order_acquire);
  if (pid > 0) {
    kill(-pid, SIGKILL);
    kill(pid, SIGKILL);
  }
}

std::string resolve_executable(const std::string& name) {
  if (name.empty()) return {};
  if (name.find('/') != std::string::npos) {
    return access(name.c_str(), X_OK) == 0 ? name : std::string{};
  }
  const char* path_env = std::getenv("PATH");
  const std::string path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
  size_t start = 0;
  while (start <= path.size()) {
    const size_t end = path.find(':', start);
    const std::string dir = path.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (!dir.empty()) {
      const std::string candidate = dir + "/" + name;
      if (access(candidate.c_str(), X_OK) == 0) return candidate;
    }
    if (end == std::string::npos) break;
    start = end + 1;
  }
  return {};
}

bool set_no_new_privs(std::string* error) {
  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
    if (error) *error = std::string("prctl(PR_SET_NO_NEW_PRIVS) failed: ") + std::strerror(errno);
    return false;
  }
  return true;
}

ProcessResult run_process(const ProcessSpec& spec, ProcessHandle* handle) {
  ProcessResult result;
  const auto started = std::chrono::steady_clock::now();

  if (spec.command.empty() || access(spec.command.c_str(), X_OK) != 0) {
    result.exit_code = 127;
    result.error_message = "spawn_failed: not executable: " + spec.command;
    return result;
  }
  if (handle && handle->kill_requested()) {
    result.exit_code = 137;
    result.killed = true;
    result.error_message = "spawn_refused: stop already requested";
    return result;
  }

  ChildPlan plan;
  plan.is_root = (geteuid() == 0);
  plan.args.push_back(spec.command);
  plan.args.insert(plan.args.end(), spec.argv.begin(), spec.argv.end());
  for (auto& s : plan.args) plan.argv.push_back(s.data());
  plan.argv.push_back(nullptr);
  for (const auto& [k, v] : spec.env) plan.envs.push_back(k + "=" + v);
  for (auto& e : plan.envs) plan.envp.push_back(e.data());
  plan.envp.push_back(nullptr);
  plan.uid_map = std::to_string(geteuid()) + " " + std::to_string(geteuid()) + " 1\n";
  plan.gid_map = std::to_string(getegid()) + " " + std::to_string(getegid()) + " 1\n";
  for (const auto& [path, size] : spec.isolation.tmpfs_mounts) {
    (void)path;
    plan.tmpfs_options.push_back("size=" + std::to_string(size) + ",mode=1777");
  }
  plan.filter = build_deny_filter();
  plan.prog.len = static_cast<unsigned short>(plan.filter.size());
  plan.prog.filter = plan.filter.data();
  plan.cpu_seconds = spec.cpu_seconds_limit > 0 ? spec.cpu_seconds_limit
                                                : (spec.timeout_ms + 999) / 1000;

  int out_pipe[2];
  int err_pipe[2];
  int report_pipe[2];
  if (pipe2(out_pipe, O_CLOEXEC) != 0) {
    result.exit_code = 127;
    result.error_message = "spawn_failed: pipe";
    return result;
  }
  if (pipe2(err_pipe, O_CLOEXEC) != 0) {
    close(out_pipe[0]);
    close(out_pipe[1]);
    result.exit_code = 127;
    result.error_message = "spawn_failed: pipe";
    return result;
  }
  if (pipe2(report_pipe, O_CLOEXEC) != 0) {
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);
    result.exit_code = 127;
    result.error_message = "spawn_failed: pipe";
    return result;
  }

  const pid_t pid = fork();
  if (pid < 0) {
    for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1], report_pipe[0], report_pipe[1]}) close(fd);
    result.exit_code = 127;
    result.error_message = "spawn_failed: fork";
    return result;
  }

  if (pid == 0) {
    close(out_pipe[0]);
    close(err_pipe[0]);
    close(report_pipe[0]);
    run_child(spec, plan, out_pipe[1], err_pipe[1], report_pipe[1]);
  }

  close(out_pipe[1]);
  close(err_pipe[1]);
  close(report_pipe[1]);
  if (handle) {
    handle->pid_.store(pid, std::memory_order_release);
    if (handle->kill_requested()) {
      kill(pid, SIGKILL);
    }
  }

  const std::uint32_t applied = read_report(report_pipe[0]);
  close(report_pipe[0]);

  fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
  fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

  const auto deadline = started + std::chrono::milliseconds(spec.timeout_ms);
  char buf[4096];
  while (true) {
    ssize_t n = read(out_pipe[0], buf, sizeof(buf));
    append_limited(result.stdout_text, buf, n, spec.max_output_bytes, result.stdout_truncated);
    n = read(err_pipe[0], buf, sizeof(buf));
    append_limited(result.stderr_text, buf, n, spec.max_output_bytes, result.stderr_truncated);

    // WNOWAIT: the pid stays reserved until the handle has forgotten it, so
    // a concurrent request_kill() can never signal a recycled pid.
    siginfo_t info{};
    if (waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) == 0 && info.si_pid == pid) {
      break;
    }
    if (handle && handle->kill_requested() && !result.killed) {
      kill(-pid, SIGKILL);
      kill(pid, SIGKILL);
      result.killed = true;
    }
    if (spec.timeout_ms > 0 && std::chrono::steady_clock::now() >= deadline && !result.timed_out) {
      kill(-pid, SIGKILL);
      kill(pid, SIGKILL);
      result.timed_out = true;
    }
    struct pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
    poll(fds, 2, 5);
  }

  if (handle) handle->pid_.store(0, std::memory_order_release);
  // Reap stragglers left in the group before collecting the leader.
  kill(-pid, SIGKILL);

  int status = 0;
  struct rusage ru{};
  while (wait4(pid, &status, 0, &ru) < 0 && errno == EINTR) {
  }

  while (true) {
    const ssize_t n = read(out_pipe[0], buf, sizeof(buf));
    if (n <= 0) break;
    append_limited(result.stdout_text, buf, n, spec.max_output_bytes, result.stdout_truncated);
  }
  while (true) {
    const ssize_t n = read(err_pipe[0], buf, sizeof(buf));
    if (n <= 0) break;
    append_limited(result.stderr_text, buf, n, spec.max_output_bytes, result.stderr_truncated);
  }
  close(out_pipe[0]);
  close(err_pipe[0]);

  if (result.stdout_truncated) result.stdout_text += "(truncated)";
  if (result.stderr_truncated) result.stderr_text += "(truncated)";

  result.duration_ms = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count());
  result.usage.cpu_seconds =
      static_cast<double>(ru.ru_utime.tv_sec + ru.ru_stime.tv_sec) +
      static_cast<double>(ru.ru_utime.tv_usec + ru.ru_stime.tv_usec) / 1e6;
  result.usage.memory_bytes = static_cast<std::uint64_t>(ru.ru_maxrss) * 1024u;

  const std::uint32_t requested = requested_mask(spec, geteuid() == 0);
  for (const auto& c : kCapNames) {
    if (!(requested & c.bit)) continue;
    if (applied & c.bit) {
      result.enforced_capabilities.push_back(c.name);
    } else {
      result.failed_capabilities.push_back(c.name);
    }
  }

  if (result.timed_out) {
    result.exit_code = 124;
  } else if (result.killed) {
    result.exit_code = 137;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

}  // namespace proofarm
