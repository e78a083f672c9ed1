#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "proofarm/config.hpp"
#include "proofarm/farm.hpp"
#include "proofarm/log.hpp"
#include "proofarm/security.hpp"
#include "proofarm/version.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitJobsFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitSecurity = 3;
constexpr int kExitConfig = 4;

std::atomic<bool> g_stop_requested{false};

void handle_stop_signal(int) { g_stop_requested.store(true); }

void install_signal_handlers() {
  struct sigaction sa {};
  sa.sa_handler = handle_stop_signal;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

std::optional<std::string> read_file(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

void usage() {
  std::cerr << "usage:\n"
            << "  proofarm version\n"
            << "  proofarm config check [--config FILE]\n"
            << "  proofarm validate [--config FILE]\n"
            << "  proofarm run [--config FILE] [--timeout-ms N] JOB.json...\n";
}

struct Args {
  std::string config_path;
  std::uint64_t timeout_ms{0};   // 0 = wait until every job is collected
  std::vector<std::string> positional;
  bool ok{true};
};

Args parse_args(int argc, char** argv, int first) {
  Args a;
  for (int i = first; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      a.config_path = argv[++i];
    } else if (arg == "--timeout-ms" && i + 1 < argc) {
      a.timeout_ms = std::strtoull(argv[++i], nullptr, 10);
    } else if (arg == "--log-level" && i + 1 < argc) {
      proofarm::set_log_level(proofarm::log_level_from_string(argv[++i]));
    } else if (arg.rfind("--", 0) == 0) {
      std::cerr << "unknown option: " << arg << "\n";
      a.ok = false;
    } else {
      a.positional.push_back(arg);
    }
  }
  return a;
}

std::optional<proofarm::FarmConfig> load_config(const Args& a) {
  if (a.config_path.empty()) {
    proofarm::FarmConfig c;
    proofarm::apply_env_overrides(c);
    return c;
  }
  std::string err;
  auto c = proofarm::load_farm_config(a.config_path, &err);
  if (!c) {
    std::cout << "{\"ok\":false,\"error\":\"" << proofarm::jsonlite::escape(err) << "\"}\n";
  }
  return c;
}

std::shared_ptr<proofarm::IVulnerabilityScanner> make_scanner(const proofarm::FarmConfig& c) {
  if (c.security.scanning.command.empty()) return nullptr;
  return std::make_shared<proofarm::CommandVulnerabilityScanner>(c.security.scanning.command);
}

int cmd_config_check(const Args& a) {
  auto c = load_config(a);
  if (!c) return kExitConfig;
  const auto v = proofarm::validate_farm_config(*c);
  std::cout << "{\"config\":" << proofarm::farm_config_to_json(*c)
            << ",\"validation\":" << proofarm::config_validation_to_json(v) << "}\n";
  return v.ok ? kExitOk : kExitConfig;
}

int cmd_validate(const Args& a) {
  auto c = load_config(a);
  if (!c) return kExitConfig;
  if (!c->security.allow_privilege_escalation) {
    std::string nnp_err;
    if (!proofarm::set_no_new_privs(&nnp_err)) proofarm::log_warn("cli", nnp_err);
  }
  const auto info = proofarm::detect_runtime_info();
  proofarm::SecurityValidator validator(c->security, info, make_scanner(*c));
  const auto r = validator.validate();
  std::cout << "{\"runtime\":" << proofarm::runtime_info_to_json(info)
            << ",\"security\":" << proofarm::security_validation_to_json(r) << "}\n";
  return r.ok ? kExitOk : kExitSecurity;
}

int cmd_run(const Args& a) {
  if (a.positional.empty()) {
    usage();
    return kExitUsage;
  }
  auto c = load_config(a);
  if (!c) return kExitConfig;

  std::vector<proofarm::Job> jobs;
  for (const auto& path : a.positional) {
    const auto text = read_file(path);
    if (!text) {
      std::cerr << "cannot read job file: " << path << "\n";
      return kExitUsage;
    }
    std::string err;
    auto job = proofarm::job_from_json(*text, &err);
    if (!job) {
      std::cerr << path << ": " << err << "\n";
      return kExitUsage;
    }
    jobs.push_back(std::move(*job));
  }

  install_signal_handlers();
  proofarm::Farm farm(*c, proofarm::FarmDependencies{});
  const auto v = farm.start();
  if (!v.ok) {
    std::cout << "{\"started\":false,\"security\":" << proofarm::security_validation_to_json(v) << "}\n";
    return v.code == proofarm::ErrorCode::config_invalid ? kExitConfig : kExitSecurity;
  }

  std::uint64_t accepted = 0;
  for (auto& job : jobs) {
    if (farm.submit(std::move(job)) == proofarm::ErrorCode::none) ++accepted;
  }

  const auto started = std::chrono::steady_clock::now();
  while (!g_stop_requested.load()) {
    if (farm.wait_for_results(accepted, std::chrono::milliseconds(100))) break;
    if (a.timeout_ms > 0 &&
        std::chrono::steady_clock::now() - started > std::chrono::milliseconds(a.timeout_ms)) {
      proofarm::log_warn("cli", "timed out waiting for results");
      break;
    }
  }
  if (g_stop_requested.load()) proofarm::log_info("cli", "stop signal received, shutting down");
  farm.stop();

  std::cout << farm.health_to_json() << "\n";
  const auto& stats = farm.stats();
  const bool all_ok = accepted == jobs.size() && stats.successful_jobs.load() == jobs.size();
  return all_ok ? kExitOk : kExitJobsFailed;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    usage();
    return kExitUsage;
  }
  const std::string cmd = argv[1];

  if (cmd == "version" || cmd == "--version") {
    std::cout << proofarm::version::manifest_to_json(proofarm::version::current_manifest()) << "\n";
    return kExitOk;
  }
  if (cmd == "config") {
    if (argc < 3 || std::string(argv[2]) != "check") {
      usage();
      return kExitUsage;
    }
    const Args a = parse_args(argc, argv, 3);
    if (!a.ok) return kExitUsage;
    return cmd_config_check(a);
  }
  if (cmd == "validate") {
    const Args a = parse_args(argc, argv, 2);
    if (!a.ok) return kExitUsage;
    return cmd_validate(a);
  }
  if (cmd == "run") {
    const Args a = parse_args(argc, argv, 2);
    if (!a.ok) return kExitUsage;
    return cmd_run(a);
  }

  usage();
  return kExitUsage;
}
