#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "proofarm/artifact_store.hpp"
#include "proofarm/channel.hpp"
#include "proofarm/config.hpp"
#include "proofarm/executor.hpp"
#include "proofarm/farm.hpp"
#include "proofarm/hash.hpp"
#include "proofarm/job_queue.hpp"
#include "proofarm/jsonlite.hpp"
#include "proofarm/log.hpp"
#include "proofarm/observability.hpp"
#include "proofarm/result_collector.hpp"
#include "proofarm/sandbox.hpp"
#include "proofarm/security.hpp"
#include "proofarm/version.hpp"
#include "proofarm/worker_pool.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

fs::path make_temp_dir(const std::string& tag) {
  static std::mt19937_64 rng(std::random_device{}());
  const fs::path p = fs::temp_directory_path() / ("proofarm_" + tag + "_" + std::to_string(rng() % 1000000007ull));
  fs::remove_all(p);
  fs::create_directories(p);
  return p;
}

long long elapsed_ms(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - since).count();
}

// ---------------------------------------------------------------------------
// Fakes
// ---------------------------------------------------------------------------

class FakeSandboxRuntime : public proofarm::SandboxRuntime {
 public:
  int build_exit_code{0};
  std::string build_stderr;
  int proof_exit_code{0};
  std::string proof_stdout{"proof checked\n"};
  bool proof_blocks{false};
  bool fail_create{false};
  bool fail_copy{false};
  std::chrono::milliseconds create_delay{0};
  std::chrono::milliseconds copy_delay{0};

  std::string create(const std::string& image, const proofarm::ResourceLimits& limits,
                     const std::vector<proofarm::SandboxMount>& mounts, std::string* error) override {
    (void)image;
    (void)mounts;
    std::this_thread::sleep_for(create_delay);
    std::lock_guard<std::mutex> lk(mu_);
    if (fail_create) {
      if (error) *error = "no capacity";
      return {};
    }
    ++creates_;
    last_limits_ = limits;
    return "fake-" + std::to_string(creates_);
  }

  proofarm::ExecResult exec(const std::string& id, const std::vector<std::string>& command,
                            std::chrono::milliseconds timeout) override {
    (void)timeout;
    proofarm::ExecResult r;
    const std::string tool = command.empty() ? "" : command.front();
    {
      std::lock_guard<std::mutex> lk(mu_);
      exec_tools_.push_back(tool);
      if (tool == "lean") last_proof_command_ = command;
    }
    if (tool == "lake") {
      r.exit_code = build_exit_code;
      r.stdout_text = "Build completed";
      r.stderr_text = build_stderr;
      return r;
    }
    if (proof_blocks) {
      std::unique_lock<std::mutex> lk(mu_);
      const bool stopped = cv_.wait_for(lk, 30s, [&] { return stopped_.count(id) > 0; });
      if (stopped) ++killed_execs_;
      r.killed = stopped;
      r.exit_code = 137;
      return r;
    }
    r.exit_code = proof_exit_code;
    r.stdout_text = proof_stdout;
    r.stderr_text = proof_exit_code == 0 ? "" : "error: type mismatch\n";
    r.usage.cpu_seconds = 0.25;
    r.usage.memory_bytes = 64 * 1024 * 1024;
    return r;
  }

  bool copy_into(const std::string& id, const std::string& host_path, const std::string& dest,
                 std::string* error) override {
    (void)id;
    (void)host_path;
    std::this_thread::sleep_for(copy_delay);
    std::lock_guard<std::mutex> lk(mu_);
    if (fail_copy) {
      if (error) *error = "disk full";
      return false;
    }
    copies_.push_back(dest);
    return true;
  }

  bool stop(const std::string& id, std::string* error) override {
    (void)error;
    {
      std::lock_guard<std::mutex> lk(mu_);
      ++stops_;
      stopped_.insert(id);
    }
    cv_.notify_all();
    return true;
  }

  bool remove(const std::string& id, std::string* error) override {
    (void)id;
    (void)error;
    std::lock_guard<std::mutex> lk(mu_);
    ++removes_;
    return true;
  }

  int creates() const { std::lock_guard<std::mutex> lk(mu_); return creates_; }
  int stops() const { std::lock_guard<std::mutex> lk(mu_); return stops_; }
  int removes() const { std::lock_guard<std::mutex> lk(mu_); return removes_; }
  int killed_execs() const { std::lock_guard<std::mutex> lk(mu_); return killed_execs_; }
  std::vector<std::string> exec_tools() const { std::lock_guard<std::mutex> lk(mu_); return exec_tools_; }
  std::vector<std::string> copies() const { std::lock_guard<std::mutex> lk(mu_); return copies_; }
  std::vector<std::string> last_proof_command() const { std::lock_guard<std::mutex> lk(mu_); return last_proof_command_; }
  proofarm::ResourceLimits last_limits() const { std::lock_guard<std::mutex> lk(mu_); return last_limits_; }

 private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  int creates_{0};
  int stops_{0};
  int removes_{0};
  int killed_execs_{0};
  std::set<std::string> stopped_;
  std::vector<std::string> exec_tools_;
  std::vector<std::string> copies_;
  std::vector<std::string> last_proof_command_;
  proofarm::ResourceLimits last_limits_;
};

class FakeArtifactStore : public proofarm::IArtifactStore {
 public:
  bool fail_download{false};
  bool fail_upload{false};
  bool fail_store{false};

  std::optional<std::string> download_code_bundle(const std::string& key, std::string* error) override {
    std::lock_guard<std::mutex> lk(mu_);
    downloads_.push_back(key);
    if (fail_download) {
      if (error) *error = "Failed to download code bundle: " + key + " not found";
      return std::nullopt;
    }
    return "/fake/bundles/" + key;
  }

  bool upload_artifact(const std::string& key, const std::string& bytes, std::string* error) override {
    std::lock_guard<std::mutex> lk(mu_);
    if (fail_upload) {
      if (error) *error = "bucket unavailable";
      return false;
    }
    uploads_[key] = bytes;
    return true;
  }

  bool store_job_result(const proofarm::JobResult& result, std::string* error) override {
    std::lock_guard<std::mutex> lk(mu_);
    if (fail_store) {
      if (error) *error = "results volume read-only";
      return false;
    }
    results_.push_back(result);
    return true;
  }

  size_t download_count() const { std::lock_guard<std::mutex> lk(mu_); return downloads_.size(); }
  std::map<std::string, std::string> uploads() const { std::lock_guard<std::mutex> lk(mu_); return uploads_; }
  std::vector<proofarm::JobResult> results() const { std::lock_guard<std::mutex> lk(mu_); return results_; }

 private:
  mutable std::mutex mu_;
  std::vector<std::string> downloads_;
  std::map<std::string, std::string> uploads_;
  std::vector<proofarm::JobResult> results_;
};

class FakeCompiler : public proofarm::TheoremCompiler {
 public:
  bool fail{false};
  std::vector<double> confidences;   // one per attempt, 1.0 once exhausted

  std::optional<proofarm::GeneratedProof> generate_proof(const proofarm::Theorem& theorem,
                                                         const proofarm::ProofOptions& options,
                                                         const proofarm::StopToken& stop,
                                                         std::string* error) override {
    (void)options;
    (void)stop;
    const size_t attempt = static_cast<size_t>(calls_.fetch_add(1));
    if (fail) {
      if (error) *error = "model returned no tactic script";
      return std::nullopt;
    }
    proofarm::GeneratedProof proof;
    proof.code = "-- proof for " + theorem.id + "\n" + theorem.lean_code;
    if (attempt < confidences.size()) proof.confidence = confidences[attempt];
    return proof;
  }

  int calls() const { return calls_.load(); }

 private:
  std::atomic<int> calls_{0};
};

// Blocks for a fixed time and ignores the stop token.
class StubbornCompiler : public proofarm::TheoremCompiler {
 public:
  explicit StubbornCompiler(std::chrono::milliseconds delay) : delay_(delay) {}

  std::optional<proofarm::GeneratedProof> generate_proof(const proofarm::Theorem& theorem,
                                                         const proofarm::ProofOptions& options,
                                                         const proofarm::StopToken& stop,
                                                         std::string* error) override {
    (void)options;
    (void)stop;
    (void)error;
    std::this_thread::sleep_for(delay_);
    proofarm::GeneratedProof proof;
    proof.code = theorem.lean_code;
    return proof;
  }

 private:
  std::chrono::milliseconds delay_;
};

// Waits on the stop token and gives up once it fires.
class CooperativeCompiler : public proofarm::TheoremCompiler {
 public:
  std::atomic<bool> saw_stop{false};

  std::optional<proofarm::GeneratedProof> generate_proof(const proofarm::Theorem& theorem,
                                                         const proofarm::ProofOptions& options,
                                                         const proofarm::StopToken& stop,
                                                         std::string* error) override {
    (void)theorem;
    (void)options;
    if (stop.wait_for(30s)) saw_stop.store(true);
    if (error) *error = "cancelled";
    return std::nullopt;
  }
};

class FakeScanner : public proofarm::IVulnerabilityScanner {
 public:
  proofarm::ScanReport report;
  bool fail{false};
  int calls{0};
  std::optional<proofarm::ScanReport> scan(std::chrono::seconds timeout, std::string* error) override {
    (void)timeout;
    ++calls;
    if (fail) {
      if (error) *error = "Security scan timed out";
      return std::nullopt;
    }
    return report;
  }
};

proofarm::Job make_job(const std::string& id, proofarm::JobPriority priority) {
  proofarm::Job job;
  job.id = id;
  job.priority = priority;
  job.theorem.id = "thm-" + id;
  job.theorem.name = "add_comm_" + id;
  job.theorem.lean_code = "theorem add_comm' (a b : Nat) : a + b = b + a := Nat.add_comm a b\n";
  job.theorem.content_digest = proofarm::blake3_hex(job.theorem.lean_code);
  return job;
}

proofarm::ExecutorOptions test_executor_options() {
  proofarm::ExecutorOptions o;
  o.staging_dir = fs::temp_directory_path().string();
  o.build_timeout = std::chrono::seconds(30);
  return o;
}

proofarm::RuntimeInfo hardened_runtime() {
  proofarm::RuntimeInfo info;
  info.isolation_runtime = "gvisor";
  info.is_rootless = true;
  info.seccomp_mode = 2;
  info.seccomp_available = true;
  info.effective_capabilities = 0;
  info.no_new_privs = true;
  return info;
}

proofarm::SecurityConfig scan_free_security() {
  proofarm::SecurityConfig s;
  s.scanning.enabled = false;
  return s;
}

proofarm::SecurityValidator passing_validator() {
  return proofarm::SecurityValidator(scan_free_security(), hardened_runtime());
}

bool wait_until_true(const std::function<bool()>& done, std::chrono::milliseconds limit) {
  const auto start = std::chrono::steady_clock::now();
  while (!done()) {
    if (std::chrono::steady_clock::now() - start > limit) return false;
    std::this_thread::sleep_for(10ms);
  }
  return true;
}

struct PoolFixture {
  std::shared_ptr<FakeSandboxRuntime> runtime = std::make_shared<FakeSandboxRuntime>();
  std::shared_ptr<FakeArtifactStore> store = std::make_shared<FakeArtifactStore>();
  std::shared_ptr<FakeCompiler> compiler = std::make_shared<FakeCompiler>();
  std::shared_ptr<proofarm::JobQueue> queue = std::make_shared<proofarm::JobQueue>(100);
  std::shared_ptr<proofarm::ResultChannel> results = std::make_shared<proofarm::ResultChannel>(100);
  std::shared_ptr<proofarm::SandboxExecutor> executor =
      std::make_shared<proofarm::SandboxExecutor>(runtime, compiler, test_executor_options());

  std::unique_ptr<proofarm::WorkerPool> make_pool(proofarm::WorkerPoolOptions options) {
    return std::make_unique<proofarm::WorkerPool>(options, queue, executor, store, results);
  }
};

// ============================================================================
// Hashing & JSON
// ============================================================================

void test_blake3_known_vectors() {
  expect(proofarm::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(proofarm::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const std::string payload = "theorem t : True := trivial";
  const std::string art = proofarm::artifact_content_hash(payload);
  const std::string res = proofarm::result_record_hash(payload);
  expect(proofarm::is_valid_digest(art) && proofarm::is_valid_digest(res), "domain digests are 64 hex chars");
  expect(art != res, "artifact and result domains differ");
  expect(art != proofarm::blake3_hex(payload), "domain digest differs from plain digest");
  expect(art == proofarm::blake3_hex("art:" + payload), "artifact domain is an 'art:' prefix");
  expect(!proofarm::is_valid_digest("ABC"), "short digest rejected");
  expect(!proofarm::is_valid_digest(std::string(64, 'G')), "non-hex digest rejected");
}

void test_json_parse_and_serialize() {
  std::optional<proofarm::jsonlite::JsonError> err;
  const auto obj = proofarm::jsonlite::parse(R"({"b":1,"a":"x","c":[true,null],"d":-1.5})", &err);
  expect(!err, "valid object parses");
  expect(proofarm::jsonlite::get_u64(obj, "b") == 1, "integer field");
  expect(proofarm::jsonlite::get_string(obj, "a") == "x", "string field");
  expect(proofarm::jsonlite::get_double(obj, "d") == -1.5, "negative double field");
  expect(proofarm::jsonlite::to_json(proofarm::jsonlite::Value{obj}) == R"({"a":"x","b":1,"c":[true,null],"d":-1.5})",
         "keys serialize in sorted order");

  proofarm::jsonlite::parse(R"({"k":1,"k":2})", &err);
  expect(err && err->code == "json_duplicate_key", "duplicate key rejected");
  proofarm::jsonlite::parse("{\"k\":1} trailing", &err);
  expect(err.has_value(), "trailing data rejected");
  proofarm::jsonlite::parse("[1,2]", &err);
  expect(err.has_value(), "non-object top level rejected");
}

// ============================================================================
// JobQueue
// ============================================================================

void test_queue_priority_order() {
  proofarm::JobQueue q(10);
  expect(q.enqueue(make_job("low", proofarm::JobPriority::low)) == proofarm::ErrorCode::none, "enqueue low");
  expect(q.enqueue(make_job("crit", proofarm::JobPriority::critical)) == proofarm::ErrorCode::none, "enqueue critical");
  auto first = q.dequeue();
  expect(first && first->id == "crit", "critical job dequeued before low");
  auto second = q.dequeue();
  expect(second && second->id == "low", "low job dequeued second");
  expect(!q.dequeue().has_value(), "empty queue yields nullopt");
}

void test_queue_fifo_within_priority() {
  proofarm::JobQueue q(10);
  q.enqueue(make_job("n1", proofarm::JobPriority::normal));
  q.enqueue(make_job("h1", proofarm::JobPriority::high));
  q.enqueue(make_job("n2", proofarm::JobPriority::normal));
  q.enqueue(make_job("h2", proofarm::JobPriority::high));
  q.enqueue(make_job("n3", proofarm::JobPriority::normal));
  std::vector<std::string> order;
  while (auto j = q.dequeue()) order.push_back(j->id);
  expect(order == std::vector<std::string>({"h1", "h2", "n1", "n2", "n3"}), "FIFO among equal priorities");
}

void test_queue_capacity() {
  proofarm::JobQueue q(2);
  expect(q.enqueue(make_job("a", proofarm::JobPriority::normal)) == proofarm::ErrorCode::none, "first enqueue");
  expect(q.size() == 1, "size 1");
  expect(q.enqueue(make_job("b", proofarm::JobPriority::normal)) == proofarm::ErrorCode::none, "second enqueue");
  expect(q.size() == 2, "size 2");
  expect(q.enqueue(make_job("c", proofarm::JobPriority::critical)) == proofarm::ErrorCode::queue_full,
         "third enqueue is queue_full");
  expect(q.size() == 2, "size unchanged after queue_full");
  auto head = q.dequeue();
  expect(head && head->id == "a", "refused job never entered the queue");
}

void test_queue_concurrent_producers() {
  auto q = std::make_shared<proofarm::JobQueue>(1000);
  std::vector<std::thread> producers;
  for (int t = 0; t < 4; ++t) {
    producers.emplace_back([q, t] {
      for (int i = 0; i < 50; ++i) {
        q->enqueue(make_job("t" + std::to_string(t) + "-" + std::to_string(i), proofarm::JobPriority::normal));
      }
    });
  }
  for (auto& p : producers) p.join();
  expect(q->size() == 200, "all concurrent enqueues land in the shared queue");
  expect(q->clear() == 200, "clear reports dropped count");
  expect(q->empty(), "queue empty after clear");
}

// ============================================================================
// Result channel
// ============================================================================

void test_channel_backpressure() {
  proofarm::BoundedChannel<int> ch(1);
  expect(ch.push(1), "first push fits");
  std::atomic<bool> second_pushed{false};
  std::thread producer([&] {
    ch.push(2);
    second_pushed = true;
  });
  std::this_thread::sleep_for(100ms);
  expect(!second_pushed.load(), "push blocks while channel is full");
  expect(ch.size() == 1, "channel holds capacity items");
  auto a = ch.pop();
  expect(a && *a == 1, "pop returns first item");
  producer.join();
  expect(second_pushed.load(), "blocked push completes after pop");
  auto b = ch.pop();
  expect(b && *b == 2, "second item delivered, nothing dropped");

  ch.close();
  expect(!ch.pop().has_value(), "pop on closed and drained channel returns nullopt");
  expect(!ch.push(3), "push after close is refused");
}

// ============================================================================
// Configuration
// ============================================================================

void test_config_parse() {
  const std::string json = R"({
    "worker_count": 4,
    "max_job_duration_seconds": 60,
    "max_queue_size": 10,
    "security": {
      "use_gvisor": false,
      "run_as_user": 2000,
      "resource_limits": {"cpu_cores": 1.5, "memory_bytes": 1073741824},
      "scanning": {"enabled": false}
    },
    "sandbox": {"image": "leanprover/lean4:4.8.0", "build_timeout_seconds": 120},
    "storage": {"root": "/tmp/pf-store", "key_prefix": "p"},
    "colour": "blue"
  })";
  std::string err;
  const auto c = proofarm::farm_config_from_json(json, &err);
  expect(err.empty(), "config parses: " + err);
  expect(c.worker_count == 4, "worker_count");
  expect(c.max_job_duration_seconds == 60, "max_job_duration_seconds");
  expect(c.max_queue_size == 10, "max_queue_size");
  expect(c.idle_wait_ms == 100, "idle_wait_ms default");
  expect(c.security.required_isolation_runtime == "none", "use_gvisor=false lifts the runtime requirement");
  expect(c.security.run_as_user == 2000, "run_as_user");
  expect(c.security.resource_limits.cpu_cores == 1.5, "cpu limit");
  expect(c.security.resource_limits.memory_bytes == 1073741824ull, "memory limit");
  expect(c.security.resource_limits.disk_bytes == 10ull * 1024 * 1024 * 1024, "disk limit default");
  expect(c.resource_limits.cpu_cores == 1.5, "sandbox limits follow security limits");
  expect(!c.security.scanning.enabled, "scanning disabled");
  expect(c.sandbox.image == "leanprover/lean4:4.8.0", "image");
  expect(c.sandbox.build_timeout_seconds == 120, "build timeout");
  expect(c.storage.key_prefix == "p", "key prefix");
  expect(c.unknown_keys == std::vector<std::string>({"colour"}), "unknown key collected");

  const auto v = proofarm::validate_farm_config(c);
  expect(v.ok, "config validates");
  bool warned = false;
  for (const auto& w : v.warnings) warned = warned || contains(w, "colour");
  expect(warned, "unknown key produces a warning");
}

void test_config_validation_errors() {
  std::string err;
  auto c = proofarm::farm_config_from_json(R"({"worker_count":0,"resource_limits":{"process_limit":0}})", &err);
  expect(err.empty(), "parses");
  const auto v = proofarm::validate_farm_config(c);
  expect(!v.ok, "zero worker_count rejected");
  bool workers = false;
  bool procs = false;
  for (const auto& e : v.errors) {
    workers = workers || contains(e, "worker_count");
    procs = procs || contains(e, "process_limit");
  }
  expect(workers && procs, "each problem is reported");

  proofarm::farm_config_from_json("{not json", &err);
  expect(!err.empty(), "malformed config reports an error");
}

void test_config_env_overrides() {
  setenv("LEAN_VERSION", "4.9.0", 1);
  setenv("PROOFARM_WORKER_COUNT", "3", 1);
  setenv("LAKE_BUILD_TIMEOUT", "45", 1);
  proofarm::FarmConfig c;
  proofarm::apply_env_overrides(c);
  unsetenv("LEAN_VERSION");
  unsetenv("PROOFARM_WORKER_COUNT");
  unsetenv("LAKE_BUILD_TIMEOUT");
  expect(c.sandbox.image == "leanprover/lean4:4.9.0", "LEAN_VERSION selects the image tag");
  expect(c.worker_count == 3, "PROOFARM_WORKER_COUNT overrides worker_count");
  expect(c.sandbox.build_timeout_seconds == 45, "LAKE_BUILD_TIMEOUT overrides build timeout");
}

void test_job_description_parse() {
  std::string err;
  const auto job = proofarm::job_from_json(R"({
    "id": "job-7",
    "priority": "critical",
    "deadline_ms": 60000,
    "theorem": {"id": "thm-7", "lean_code": "theorem t : True := trivial", "content_digest": "abc"},
    "options": {"timeout_seconds": 30, "proof_strategy": "simp",
                "resource_limits": {"memory_bytes": 536870912},
                "metadata": {"source": "ci"}}
  })", &err);
  expect(job.has_value(), "job parses: " + err);
  expect(job->id == "job-7", "job id");
  expect(job->priority == proofarm::JobPriority::critical, "priority by name");
  expect(job->deadline.has_value(), "deadline set");
  expect(job->theorem.content_digest == "abc", "content digest");
  expect(job->options.timeout_seconds == 30, "timeout option");
  expect(job->options.proof_strategy == "simp", "strategy");
  expect(job->options.resource_limits && job->options.resource_limits->memory_bytes == 536870912ull,
         "per-job limits");
  expect(job->options.metadata.at("source") == "ci", "metadata");

  const auto numeric = proofarm::job_from_json(R"({"id":"j","priority":1,"theorem":{"id":"t"}})", &err);
  expect(numeric && numeric->priority == proofarm::JobPriority::normal, "numeric priority");

  expect(!proofarm::job_from_json(R"({"theorem":{"id":"t"}})", &err), "missing id rejected");
  expect(!proofarm::job_from_json(R"({"id":"j"})", &err), "missing theorem rejected");
}

void test_job_priority_must_be_known() {
  std::string err;
  const auto urgent = proofarm::job_from_json(R"({"id":"j1","priority":"urgent","theorem":{"id":"t"}})", &err);
  expect(!urgent, "unknown priority name rejected");
  expect(contains(err, "unknown priority") && contains(err, "urgent"), "error names the priority: " + err);

  err.clear();
  expect(!proofarm::job_from_json(R"({"id":"j2","priority":"critcal","theorem":{"id":"t"}})", &err),
         "misspelled priority rejected");
  expect(!proofarm::job_from_json(R"({"id":"j3","priority":7,"theorem":{"id":"t"}})", &err),
         "out of range numeric priority rejected");
  expect(!proofarm::job_from_json(R"({"id":"j4","priority":true,"theorem":{"id":"t"}})", &err),
         "non-string priority rejected");

  const auto upper = proofarm::job_from_json(R"({"id":"j5","priority":"NORMAL","theorem":{"id":"t"}})", &err);
  expect(upper && upper->priority == proofarm::JobPriority::normal, "priority names are case-insensitive");
  expect(!proofarm::priority_from_string("urgent").has_value(), "priority_from_string has no fallback");
  expect(!proofarm::priority_from_int(4).has_value(), "priority_from_int has no fallback");
}

void test_resource_limits_clamped_to_ceiling() {
  proofarm::ResourceLimits ceiling;
  ceiling.cpu_cores = 2.0;
  ceiling.memory_bytes = 1ull << 30;
  ceiling.process_limit = 64;

  proofarm::ResourceLimits asked;
  asked.cpu_cores = 64.0;
  asked.memory_bytes = 0;
  asked.process_limit = 0;
  asked.file_descriptor_limit = 256;
  bool clamped = false;
  const auto l = proofarm::clamp_resource_limits(asked, ceiling, &clamped);
  expect(clamped, "oversized request reported");
  expect(l.cpu_cores == 2.0, "cpu capped at the ceiling");
  expect(l.memory_bytes == (1ull << 30), "zero memory takes the ceiling");
  expect(l.process_limit == 64, "zero process limit takes the ceiling");
  expect(l.file_descriptor_limit == 256, "smaller request kept");

  const auto none = proofarm::clamp_resource_limits(std::nullopt, ceiling, &clamped);
  expect(!clamped && none.memory_bytes == ceiling.memory_bytes, "missing request uses the ceiling");

  proofarm::FarmConfig cfg;
  cfg.resource_limits.memory_bytes = 1ull << 30;
  cfg.security.resource_limits.process_limit = 32;
  const auto opts = proofarm::executor_options_from_config(cfg);
  expect(opts.limit_ceiling.memory_bytes == (1ull << 30), "farm limits bound the ceiling");
  expect(opts.limit_ceiling.process_limit == 32, "security limits bound the ceiling too");
}

// ============================================================================
// Security validation
// ============================================================================

void test_security_all_checks_pass() {
  proofarm::SecurityValidator v(scan_free_security(), hardened_runtime());
  const auto r = v.validate();
  expect(r.ok, "hardened environment passes: " + r.message);
  expect(r.code == proofarm::ErrorCode::none, "no error code");
}

void test_security_runtime_failures() {
  auto rt = hardened_runtime();
  rt.is_rootless = false;
  auto r = proofarm::SecurityValidator(scan_free_security(), rt).validate();
  expect(!r.ok && r.code == proofarm::ErrorCode::security_validation_failed, "root process rejected");
  expect(r.check == "runtime" && contains(r.message, "Rootless"), "rootless check named");

  rt = hardened_runtime();
  rt.isolation_runtime = "native";
  r = proofarm::SecurityValidator(scan_free_security(), rt).validate();
  expect(!r.ok && r.message == "gVisor runtime is required but not detected", "gVisor requirement");

  auto relaxed = scan_free_security();
  relaxed.required_isolation_runtime = "none";
  r = proofarm::SecurityValidator(relaxed, rt).validate();
  expect(r.ok, "runtime requirement can be lifted explicitly");

  rt = hardened_runtime();
  rt.seccomp_mode = 0;
  rt.seccomp_available = false;
  r = proofarm::SecurityValidator(scan_free_security(), rt).validate();
  expect(!r.ok && contains(r.message, "Seccomp"), "seccomp required");
}

void test_security_config_failures() {
  auto s = scan_free_security();
  s.run_as_user = 0;
  auto r = proofarm::SecurityValidator(s, hardened_runtime()).validate();
  expect(!r.ok && r.check == "config" && r.message == "Cannot run as root user (UID 0)", "uid 0 rejected");

  s = scan_free_security();
  s.drop_all_capabilities = false;
  r = proofarm::SecurityValidator(s, hardened_runtime()).validate();
  expect(!r.ok && contains(r.message, "capabilities"), "capabilities must be dropped");

  s = scan_free_security();
  s.allow_privilege_escalation = true;
  r = proofarm::SecurityValidator(s, hardened_runtime()).validate();
  expect(!r.ok && contains(r.message, "Privilege escalation"), "privilege escalation rejected");

  s = scan_free_security();
  s.privileged = true;
  r = proofarm::SecurityValidator(s, hardened_runtime()).validate();
  expect(!r.ok && r.message == "Privileged mode must be disabled", "privileged mode rejected");

  s = scan_free_security();
  s.resource_limits.memory_bytes = 0;
  r = proofarm::SecurityValidator(s, hardened_runtime()).validate();
  expect(!r.ok && r.check == "resource_limits", "zero memory limit rejected");
}

void test_security_vulnerability_scan() {
  proofarm::SecurityConfig s;
  s.scanning.enabled = true;
  s.scanning.max_critical = 0;
  s.scanning.max_high = 5;

  auto scanner = std::make_shared<FakeScanner>();
  scanner->report.critical = 0;
  scanner->report.high = 5;
  auto r = proofarm::SecurityValidator(s, hardened_runtime(), scanner).validate();
  expect(r.ok && r.scan && r.scan->high == 5, "scan within thresholds passes");

  scanner->report.critical = 1;
  r = proofarm::SecurityValidator(s, hardened_runtime(), scanner).validate();
  expect(!r.ok && r.message == "Too many critical vulnerabilities: 1 (max: 0)", "critical threshold enforced");

  scanner->report.critical = 0;
  scanner->report.high = 6;
  r = proofarm::SecurityValidator(s, hardened_runtime(), scanner).validate();
  expect(!r.ok && r.check == "vulnerability_scan", "high threshold enforced");

  scanner->fail = true;
  r = proofarm::SecurityValidator(s, hardened_runtime(), scanner).validate();
  expect(!r.ok && contains(r.message, "timed out"), "scan failure fails validation");

  r = proofarm::SecurityValidator(s, hardened_runtime(), nullptr).validate();
  expect(!r.ok && r.check == "vulnerability_scan", "enabled scan without scanner fails");

  std::string err;
  auto parsed = proofarm::parse_scan_report(R"({"critical":2,"high":3,"medium":4,"low":5})", &err);
  expect(parsed && parsed->critical == 2 && parsed->low == 5, "scanner report parses");
  expect(!proofarm::parse_scan_report(R"({"medium":1})", &err), "report without counts rejected");
}

void test_proc_status_parsing() {
  const std::string status =
      "Name:\tproofarm\nUid:\t1000\t1000\t1000\t1000\nCapEff:\t0000000000000000\n"
      "NoNewPrivs:\t1\nSeccomp:\t2\n";
  const auto info = proofarm::parse_proc_status(status, proofarm::RuntimeInfo{});
  expect(info.seccomp_available && info.seccomp_mode == 2, "seccomp mode parsed");
  expect(info.effective_capabilities == 0, "CapEff parsed");
  expect(info.no_new_privs, "NoNewPrivs parsed");

  const auto caps = proofarm::parse_proc_status("CapEff:\t000001ffffffffff\n", proofarm::RuntimeInfo{});
  expect(caps.effective_capabilities == 0x000001ffffffffffull, "CapEff hex mask");
  expect(!caps.seccomp_available, "no Seccomp line means unavailable");
}

void test_pool_refuses_start_after_failed_validation() {
  PoolFixture fx;
  proofarm::WorkerPoolOptions opts;
  opts.worker_count = 4;
  opts.idle_wait = 10ms;
  auto pool = fx.make_pool(opts);

  auto rt = hardened_runtime();
  rt.is_rootless = false;
  const auto refused = pool->start(proofarm::SecurityValidator(scan_free_security(), rt));
  expect(!refused.ok, "start refused");
  expect(refused.check == "runtime" && refused.code == proofarm::ErrorCode::security_validation_failed,
         "refusal names the failing check");
  expect(!pool->is_running(), "pool not running");
  expect(pool->active_worker_count() == 0, "no worker thread started");

  pool->submit(make_job("queued", proofarm::JobPriority::high));
  std::this_thread::sleep_for(150ms);
  expect(pool->current_queue_depth() == 1, "nobody consumes the queue");
  expect(pool->jobs_started() == 0 && fx.runtime->creates() == 0, "no job ever ran");
}

void test_security_checks_detected_process_state() {
  auto rt = hardened_runtime();
  rt.effective_capabilities = 0x000001ffffffffffull;
  auto r = proofarm::SecurityValidator(scan_free_security(), rt).validate();
  expect(!r.ok && r.check == "config", "effective capabilities fail validation");
  expect(contains(r.message, "capabilities") && contains(r.message, "0x1ffffffffff"), "mask reported: " + r.message);

  rt = hardened_runtime();
  rt.no_new_privs = false;
  r = proofarm::SecurityValidator(scan_free_security(), rt).validate();
  expect(!r.ok && r.check == "config" && contains(r.message, "NoNewPrivs"), "missing NoNewPrivs fails validation");

  rt = hardened_runtime();
  rt.effective_capabilities = 0x000001ffffffffffull;
  rt.no_new_privs = false;
  auto lenient = scan_free_security();
  lenient.drop_all_capabilities = false;
  r = proofarm::SecurityValidator(lenient, rt).validate();
  expect(!r.ok, "fully privileged process never passes");

  rt = hardened_runtime();
  rt.bounding_sys_admin = true;
  rt.network_isolated = false;
  r = proofarm::SecurityValidator(scan_free_security(), rt).validate();
  expect(r.ok, "bounding set and host network are reported, not gated: " + r.message);

  const auto parsed = proofarm::parse_proc_status("CapBnd:\t000001ffffffffff\n", proofarm::RuntimeInfo{});
  expect(parsed.bounding_sys_admin, "CAP_SYS_ADMIN found in CapBnd");
  const auto narrow = proofarm::parse_proc_status("CapBnd:\t0000000000000400\n", proofarm::RuntimeInfo{});
  expect(!narrow.bounding_sys_admin, "CapBnd without CAP_SYS_ADMIN");
  const std::string json = proofarm::runtime_info_to_json(rt);
  expect(contains(json, "\"bounding_sys_admin\":true") && contains(json, "\"network_isolated\":false"),
         "new fields serialized");
}

// ============================================================================
// SandboxExecutor
// ============================================================================

void test_executor_success_pipeline() {
  auto rt = std::make_shared<FakeSandboxRuntime>();
  proofarm::SandboxExecutor ex(rt, std::make_shared<FakeCompiler>(), test_executor_options());
  auto job = make_job("ok", proofarm::JobPriority::normal);
  job.options.proof_strategy = "omega";
  const auto out = ex.run_pipeline(job, "/fake/bundle", std::chrono::steady_clock::now() + 10s);

  expect(out.success, "pipeline succeeds: " + out.error_message);
  expect(out.artifact.has_value(), "artifact produced");
  expect(out.artifact->status == proofarm::ProofStatus::success, "artifact status success");
  expect(out.artifact->exit_code == 0, "exit code 0");
  expect(out.artifact->output == "proof checked\n", "stdout captured");
  expect(out.artifact->proof_strategy == "omega", "strategy carried over");
  expect(out.artifact->theorem_id == job.theorem.id, "theorem id");
  expect(out.artifact->content_digest ==
             proofarm::artifact_content_hash("-- proof for " + job.theorem.id + "\n" + job.theorem.lean_code),
         "content digest covers the generated proof code");
  expect(out.artifact->metadata.at("sandbox_id") == out.sandbox_id, "sandbox id recorded");
  expect(out.usage.cpu_seconds == 0.25, "resource usage captured");

  expect(rt->exec_tools() == std::vector<std::string>({"lake", "lean"}), "build runs before proof");
  const auto cmd = rt->last_proof_command();
  expect(cmd.size() == 3 && cmd[1] == "--run" && cmd[2] == "/var/lean-farm/code/proof.lean", "lean --run proof file");
  bool proof_copied = false;
  for (const auto& c : rt->copies()) proof_copied = proof_copied || c == "/var/lean-farm/code/proof.lean";
  expect(proof_copied, "proof file copied into the sandbox");
  expect(rt->creates() == 1 && rt->removes() == 1, "one create, one cleanup");
  expect(ex.live_sandboxes() == 0, "no sandbox left behind");
}

void test_executor_cleanup_once_on_build_failure() {
  auto rt = std::make_shared<FakeSandboxRuntime>();
  rt->build_exit_code = 1;
  rt->build_stderr = "error: unknown identifier 'foo'";
  proofarm::SandboxExecutor ex(rt, std::make_shared<FakeCompiler>(), test_executor_options());
  const auto out = ex.run_pipeline(make_job("bad", proofarm::JobPriority::normal), "/fake/bundle",
                                   std::chrono::steady_clock::now() + 10s);

  expect(!out.success, "build failure fails the pipeline");
  expect(out.error_code == proofarm::ErrorCode::build_failed, "build_failed code");
  expect(contains(out.error_message, "Lean compilation failed") && contains(out.error_message, "unknown identifier"),
         "build error surfaced");
  expect(rt->creates() == 1, "one create");
  expect(rt->removes() == 1, "cleanup invoked exactly once");
  expect(rt->exec_tools() == std::vector<std::string>({"lake"}), "proof never ran");

  expect(!ex.cleanup(out.sandbox_id), "second cleanup is a no-op");
  expect(rt->removes() == 1, "no extra remove");
}

void test_executor_failure_paths_clean_up() {
  {
    auto rt = std::make_shared<FakeSandboxRuntime>();
    auto compiler = std::make_shared<FakeCompiler>();
    compiler->fail = true;
    proofarm::SandboxExecutor ex(rt, compiler, test_executor_options());
    const auto out = ex.run_pipeline(make_job("gen", proofarm::JobPriority::normal), "/fake/bundle",
                                     std::chrono::steady_clock::now() + 10s);
    expect(out.error_code == proofarm::ErrorCode::proof_generation_failed, "generation failure code");
    expect(rt->removes() == 1, "cleanup after generation failure");
  }
  {
    auto rt = std::make_shared<FakeSandboxRuntime>();
    rt->fail_copy = true;
    proofarm::SandboxExecutor ex(rt, std::make_shared<FakeCompiler>(), test_executor_options());
    const auto out = ex.run_pipeline(make_job("mnt", proofarm::JobPriority::normal), "/fake/bundle",
                                     std::chrono::steady_clock::now() + 10s);
    expect(out.error_code == proofarm::ErrorCode::mount_failed, "mount failure code");
    expect(rt->removes() == 1, "cleanup after mount failure");
  }
  {
    auto rt = std::make_shared<FakeSandboxRuntime>();
    rt->proof_exit_code = 1;
    proofarm::SandboxExecutor ex(rt, std::make_shared<FakeCompiler>(), test_executor_options());
    const auto out = ex.run_pipeline(make_job("lean", proofarm::JobPriority::normal), "/fake/bundle",
                                     std::chrono::steady_clock::now() + 10s);
    expect(out.error_code == proofarm::ErrorCode::proof_execution_failed, "execution failure code");
    expect(out.artifact && out.artifact->status == proofarm::ProofStatus::failed, "failed artifact kept");
    expect(out.artifact->logs.size() == 1 && contains(out.artifact->logs[0], "type mismatch"), "stderr kept as log");
    expect(rt->removes() == 1, "cleanup after execution failure");
  }
  {
    auto rt = std::make_shared<FakeSandboxRuntime>();
    rt->fail_create = true;
    proofarm::SandboxExecutor ex(rt, std::make_shared<FakeCompiler>(), test_executor_options());
    const auto out = ex.run_pipeline(make_job("cr", proofarm::JobPriority::normal), "/fake/bundle",
                                     std::chrono::steady_clock::now() + 10s);
    expect(out.error_code == proofarm::ErrorCode::sandbox_creation_failed, "creation failure code");
    expect(rt->removes() == 0 && rt->stops() == 0, "nothing to clean up");
  }
}

void test_sandbox_lease_releases_once() {
  auto rt = std::make_shared<FakeSandboxRuntime>();
  proofarm::SandboxExecutor ex(rt, std::make_shared<FakeCompiler>(), test_executor_options());
  std::string err;
  const std::string id = ex.create(proofarm::ResourceLimits{}, &err);
  expect(!id.empty(), "sandbox created");
  expect(ex.state(id) == proofarm::SandboxState::created, "state created");
  {
    proofarm::SandboxLease lease(ex, id);
    lease.release();
    lease.release();
  }
  expect(rt->removes() == 1, "lease cleans up exactly once");
  expect(!ex.state(id).has_value(), "cleaned sandbox forgotten");
}

void test_generation_attempts_and_confidence() {
  {
    auto rt = std::make_shared<FakeSandboxRuntime>();
    auto compiler = std::make_shared<FakeCompiler>();
    compiler->confidences = {0.3, 0.9};
    proofarm::SandboxExecutor ex(rt, compiler, test_executor_options());
    auto job = make_job("retry", proofarm::JobPriority::normal);
    job.options.max_attempts = 3;
    job.options.confidence_threshold = 0.8;
    const auto out = ex.run_pipeline(job, "/fake/bundle", std::chrono::steady_clock::now() + 10s);
    expect(out.success, "second attempt accepted: " + out.error_message);
    expect(compiler->calls() == 2, "stopped after the first confident proof");
    expect(out.artifact->confidence_score == 0.9, "confidence carried into the artifact");
    expect(out.artifact->metadata.at("generation_attempts") == "2", "attempt count recorded");
  }
  {
    auto rt = std::make_shared<FakeSandboxRuntime>();
    auto compiler = std::make_shared<FakeCompiler>();
    compiler->confidences = {0.1, 0.2, 0.95};
    proofarm::SandboxExecutor ex(rt, compiler, test_executor_options());
    auto job = make_job("lowconf", proofarm::JobPriority::normal);
    job.options.max_attempts = 2;
    job.options.confidence_threshold = 0.8;
    const auto out = ex.run_pipeline(job, "/fake/bundle", std::chrono::steady_clock::now() + 10s);
    expect(out.error_code == proofarm::ErrorCode::proof_generation_failed, "low confidence fails generation");
    expect(contains(out.error_message, "after 2 attempt(s)") && contains(out.error_message, "below threshold 0.8"),
           "message explains the rejection: " + out.error_message);
    expect(compiler->calls() == 2, "max_attempts bounds the retries");
    expect(rt->exec_tools() == std::vector<std::string>({"lake"}), "rejected proof never ran");
    expect(rt->removes() == 1, "sandbox cleaned up");
  }
  {
    auto rt = std::make_shared<FakeSandboxRuntime>();
    auto compiler = std::make_shared<FakeCompiler>();
    compiler->fail = true;
    proofarm::SandboxExecutor ex(rt, compiler, test_executor_options());
    auto job = make_job("zero", proofarm::JobPriority::normal);
    job.options.max_attempts = 0;
    const auto out = ex.run_pipeline(job, "/fake/bundle", std::chrono::steady_clock::now() + 10s);
    expect(out.error_code == proofarm::ErrorCode::proof_generation_failed, "failing compiler");
    expect(compiler->calls() == 1, "max_attempts 0 still makes one attempt");
  }
}

// ============================================================================
// WorkerPool
// ============================================================================

void test_deadline_passed_skips_sandbox() {
  PoolFixture fx;
  auto pool = fx.make_pool(proofarm::WorkerPoolOptions{});
  auto job = make_job("late", proofarm::JobPriority::critical);
  job.deadline = std::chrono::steady_clock::now() - 1s;
  const auto r = pool->process_job(job, 0);
  expect(!r.success, "late job fails");
  expect(r.error_code == proofarm::ErrorCode::deadline_exceeded, "deadline_exceeded code");
  expect(r.error_message && contains(*r.error_message, "deadline"), "message mentions deadline");
  expect(fx.runtime->creates() == 0, "no sandbox created");
  expect(fx.store->download_count() == 0, "no bundle downloaded");
}

void test_job_timeout_stops_sandbox() {
  PoolFixture fx;
  fx.runtime->proof_blocks = true;
  proofarm::WorkerPoolOptions opts;
  opts.max_job_duration = std::chrono::seconds(1);
  auto pool = fx.make_pool(opts);

  const auto started = std::chrono::steady_clock::now();
  const auto r = pool->process_job(make_job("slow", proofarm::JobPriority::normal), 0);
  const auto took = elapsed_ms(started);

  expect(!r.success, "slow job fails");
  expect(r.error_code == proofarm::ErrorCode::timeout, "timeout code");
  expect(r.error_message && contains(*r.error_message, "timeout"), "timeout message");
  expect(took >= 950 && took < 1500, "timeout fires within bounded overhead (" + std::to_string(took) + "ms)");
  expect(fx.runtime->killed_execs() == 1, "running proof was stopped, not abandoned");
  expect(fx.runtime->creates() == 1 && fx.runtime->removes() == 1, "cleanup still runs once");
}

void test_bundle_download_failure() {
  PoolFixture fx;
  fx.store->fail_download = true;
  auto pool = fx.make_pool(proofarm::WorkerPoolOptions{});
  const auto r = pool->process_job(make_job("nobundle", proofarm::JobPriority::normal), 2);
  expect(r.error_code == proofarm::ErrorCode::bundle_download_failed, "bundle_download_failed code");
  expect(r.worker_index == 2, "worker index recorded");
  expect(fx.runtime->creates() == 0, "no sandbox without a bundle");
}

void test_upload_failure_is_not_fatal() {
  PoolFixture fx;
  fx.store->fail_upload = true;
  auto pool = fx.make_pool(proofarm::WorkerPoolOptions{});
  const auto r = pool->process_job(make_job("up", proofarm::JobPriority::normal), 0);
  expect(r.success, "job succeeds although the upload failed");
  expect(r.proof_artifact.has_value(), "artifact still reported");
}

void test_successful_job_uploads_artifact() {
  PoolFixture fx;
  proofarm::WorkerPoolOptions opts;
  opts.key_prefix = "proofs";
  auto pool = fx.make_pool(opts);
  auto job = make_job("up2", proofarm::JobPriority::normal);
  proofarm::ResourceLimits limits;
  limits.memory_bytes = 512ull * 1024 * 1024;
  job.options.resource_limits = limits;
  const auto r = pool->process_job(job, 0);
  expect(r.success, "job succeeds");
  const auto uploads = fx.store->uploads();
  expect(uploads.size() == 1, "one artifact uploaded");
  expect(uploads.begin()->first == "proofs/" + r.proof_artifact->id, "artifact key is prefix/id");
  expect(contains(uploads.begin()->second, "\"status\":\"success\""), "serialized artifact uploaded");
  expect(fx.runtime->last_limits().memory_bytes == 512ull * 1024 * 1024, "per-job limits reach the sandbox");
}

void test_graceful_shutdown_latency() {
  PoolFixture fx;
  proofarm::WorkerPoolOptions opts;
  opts.worker_count = 4;
  opts.idle_wait = std::chrono::milliseconds(10000);
  auto pool = fx.make_pool(opts);
  const auto started = pool->start(passing_validator());
  expect(started.ok, "pool starts: " + started.message);
  expect(pool->is_running(), "running");
  const auto wait_start = std::chrono::steady_clock::now();
  while (pool->active_worker_count() < 4 && elapsed_ms(wait_start) < 1000) std::this_thread::sleep_for(5ms);
  expect(pool->active_worker_count() == 4, "all workers live");

  std::this_thread::sleep_for(50ms);
  const auto stop_start = std::chrono::steady_clock::now();
  pool->stop();
  const auto took = elapsed_ms(stop_start);
  expect(took < 500, "idle workers exit promptly on stop (" + std::to_string(took) + "ms)");
  expect(pool->active_worker_count() == 0, "no live workers after stop");
  expect(!pool->is_running(), "not running after stop");
}

void test_slow_generation_times_out() {
  PoolFixture fx;
  fx.executor = std::make_shared<proofarm::SandboxExecutor>(fx.runtime, std::make_shared<StubbornCompiler>(3000ms),
                                                            test_executor_options());
  proofarm::WorkerPoolOptions opts;
  opts.max_job_duration = std::chrono::seconds(1);
  auto pool = fx.make_pool(opts);

  const auto started = std::chrono::steady_clock::now();
  const auto r = pool->process_job(make_job("thinking", proofarm::JobPriority::normal), 0);
  const auto took = elapsed_ms(started);

  expect(r.error_code == proofarm::ErrorCode::timeout, "slow generation reported as timeout");
  expect(took >= 950 && took < 1500, "worker released at the deadline (" + std::to_string(took) + "ms)");
  expect(fx.runtime->creates() == 1 && fx.runtime->removes() == 1, "sandbox cleaned up once");
  expect(fx.runtime->exec_tools() == std::vector<std::string>({"lake"}), "proof never ran");
  expect(fx.executor->live_sandboxes() == 0, "no live sandbox");
  expect(fx.executor->pending_helpers() == 1, "generation still finishing in the background");
  expect(wait_until_true([&] { return fx.executor->pending_helpers() == 0; }, 5000ms), "helper finishes later");
}

void test_generation_sees_stop_at_deadline() {
  PoolFixture fx;
  auto compiler = std::make_shared<CooperativeCompiler>();
  fx.executor = std::make_shared<proofarm::SandboxExecutor>(fx.runtime, compiler, test_executor_options());
  proofarm::WorkerPoolOptions opts;
  opts.max_job_duration = std::chrono::seconds(1);
  auto pool = fx.make_pool(opts);

  const auto started = std::chrono::steady_clock::now();
  const auto r = pool->process_job(make_job("coop", proofarm::JobPriority::normal), 0);
  const auto took = elapsed_ms(started);

  expect(r.error_code == proofarm::ErrorCode::timeout, "timeout code");
  expect(took < 1500, "released at the deadline (" + std::to_string(took) + "ms)");
  expect(wait_until_true([&] { return compiler->saw_stop.load(); }, 2000ms), "compiler observed the stop token");
  expect(wait_until_true([&] { return fx.executor->pending_helpers() == 0; }, 2000ms), "helper exits promptly");
}

void test_slow_sandbox_calls_time_out() {
  {
    PoolFixture fx;
    fx.runtime->copy_delay = 3000ms;
    proofarm::WorkerPoolOptions opts;
    opts.max_job_duration = std::chrono::seconds(1);
    auto pool = fx.make_pool(opts);
    const auto started = std::chrono::steady_clock::now();
    const auto r = pool->process_job(make_job("slowcopy", proofarm::JobPriority::normal), 0);
    const auto took = elapsed_ms(started);
    expect(r.error_code == proofarm::ErrorCode::timeout, "slow mount reported as timeout");
    expect(took < 1500, "slow mount released at the deadline (" + std::to_string(took) + "ms)");
    expect(fx.runtime->removes() == 1, "sandbox cleaned up once");
  }
  {
    PoolFixture fx;
    fx.runtime->create_delay = 2000ms;
    proofarm::WorkerPoolOptions opts;
    opts.max_job_duration = std::chrono::seconds(1);
    auto pool = fx.make_pool(opts);
    const auto started = std::chrono::steady_clock::now();
    const auto r = pool->process_job(make_job("slowcreate", proofarm::JobPriority::normal), 0);
    const auto took = elapsed_ms(started);
    expect(r.error_code == proofarm::ErrorCode::timeout, "slow create reported as timeout");
    expect(took < 1500, "slow create released at the deadline (" + std::to_string(took) + "ms)");
    expect(wait_until_true([&] { return fx.executor->pending_helpers() == 0; }, 5000ms), "create finishes later");
    expect(fx.runtime->creates() == 1 && fx.runtime->removes() == 1, "late sandbox removed");
    expect(fx.executor->live_sandboxes() == 0, "late sandbox never tracked");
  }
}

void test_job_limits_cannot_exceed_farm() {
  PoolFixture fx;
  auto pool = fx.make_pool(proofarm::WorkerPoolOptions{});
  auto job = make_job("greedy", proofarm::JobPriority::normal);
  proofarm::ResourceLimits asked;
  asked.memory_bytes = 0;
  asked.process_limit = 0;
  asked.cpu_cores = 64.0;
  job.options.resource_limits = asked;
  const auto r = pool->process_job(job, 0);
  expect(r.success, "job still runs: " + (r.error_message ? *r.error_message : std::string()));
  const proofarm::ResourceLimits ceiling{};
  const auto got = fx.runtime->last_limits();
  expect(got.memory_bytes == ceiling.memory_bytes, "memory bounded (" + std::to_string(got.memory_bytes) + ")");
  expect(got.process_limit == ceiling.process_limit, "process count bounded");
  expect(got.cpu_cores == ceiling.cpu_cores, "cpu bounded");
}

void test_pool_start_runs_validation() {
  PoolFixture fx;
  proofarm::WorkerPoolOptions opts;
  opts.worker_count = 0;
  auto pool = fx.make_pool(opts);
  const auto r = pool->start(passing_validator());
  expect(!r.ok && r.check == "pool" && r.code == proofarm::ErrorCode::config_invalid, "zero workers refused");

  opts.worker_count = 1;
  auto scanned = fx.make_pool(opts);
  auto scanner = std::make_shared<FakeScanner>();
  proofarm::SecurityConfig s;
  s.scanning.enabled = true;
  const auto v = scanned->start(proofarm::SecurityValidator(s, hardened_runtime(), scanner));
  expect(v.ok && scanner->calls == 1, "start ran the scan itself");
  expect(v.scan.has_value(), "scan report returned");
  scanned->stop();
}

// ============================================================================
// ResultCollector & Farm
// ============================================================================

void test_collector_counts_persist_failures() {
  auto channel = std::make_shared<proofarm::ResultChannel>(4);
  auto store = std::make_shared<FakeArtifactStore>();
  store->fail_store = true;
  auto stats = std::make_shared<proofarm::FarmStats>();
  proofarm::ResultCollector collector(channel, store, stats);

  proofarm::JobResult r;
  r.job_id = "j1";
  r.success = false;
  r.error_code = proofarm::ErrorCode::build_failed;
  r.error_message = "Lean compilation failed";
  collector.collect(r);

  expect(stats->persist_failures.load() == 1, "persist failure counted");
  expect(stats->failed_jobs.load() == 1, "failure counted");
  expect(stats->failure_categories().at("build_failed") == 1, "failure category recorded");
  expect(collector.processed() == 1, "result processed");
}

void test_collector_drains_without_loss() {
  auto channel = std::make_shared<proofarm::ResultChannel>(1);
  auto store = std::make_shared<FakeArtifactStore>();
  auto stats = std::make_shared<proofarm::FarmStats>();
  proofarm::ResultCollector collector(channel, store, stats);
  collector.start();

  std::vector<std::thread> producers;
  for (int t = 0; t < 4; ++t) {
    producers.emplace_back([channel, t] {
      for (int i = 0; i < 5; ++i) {
        proofarm::JobResult r;
        r.job_id = "p" + std::to_string(t) + "-" + std::to_string(i);
        r.success = true;
        r.duration_ms = static_cast<std::uint64_t>(i * 10);
        channel->push(std::move(r));
      }
    });
  }
  for (auto& p : producers) p.join();
  collector.stop();
  expect(store->results().size() == 20, "every result persisted through a capacity-1 channel");
  expect(stats->successful_jobs.load() == 20, "every result counted");
  expect(stats->latency.count() == 20, "latency recorded per result");
}

std::atomic<int> g_events_seen{0};
void count_event(const proofarm::JobEvent& ev) {
  if (!ev.job_id.empty()) g_events_seen.fetch_add(1);
}

void test_farm_end_to_end() {
  auto runtime = std::make_shared<FakeSandboxRuntime>();
  auto store = std::make_shared<FakeArtifactStore>();
  auto scanner = std::make_shared<FakeScanner>();
  scanner->report.high = 1;

  proofarm::FarmConfig cfg;
  cfg.worker_count = 2;
  cfg.idle_wait_ms = 10;
  cfg.max_job_duration_seconds = 30;

  proofarm::FarmDependencies deps;
  deps.runtime = runtime;
  deps.compiler = std::make_shared<FakeCompiler>();
  deps.store = store;
  deps.scanner = scanner;
  deps.runtime_info = hardened_runtime();

  g_events_seen = 0;
  proofarm::set_job_event_hook(count_event);
  {
    proofarm::Farm farm(cfg, deps);
    const auto v = farm.start();
    expect(v.ok, "farm starts: " + v.message);
    expect(scanner->calls == 1, "scan ran once at startup");
    for (int i = 0; i < 5; ++i) {
      expect(farm.submit(make_job("e2e-" + std::to_string(i), proofarm::JobPriority::normal)) ==
                 proofarm::ErrorCode::none,
             "submit accepted");
    }
    expect(farm.wait_for_results(5, 10000ms), "all results collected");
    expect(farm.stats().successful_jobs.load() == 5, "five successes");
    expect(store->results().size() == 5, "five results persisted");
    expect(store->uploads().size() == 5, "five artifacts uploaded");
    expect(runtime->creates() == 5 && runtime->removes() == 5, "every sandbox cleaned up");
    expect(runtime->last_limits().memory_bytes == cfg.resource_limits.memory_bytes, "configured limits applied");
    const std::string health = farm.health_to_json();
    expect(contains(health, "\"running\":true"), "health reports running");
    farm.stop();
    expect(farm.pool().active_worker_count() == 0, "workers gone after stop");
  }
  proofarm::set_job_event_hook(nullptr);
  expect(g_events_seen.load() == 5, "one event per job");
}

void test_farm_refuses_insecure_start() {
  auto runtime = std::make_shared<FakeSandboxRuntime>();
  proofarm::FarmConfig cfg;
  cfg.worker_count = 2;
  cfg.idle_wait_ms = 10;
  cfg.security.scanning.enabled = false;
  auto rt = hardened_runtime();
  rt.is_rootless = false;

  proofarm::FarmDependencies deps;
  deps.runtime = runtime;
  deps.compiler = std::make_shared<FakeCompiler>();
  deps.store = std::make_shared<FakeArtifactStore>();
  deps.runtime_info = rt;

  proofarm::Farm farm(cfg, deps);
  const auto v = farm.start();
  expect(!v.ok && v.code == proofarm::ErrorCode::security_validation_failed, "farm refuses to start");
  expect(!farm.pool().is_running(), "pool never started");
  farm.submit(make_job("x", proofarm::JobPriority::normal));
  std::this_thread::sleep_for(100ms);
  expect(farm.pool().current_queue_depth() == 1, "job stays queued");
  expect(runtime->creates() == 0, "no sandbox created");
}

// ============================================================================
// LocalArtifactStore
// ============================================================================

void test_store_artifact_round_trip() {
  const fs::path root = make_temp_dir("store");
  proofarm::StorageConfig sc;
  sc.root = root.string();
  proofarm::LocalArtifactStore store(sc);

  std::string bytes = "{\"output\":\"";
  for (int i = 0; i < 200; ++i) bytes += "goals accomplished ";
  bytes += "\"}";
  std::string err;
  expect(store.upload_artifact("proofs/proof-1", bytes, &err), "upload succeeds: " + err);
  const auto back = store.get_artifact("proofs/proof-1");
  expect(back && *back == bytes, "artifact reads back intact");

  const std::string digest = proofarm::artifact_content_hash(bytes);
  const auto info = store.info(digest);
  expect(info && info->original_size == bytes.size(), "meta records original size");
  expect(info->encoding == "identity" || info->encoding == "zstd", "known encoding");
  expect(store.upload_artifact("proofs/proof-1-copy", bytes, &err), "re-upload dedups");
  expect(store.get_object(digest).has_value(), "object readable by digest");

  fs::remove_all(root);
}

void test_store_detects_corruption() {
  const fs::path root = make_temp_dir("corrupt");
  proofarm::StorageConfig sc;
  sc.root = root.string();
  sc.compress_artifacts = false;
  proofarm::LocalArtifactStore store(sc);

  const std::string bytes = "artifact bytes for corruption check";
  std::string err;
  expect(store.upload_artifact("k", bytes, &err), "upload");
  const std::string digest = proofarm::artifact_content_hash(bytes);
  const fs::path obj = root / "objects" / digest.substr(0, 2) / digest.substr(2, 2) / digest;
  {
    std::fstream file(obj, std::ios::in | std::ios::out | std::ios::binary);
    expect(file.good(), "can open object file");
    char byte;
    file.read(&byte, 1);
    byte ^= 0x5a;
    file.seekp(0);
    file.write(&byte, 1);
  }
  expect(!store.get_artifact("k").has_value(), "corrupted blob reads as absent");

  fs::remove_all(root);
}

void test_store_keys_and_bundles() {
  const fs::path root = make_temp_dir("bundles");
  proofarm::StorageConfig sc;
  sc.root = root.string();
  proofarm::LocalArtifactStore store(sc);

  std::string err;
  expect(!store.upload_artifact("../escape", "x", &err), "escaping key rejected");
  expect(!store.upload_artifact("/abs", "x", &err), "absolute key rejected");
  expect(!store.download_code_bundle("a/../../b", &err), "escaping bundle key rejected");

  fs::create_directories(root / "bundles" / "proofs" / "abc123");
  std::ofstream(root / "bundles" / "proofs" / "abc123" / "lakefile.lean") << "import Lake\n";
  const auto path = store.download_code_bundle("proofs/abc123", &err);
  expect(path && fs::exists(fs::path(*path) / "lakefile.lean"), "bundle resolved to its directory");

  err.clear();
  expect(!store.download_code_bundle("proofs/missing", &err), "missing bundle");
  expect(contains(err, "not found"), "missing bundle error");

  proofarm::Theorem t;
  t.id = "thm";
  t.content_digest = "abc123";
  expect(proofarm::bundle_key("proofs", t) == "proofs/abc123", "bundle key uses content digest");

  fs::remove_all(root);
}

void test_store_persists_results() {
  const fs::path root = make_temp_dir("results");
  proofarm::StorageConfig sc;
  sc.root = root.string();
  proofarm::LocalArtifactStore store(sc);

  proofarm::JobResult r;
  r.job_id = "job-1";
  r.theorem_id = "thm-1";
  r.success = false;
  r.error_code = proofarm::ErrorCode::timeout;
  r.error_message = "Job timeout after 300000ms";
  std::string err;
  expect(store.store_job_result(r, &err), "first result stored");
  r.job_id = "job-2";
  expect(store.store_job_result(r, &err), "second result stored");

  const auto lines = store.read_job_results();
  expect(lines.size() == 2, "two NDJSON lines");
  std::optional<proofarm::jsonlite::JsonError> perr;
  const auto obj = proofarm::jsonlite::parse(lines[1], &perr);
  expect(!perr, "result line is JSON");
  const auto inner = proofarm::jsonlite::get_object(obj, "result");
  expect(inner && proofarm::jsonlite::get_string(*inner, "job_id") == "job-2", "result payload");
  expect(proofarm::jsonlite::get_string(*inner, "error_code") == "timeout", "error code serialized");
  expect(proofarm::jsonlite::get_string(obj, "record_hash") == proofarm::result_record_hash(proofarm::job_result_to_json(r)),
         "record hash covers the serialized result");

  fs::remove_all(root);
}

// ============================================================================
// Process execution & native runtime
// ============================================================================

void test_run_process_basic() {
  proofarm::ProcessSpec spec;
  spec.command = "/bin/sh";
  spec.argv = {"-c", "echo proof; echo warn 1>&2; exit 3"};
  const auto r = proofarm::run_process(spec);
  expect(r.error_message.empty(), "process ran: " + r.error_message);
  expect(r.exit_code == 3, "exit code propagated");
  expect(r.stdout_text == "proof\n", "stdout captured");
  expect(r.stderr_text == "warn\n", "stderr captured");
}

void test_run_process_truncation() {
  proofarm::ProcessSpec spec;
  spec.command = "/bin/sh";
  spec.argv = {"-c", "printf 'ABCDEFGHIJ'"};
  spec.max_output_bytes = 4;
  const auto r = proofarm::run_process(spec);
  expect(r.stdout_truncated, "stdout truncates at max_output_bytes");
}

void test_run_process_timeout() {
  proofarm::ProcessSpec spec;
  spec.command = "/bin/sh";
  spec.argv = {"-c", "sleep 10"};
  spec.timeout_ms = 50;
  const auto started = std::chrono::steady_clock::now();
  const auto r = proofarm::run_process(spec);
  expect(r.timed_out && r.exit_code == 124, "timeout exit code = 124");
  expect(elapsed_ms(started) < 2000, "child killed promptly");
}

void test_process_handle_kill() {
  proofarm::ProcessSpec spec;
  spec.command = "/bin/sh";
  spec.argv = {"-c", "sleep 10"};
  spec.timeout_ms = 20000;
  proofarm::ProcessHandle handle;
  std::thread killer([&] {
    std::this_thread::sleep_for(100ms);
    handle.request_kill();
  });
  const auto started = std::chrono::steady_clock::now();
  const auto r = proofarm::run_process(spec, &handle);
  killer.join();
  expect(r.killed && r.exit_code == 137, "killed child reports 137");
  expect(elapsed_ms(started) < 2000, "kill is prompt");
}

void test_namespace_runtime_lifecycle() {
  const fs::path root = make_temp_dir("rt");
  const fs::path host_file = root / "hello.txt";
  std::ofstream(host_file) << "proof-farm\n";

  proofarm::NamespaceSandboxOptions opts;
  opts.work_root = (root / "sandboxes").string();
  proofarm::NamespaceSandboxRuntime rt(opts);

  std::string err;
  const std::string id = rt.create("leanprover/lean4:4.7.0", proofarm::ResourceLimits{}, {}, &err);
  expect(!id.empty(), "sandbox created: " + err);
  expect(rt.live_sandboxes() == 1, "one live sandbox");
  expect(rt.copy_into(id, host_file.string(), "/var/lean-farm/code/hello.txt", &err), "copy into sandbox");
  const fs::path mapped = rt.host_path_for(id, "/var/lean-farm/code/hello.txt");
  expect(fs::exists(mapped), "sandbox path backed by host directory");

  const auto r = rt.exec(id, {"cat", "/var/lean-farm/code/hello.txt"}, 5000ms);
  expect(r.error_message.empty() && r.exit_code == 0, "cat ran in sandbox: " + r.error_message + r.stderr_text);
  expect(r.stdout_text == "proof-farm\n", "sandbox path translated for the command");

  expect(rt.stop(id, &err), "stop");
  const auto after = rt.exec(id, {"cat", "/var/lean-farm/code/hello.txt"}, 5000ms);
  expect(after.killed && after.exit_code == 137, "stopped sandbox refuses exec");
  expect(rt.remove(id, &err), "remove");
  expect(rt.live_sandboxes() == 0, "no live sandbox");
  expect(!fs::exists(mapped), "sandbox directory removed");
  expect(!rt.remove(id, &err), "second remove reports unknown id");

  fs::remove_all(root);
}

// ============================================================================
// Observability & misc
// ============================================================================

void test_latency_histogram() {
  proofarm::LatencyHistogram h;
  h.record(1);
  h.record(2);
  h.record(3);
  h.record(100);
  expect(h.count() == 4, "histogram count");
  expect(h.sum_ms() == 106, "histogram sum");
  expect(h.percentile(1.0) >= 64.0, "p100 lands in the 64-128ms bucket");
  expect(h.percentile(0.25) < 4.0, "p25 lands in a low bucket");
}

void test_job_event_serialization() {
  proofarm::JobResult r;
  r.job_id = "job-ev";
  r.theorem_id = "thm-ev";
  r.success = false;
  r.error_code = proofarm::ErrorCode::timeout;
  r.duration_ms = 42;
  proofarm::ProofArtifact a;
  a.output = "secret proof output";
  a.content_digest = proofarm::artifact_content_hash("code");
  r.proof_artifact = a;
  const auto ev = proofarm::make_job_event(r, proofarm::JobPriority::high);
  const std::string line = proofarm::job_event_to_json(ev);
  expect(contains(line, "\"job_id\":\"job-ev\""), "event carries job id");
  expect(contains(line, "\"priority\":\"high\""), "event carries priority");
  expect(contains(line, a.content_digest), "event carries artifact digest");
  expect(!contains(line, "secret proof output"), "event never carries proof output");
}

void test_log_levels_and_version() {
  expect(proofarm::log_level_from_string("debug") == proofarm::LogLevel::debug, "debug level");
  expect(proofarm::log_level_from_string("WARN") == proofarm::LogLevel::warn, "level names are case-insensitive");
  expect(proofarm::log_level_from_string("bogus") == proofarm::LogLevel::info, "unknown level maps to info");
  const auto manifest = proofarm::version::manifest_to_json(proofarm::version::current_manifest());
  expect(contains(manifest, "\"hash_algorithm\":1"), "manifest lists hash algorithm version");
  expect(contains(manifest, "blake3"), "manifest names the hash primitive");
}

}  // namespace

int main() {
  proofarm::set_log_level(proofarm::LogLevel::error);
  std::cout << "=== proofarm test suite ===\n";

  std::cout << "\n[Hashing & JSON]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("JSON parse and serialize", test_json_parse_and_serialize);

  std::cout << "\n[JobQueue]\n";
  run_test("priority order", test_queue_priority_order);
  run_test("FIFO within priority", test_queue_fifo_within_priority);
  run_test("capacity", test_queue_capacity);
  run_test("concurrent producers", test_queue_concurrent_producers);

  std::cout << "\n[Result channel]\n";
  run_test("backpressure", test_channel_backpressure);

  std::cout << "\n[Configuration]\n";
  run_test("config parse", test_config_parse);
  run_test("config validation errors", test_config_validation_errors);
  run_test("environment overrides", test_config_env_overrides);
  run_test("job description parse", test_job_description_parse);
  run_test("job priority must be known", test_job_priority_must_be_known);
  run_test("resource limits clamped to ceiling", test_resource_limits_clamped_to_ceiling);

  std::cout << "\n[Security validation]\n";
  run_test("all checks pass", test_security_all_checks_pass);
  run_test("runtime failures", test_security_runtime_failures);
  run_test("config failures", test_security_config_failures);
  run_test("vulnerability scan", test_security_vulnerability_scan);
  run_test("/proc status parsing", test_proc_status_parsing);
  run_test("detected process state checked", test_security_checks_detected_process_state);
  run_test("pool refuses start after failed validation", test_pool_refuses_start_after_failed_validation);

  std::cout << "\n[SandboxExecutor]\n";
  run_test("success pipeline", test_executor_success_pipeline);
  run_test("cleanup once on build failure", test_executor_cleanup_once_on_build_failure);
  run_test("failure paths clean up", test_executor_failure_paths_clean_up);
  run_test("sandbox lease releases once", test_sandbox_lease_releases_once);
  run_test("generation attempts and confidence", test_generation_attempts_and_confidence);

  std::cout << "\n[WorkerPool]\n";
  run_test("deadline passed skips sandbox", test_deadline_passed_skips_sandbox);
  run_test("job timeout stops sandbox", test_job_timeout_stops_sandbox);
  run_test("bundle download failure", test_bundle_download_failure);
  run_test("upload failure is not fatal", test_upload_failure_is_not_fatal);
  run_test("successful job uploads artifact", test_successful_job_uploads_artifact);
  run_test("graceful shutdown latency", test_graceful_shutdown_latency);
  run_test("slow generation times out", test_slow_generation_times_out);
  run_test("generation sees stop at deadline", test_generation_sees_stop_at_deadline);
  run_test("slow sandbox calls time out", test_slow_sandbox_calls_time_out);
  run_test("job limits cannot exceed farm", test_job_limits_cannot_exceed_farm);
  run_test("pool start runs validation", test_pool_start_runs_validation);

  std::cout << "\n[ResultCollector & Farm]\n";
  run_test("persist failures counted", test_collector_counts_persist_failures);
  run_test("collector drains without loss", test_collector_drains_without_loss);
  run_test("farm end to end", test_farm_end_to_end);
  run_test("farm refuses insecure start", test_farm_refuses_insecure_start);

  std::cout << "\n[LocalArtifactStore]\n";
  run_test("artifact round trip", test_store_artifact_round_trip);
  run_test("corruption detection", test_store_detects_corruption);
  run_test("keys and bundles", test_store_keys_and_bundles);
  run_test("result persistence", test_store_persists_results);

  std::cout << "\n[Process execution]\n";
  run_test("run_process basic", test_run_process_basic);
  run_test("stdout truncation", test_run_process_truncation);
  run_test("timeout enforcement", test_run_process_timeout);
  run_test("process handle kill", test_process_handle_kill);
  run_test("namespace runtime lifecycle", test_namespace_runtime_lifecycle);

  std::cout << "\n[Observability]\n";
  run_test("latency histogram", test_latency_histogram);
  run_test("job event serialization", test_job_event_serialization);
  run_test("log levels and version", test_log_levels_and_version);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return 0;
}
