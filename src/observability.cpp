#include "proofarm/observability.hpp"

#include "proofarm/jsonlite.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>

namespace proofarm {

namespace {

inline size_t bucket_for_ms(std::uint64_t duration_ms) {
  if (duration_ms == 0) return 0;
  const size_t b = static_cast<size_t>(std::bit_width(duration_ms));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

std::atomic<JobEventHook> g_event_hook{nullptr};

}  // namespace

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(std::uint64_t duration_ms) {
  buckets_[bucket_for_ms(duration_ms)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_ms_.fetch_add(duration_ms, std::memory_order_relaxed);
}

double LatencyHistogram::mean_ms() const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_ms_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  std::uint64_t counts[kBuckets];
  for (size_t i = 0; i < kBuckets; ++i) {
    counts[i] = buckets_[i].load(std::memory_order_relaxed);
  }

  const std::uint64_t target = static_cast<std::uint64_t>(p * static_cast<double>(n));
  std::uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += counts[i];
    if (cumulative >= target) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(160);
  char buf[32];
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_ms\":";
  std::snprintf(buf, sizeof(buf), "%.2f", mean_ms());
  out += buf;
  out += ",\"p50_ms\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.50));
  out += buf;
  out += ",\"p95_ms\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.95));
  out += buf;
  out += ",\"p99_ms\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.99));
  out += buf;
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// FarmStats
// ---------------------------------------------------------------------------

void FarmStats::record(const JobResult& result) {
  total_jobs.fetch_add(1, std::memory_order_relaxed);
  if (result.success) {
    successful_jobs.fetch_add(1, std::memory_order_relaxed);
  } else {
    failed_jobs.fetch_add(1, std::memory_order_relaxed);
    if (result.error_code == ErrorCode::timeout) {
      timed_out_jobs.fetch_add(1, std::memory_order_relaxed);
    }
    std::lock_guard<std::mutex> lk(failure_mu_);
    ++failure_categories_[to_string(result.error_code)];
  }
  latency.record(result.duration_ms);
}

std::map<std::string, std::uint64_t> FarmStats::failure_categories() const {
  std::lock_guard<std::mutex> lk(failure_mu_);
  return failure_categories_;
}

std::string FarmStats::to_json() const {
  std::string out;
  out.reserve(512);
  out += "{\"total_jobs\":";
  out += std::to_string(total_jobs.load(std::memory_order_relaxed));
  out += ",\"successful_jobs\":";
  out += std::to_string(successful_jobs.load(std::memory_order_relaxed));
  out += ",\"failed_jobs\":";
  out += std::to_string(failed_jobs.load(std::memory_order_relaxed));
  out += ",\"timed_out_jobs\":";
  out += std::to_string(timed_out_jobs.load(std::memory_order_relaxed));
  out += ",\"persist_failures\":";
  out += std::to_string(persist_failures.load(std::memory_order_relaxed));
  out += ",\"latency\":";
  out += latency.to_json();
  out += ",\"failure_categories\":{";
  bool first = true;
  for (const auto& [code, n] : failure_categories()) {
    if (!first) out += ",";
    first = false;
    out += "\"" + code + "\":" + std::to_string(n);
  }
  out += "}}";
  return out;
}

// ---------------------------------------------------------------------------
// Event emission
// ---------------------------------------------------------------------------

JobEvent make_job_event(const JobResult& result, JobPriority priority) {
  JobEvent ev;
  ev.job_id = result.job_id;
  ev.theorem_id = result.theorem_id;
  ev.priority = to_string(priority);
  ev.ok = result.success;
  ev.error_code = to_string(result.error_code);
  ev.duration_ms = result.duration_ms;
  ev.worker_index = result.worker_index;
  if (result.proof_artifact) ev.artifact_digest = result.proof_artifact->content_digest;
  return ev;
}

std::string job_event_to_json(const JobEvent& ev) {
  jsonlite::Object o;
  o["job_id"] = ev.job_id;
  o["theorem_id"] = ev.theorem_id;
  o["priority"] = ev.priority;
  o["ok"] = ev.ok;
  o["error_code"] = ev.error_code;
  o["duration_ms"] = static_cast<std::uint64_t>(ev.duration_ms);
  o["worker"] = ev.worker_index < 0 ? jsonlite::Value{nullptr}
                                    : jsonlite::Value{static_cast<std::uint64_t>(ev.worker_index)};
  o["artifact_digest"] = ev.artifact_digest;
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

void set_job_event_hook(JobEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_job_event(const JobEvent& ev) {
  JobEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  const char* log_path = std::getenv("PROOFARM_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  std::string line = job_event_to_json(ev);
  line += '\n';
  // O_APPEND writes below PIPE_BUF are atomic on POSIX.
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace proofarm
