#pragma once

// proofarm/observability.hpp — Job outcome statistics and event stream.
//
// DESIGN:
//   JobEvent is the observable unit: ResultCollector emits exactly one per
//   JobResult it consumes. Events are
//     - counted into the collector's FarmStats (always),
//     - handed to a registered hook if one is set, otherwise
//     - appended as one JSON line to PROOFARM_EVENT_LOG when that is set.
//   Event emission never blocks on anything other than a local file append.
//
// INVARIANT: events carry identifiers, digests and counters only. Proof
// output and sandbox stdout/stderr never appear in an event line.

#include <array>
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "proofarm/types.hpp"

namespace proofarm {

struct JobEvent {
  std::string job_id;
  std::string theorem_id;
  std::string priority;
  bool ok{false};
  std::string error_code;
  std::uint64_t duration_ms{0};
  int worker_index{-1};
  std::string artifact_digest;   // empty when no artifact was produced
};

// ---------------------------------------------------------------------------
// LatencyHistogram — power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers job durations in [2^(i-1) ms, 2^i ms); bucket 0 is [0, 1ms).
// Bucket boundaries are fixed; readers of to_json() rely on them.
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(std::uint64_t duration_ms);

  // p in [0.0, 1.0]. Returns milliseconds, 0.0 if empty.
  double percentile(double p) const;

  std::uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  std::uint64_t sum_ms() const { return sum_ms_.load(std::memory_order_relaxed); }
  double mean_ms() const;

  std::string to_json() const;

 private:
  std::array<std::atomic<std::uint64_t>, kBuckets> buckets_{};
  std::atomic<std::uint64_t> count_{0};
  std::atomic<std::uint64_t> sum_ms_{0};
};

// ---------------------------------------------------------------------------
// FarmStats — aggregated job outcome counters
// ---------------------------------------------------------------------------
// Thread-safe. Counters are atomic; the failure-category map has its own mutex.
class FarmStats {
 public:
  void record(const JobResult& result);
  void record_persist_failure() { persist_failures.fetch_add(1, std::memory_order_relaxed); }

  std::map<std::string, std::uint64_t> failure_categories() const;
  std::string to_json() const;

  std::atomic<std::uint64_t> total_jobs{0};
  std::atomic<std::uint64_t> successful_jobs{0};
  std::atomic<std::uint64_t> failed_jobs{0};
  std::atomic<std::uint64_t> timed_out_jobs{0};
  std::atomic<std::uint64_t> persist_failures{0};

  LatencyHistogram latency;

 private:
  mutable std::mutex failure_mu_;
  std::map<std::string, std::uint64_t> failure_categories_;
};

JobEvent make_job_event(const JobResult& result, JobPriority priority);

// Serialize one event as a compact single line (no trailing newline).
std::string job_event_to_json(const JobEvent& ev);

// Fire-and-forget. Hook takes precedence over the PROOFARM_EVENT_LOG sink.
void emit_job_event(const JobEvent& ev);

using JobEventHook = void (*)(const JobEvent&);
void set_job_event_hook(JobEventHook hook);

}  // namespace proofarm
