#include "proofarm/result_collector.hpp"

#include "proofarm/log.hpp"

namespace proofarm {

ResultCollector::ResultCollector(std::shared_ptr<ResultChannel> channel, std::shared_ptr<IArtifactStore> store,
                                 std::shared_ptr<FarmStats> stats)
    : channel_(std::move(channel)), store_(std::move(store)), stats_(std::move(stats)) {}

ResultCollector::~ResultCollector() { stop(); }

void ResultCollector::start() {
  if (thread_.joinable()) return;
  thread_ = std::thread([this] { run(); });
}

void ResultCollector::stop() {
  channel_->close();
  if (thread_.joinable()) thread_.join();
}

void ResultCollector::run() {
  while (auto result = channel_->pop()) {
    collect(*result);
  }
  log_debug("collector", "result channel closed and drained");
}

void ResultCollector::collect(const JobResult& result) {
  if (result.success) {
    log_info("collector", "job " + result.job_id + " succeeded in " + std::to_string(result.duration_ms) + "ms");
  } else {
    log_warn("collector", "job " + result.job_id + " failed (" + to_string(result.error_code) +
                              "): " + result.error_message.value_or(""));
  }

  stats_->record(result);
  emit_job_event(make_job_event(result, result.priority));

  if (store_) {
    std::string err;
    if (!store_->store_job_result(result, &err)) {
      stats_->record_persist_failure();
      log_error("collector", "failed to persist result for job " + result.job_id + ": " + err);
    }
  }

  {
    std::lock_guard<std::mutex> lk(mu_);
    ++processed_;
  }
  cv_.notify_all();
}

std::uint64_t ResultCollector::processed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return processed_;
}

bool ResultCollector::wait_for_processed(std::uint64_t n, std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lk(mu_);
  return cv_.wait_for(lk, timeout, [&] { return processed_ >= n; });
}

}  // namespace proofarm
