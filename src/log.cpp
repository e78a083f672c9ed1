#include "proofarm/log.hpp"

#include <atomic>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <mutex>

namespace proofarm {

namespace {

std::mutex g_log_mu;
std::atomic<int> g_level{-1};  // -1 = not yet initialized from env

const char* level_name(LogLevel level) {
  switch (level) {
    case LogLevel::error: return "ERROR";
    case LogLevel::warn: return "WARN";
    case LogLevel::info: return "INFO";
    case LogLevel::debug: return "DEBUG";
  }
  return "INFO";
}

}  // namespace

LogLevel log_level_from_string(const std::string& name) {
  std::string lower;
  for (char c : name) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (lower == "error") return LogLevel::error;
  if (lower == "warn" || lower == "warning") return LogLevel::warn;
  if (lower == "debug" || lower == "trace") return LogLevel::debug;
  return LogLevel::info;
}

void set_log_level(LogLevel level) {
  g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() {
  int lvl = g_level.load(std::memory_order_relaxed);
  if (lvl < 0) {
    const char* env = std::getenv("PROOFARM_LOG_LEVEL");
    const LogLevel parsed = (env && env[0]) ? log_level_from_string(env) : LogLevel::info;
    int expected = -1;
    g_level.compare_exchange_strong(expected, static_cast<int>(parsed), std::memory_order_relaxed);
    lvl = g_level.load(std::memory_order_relaxed);
  }
  return static_cast<LogLevel>(lvl);
}

void log_message(LogLevel level, const char* component, const std::string& message) {
  if (static_cast<int>(level) > static_cast<int>(log_level())) return;
  std::lock_guard<std::mutex> lk(g_log_mu);
  std::fprintf(stderr, "[proofarm:%s] %s %s\n", component, level_name(level), message.c_str());
}

}  // namespace proofarm
