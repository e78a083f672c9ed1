#pragma once

// proofarm/log.hpp — Leveled stderr logging.
//
// Every line has the form "[proofarm:<component>] <LEVEL> <message>" and is
// written with a single fprintf under a process-wide mutex, so lines from
// concurrent workers never interleave. stdout is reserved for command output.
//
// The threshold is read once from PROOFARM_LOG_LEVEL (error|warn|info|debug,
// default info) unless set_log_level() was called first.

#include <string>

namespace proofarm {

enum class LogLevel {
  error = 0,
  warn = 1,
  info = 2,
  debug = 3,
};

void set_log_level(LogLevel level);
LogLevel log_level();

// Unknown names map to info.
LogLevel log_level_from_string(const std::string& name);

void log_message(LogLevel level, const char* component, const std::string& message);

inline void log_error(const char* component, const std::string& message) { log_message(LogLevel::error, component, message); }
inline void log_warn(const char* component, const std::string& message) { log_message(LogLevel::warn, component, message); }
inline void log_info(const char* component, const std::string& message) { log_message(LogLevel::info, component, message); }
inline void log_debug(const char* component, const std::string& message) { log_message(LogLevel::debug, component, message); }

}  // namespace proofarm
