#pragma once

#include <string>

// File logger. The operator's terminal belongs to the monitored program
// while a session runs, so nothing here ever writes to stdout/stderr.

enum class LogLevel {
    kDebug = 0,
    kInfo,
    kWarn,
    kError,
};

// Parse "debug" / "info" / "warn" / "warning" / "error". Unknown -> kInfo.
LogLevel parse_log_level(const std::string& name);

// Redirect the log to `path` and set the minimum level written.
// Parent directories are created. An empty path keeps the current file.
void log_configure(const std::string& path, LogLevel min_level);

// Current log file path (default: <temp_dir>/cctrace.log).
std::string log_path();

void tracer_log(LogLevel level, const std::string& msg);

inline void log_debug(const std::string& msg) { tracer_log(LogLevel::kDebug, msg); }
inline void log_info(const std::string& msg)  { tracer_log(LogLevel::kInfo, msg); }
inline void log_warn(const std::string& msg)  { tracer_log(LogLevel::kWarn, msg); }
inline void log_error(const std::string& msg) { tracer_log(LogLevel::kError, msg); }
