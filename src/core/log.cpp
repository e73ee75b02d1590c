#include "log.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <mutex>

namespace {

std::mutex g_log_mutex;
std::string g_log_path;
LogLevel g_min_level = LogLevel::kInfo;

const std::string& current_path() {
    if (g_log_path.empty())
        g_log_path = (platform::temp_dir() / "cctrace.log").string();
    return g_log_path;
}

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo:  return "INFO ";
        case LogLevel::kWarn:  return "WARN ";
        case LogLevel::kError: return "ERROR";
    }
    return "INFO ";
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    std::string n = to_lower(trimmed(name));
    if (n == "debug") return LogLevel::kDebug;
    if (n == "warn" || n == "warning") return LogLevel::kWarn;
    if (n == "error" || n == "critical") return LogLevel::kError;
    return LogLevel::kInfo;
}

void log_configure(const std::string& path, LogLevel min_level) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!path.empty()) {
        std::error_code ec;
        auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) std::filesystem::create_directories(parent, ec);
        g_log_path = path;
    }
    g_min_level = min_level;
}

std::string log_path() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return current_path();
}

void tracer_log(LogLevel level, const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (level < g_min_level) return;

    std::ofstream out(current_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << level_tag(level) << " " << msg << "\n";
}
