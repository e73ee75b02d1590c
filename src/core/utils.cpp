#include "utils.hpp"
#include "types.hpp"
#include <chrono>
#include <ctime>
#include <cctype>

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

std::string now_stamp() {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d-%H%M%S", &tm_buf);
    return std::string(buf);
}

std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// ── PrivacyMode names ────────────────────────────────────────

std::string privacy_mode_name(PrivacyMode mode) {
    switch (mode) {
        case PrivacyMode::kMinimal:  return "minimal";
        case PrivacyMode::kModerate: return "moderate";
        case PrivacyMode::kStrict:   return "strict";
    }
    return "strict";
}

std::optional<PrivacyMode> parse_privacy_mode(const std::string& name) {
    std::string n = to_lower(trimmed(name));
    if (n == "minimal")  return PrivacyMode::kMinimal;
    if (n == "moderate") return PrivacyMode::kModerate;
    if (n == "strict")   return PrivacyMode::kStrict;
    return std::nullopt;
}
