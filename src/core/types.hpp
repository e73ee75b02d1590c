#pragma once

#include <string>
#include <optional>
#include <vector>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Redaction strength selected by the operator.
//   minimal  -> MAXIMUM patterns only
//   moderate -> HIGH and MAXIMUM
//   strict   -> every level
enum class PrivacyMode {
    kMinimal,
    kModerate,
    kStrict,
};

std::string privacy_mode_name(PrivacyMode mode);
std::optional<PrivacyMode> parse_privacy_mode(const std::string& name);

// One custom pattern record as it appears in cctrace.yaml.
struct PatternRecord {
    std::string name;
    std::string pattern;
    std::string description;
    std::string level = "high";
    std::optional<std::string> replacement;
};

struct TracerSettings {
    std::string command = "claude";
    PrivacyMode privacy_mode = PrivacyMode::kStrict;
    std::string sessions_dir = "./sessions";
    bool debug = false;
    std::string log_level = "info";
    std::string prompt_marker = ">";
    int session_timeout = 0;            // seconds, 0 = no limit
    int teardown_grace_ms = 2000;
    std::vector<PatternRecord> patterns;
    std::vector<std::string> disabled_patterns;
};
