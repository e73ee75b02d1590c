#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <cstdlib>

namespace fs = std::filesystem;

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

bool project_config_exists(const fs::path& dir) {
    return fs::exists(get_project_config_path(dir));
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".cctrace";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / "cctrace.yaml";
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# cctrace configuration
# Project-level ./cctrace.yaml overrides anything set here.

# Program to run under the tracer
command: "claude"

# Redaction strength: minimal | moderate | strict
privacy_mode: "strict"

# Where session artifacts (pty-*.json) are written
sessions_dir: "./sessions"

# Trace segmentation to sessions_dir/debug-*.log
debug: false
log_level: "info"

# Character the monitored program prints when it waits for input
prompt_marker: ">"

# End the session after this many seconds (0 = never)
session_timeout: 0

# How long to wait for the program to exit at teardown
teardown_grace_ms: 2000

# Extra redaction patterns
# patterns:
#   - name: "INTERNAL_TICKET"
#     pattern: "TICKET-[0-9]{4,}"
#     description: "Internal ticket id"
#     level: "high"
#     replacement: "[TICKET]"
patterns: []

# Built-in patterns to switch off, by name
disabled_patterns: []
)";

    try {
        fs::create_directories(config_path.parent_path());
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

static PatternRecord parse_pattern_record(const YAML::Node& node) {
    PatternRecord rec;
    rec.name = node["name"].as<std::string>("");
    rec.pattern = node["pattern"].as<std::string>("");
    rec.description = node["description"].as<std::string>("");
    rec.level = node["level"].as<std::string>("high");
    if (node["replacement"] && node["replacement"].IsScalar()) {
        rec.replacement = node["replacement"].as<std::string>();
    }
    return rec;
}

Result<void> Config::overlay_file(const fs::path& path) {
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root || root.IsNull()) return Result<void>::Ok();
        if (!root.IsMap()) {
            return Result<void>::Err("Expected a mapping at the top of " + path.string());
        }

        TracerSettings& s = settings_;
        s.command = root["command"].as<std::string>(s.command);
        s.sessions_dir = root["sessions_dir"].as<std::string>(s.sessions_dir);
        s.debug = root["debug"].as<bool>(s.debug);
        s.log_level = root["log_level"].as<std::string>(s.log_level);
        s.prompt_marker = root["prompt_marker"].as<std::string>(s.prompt_marker);
        s.session_timeout = root["session_timeout"].as<int>(s.session_timeout);
        s.teardown_grace_ms = root["teardown_grace_ms"].as<int>(s.teardown_grace_ms);

        if (root["privacy_mode"]) {
            std::string name = root["privacy_mode"].as<std::string>("");
            auto mode = parse_privacy_mode(name);
            if (mode) {
                s.privacy_mode = *mode;
            } else {
                warnings_.push_back("Unknown privacy_mode '" + name + "' in " +
                                    path.string() + ", keeping " +
                                    privacy_mode_name(s.privacy_mode));
            }
        }

        if (root["patterns"] && root["patterns"].IsSequence()) {
            for (const auto& n : root["patterns"]) {
                if (!n.IsMap()) {
                    warnings_.push_back("Ignoring non-mapping entry under patterns in " + path.string());
                    continue;
                }
                s.patterns.push_back(parse_pattern_record(n));
            }
        }

        if (root["disabled_patterns"]) {
            if (root["disabled_patterns"].IsSequence()) {
                for (const auto& n : root["disabled_patterns"])
                    s.disabled_patterns.push_back(n.as<std::string>());
            } else if (root["disabled_patterns"].IsScalar()) {
                s.disabled_patterns.push_back(root["disabled_patterns"].as<std::string>());
            }
        }

        if (s.prompt_marker.empty()) s.prompt_marker = DEFAULT_PROMPT_MARKER;
        if (s.session_timeout < 0) s.session_timeout = 0;
        if (s.teardown_grace_ms < 0) s.teardown_grace_ms = DEFAULT_TEARDOWN_GRACE_MS;

        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to parse " + path.string() + ": " + e.what());
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }
    Config config;
    auto r = config.overlay_file(path);
    if (r.is_err()) return Result<Config>::Err(r.error);
    return Result<Config>::Ok(config);
}

Result<Config> Config::load_global() {
    return load_file(get_global_config_path());
}

Result<Config> Config::load_project(const fs::path& dir) {
    return load_file(get_project_config_path(dir));
}

Result<Config> Config::load(const fs::path& project_dir) {
    Config config;

    if (global_config_exists()) {
        auto r = config.overlay_file(get_global_config_path());
        if (r.is_err()) return Result<Config>::Err(r.error);
    }

    if (project_config_exists(project_dir)) {
        auto r = config.overlay_file(get_project_config_path(project_dir));
        if (r.is_err()) return Result<Config>::Err(r.error);
    }

    if (const char* env_mode = std::getenv("CCTRACE_PRIVACY_MODE")) {
        auto mode = parse_privacy_mode(env_mode);
        if (mode) {
            config.settings_.privacy_mode = *mode;
        } else {
            config.warnings_.push_back(std::string("Ignoring CCTRACE_PRIVACY_MODE=") + env_mode);
        }
    }

    return Result<Config>::Ok(config);
}
