#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load global config from ~/.cctrace/config.yaml
    static Result<Config> load_global();

    // Load project config from ./cctrace.yaml
    static Result<Config> load_project(const fs::path& dir = fs::current_path());

    // Load a single YAML file on top of the defaults.
    static Result<Config> load_file(const fs::path& path);

    // Global, then project (project keys win), then CCTRACE_PRIVACY_MODE.
    // Missing files are not an error; files that fail to parse are.
    static Result<Config> load(const fs::path& project_dir = fs::current_path());

    const TracerSettings& settings() const { return settings_; }
    TracerSettings& settings() { return settings_; }

    // Non-fatal problems found while reading (unknown mode names and such).
    const std::vector<std::string>& warnings() const { return warnings_; }

public:
    Config() = default;

private:
    TracerSettings settings_;
    std::vector<std::string> warnings_;

    Result<void> overlay_file(const fs::path& path);
};

// Helper to check if configs exist
bool global_config_exists();
bool project_config_exists(const fs::path& dir = fs::current_path());

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_project_config_path(const fs::path& dir = fs::current_path());

// Create default global config
Result<void> create_default_global_config();
