#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>

// Ordered: a mode scans every level at or above its floor.
enum class SensitivityLevel {
    kLow = 1,
    kMedium = 2,
    kHigh = 3,
    kMaximum = 4,
};

std::string sensitivity_name(SensitivityLevel level);   // "LOW" .. "MAXIMUM"
std::optional<SensitivityLevel> parse_sensitivity(const std::string& name);

// Lowest level scanned in `mode`.
SensitivityLevel mode_floor(PrivacyMode mode);
bool mode_scans(PrivacyMode mode, SensitivityLevel level);

// A registered detector. `regex` is ECMAScript syntax, matched case-insensitively.
// `replacement` may reference groups ($1, $&); without one the match is
// replaced by "[<NAME>_REDACTED]".
struct PatternSpec {
    std::string name;
    std::string regex;
    std::string description;
    SensitivityLevel level = SensitivityLevel::kHigh;
    std::optional<std::string> replacement;
    bool enabled = true;
};

// One occurrence found by a scan. Offsets are byte offsets, end exclusive.
struct Match {
    std::string pattern_name;
    size_t start = 0;
    size_t end = 0;
    SensitivityLevel level = SensitivityLevel::kLow;
    std::string replacement;

    size_t length() const { return end - start; }
};

struct MaskResult {
    std::string text;
    std::vector<Match> matches;     // kept matches, ascending start

    // Distinct pattern names in order of first appearance.
    std::vector<std::string> pattern_names() const;
};

struct SensitivityReport {
    std::optional<SensitivityLevel> level;   // highest detected, nullopt when clean
    int score = 0;                           // numeric level, 0 when clean
    bool requires_approval = false;          // level >= HIGH
    std::vector<std::string> detected;
};

struct PatternSummary {
    std::string name;
    std::string description;
    SensitivityLevel level;
    bool enabled;
    bool scanned;   // enabled and selected by the current mode
};

// Built-in registry, in registration order.
std::vector<PatternSpec> default_patterns();
