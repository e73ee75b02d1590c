#pragma once

#include <regex>
#include <shared_mutex>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "pattern.hpp"

// RedactionEngine: detects and masks sensitive substrings.
//
// Holds an ordered registry of patterns and an operating mode that selects
// which sensitivity levels are scanned. One instance is built by the caller
// and shared by every segmenter that needs it. Scans share a reader lock
// and registry changes take it exclusively, so sessions mask in parallel.
//
// Searches never walk more than SCAN_WINDOW_MAX bytes: long text is cut
// into windows at line breaks (or blanks), and an unbroken run longer
// than SCAN_TOKEN_MAX cannot be searched at all, so it is reported as an
// OVERLONG_TOKEN match at MAXIMUM level whatever the mode.
//
//     RedactionEngine engine(PrivacyMode::kStrict);
//     MaskResult r = engine.mask("contact me at a@b.com");
//     // r.text == "contact me at [EMAIL_REDACTED]"
class RedactionEngine {
public:
    // Starts with default_patterns() unless load_defaults is false.
    explicit RedactionEngine(PrivacyMode mode = PrivacyMode::kStrict,
                             bool load_defaults = true);

    RedactionEngine(const RedactionEngine&) = delete;
    RedactionEngine& operator=(const RedactionEngine&) = delete;

    // ── Registry ────────────────────────────────────────────────

    // Compiles and appends. Fails on an empty or duplicate name, or a
    // malformed expression; the registry is unchanged on failure.
    Result<void> add_pattern(const PatternSpec& spec);

    bool remove_pattern(const std::string& name);
    bool enable_pattern(const std::string& name);
    bool disable_pattern(const std::string& name);
    bool has_pattern(const std::string& name) const;
    size_t pattern_count() const;

    void set_mode(PrivacyMode mode);
    PrivacyMode mode() const;

    // ── Scanning ────────────────────────────────────────────────

    // Every occurrence of every active pattern, ordered by ascending start
    // and, on equal starts, descending end. Matches of different patterns
    // may overlap here. `^` and `$` anchor at line breaks.
    std::vector<Match> scan(const std::string& text) const;

    // Keep the earliest-starting (longest on ties) match and drop anything
    // overlapping an already kept one. Input need not be sorted.
    static std::vector<Match> resolve_overlaps(std::vector<Match> matches);

    // Substitute resolved matches, rightmost first. A text without matches
    // comes back unchanged with an empty match list.
    MaskResult mask(const std::string& text) const;

    SensitivityReport analyze(const std::string& text) const;

    std::vector<PatternSummary> summary() const;

    // Token used when a pattern has no replacement: "[NAME_REDACTED]".
    static std::string fallback_token(const std::string& pattern_name);

private:
    struct Entry {
        PatternSpec spec;
        std::regex regex;
    };

    mutable std::shared_mutex mutex_;
    std::vector<Entry> entries_;
    PrivacyMode mode_;

    Entry* find_locked(const std::string& name);
};

// Apply mode, custom patterns and disabled names from the settings.
// Each problem (malformed pattern, unknown level or name) is returned as
// a warning; the offending item is skipped and the rest still load.
std::vector<std::string> configure_engine(RedactionEngine& engine,
                                          const TracerSettings& settings);
