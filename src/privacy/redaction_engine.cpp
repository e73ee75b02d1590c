#include "redaction_engine.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <mutex>

static const auto REGEX_FLAGS =
    std::regex::ECMAScript | std::regex::icase | std::regex::multiline;

RedactionEngine::RedactionEngine(PrivacyMode mode, bool load_defaults)
    : mode_(mode) {
    if (!load_defaults) return;
    for (const auto& spec : default_patterns()) {
        auto r = add_pattern(spec);
        if (r.is_err()) log_error("Built-in pattern rejected: " + r.error);
    }
}

// ── Registry ─────────────────────────────────────────────────

RedactionEngine::Entry* RedactionEngine::find_locked(const std::string& name) {
    for (auto& e : entries_) {
        if (e.spec.name == name) return &e;
    }
    return nullptr;
}

Result<void> RedactionEngine::add_pattern(const PatternSpec& spec) {
    if (trimmed(spec.name).empty()) {
        return Result<void>::Err("pattern has no name");
    }
    if (spec.regex.empty()) {
        return Result<void>::Err(fmt::format("pattern {} has an empty expression", spec.name));
    }

    std::regex compiled;
    try {
        compiled = std::regex(spec.regex, REGEX_FLAGS);
    } catch (const std::regex_error& e) {
        return Result<void>::Err(fmt::format("pattern {} is malformed ({}): {}",
                                             spec.name, e.what(), spec.regex));
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (find_locked(spec.name)) {
        return Result<void>::Err(fmt::format("pattern {} is already registered", spec.name));
    }
    entries_.push_back(Entry{spec, std::move(compiled)});
    return Result<void>::Ok();
}

bool RedactionEngine::remove_pattern(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.spec.name == name; });
    if (it == entries_.end()) return false;
    entries_.erase(it);
    return true;
}

bool RedactionEngine::enable_pattern(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    Entry* e = find_locked(name);
    if (!e) return false;
    e->spec.enabled = true;
    return true;
}

bool RedactionEngine::disable_pattern(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    Entry* e = find_locked(name);
    if (!e) return false;
    e->spec.enabled = false;
    return true;
}

bool RedactionEngine::has_pattern(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& e : entries_) {
        if (e.spec.name == name) return true;
    }
    return false;
}

size_t RedactionEngine::pattern_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

void RedactionEngine::set_mode(PrivacyMode mode) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    mode_ = mode;
}

PrivacyMode RedactionEngine::mode() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return mode_;
}

std::string RedactionEngine::fallback_token(const std::string& pattern_name) {
    std::string token;
    for (char c : pattern_name) {
        unsigned char uc = static_cast<unsigned char>(c);
        token += std::isalnum(uc) ? static_cast<char>(std::toupper(uc)) : '_';
    }
    return "[" + token + "_REDACTED]";
}

// ── Scanning ─────────────────────────────────────────────────

static bool match_order(const Match& a, const Match& b) {
    if (a.start != b.start) return a.start < b.start;
    return a.end > b.end;
}

namespace {

struct Span {
    size_t begin;
    size_t end;
};

bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Cut [begin, end) into windows of at most SCAN_WINDOW_MAX bytes, each
// ending after a line break when one is in reach, else after a blank.
void split_region(const std::string& text, size_t begin, size_t end, std::vector<Span>& out) {
    const size_t window_max = static_cast<size_t>(SCAN_WINDOW_MAX);
    while (end - begin > window_max) {
        size_t limit = begin + window_max;
        size_t cut = limit;
        size_t nl = text.rfind('\n', limit - 1);
        if (nl != std::string::npos && nl >= begin) {
            cut = nl + 1;
        } else {
            for (size_t i = limit; i > begin; --i) {
                if (is_blank(text[i - 1])) { cut = i; break; }
            }
        }
        out.push_back({begin, cut});
        begin = cut;
    }
    if (begin < end) out.push_back({begin, end});
}

// Searchable windows of `text`, plus the unbroken runs too long to search.
void plan_windows(const std::string& text, std::vector<Span>& windows,
                  std::vector<Span>& overlong) {
    const size_t token_max = static_cast<size_t>(SCAN_TOKEN_MAX);
    size_t region = 0;
    size_t i = 0;
    while (i < text.size()) {
        if (is_blank(text[i])) { ++i; continue; }
        size_t j = i;
        while (j < text.size() && !is_blank(text[j])) ++j;
        if (j - i > token_max) {
            split_region(text, region, i, windows);
            overlong.push_back({i, j});
            region = j;
        }
        i = j;
    }
    split_region(text, region, text.size(), windows);
}

} // namespace

std::vector<Match> RedactionEngine::scan(const std::string& text) const {
    std::vector<Match> found;
    if (text.empty()) return found;

    std::vector<Span> windows;
    std::vector<Span> overlong;
    plan_windows(text, windows, overlong);

    for (const auto& span : overlong) {
        log_warn(fmt::format("Masking a {}-byte unbroken run at offset {} without scanning it",
                             span.end - span.begin, span.begin));
        Match match;
        match.pattern_name = OVERLONG_TOKEN_NAME;
        match.start = span.begin;
        match.end = span.end;
        match.level = SensitivityLevel::kMaximum;
        match.replacement = fallback_token(OVERLONG_TOKEN_NAME);
        found.push_back(std::move(match));
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& e : entries_) {
        if (!e.spec.enabled || !mode_scans(mode_, e.spec.level)) continue;

        try {
            for (const auto& w : windows) {
                // Anchors and word boundaries see past the window edges.
                auto flags = std::regex_constants::match_default;
                if (w.begin > 0) flags |= std::regex_constants::match_prev_avail;
                if (w.end < text.size()) flags |= std::regex_constants::match_not_eol;

                auto first = text.begin() + static_cast<std::ptrdiff_t>(w.begin);
                auto last = text.begin() + static_cast<std::ptrdiff_t>(w.end);
                for (std::sregex_iterator it(first, last, e.regex, flags), done; it != done; ++it) {
                    const std::smatch& m = *it;
                    if (m.length(0) == 0) continue;

                    Match match;
                    match.pattern_name = e.spec.name;
                    match.start = w.begin + static_cast<size_t>(m.position(0));
                    match.end = match.start + static_cast<size_t>(m.length(0));
                    match.level = e.spec.level;
                    match.replacement = e.spec.replacement
                        ? m.format(*e.spec.replacement)
                        : fallback_token(e.spec.name);
                    found.push_back(std::move(match));
                }
            }
        } catch (const std::regex_error& ex) {
            log_warn(fmt::format("Pattern {} skipped for this scan: {}", e.spec.name, ex.what()));
        }
    }

    std::stable_sort(found.begin(), found.end(), match_order);
    return found;
}

std::vector<Match> RedactionEngine::resolve_overlaps(std::vector<Match> matches) {
    std::stable_sort(matches.begin(), matches.end(), match_order);

    std::vector<Match> kept;
    size_t last_end = 0;
    for (auto& m : matches) {
        if (!kept.empty() && m.start < last_end) continue;
        last_end = m.end;
        kept.push_back(std::move(m));
    }
    return kept;
}

MaskResult RedactionEngine::mask(const std::string& text) const {
    MaskResult result;
    result.text = text;
    result.matches = resolve_overlaps(scan(text));

    // Rightmost first so earlier offsets stay valid.
    for (auto it = result.matches.rbegin(); it != result.matches.rend(); ++it) {
        result.text.replace(it->start, it->length(), it->replacement);
    }
    return result;
}

SensitivityReport RedactionEngine::analyze(const std::string& text) const {
    SensitivityReport report;
    for (const auto& m : scan(text)) {
        if (std::find(report.detected.begin(), report.detected.end(), m.pattern_name)
                == report.detected.end()) {
            report.detected.push_back(m.pattern_name);
        }
        if (!report.level || static_cast<int>(m.level) > static_cast<int>(*report.level)) {
            report.level = m.level;
        }
    }
    if (report.level) {
        report.score = static_cast<int>(*report.level);
        report.requires_approval = static_cast<int>(*report.level) >=
                                   static_cast<int>(SensitivityLevel::kHigh);
    }
    return report;
}

std::vector<PatternSummary> RedactionEngine::summary() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<PatternSummary> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) {
        out.push_back({e.spec.name, e.spec.description, e.spec.level, e.spec.enabled,
                       e.spec.enabled && mode_scans(mode_, e.spec.level)});
    }
    return out;
}

// ── Settings ─────────────────────────────────────────────────

std::vector<std::string> configure_engine(RedactionEngine& engine,
                                          const TracerSettings& settings) {
    std::vector<std::string> warnings;
    engine.set_mode(settings.privacy_mode);

    for (const auto& rec : settings.patterns) {
        auto level = parse_sensitivity(rec.level);
        if (!level) {
            warnings.push_back(fmt::format("Custom pattern {} skipped: unknown level '{}'",
                                           rec.name, rec.level));
            continue;
        }
        PatternSpec spec;
        spec.name = rec.name;
        spec.regex = rec.pattern;
        spec.description = rec.description;
        spec.level = *level;
        spec.replacement = rec.replacement;

        auto r = engine.add_pattern(spec);
        if (r.is_err()) warnings.push_back("Custom pattern skipped: " + r.error);
    }

    for (const auto& name : settings.disabled_patterns) {
        if (!engine.disable_pattern(name))
            warnings.push_back("Cannot disable unknown pattern " + name);
    }

    for (const auto& w : warnings) log_warn(w);
    return warnings;
}
