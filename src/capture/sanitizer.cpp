#include "sanitizer.hpp"
#include <core/constants.hpp>
#include <regex>
#include <vector>

namespace {

const char ESC = '\x1b';
const char BEL = '\x07';

// Glyphs the monitored UI draws around and inside its panels.
const std::vector<std::string>& ui_glyphs() {
    static const std::vector<std::string> glyphs = {
        // box drawing
        "\xe2\x95\xad", "\xe2\x94\x80", "\xe2\x95\xae", "\xe2\x94\x82",   // ╭ ─ ╮ │
        "\xe2\x95\xb0", "\xe2\x95\xaf", "\xe2\x94\x90", "\xe2\x94\x94",   // ╰ ╯ ┐ └
        "\xe2\x94\x98", "\xe2\x94\x9c", "\xe2\x94\xa4", "\xe2\x94\xac",   // ┘ ├ ┤ ┬
        "\xe2\x94\xb4", "\xe2\x94\xbc",                                   // ┴ ┼
        // bullets, arrows, spinner frames
        "\xe2\x8e\xbf", "\xe2\xa7\x89", "\xe2\x9c\xbb", "\xe2\x97\x8f",   // ⎿ ⧉ ✻ ●
        "\xe2\x80\xa2", "\xe2\x96\xb8", "\xe2\x96\xb9", "\xe2\xac\xa4",   // • ▸ ▹ ⬤
        "\xe2\x8f\xba", "\xe2\x9c\xb3", "\xe2\x9c\xb6", "\xe2\x9c\xa2",   // ⏺ ✳ ✶ ✢
        "\xe2\x9c\xbd",                                                   // ✽
    };
    return glyphs;
}

// Banner, hint and status text that never belongs to a turn.
const std::vector<std::regex>& boilerplate() {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(Welcome to Claude Code!)"),
        std::regex(R"(/help for help.*)"),
        std::regex(R"(\? for shortcuts.*)"),
        std::regex(R"(cwd:.*)"),
        std::regex(R"(\(\d+s.*tokens.*\))"),
        std::regex(R"(Selected \d+ lines from.*)"),
    };
    return patterns;
}

// Index just past the escape sequence starting at s[pos] (an ESC),
// or npos if the sequence runs off the end of the text.
size_t escape_end(const std::string& s, size_t pos) {
    size_t i = pos + 1;
    if (i >= s.size()) return std::string::npos;

    char kind = s[i];
    if (kind == '[') {
        // CSI: parameter and intermediate bytes, then a final byte 0x40-0x7E
        for (++i; i < s.size(); ++i) {
            unsigned char c = static_cast<unsigned char>(s[i]);
            if (c >= 0x40 && c <= 0x7e) return i + 1;
            if (c < 0x20 || c > 0x7e) return i;   // malformed: stop before it
        }
        return std::string::npos;
    }
    if (kind == ']' || kind == 'P' || kind == 'X' || kind == '^' || kind == '_') {
        // String sequences end with BEL (OSC only) or ST (ESC \)
        for (++i; i < s.size(); ++i) {
            if (s[i] == BEL && kind == ']') return i + 1;
            if (s[i] == ESC) {
                if (i + 1 >= s.size()) return std::string::npos;
                if (s[i + 1] == '\\') return i + 2;
            }
        }
        return std::string::npos;
    }
    unsigned char k = static_cast<unsigned char>(kind);
    if (k >= 0x20 && k <= 0x2f) {
        // ESC + intermediates + final (charset selection and the like)
        for (++i; i < s.size(); ++i) {
            unsigned char c = static_cast<unsigned char>(s[i]);
            if (c < 0x20 || c > 0x2f) return i + 1;
        }
        return std::string::npos;
    }
    return i + 1;   // two-byte sequence (ESC 7, ESC =, ...)
}

// Escapes and control bytes out, line breaks normalized.
std::string strip_controls(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (c == ESC) {
            size_t end = escape_end(in, i);
            if (end == std::string::npos) break;   // truncated sequence: drop the rest
            i = end - 1;
            continue;
        }
        if (c == '\r') {
            out += '\n';
            if (i + 1 < in.size() && in[i + 1] == '\n') ++i;
            continue;
        }
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 && c != '\n' && c != '\t' && c != '\b') continue;
        out += c;
    }
    return out;
}

void erase_all(std::string& s, const std::string& needle) {
    size_t pos = 0;
    while ((pos = s.find(needle, pos)) != std::string::npos) s.erase(pos, needle.size());
}

// Trailing blanks off every terminated line. The unterminated tail is
// left alone: in a stream its blanks may be followed by more text.
std::string rstrip_lines(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    size_t start = 0;
    for (;;) {
        size_t nl = in.find('\n', start);
        if (nl == std::string::npos) {
            out.append(in, start, std::string::npos);
            break;
        }
        size_t last = nl;
        while (last > start && (in[last - 1] == ' ' || in[last - 1] == '\t')) --last;
        out.append(in, start, last - start);
        out += '\n';
        start = nl + 1;
    }
    return out;
}

// Boilerplate never spans lines; overlong lines are left untouched so the
// regex walk stays bounded.
std::string strip_boilerplate(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    size_t start = 0;
    while (start < in.size()) {
        size_t nl = in.find('\n', start);
        size_t end = (nl == std::string::npos) ? in.size() : nl;
        std::string line = in.substr(start, end - start);
        if (line.size() <= static_cast<size_t>(BOILERPLATE_LINE_MAX)) {
            for (const auto& re : boilerplate()) line = std::regex_replace(line, re, "");
        }
        out += line;
        if (nl == std::string::npos) break;
        out += '\n';
        start = nl + 1;
    }
    return out;
}

std::string strip_decoration(std::string s) {
    for (const auto& g : ui_glyphs()) erase_all(s, g);
    return rstrip_lines(strip_boilerplate(s));
}

// Length of an incomplete UTF-8 sequence at the end of `s` (0 if none).
size_t utf8_tail(const std::string& s) {
    size_t n = s.size();
    for (size_t back = 1; back <= 3 && back <= n; ++back) {
        unsigned char c = static_cast<unsigned char>(s[n - back]);
        if ((c & 0xc0) == 0x80) continue;      // continuation byte, keep looking
        size_t need = 0;
        if ((c & 0xe0) == 0xc0) need = 2;
        else if ((c & 0xf0) == 0xe0) need = 3;
        else if ((c & 0xf8) == 0xf0) need = 4;
        return (need > back) ? back : 0;
    }
    return 0;
}

// Start of an unterminated escape sequence near the end of `s` (npos if none).
size_t escape_tail(const std::string& s) {
    size_t esc = s.rfind(ESC);
    if (esc == std::string::npos) return std::string::npos;
    if (s.size() - esc > static_cast<size_t>(ESCAPE_HOLD_MAX)) return std::string::npos;
    // An ESC inside a string sequence may be the start of its terminator.
    size_t from = esc;
    while (from > 0) {
        size_t prev = s.rfind(ESC, from - 1);
        if (prev == std::string::npos || s.size() - prev > static_cast<size_t>(ESCAPE_HOLD_MAX)) break;
        size_t end = escape_end(s, prev);
        if (end != std::string::npos) break;
        from = prev;
    }
    return escape_end(s, from) == std::string::npos ? from : std::string::npos;
}

} // namespace

// ── Pure transform ───────────────────────────────────────────

std::string StreamSanitizer::sanitize(const std::string& text) {
    std::string s = strip_controls(text);
    // Removing one piece of decoration can splice together another.
    for (int pass = 0; pass < 8; ++pass) {
        std::string next = strip_decoration(s);
        if (next == s) break;
        s = std::move(next);
    }
    return s;
}

std::string StreamSanitizer::decode_utf8_lossy(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());
    size_t i = 0;
    while (i < bytes.size()) {
        unsigned char c = static_cast<unsigned char>(bytes[i]);
        size_t len = 0;
        unsigned char lo = 0x80, hi = 0xbf;   // bounds for the second byte
        if (c < 0x80) len = 1;
        else if (c >= 0xc2 && c <= 0xdf) len = 2;
        else if (c >= 0xe0 && c <= 0xef) {
            len = 3;
            if (c == 0xe0) lo = 0xa0;
            if (c == 0xed) hi = 0x9f;
        } else if (c >= 0xf0 && c <= 0xf4) {
            len = 4;
            if (c == 0xf0) lo = 0x90;
            if (c == 0xf4) hi = 0x8f;
        }

        if (len == 0 || i + len > bytes.size()) { ++i; continue; }

        bool ok = true;
        for (size_t k = 1; k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(bytes[i + k]);
            unsigned char min = (k == 1) ? lo : 0x80;
            unsigned char max = (k == 1) ? hi : 0xbf;
            if (cc < min || cc > max) { ok = false; break; }
        }
        if (!ok) { ++i; continue; }

        out.append(bytes, i, len);
        i += len;
    }
    return out;
}

// ── Streaming ────────────────────────────────────────────────

std::string StreamSanitizer::feed(const char* data, size_t len) {
    if (len > 0) pending_.append(data, len);
    if (pending_.empty()) return {};

    size_t cut = pending_.size() - utf8_tail(pending_);
    if (side_ == Side::kOutput) {
        size_t esc = escape_tail(pending_.substr(0, cut));
        if (esc != std::string::npos) cut = esc;
    }

    std::string ready = pending_.substr(0, cut);
    pending_.erase(0, cut);
    if (ready.empty()) return {};
    return sanitize(decode_utf8_lossy(ready));
}

std::string StreamSanitizer::flush() {
    std::string rest;
    rest.swap(pending_);
    if (rest.empty()) return {};
    return sanitize(decode_utf8_lossy(rest));
}
