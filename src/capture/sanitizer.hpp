#pragma once

#include <cstddef>
#include <string>

// StreamSanitizer: turns terminal byte streams into plain text.
//
// sanitize() is the pure transform: it removes escape sequences (CSI,
// OSC, DCS and friends), stray control bytes, the monitored program's
// box-drawing and bullet glyphs, and known boilerplate (banner, help
// hints, cwd echoes, timing/token annotations). Line breaks are
// normalized to '\n'; tab, backspace and DEL survive so that the
// segmenter can replay line editing. sanitize(sanitize(x)) == sanitize(x).
//
// feed() adapts it to a byte stream read in arbitrary chunks: invalid
// UTF-8 is dropped, and a multi-byte character or escape sequence cut
// by a read boundary is held back until the next chunk completes it.
// Use one instance per direction.
class StreamSanitizer {
public:
    // Keystrokes reach the tracer whole, so on the input side an ESC
    // that ends a read is the Escape key and is never held back.
    enum class Side { kOutput, kInput };

    explicit StreamSanitizer(Side side = Side::kOutput) : side_(side) {}

    static std::string sanitize(const std::string& text);

    // Drop bytes that do not form valid UTF-8. Never fails.
    static std::string decode_utf8_lossy(const std::string& bytes);

    std::string feed(const char* data, size_t len);
    std::string feed(const std::string& bytes) { return feed(bytes.data(), bytes.size()); }

    // Sanitize and release anything still held back (end of stream).
    std::string flush();

    void reset() { pending_.clear(); }
    size_t pending_bytes() const { return pending_.size(); }

private:
    Side side_;
    std::string pending_;
};
