#include "turn_segmenter.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <privacy/redaction_engine.hpp>
#include <fmt/format.h>

namespace {

// Remove the last UTF-8 code point (for backspace).
void pop_codepoint(std::string& s) {
    while (!s.empty()) {
        unsigned char c = static_cast<unsigned char>(s.back());
        s.pop_back();
        if ((c & 0xc0) != 0x80) break;
    }
}

} // namespace

const char* segmenter_state_name(TurnSegmenter::State state) {
    switch (state) {
        case TurnSegmenter::State::kIdle:            return "idle";
        case TurnSegmenter::State::kCapturingInput:  return "capturing-input";
        case TurnSegmenter::State::kCapturingOutput: return "capturing-output";
    }
    return "idle";
}

TurnSegmenter::TurnSegmenter(Session& session, const RedactionEngine& engine,
                             BoundaryDetector& detector, InteractionSink& sink)
    : session_(session), engine_(engine), detector_(detector), sink_(sink) {}

// ── Input ────────────────────────────────────────────────────

void TurnSegmenter::on_input(const std::string& text) {
    for (char c : text) {
        if (state_ == State::kCapturingOutput) {
            // Typed ahead while the response is still streaming.
            continue;
        }
        if (state_ == State::kIdle) enter(State::kCapturingInput);

        if (c == '\n') {
            submitted_ = trimmed(user_buf_);
            enter(State::kCapturingOutput);
        } else if (c == '\b' || c == '\x7f') {
            pop_codepoint(user_buf_);
        } else {
            user_buf_ += c;
        }
    }
}

// ── Output ───────────────────────────────────────────────────

void TurnSegmenter::on_output(const std::string& text) {
    if (text.empty()) return;

    partial_line_ += text;
    size_t start = 0;
    size_t nl;
    while ((nl = partial_line_.find('\n', start)) != std::string::npos) {
        if (state_ == State::kCapturingOutput) {
            take_line(partial_line_.substr(start, nl - start));
        }
        start = nl + 1;
    }
    partial_line_.erase(0, start);

    if (state_ != State::kCapturingOutput) {
        // Nothing before Enter belongs to a response.
        partial_line_.clear();
        return;
    }

    if (detector_.inspect(text) == BoundarySignal::kBoundaryReached) {
        if (!partial_line_.empty()) {
            take_line(partial_line_);
            partial_line_.clear();
        }
        finalize_turn();
    }
}

void TurnSegmenter::take_line(const std::string& line) {
    std::string t = trimmed(line);
    if (t.empty()) return;
    if (detector_.is_prompt_line(t)) return;
    if (!submitted_.empty() && t == submitted_) return;   // terminal echo of the prompt
    assistant_buf_.append(line, 0, line.find_last_not_of(" \t") + 1);
    assistant_buf_ += '\n';
}

// ── Finalization ─────────────────────────────────────────────

bool TurnSegmenter::flush() {
    if (state_ == State::kCapturingOutput && !partial_line_.empty()) {
        take_line(partial_line_);
    }
    partial_line_.clear();
    if (state_ == State::kIdle) return false;
    return finalize_turn();
}

bool TurnSegmenter::finalize_turn() {
    std::string user = trimmed(user_buf_);
    std::string assistant = trimmed(assistant_buf_);

    if (user.empty()) {
        log_debug("segmenter: empty prompt, turn discarded");
        reset_turn();
        return false;
    }

    MaskResult mu = engine_.mask(user);
    MaskResult ma = engine_.mask(assistant);

    Interaction it;
    it.sequence_number = session_.next_sequence();
    it.timestamp = now_iso();
    it.raw_user = user;
    it.raw_assistant = assistant;
    it.masked_user = mu.text;
    it.masked_assistant = ma.text;
    for (const auto& name : mu.pattern_names()) it.detected_patterns.push_back(name);
    for (const auto& name : ma.pattern_names()) {
        bool seen = false;
        for (const auto& d : it.detected_patterns) seen = seen || d == name;
        if (!seen) it.detected_patterns.push_back(name);
    }

    session_.interactions.push_back(it);
    reset_turn();
    log_info(fmt::format("session {}: interaction {} recorded ({} patterns masked)",
                         session_.id, it.id(), it.detected_patterns.size()));

    auto r = sink_.append(session_.id, it);
    if (r.is_err()) {
        log_warn(fmt::format("session {}: could not store {}: {}", session_.id, it.id(), r.error));
    }
    return true;
}

void TurnSegmenter::reset_turn() {
    user_buf_.clear();
    assistant_buf_.clear();
    partial_line_.clear();
    submitted_.clear();
    enter(State::kIdle);
}

void TurnSegmenter::enter(State next) {
    if (next == state_) return;
    log_debug(fmt::format("session {}: segmenter {} -> {}", session_.id,
                          segmenter_state_name(state_), segmenter_state_name(next)));
    state_ = next;
}
