#pragma once

#include <string>
#include "boundary_detector.hpp"
#include "interaction_sink.hpp"
#include "session.hpp"

class RedactionEngine;

// Groups sanitized operator input and program output into turns.
//
//   idle --(any input)--> capturing-input --(Enter)--> capturing-output
//     ^                                                       |
//     +----------------(boundary: turn finalized)-------------+
//
// Input typed while a response is still being captured is ignored.
// Output outside capturing-output is never recorded. A turn whose
// prompt is blank is discarded. Finalized turns are masked, appended
// to the session and handed to the sink.
class TurnSegmenter {
public:
    enum class State {
        kIdle,
        kCapturingInput,
        kCapturingOutput,
    };

    TurnSegmenter(Session& session, const RedactionEngine& engine,
                  BoundaryDetector& detector, InteractionSink& sink);

    void on_input(const std::string& text);
    void on_output(const std::string& text);

    // End of session: finalize whatever turn is still open.
    // Returns true if an interaction was recorded.
    bool flush();

    State state() const { return state_; }
    const std::string& user_buffer() const { return user_buf_; }
    const std::string& assistant_buffer() const { return assistant_buf_; }

private:
    Session& session_;
    const RedactionEngine& engine_;
    BoundaryDetector& detector_;
    InteractionSink& sink_;

    State state_ = State::kIdle;
    std::string user_buf_;
    std::string assistant_buf_;
    std::string partial_line_;      // output after the last '\n'
    std::string submitted_;         // trimmed prompt, for echo suppression

    void take_line(const std::string& line);
    bool finalize_turn();
    void reset_turn();
    void enter(State next);
};

const char* segmenter_state_name(TurnSegmenter::State state);
