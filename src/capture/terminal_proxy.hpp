#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <core/constants.hpp>
#include <core/types.hpp>
#include <platform/pty_host.hpp>
#include "boundary_detector.hpp"
#include "interaction_sink.hpp"
#include "sanitizer.hpp"
#include "session.hpp"

class RedactionEngine;
class SessionRegistry;
class TurnSegmenter;

struct ProxyOptions {
    std::string project_path;                       // empty: current directory
    int session_timeout_secs = 0;                   // 0: no limit
    int teardown_grace_ms = DEFAULT_TEARDOWN_GRACE_MS;
    int poll_ms = PROXY_POLL_MS;
    bool debug = false;
    SessionRegistry* registry = nullptr;            // optional active-session table

    // Called once the session exists, before the terminal goes raw.
    std::function<void(const Session&)> on_session_start;
};

// TerminalProxy: sits between the operator's terminal and one child
// program. Bytes are relayed unchanged in both directions; a sanitized
// copy of each direction drives a TurnSegmenter that records turns
// into the session and the sink.
//
// One proxy runs one session at a time. The engine may be shared with
// other proxies; host, detector and sink belong to this one.
class TerminalProxy {
public:
    TerminalProxy(platform::TerminalHost& host,
                  const RedactionEngine& engine,
                  BoundaryDetector& detector,
                  InteractionSink& sink,
                  ProxyOptions options = {});

    TerminalProxy(const TerminalProxy&) = delete;
    TerminalProxy& operator=(const TerminalProxy&) = delete;

    // Run `command` and relay until it exits, the operator ends input
    // (EOF or a lone Ctrl-D), an interrupt arrives, or the session
    // times out. Fails before any session exists if the program cannot
    // be started. Otherwise the finished session is returned; its status
    // reports how it ended.
    Result<Session> start(const std::string& command);

    // Ask a running start() to wind down. Safe from any thread.
    void request_stop() { stop_requested_ = true; }

private:
    enum class EndReason {
        kChildExited,
        kOperatorEof,
        kInterrupted,
        kTimeout,
        kIoError,
    };

    platform::TerminalHost& host_;
    const RedactionEngine& engine_;
    BoundaryDetector& detector_;
    InteractionSink& sink_;
    ProxyOptions options_;
    std::atomic<bool> stop_requested_{false};

    StreamSanitizer input_stream_{StreamSanitizer::Side::kInput};
    StreamSanitizer output_stream_;

    class Teardown;

    EndReason run_loop(TurnSegmenter& segmenter);
    bool relay_output(TurnSegmenter& segmenter, const char* data, long n);
    void drain_child(TurnSegmenter& segmenter);

    static SessionStatus status_for(EndReason reason);
    static const char* reason_name(EndReason reason);
};
