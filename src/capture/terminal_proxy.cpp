#include "terminal_proxy.hpp"
#include "session_registry.hpp"
#include "turn_segmenter.hpp"
#include <core/log.hpp>
#include <platform/terminal.hpp>
#include <privacy/redaction_engine.hpp>
#include <fmt/format.h>
#include <chrono>
#include <filesystem>

// ── Scoped helpers ─────────────────────────────────────────────

namespace {

// Operator terminal in raw mode for the lifetime of the scope.
class RawModeScope {
public:
    explicit RawModeScope(platform::TerminalHost& host) : host_(host) { host_.set_raw_mode(); }
    ~RawModeScope() { host_.restore_mode(); }

    RawModeScope(const RawModeScope&) = delete;
    RawModeScope& operator=(const RawModeScope&) = delete;

private:
    platform::TerminalHost& host_;
};

} // namespace

// Finalizes the session however start() is left. close() is the normal
// path; the destructor covers unwinding and marks the session as failed.
class TerminalProxy::Teardown {
public:
    Teardown(TerminalProxy& proxy, Session& session, TurnSegmenter& segmenter)
        : proxy_(proxy), session_(session), segmenter_(segmenter) {}

    ~Teardown() { close(SessionStatus::kError); }

    Teardown(const Teardown&) = delete;
    Teardown& operator=(const Teardown&) = delete;

    void close(SessionStatus status) {
        if (done_) return;
        done_ = true;

        try {
            segmenter_.on_output(proxy_.output_stream_.flush());
            segmenter_.on_input(proxy_.input_stream_.flush());
            segmenter_.flush();
        } catch (const std::exception& e) {
            log_error(fmt::format("session {}: flushing pending turn failed: {}", session_.id, e.what()));
        }

        proxy_.host_.terminate_child(proxy_.options_.teardown_grace_ms);
        int code = proxy_.host_.child_exit_code();
        if (code >= 0) session_.exit_code = code;
        proxy_.host_.close();

        session_.finalize(status);
        auto r = proxy_.sink_.finish(session_);
        if (r.is_err()) {
            log_warn(fmt::format("session {}: final write failed: {}", session_.id, r.error));
        }

        if (proxy_.options_.registry) proxy_.options_.registry->remove(session_.id);

        log_info(fmt::format("session {} ended: {} ({} interactions)",
                             session_.id, session_status_name(session_.status),
                             session_.interactions.size()));
    }

private:
    TerminalProxy& proxy_;
    Session& session_;
    TurnSegmenter& segmenter_;
    bool done_ = false;
};

// ── Lifecycle ──────────────────────────────────────────────────

TerminalProxy::TerminalProxy(platform::TerminalHost& host,
                             const RedactionEngine& engine,
                             BoundaryDetector& detector,
                             InteractionSink& sink,
                             ProxyOptions options)
    : host_(host), engine_(engine), detector_(detector), sink_(sink),
      options_(std::move(options)) {}

Result<Session> TerminalProxy::start(const std::string& command) {
    stop_requested_ = false;
    input_stream_.reset();
    output_stream_.reset();

    auto pty = host_.allocate_pty();
    if (pty.is_err()) {
        log_error("pty allocation failed: " + pty.error);
        return Result<Session>::Err(pty.error);
    }
    auto spawned = host_.spawn(command);
    if (spawned.is_err()) {
        log_error("spawn failed: " + spawned.error);
        host_.close();
        return Result<Session>::Err(spawned.error);
    }

    std::string project = options_.project_path;
    if (project.empty()) {
        std::error_code ec;
        project = std::filesystem::current_path(ec).string();
    }

    Session session = Session::create(command, project);
    session.privacy_mode = engine_.mode();
    session.debug = options_.debug;

    if (options_.registry) {
        std::string base = session.id;
        for (int n = 2; !options_.registry->add(session.id, this); ++n) {
            session.id = fmt::format("{}-{}", base, n);
        }
    }

    log_info(fmt::format("session {} started: {} (mode {})",
                         session.id, command, privacy_mode_name(session.privacy_mode)));

    auto begun = sink_.begin(session);
    if (begun.is_err()) {
        log_warn(fmt::format("session {}: initial write failed: {}", session.id, begun.error));
    }

    TurnSegmenter segmenter(session, engine_, detector_, sink_);
    Teardown teardown(*this, session, segmenter);

    if (options_.on_session_start) options_.on_session_start(session);

    EndReason reason = EndReason::kIoError;
    {
        RawModeScope raw(host_);
        try {
            reason = run_loop(segmenter);
        } catch (const std::exception& e) {
            log_error(fmt::format("session {}: relay aborted: {}", session.id, e.what()));
            reason = EndReason::kIoError;
        }
    }

    log_info(fmt::format("session {}: loop ended ({})", session.id, reason_name(reason)));
    teardown.close(status_for(reason));
    return Result<Session>::Ok(session);
}

// ── Relay loop ─────────────────────────────────────────────────

TerminalProxy::EndReason TerminalProxy::run_loop(TurnSegmenter& segmenter) {
    using clock = std::chrono::steady_clock;
    const auto started = clock::now();
    char buf[PROXY_READ_BUF_SIZE];

    for (;;) {
        if (stop_requested_ || platform::interrupt_requested()) {
            return EndReason::kInterrupted;
        }
        if (options_.session_timeout_secs > 0 &&
            clock::now() - started >= std::chrono::seconds(options_.session_timeout_secs)) {
            return EndReason::kTimeout;
        }

        auto ready = host_.wait_readable(options_.poll_ms);
        if (ready.is_err()) {
            log_error("wait failed: " + ready.error);
            return EndReason::kIoError;
        }

        if (ready.value.child_output) {
            long n = host_.read_child(buf, sizeof(buf));
            if (n < 0) {
                log_error("child read failed: " + host_.last_error());
                return EndReason::kIoError;
            }
            if (n == 0) return EndReason::kChildExited;
            if (!relay_output(segmenter, buf, n)) return EndReason::kIoError;
        }

        if (ready.value.operator_input) {
            long n = host_.read_operator(buf, sizeof(buf));
            if (n < 0) {
                log_error("operator read failed: " + host_.last_error());
                return EndReason::kIoError;
            }
            if (n == 0) return EndReason::kOperatorEof;
            if (n == 1 && buf[0] == OPERATOR_EOF_BYTE) return EndReason::kOperatorEof;

            if (!host_.write_child(buf, static_cast<size_t>(n))) {
                log_error("child write failed: " + host_.last_error());
                return EndReason::kIoError;
            }
            segmenter.on_input(input_stream_.feed(buf, static_cast<size_t>(n)));
        }

        if (!host_.child_running()) {
            drain_child(segmenter);
            return EndReason::kChildExited;
        }
    }
}

bool TerminalProxy::relay_output(TurnSegmenter& segmenter, const char* data, long n) {
    if (!host_.write_operator(data, static_cast<size_t>(n))) {
        log_error("operator write failed: " + host_.last_error());
        return false;
    }
    segmenter.on_output(output_stream_.feed(data, static_cast<size_t>(n)));
    return true;
}

// Output the child wrote just before exiting is still in the pty.
void TerminalProxy::drain_child(TurnSegmenter& segmenter) {
    char buf[PROXY_READ_BUF_SIZE];
    for (int i = 0; i < PROXY_DRAIN_MAX_READS; i++) {
        auto ready = host_.wait_readable(0);
        if (ready.is_err() || !ready.value.child_output) break;
        long n = host_.read_child(buf, sizeof(buf));
        if (n <= 0) break;
        if (!relay_output(segmenter, buf, n)) break;
    }
}

SessionStatus TerminalProxy::status_for(EndReason reason) {
    switch (reason) {
        case EndReason::kChildExited:
        case EndReason::kOperatorEof:
        case EndReason::kInterrupted: return SessionStatus::kCompleted;
        case EndReason::kTimeout:     return SessionStatus::kTimeout;
        case EndReason::kIoError:     return SessionStatus::kError;
    }
    return SessionStatus::kError;
}

const char* TerminalProxy::reason_name(EndReason reason) {
    switch (reason) {
        case EndReason::kChildExited: return "child exited";
        case EndReason::kOperatorEof: return "operator end of input";
        case EndReason::kInterrupted: return "interrupted";
        case EndReason::kTimeout:     return "session timeout";
        case EndReason::kIoError:     return "i/o error";
    }
    return "unknown";
}
