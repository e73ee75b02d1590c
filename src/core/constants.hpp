#pragma once

// ── Proxy loop ──────────────────────────────────────────────
constexpr int PROXY_POLL_MS              = 100;   // Readiness wait before re-checking the child
constexpr int PROXY_DRAIN_MAX_READS      = 64;    // Reads allowed when draining output after child exit
constexpr int DEFAULT_TEARDOWN_GRACE_MS  = 2000;  // SIGTERM -> SIGKILL window at teardown
constexpr char OPERATOR_EOF_BYTE         = 0x04;  // Ctrl-D on its own ends the session

// ── Buffer sizes ────────────────────────────────────────────
constexpr int PROXY_READ_BUF_SIZE        = 4096;
constexpr int ESCAPE_HOLD_MAX            = 64;    // Longest escape tail held back between chunks
constexpr int BOILERPLATE_LINE_MAX       = 512;   // Longer lines are never boilerplate

// ── Redaction ───────────────────────────────────────────────
// std::regex recurses per character it consumes, so no search may walk
// an unbounded slice of text.
constexpr int SCAN_WINDOW_MAX            = 8192;  // Longest slice one search walks
constexpr int SCAN_TOKEN_MAX             = 4096;  // Unbroken runs longer than this are masked whole
constexpr const char* OVERLONG_TOKEN_NAME = "OVERLONG_TOKEN";

// ── Session artifacts ───────────────────────────────────────
constexpr const char* SESSION_ID_PREFIX      = "pty-";
constexpr const char* SESSION_FILE_EXT       = ".json";
constexpr const char* MONITOR_TYPE           = "pty";
constexpr const char* MESSAGE_TYPE           = "interaction";
constexpr int SESSION_LIST_LIMIT             = 10;

// ── Defaults ────────────────────────────────────────────────
constexpr const char* DEFAULT_COMMAND        = "claude";
constexpr const char* DEFAULT_SESSIONS_DIR   = "./sessions";
constexpr const char* DEFAULT_PROMPT_MARKER  = ">";
constexpr const char* CCTRACE_VERSION        = "0.2.0";
