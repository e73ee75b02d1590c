#pragma once

#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>

enum class SessionStatus {
    kActive,
    kCompleted,
    kError,
    kTimeout,
};

std::string session_status_name(SessionStatus status);
SessionStatus parse_session_status(const std::string& name);   // unknown -> kError

// One prompt/response exchange. Both texts are kept as captured and
// as masked; only the masked pair is meant to leave the machine.
struct Interaction {
    int sequence_number = 0;
    std::string timestamp;              // ISO, local time of finalization
    std::string raw_user;
    std::string raw_assistant;
    std::string masked_user;
    std::string masked_assistant;
    std::vector<std::string> detected_patterns;

    std::string id() const { return "int-" + std::to_string(sequence_number); }
};

// One run of the monitored program.
struct Session {
    std::string id;                     // pty-YYYYMMDD-HHMMSS
    std::string project_path;           // working directory at start
    std::string start_time;
    std::string end_time;               // empty while active
    SessionStatus status = SessionStatus::kActive;

    // Metadata
    std::string monitor_type = "pty";
    std::string command;
    PrivacyMode privacy_mode = PrivacyMode::kStrict;
    bool debug = false;
    std::optional<int> exit_code;

    std::vector<Interaction> interactions;

    // New active session stamped with the current time.
    static Session create(const std::string& command, const std::string& project_path);

    // Set the terminal status and end time. Only the first call counts.
    void finalize(SessionStatus final_status);

    bool active() const { return status == SessionStatus::kActive; }
    int next_sequence() const { return static_cast<int>(interactions.size()); }
};

// "pty-" + compact local timestamp.
std::string make_session_id();
