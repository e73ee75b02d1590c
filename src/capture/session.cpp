#include "session.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>

std::string session_status_name(SessionStatus status) {
    switch (status) {
        case SessionStatus::kActive:    return "active";
        case SessionStatus::kCompleted: return "completed";
        case SessionStatus::kError:     return "error";
        case SessionStatus::kTimeout:   return "timeout";
    }
    return "error";
}

SessionStatus parse_session_status(const std::string& name) {
    if (name == "active")    return SessionStatus::kActive;
    if (name == "completed") return SessionStatus::kCompleted;
    if (name == "timeout")   return SessionStatus::kTimeout;
    return SessionStatus::kError;
}

std::string make_session_id() {
    return std::string(SESSION_ID_PREFIX) + now_stamp();
}

Session Session::create(const std::string& command, const std::string& project_path) {
    Session s;
    s.id = make_session_id();
    s.project_path = project_path;
    s.start_time = now_iso();
    s.monitor_type = MONITOR_TYPE;
    s.command = command;
    return s;
}

void Session::finalize(SessionStatus final_status) {
    if (!active()) return;
    status = final_status;
    end_time = now_iso();
}
