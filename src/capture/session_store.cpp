#include "session_store.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>

using json = nlohmann::json;

namespace {

json interaction_to_json(const Interaction& it) {
    return json{
        {"id", it.id()},
        {"sequence_number", it.sequence_number},
        {"timestamp", it.timestamp},
        {"user_prompt", it.masked_user},
        {"claude_response", it.masked_assistant},
        {"message_type", MESSAGE_TYPE},
        {"raw_user", it.raw_user},
        {"raw_assistant", it.raw_assistant},
        {"detected_patterns", it.detected_patterns},
    };
}

json session_to_json(const Session& s) {
    json doc;
    doc["id"] = s.id;
    doc["session_id"] = s.id;
    doc["project_path"] = s.project_path;
    doc["start_time"] = s.start_time;
    doc["end_time"] = s.end_time.empty() ? json(nullptr) : json(s.end_time);
    doc["status"] = session_status_name(s.status);
    doc["metadata"] = {
        {"monitor_type", s.monitor_type},
        {"command", s.command},
        {"privacy_mode", privacy_mode_name(s.privacy_mode)},
        {"debug", s.debug},
    };
    doc["exit_code"] = s.exit_code ? json(*s.exit_code) : json(nullptr);

    json items = json::array();
    for (const auto& it : s.interactions) items.push_back(interaction_to_json(it));
    doc["interactions"] = std::move(items);
    doc["total_interactions"] = s.interactions.size();
    return doc;
}

std::string string_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

Interaction interaction_from_json(const json& j, int fallback_seq) {
    Interaction it;
    it.sequence_number = j.value("sequence_number", fallback_seq);
    it.timestamp = string_field(j, "timestamp");
    it.masked_user = string_field(j, "user_prompt");
    it.masked_assistant = string_field(j, "claude_response");
    it.raw_user = string_field(j, "raw_user");
    it.raw_assistant = string_field(j, "raw_assistant");
    auto pats = j.find("detected_patterns");
    if (pats != j.end() && pats->is_array()) {
        for (const auto& p : *pats) {
            if (p.is_string()) it.detected_patterns.push_back(p.get<std::string>());
        }
    }
    return it;
}

} // namespace

// ── SessionFileSink ──────────────────────────────────────────

SessionFileSink::SessionFileSink(fs::path dir) : dir_(std::move(dir)) {}

fs::path SessionFileSink::path_for(const std::string& session_id) const {
    return dir_ / (session_id + SESSION_FILE_EXT);
}

Result<void> SessionFileSink::begin(const Session& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    open_[session.id] = session;
    return write_locked(session);
}

Result<void> SessionFileSink::append(const std::string& session_id,
                                     const Interaction& interaction) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = open_.find(session_id);
    if (it == open_.end()) {
        return Result<void>::Err(fmt::format("session {} was not started", session_id));
    }
    it->second.interactions.push_back(interaction);
    return write_locked(it->second);
}

Result<void> SessionFileSink::finish(const Session& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    open_.erase(session.id);
    return write_locked(session);
}

Result<void> SessionFileSink::write_locked(const Session& session) {
    fs::path target = path_for(session.id);
    fs::path tmp = target;
    tmp += ".tmp";

    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        return Result<void>::Err(fmt::format("cannot create {}: {}", dir_.string(), ec.message()));
    }

    std::string text;
    try {
        text = session_to_json(session).dump(2, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception& e) {
        return Result<void>::Err(fmt::format("cannot encode session {}: {}", session.id, e.what()));
    }

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Result<void>::Err(fmt::format("cannot open {}", tmp.string()));
        }
        out << text << "\n";
        out.flush();
        if (!out) {
            return Result<void>::Err(fmt::format("write failed: {}", tmp.string()));
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return Result<void>::Err(fmt::format("cannot replace {}", target.string()));
    }
    log_debug(fmt::format("session {} written ({} interactions)",
                          session.id, session.interactions.size()));
    return Result<void>::Ok();
}

// ── Reading ──────────────────────────────────────────────────

Result<Session> load_session(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<Session>::Err(fmt::format("cannot open {}", path.string()));
    }

    json doc = json::parse(in, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Result<Session>::Err(fmt::format("{} is not a session file", path.string()));
    }

    Session s;
    s.id = string_field(doc, "id");
    if (s.id.empty()) s.id = string_field(doc, "session_id");
    if (s.id.empty()) s.id = path.stem().string();
    s.project_path = string_field(doc, "project_path");
    s.start_time = string_field(doc, "start_time");
    s.end_time = string_field(doc, "end_time");
    s.status = parse_session_status(string_field(doc, "status"));

    auto meta = doc.find("metadata");
    if (meta != doc.end() && meta->is_object()) {
        std::string monitor = string_field(*meta, "monitor_type");
        if (!monitor.empty()) s.monitor_type = monitor;
        s.command = string_field(*meta, "command");
        auto mode = parse_privacy_mode(string_field(*meta, "privacy_mode"));
        if (mode) s.privacy_mode = *mode;
        auto dbg = meta->find("debug");
        if (dbg != meta->end() && dbg->is_boolean()) s.debug = dbg->get<bool>();
    }

    auto code = doc.find("exit_code");
    if (code != doc.end() && code->is_number_integer()) s.exit_code = code->get<int>();

    auto items = doc.find("interactions");
    if (items != doc.end() && items->is_array()) {
        for (const auto& j : *items) {
            if (!j.is_object()) continue;
            s.interactions.push_back(interaction_from_json(j, s.next_sequence()));
        }
    }
    return Result<Session>::Ok(std::move(s));
}

std::vector<fs::path> list_session_files(const fs::path& dir) {
    std::vector<std::pair<fs::file_time_type, fs::path>> found;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return {};

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file(ec)) continue;
        if (entry.path().extension() != SESSION_FILE_EXT) continue;
        auto mtime = entry.last_write_time(ec);
        if (ec) continue;
        found.emplace_back(mtime, entry.path());
    }

    std::sort(found.begin(), found.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) return a.first > b.first;
        return a.second.filename() > b.second.filename();
    });

    std::vector<fs::path> out;
    out.reserve(found.size());
    for (auto& f : found) out.push_back(std::move(f.second));
    return out;
}

fs::path resolve_session_file(const fs::path& dir, const std::string& id_or_path) {
    fs::path direct(id_or_path);
    std::error_code ec;
    if (fs::is_regular_file(direct, ec)) return direct;

    fs::path by_id = dir / id_or_path;
    if (by_id.extension() != SESSION_FILE_EXT) by_id += SESSION_FILE_EXT;
    return by_id;
}
