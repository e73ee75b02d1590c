#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "interaction_sink.hpp"

namespace fs = std::filesystem;

// Writes one JSON document per session to <dir>/<session-id>.json.
// The whole document is rewritten on every event (through a temporary
// file and a rename), so the file on disk always parses and always
// reflects everything captured so far.
class SessionFileSink : public InteractionSink {
public:
    explicit SessionFileSink(fs::path dir);

    Result<void> begin(const Session& session) override;
    Result<void> append(const std::string& session_id,
                        const Interaction& interaction) override;
    Result<void> finish(const Session& session) override;

    fs::path path_for(const std::string& session_id) const;
    const fs::path& dir() const { return dir_; }

private:
    fs::path dir_;
    std::mutex mutex_;
    std::map<std::string, Session> open_;   // sessions between begin() and finish()

    Result<void> write_locked(const Session& session);
};

// ── Reading artifacts back ───────────────────────────────────

// Parse a session artifact. Missing optional fields take defaults;
// an unreadable or non-JSON file is an error.
Result<Session> load_session(const fs::path& path);

// Session files in `dir`, newest first (by modification time).
std::vector<fs::path> list_session_files(const fs::path& dir);

// Resolve a session id or a path to an artifact file.
fs::path resolve_session_file(const fs::path& dir, const std::string& id_or_path);
