#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

class TerminalProxy;

// Active-session table: one entry per running TerminalProxy, keyed by
// session id. Proxies add themselves when their session starts and
// remove themselves at teardown. Entries are not owned.
class SessionRegistry {
public:
    // False if the id is already taken.
    bool add(const std::string& session_id, TerminalProxy* proxy);
    void remove(const std::string& session_id);

    TerminalProxy* find(const std::string& session_id) const;
    std::vector<std::string> active_ids() const;
    size_t size() const;

    // request_stop() on every registered proxy.
    void stop_all();

private:
    mutable std::mutex mutex_;
    std::map<std::string, TerminalProxy*> proxies_;
};
