#include "session_registry.hpp"
#include "terminal_proxy.hpp"

bool SessionRegistry::add(const std::string& session_id, TerminalProxy* proxy) {
    std::lock_guard<std::mutex> lock(mutex_);
    return proxies_.emplace(session_id, proxy).second;
}

void SessionRegistry::remove(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    proxies_.erase(session_id);
}

TerminalProxy* SessionRegistry::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = proxies_.find(session_id);
    return it == proxies_.end() ? nullptr : it->second;
}

std::vector<std::string> SessionRegistry::active_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(proxies_.size());
    for (const auto& kv : proxies_) ids.push_back(kv.first);
    return ids;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return proxies_.size();
}

void SessionRegistry::stop_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& kv : proxies_) kv.second->request_stop();
}
