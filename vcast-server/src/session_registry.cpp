#include "vcast/session_registry.hpp"

#include <mutex>

namespace vcast {

bool SessionRegistry::add(SessionPtr session) {
    if (!session) return false;
    const uint64_t id = session->id();
    std::unique_lock lock(mtx_);
    return sessions_.emplace(id, std::move(session)).second;
}

bool SessionRegistry::remove(uint64_t id) {
    std::unique_lock lock(mtx_);
    return sessions_.erase(id) > 0;
}

SessionRegistry::SessionPtr SessionRegistry::find(uint64_t id) const {
    std::shared_lock lock(mtx_);
    auto it = sessions_.find(id);
    return it != sessions_.end() ? it->second : nullptr;
}

bool SessionRegistry::contains(uint64_t id) const {
    std::shared_lock lock(mtx_);
    return sessions_.count(id) > 0;
}

std::size_t SessionRegistry::size() const {
    std::shared_lock lock(mtx_);
    return sessions_.size();
}

std::vector<SessionRegistry::SessionPtr> SessionRegistry::snapshot() const {
    std::vector<SessionPtr> out;
    std::shared_lock lock(mtx_);
    out.reserve(sessions_.size());
    for (const auto& kv : sessions_) out.push_back(kv.second);
    return out;
}

void SessionRegistry::close_all(const std::string& reason) {
    // close outside the lock: on_closed handlers call remove()
    for (auto& s : snapshot()) s->close(reason);

    std::unique_lock lock(mtx_);
    sessions_.clear();
}

} // namespace vcast
