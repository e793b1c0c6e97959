#pragma once
#include "vcast/viewer_session.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace vcast {

// Live viewer sessions keyed by id.
// Readers take a snapshot so a removal during fan-out never invalidates iteration.
class SessionRegistry {
public:
    using SessionPtr = std::shared_ptr<ViewerSession>;

    // false if a session with the same id is already registered
    bool add(SessionPtr session);

    // idempotent; false if nothing was removed
    bool remove(uint64_t id);

    SessionPtr find(uint64_t id) const;
    bool contains(uint64_t id) const;
    std::size_t size() const;

    std::vector<SessionPtr> snapshot() const;

    // Close every session (each one removes itself through its on_closed hook
    // when wired by FrameHub); then clears whatever is left.
    void close_all(const std::string& reason);

private:
    mutable std::shared_mutex mtx_;
    std::unordered_map<uint64_t, SessionPtr> sessions_;
};

} // namespace vcast
