#pragma once
#include "vcast/frame_slot.hpp"
#include "vcast/session_registry.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <thread>

namespace vcast {

// Watches the slot and fans every new version out to all registered sessions.
// Per-session delivery state lives in ViewerSession, not here.
class BroadcastLoop {
public:
    BroadcastLoop(FrameSlot& slot, SessionRegistry& registry,
                  std::chrono::milliseconds poll_interval);
    ~BroadcastLoop();

    BroadcastLoop(const BroadcastLoop&) = delete;
    BroadcastLoop& operator=(const BroadcastLoop&) = delete;

    void start();
    void stop();
    bool running() const { return running_.load(); }

    // One Idle/Fanning-out step. Returns the number of sessions offered the
    // frame (0 when the slot has not changed since the last step).
    std::size_t step();

    uint64_t last_broadcast_version() const { return last_version_.load(); }
    uint64_t broadcasts() const { return broadcasts_.load(); }

private:
    void run();

    FrameSlot& slot_;
    SessionRegistry& registry_;
    const std::chrono::milliseconds poll_interval_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> last_version_{0};
    std::atomic<uint64_t> broadcasts_{0};
    std::thread thread_;
};

} // namespace vcast
