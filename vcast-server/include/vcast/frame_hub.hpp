#pragma once
#include "vcast/broadcast_loop.hpp"
#include "vcast/frame_slot.hpp"
#include "vcast/frame_transport.hpp"
#include "vcast/session_registry.hpp"
#include "vcast/stream_stats.hpp"
#include "vcast/viewer_session.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace vcast {

struct HubOptions {
    std::size_t queue_capacity = ViewerSession::kDefaultCapacity;
    std::chrono::milliseconds poll_interval{33};
};

// Everything one stream needs: the latest-frame slot, the live viewers,
// and the loop that fans new frames out to them.
class FrameHub {
public:
    explicit FrameHub(HubOptions opts = {});
    ~FrameHub();

    FrameHub(const FrameHub&) = delete;
    FrameHub& operator=(const FrameHub&) = delete;

    void start();
    void shutdown();

    // Producer entry point.
    uint64_t publish(std::string payload);

    // Register a new viewer, seed it with the current frame (if any) and
    // start its flush routine. The session deregisters itself on close.
    std::shared_ptr<ViewerSession> attach(std::shared_ptr<FrameTransport> transport);

    FrameSlot& slot() { return slot_; }
    SessionRegistry& registry() { return registry_; }
    BroadcastLoop& broadcaster() { return broadcast_; }
    StreamStats& stats() { return stats_; }
    const HubOptions& options() const { return opts_; }

    std::size_t viewers() const { return registry_.size(); }

private:
    HubOptions opts_;
    StreamStats stats_;
    FrameSlot slot_;
    SessionRegistry registry_;
    BroadcastLoop broadcast_;
    std::atomic<uint64_t> next_id_{1};
    std::atomic<bool> shut_down_{false};
};

} // namespace vcast
