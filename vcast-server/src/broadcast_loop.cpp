#include "vcast/broadcast_loop.hpp"

#include <iostream>

namespace vcast {

BroadcastLoop::BroadcastLoop(FrameSlot& slot, SessionRegistry& registry,
                             std::chrono::milliseconds poll_interval)
    : slot_(slot)
    , registry_(registry)
    , poll_interval_(poll_interval.count() > 0 ? poll_interval : std::chrono::milliseconds(1)) {}

BroadcastLoop::~BroadcastLoop() {
    stop();
}

void BroadcastLoop::start() {
    if (running_.exchange(true)) return;
    thread_ = std::thread([this]{ run(); });
    std::cerr << "[broadcast] started (poll " << poll_interval_.count() << " ms)\n";
}

void BroadcastLoop::stop() {
    if (!running_.exchange(false)) return;
    slot_.interrupt();
    if (thread_.joinable()) thread_.join();
    std::cerr << "[broadcast] stopped after " << broadcasts_.load()
              << " broadcasts (last version " << last_version_.load() << ")\n";
}

std::size_t BroadcastLoop::step() {
    Frame f = slot_.read();
    if (f.empty() || f.version <= last_version_.load()) return 0;   // Idle

    // Fanning-out
    last_version_.store(f.version);
    broadcasts_.fetch_add(1);

    auto sessions = registry_.snapshot();
    for (auto& s : sessions) s->offer(f);
    return sessions.size();
}

void BroadcastLoop::run() {
    while (running_.load()) {
        // woken by publish(); the timeout doubles as the polling interval
        slot_.wait_newer(last_version_.load(), poll_interval_);
        if (!running_.load()) break;
        step();
    }
}

} // namespace vcast
