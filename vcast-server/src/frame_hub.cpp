#include "vcast/frame_hub.hpp"

#include <iostream>
#include <utility>

namespace vcast {

FrameHub::FrameHub(HubOptions opts)
    : opts_(opts)
    , broadcast_(slot_, registry_, opts.poll_interval) {}

FrameHub::~FrameHub() {
    shutdown();
}

void FrameHub::start() {
    broadcast_.start();
}

void FrameHub::shutdown() {
    if (shut_down_.exchange(true)) return;
    broadcast_.stop();
    registry_.close_all("server shutdown");
}

uint64_t FrameHub::publish(std::string payload) {
    uint64_t v = slot_.publish(std::move(payload));
    stats_.frames_published.fetch_add(1, std::memory_order_relaxed);
    return v;
}

std::shared_ptr<ViewerSession> FrameHub::attach(std::shared_ptr<FrameTransport> transport) {
    const uint64_t id = next_id_.fetch_add(1);
    auto session = std::make_shared<ViewerSession>(id, std::move(transport),
                                                   opts_.queue_capacity, &stats_);

    if (shut_down_.load()) {
        session->close("server shutting down");
        return session;
    }

    session->set_on_closed([this](uint64_t sid, const std::string&) {
        registry_.remove(sid);
    });

    registry_.add(session);
    // shutdown() may have run close_all between the check above and add()
    if (shut_down_.load()) {
        session->close("server shutting down");
        return session;
    }
    stats_.sessions_opened.fetch_add(1, std::memory_order_relaxed);

    // late joiner: current frame right away instead of waiting for the next publish
    Frame current = slot_.read();
    if (!current.empty()) session->offer(current);

    session->start();

    std::cerr << "[session] #" << id << " attached (viewers=" << registry_.size()
              << ", seed version " << current.version << ")\n";
    return session;
}

} // namespace vcast
