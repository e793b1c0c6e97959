#include "vcast/viewer_session.hpp"

#include <iostream>
#include <utility>

namespace vcast {

ViewerSession::ViewerSession(uint64_t id,
                             std::shared_ptr<FrameTransport> transport,
                             std::size_t capacity,
                             StreamStats* stats)
    : id_(id)
    , stats_(stats)
    , queue_(capacity)
    , transport_(std::move(transport)) {}

ViewerSession::~ViewerSession() = default;

void ViewerSession::set_on_closed(ClosedHandler h) {
    std::lock_guard<std::mutex> lk(mtx_);
    on_closed_ = std::move(h);
}

// ---------------- Producer side ----------------

bool ViewerSession::offer(const Frame& frame) {
    if (frame.empty()) return false;
    if (closed()) return false;

    // already delivered (or something newer was)
    if (frame.version <= last_sent_version()) return false;

    std::size_t evicted = 0;
    bool queued = queue_.push_if(
        frame,
        [](const Frame& cand, const Frame& newest) { return cand.version > newest.version; },
        &evicted
    );
    if (!queued) return false;

    if (evicted && stats_) stats_->frames_dropped.fetch_add(evicted, std::memory_order_relaxed);

    pump();
    return true;
}

// ---------------- Flush routine ----------------

void ViewerSession::start() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (started_) return;
        started_ = true;
    }
    pump();
}

void ViewerSession::pump() {
    std::shared_ptr<FrameTransport> t;
    Frame next;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!started_ || in_flight_ || !transport_ || closed()) return;

        while (true) {
            auto item = queue_.try_pop();
            if (!item) return;
            // never resend, never go backwards
            if (item->version <= last_sent_.load(std::memory_order_relaxed)) continue;
            next = std::move(*item);
            break;
        }

        in_flight_ = true;
        t = transport_;
    }

    const uint64_t version = next.version;
    const std::size_t bytes = next.size();
    t->async_send(
        std::move(next.payload),
        [self = shared_from_this(), version, bytes](bool ok) {
            self->on_sent(version, bytes, ok);
        }
    );
}

void ViewerSession::on_sent(uint64_t version, std::size_t bytes, bool ok) {
    if (!ok) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            in_flight_ = false;
        }
        close("send failed on version " + std::to_string(version));
        return;
    }

    {
        std::lock_guard<std::mutex> lk(mtx_);
        in_flight_ = false;
        if (version > last_sent_.load(std::memory_order_relaxed)) {
            last_sent_.store(version, std::memory_order_release);
        }
    }

    frames_sent_.fetch_add(1, std::memory_order_relaxed);
    if (stats_) {
        stats_->frames_sent.fetch_add(1, std::memory_order_relaxed);
        stats_->bytes_sent.fetch_add(bytes, std::memory_order_relaxed);
    }

    pump();
}

bool ViewerSession::send_in_flight() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return in_flight_;
}

std::vector<uint64_t> ViewerSession::pending_versions() const {
    std::vector<uint64_t> out;
    for (const auto& f : queue_.items()) out.push_back(f.version);
    return out;
}

// ---------------- Termination ----------------

void ViewerSession::close(const std::string& reason) {
    ClosedHandler h;
    std::shared_ptr<FrameTransport> t;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (closed_.exchange(true)) return;
        h = std::move(on_closed_);
        on_closed_ = nullptr;
        // drop our reference so a transport holding the session can go away
        t = std::move(transport_);
    }

    queue_.close();

    std::string peer = t ? t->describe() : std::string("peer");
    if (t) t->close();

    if (stats_) stats_->sessions_closed.fetch_add(1, std::memory_order_relaxed);

    std::cerr << "[session] #" << id_ << " " << peer << " closed: " << reason
              << " (sent=" << frames_sent() << " dropped=" << dropped()
              << " last_version=" << last_sent_version() << ")\n";

    if (h) h(id_, reason);
}

} // namespace vcast
