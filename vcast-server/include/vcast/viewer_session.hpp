#pragma once
#include "vcast/drop_oldest_queue.hpp"
#include "vcast/frame.hpp"
#include "vcast/frame_transport.hpp"
#include "vcast/stream_stats.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace vcast {

/**
 * One connected viewer.
 * - offer() is called from the broadcast thread (and once for the seed frame)
 * - the flush routine keeps a single send in flight and drains oldest-first
 * - any send failure or explicit close() terminates the session for good
 */
class ViewerSession : public std::enable_shared_from_this<ViewerSession> {
public:
    using ClosedHandler = std::function<void(uint64_t id, const std::string& reason)>;

    static constexpr std::size_t kDefaultCapacity = 4;

    ViewerSession(uint64_t id,
                  std::shared_ptr<FrameTransport> transport,
                  std::size_t capacity = kDefaultCapacity,
                  StreamStats* stats = nullptr);
    ~ViewerSession();

    ViewerSession(const ViewerSession&) = delete;
    ViewerSession& operator=(const ViewerSession&) = delete;

    // Queue a frame unless it is empty, already sent, or not newer than
    // what is pending. Returns true if it was queued.
    bool offer(const Frame& frame);

    // Begin flushing. Frames offered before start() wait in the queue.
    void start();

    // Idempotent. Discards the queue, closes the transport, fires on_closed once.
    void close(const std::string& reason);

    // Must be set before start().
    void set_on_closed(ClosedHandler h);

    uint64_t id() const { return id_; }
    uint64_t last_sent_version() const { return last_sent_.load(std::memory_order_acquire); }
    bool closed() const { return closed_.load(std::memory_order_acquire); }
    bool send_in_flight() const;

    std::vector<uint64_t> pending_versions() const;
    std::size_t pending() const { return queue_.size(); }
    std::size_t capacity() const { return queue_.capacity(); }
    uint64_t dropped() const { return queue_.dropped(); }
    uint64_t frames_sent() const { return frames_sent_.load(std::memory_order_relaxed); }

private:
    void pump();
    void on_sent(uint64_t version, std::size_t bytes, bool ok);

    const uint64_t id_;
    StreamStats* stats_;
    DropOldestQueue<Frame> queue_;

    mutable std::mutex mtx_;
    std::shared_ptr<FrameTransport> transport_;   // released on close
    ClosedHandler on_closed_;
    bool started_ = false;
    bool in_flight_ = false;

    std::atomic<bool> closed_{false};
    std::atomic<uint64_t> last_sent_{0};
    std::atomic<uint64_t> frames_sent_{0};
};

} // namespace vcast
