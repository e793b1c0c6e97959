#pragma once
#include "vcast/frame.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <shared_mutex>
#include <string>

namespace vcast {

/**
 * Single-slot store of the latest published frame.
 * - one writer (publish), many readers (read / wait_newer)
 * - payload and version are swapped together under the lock
 */
class FrameSlot {
public:
    FrameSlot() = default;

    FrameSlot(const FrameSlot&) = delete;
    FrameSlot& operator=(const FrameSlot&) = delete;

    // Store payload as the current frame; returns its version (previous + 1).
    uint64_t publish(std::string payload);

    // Current frame, or an empty Frame (version 0) before the first publish.
    Frame read() const;

    uint64_t version() const;

    // Block until version() > seen, the timeout expires, or interrupt().
    // Returns true if a newer frame is available.
    bool wait_newer(uint64_t seen, std::chrono::milliseconds timeout) const;

    // Wake every waiter (shutdown).
    void interrupt();

private:
    mutable std::shared_mutex mtx_;
    Frame current_;

    // notification side channel; never held while touching current_
    mutable std::mutex wait_mtx_;
    mutable std::condition_variable wait_cv_;
    uint64_t notified_version_ = 0;
    uint64_t interrupts_ = 0;
};

} // namespace vcast
