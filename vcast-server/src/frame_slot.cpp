#include "vcast/frame_slot.hpp"

#include <utility>

namespace vcast {

// ----------------------- Publish -----------------------

uint64_t FrameSlot::publish(std::string payload) {
    // allocate outside the lock; readers only ever see a complete payload
    auto p = std::make_shared<const std::string>(std::move(payload));

    uint64_t v = 0;
    {
        std::unique_lock lock(mtx_);
        v = current_.version + 1;
        current_.payload = std::move(p);
        current_.version = v;
    }

    {
        std::lock_guard<std::mutex> lk(wait_mtx_);
        notified_version_ = v;
    }
    wait_cv_.notify_all();
    return v;
}

// ----------------------- Read -----------------------

Frame FrameSlot::read() const {
    std::shared_lock lock(mtx_);
    return current_;
}

uint64_t FrameSlot::version() const {
    std::shared_lock lock(mtx_);
    return current_.version;
}

bool FrameSlot::wait_newer(uint64_t seen, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(wait_mtx_);
    const uint64_t interrupts = interrupts_;
    wait_cv_.wait_for(lk, timeout, [&]{
        return notified_version_ > seen || interrupts_ != interrupts;
    });
    return notified_version_ > seen;
}

void FrameSlot::interrupt() {
    {
        std::lock_guard<std::mutex> lk(wait_mtx_);
        ++interrupts_;
    }
    wait_cv_.notify_all();
}

} // namespace vcast
