#pragma once
#include "vcast/capture_source.hpp"
#include "vcast/encoder.hpp"
#include "vcast/frame_slot.hpp"
#include "vcast/pow2_histogram.hpp"
#include "vcast/stream_stats.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace vcast {

struct PublisherOptions {
    int fps = 30;
    int quality = 80;
    // consecutive failed cycles before giving up; 0 = retry forever
    int max_consecutive_failures = 150;
};

/**
 * Producer loop: capture -> encode -> FrameSlot::publish, paced to `fps`.
 * A failed cycle is logged and skipped; the slot keeps serving the previous frame.
 */
class Publisher {
public:
    using FatalHandler = std::function<void(const std::string& reason)>;

    Publisher(FrameSlot& slot, CaptureSource& source, Encoder& encoder,
              PublisherOptions opts, StreamStats* stats = nullptr);
    ~Publisher();

    Publisher(const Publisher&) = delete;
    Publisher& operator=(const Publisher&) = delete;

    // Opens the capture source (throws std::runtime_error if it cannot be
    // opened) and starts the loop thread.
    void start();

    // Stops the loop and releases the capture device. Safe to call twice.
    void stop();

    // Called from the loop thread once the failure limit is hit.
    // Must not call stop() synchronously.
    void set_on_fatal(FatalHandler h) { on_fatal_ = std::move(h); }

    // One capture/encode/publish cycle. Returns true if a frame was published.
    bool run_cycle();

    bool running() const { return running_.load(); }
    bool failed() const { return failed_.load(); }
    uint64_t published() const { return published_.load(); }
    uint64_t consecutive_failures() const { return consecutive_failures_.load(); }
    const Pow2Histogram& cycle_latency() const { return cycle_hist_; }

private:
    void run();

    FrameSlot& slot_;
    CaptureSource& source_;
    Encoder& encoder_;
    PublisherOptions opts_;
    StreamStats* stats_;
    FatalHandler on_fatal_;

    RawImage raw_;
    std::string encoded_;
    Pow2Histogram cycle_hist_;

    std::atomic<bool> running_{false};
    std::atomic<bool> failed_{false};
    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> consecutive_failures_{0};

    std::mutex sleep_mtx_;
    std::condition_variable sleep_cv_;
    std::thread thread_;
};

} // namespace vcast
