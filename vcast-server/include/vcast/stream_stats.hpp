#pragma once
#include <atomic>
#include <cstdint>

namespace vcast {

// Plain copy of the counters, taken once per stats tick.
struct StatsLine {
    int64_t ts_wall_us = 0;
    uint64_t frames_published = 0;
    uint64_t capture_failures = 0;
    uint64_t encode_failures = 0;
    uint64_t frames_sent = 0;
    uint64_t frames_dropped = 0;
    uint64_t bytes_sent = 0;
    uint64_t ingest_frames = 0;
    uint64_t ingest_bytes = 0;
    uint64_t sessions_opened = 0;
    uint64_t sessions_closed = 0;
    uint64_t viewers = 0;

    // rates over the last interval
    double publish_fps = 0.0;
    double send_kbps = 0.0;
    double ingest_fps = 0.0;
    double ingest_kbps = 0.0;
};

// Process-lifetime counters, updated lock-free from every thread.
struct StreamStats {
    std::atomic<uint64_t> frames_published{0};
    std::atomic<uint64_t> capture_failures{0};
    std::atomic<uint64_t> encode_failures{0};
    std::atomic<uint64_t> frames_sent{0};
    std::atomic<uint64_t> frames_dropped{0};
    std::atomic<uint64_t> bytes_sent{0};
    std::atomic<uint64_t> ingest_frames{0};
    std::atomic<uint64_t> ingest_bytes{0};
    std::atomic<uint64_t> sessions_opened{0};
    std::atomic<uint64_t> sessions_closed{0};

    StatsLine sample() const {
        StatsLine s;
        s.frames_published = frames_published.load(std::memory_order_relaxed);
        s.capture_failures = capture_failures.load(std::memory_order_relaxed);
        s.encode_failures  = encode_failures.load(std::memory_order_relaxed);
        s.frames_sent      = frames_sent.load(std::memory_order_relaxed);
        s.frames_dropped   = frames_dropped.load(std::memory_order_relaxed);
        s.bytes_sent       = bytes_sent.load(std::memory_order_relaxed);
        s.ingest_frames    = ingest_frames.load(std::memory_order_relaxed);
        s.ingest_bytes     = ingest_bytes.load(std::memory_order_relaxed);
        s.sessions_opened  = sessions_opened.load(std::memory_order_relaxed);
        s.sessions_closed  = sessions_closed.load(std::memory_order_relaxed);
        return s;
    }
};

// Fill the rate fields of `cur` from the previous sample.
inline void compute_rates(StatsLine& cur, const StatsLine& prev, double elapsed_s) {
    if (elapsed_s <= 0) return;
    cur.publish_fps = (double)(cur.frames_published - prev.frames_published) / elapsed_s;
    cur.send_kbps   = (double)(cur.bytes_sent - prev.bytes_sent) / 1024.0 / elapsed_s;
    cur.ingest_fps  = (double)(cur.ingest_frames - prev.ingest_frames) / elapsed_s;
    cur.ingest_kbps = (double)(cur.ingest_bytes - prev.ingest_bytes) / 1024.0 / elapsed_s;
}

} // namespace vcast
