#pragma once
#include "vcast/drop_oldest_queue.hpp"
#include "vcast/frame_hub.hpp"
#include "vcast/jsonl_writer.hpp"
#include "vcast/pg_writer.hpp"
#include "vcast/stream_stats.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace vcast {

int64_t now_wall_us();

// Samples the hub's counters every interval, logs one line, and forwards
// the sample to the optional JSONL / PostgreSQL sinks.
// The database gets its own thread behind a small drop-oldest queue.
class StatsReporter {
public:
    StatsReporter(FrameHub& hub, std::chrono::milliseconds interval,
                  JsonlWriter* jsonl = nullptr, PgWriter* pg = nullptr);
    ~StatsReporter();

    StatsReporter(const StatsReporter&) = delete;
    StatsReporter& operator=(const StatsReporter&) = delete;

    void start();
    void stop();

    // Take one sample now (also used by the timer thread).
    StatsLine tick();

private:
    void run();
    void run_pg();

    FrameHub& hub_;
    const std::chrono::milliseconds interval_;
    JsonlWriter* jsonl_;
    PgWriter* pg_;

    StatsLine prev_;
    std::chrono::steady_clock::time_point prev_time_;

    DropOldestQueue<StatsLine> pg_queue_{256};

    std::atomic<bool> running_{false};
    std::mutex mtx_;
    std::condition_variable cv_;
    std::thread thread_;
    std::thread pg_thread_;
};

} // namespace vcast
