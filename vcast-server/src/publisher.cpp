#include "vcast/publisher.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace vcast {

using SteadyClock = std::chrono::steady_clock;

Publisher::Publisher(FrameSlot& slot, CaptureSource& source, Encoder& encoder,
                     PublisherOptions opts, StreamStats* stats)
    : slot_(slot), source_(source), encoder_(encoder), opts_(opts), stats_(stats) {
    if (opts_.fps < 1) opts_.fps = 1;
}

Publisher::~Publisher() {
    stop();
}

void Publisher::start() {
    if (running_.load()) return;

    // startup error, reported to the caller rather than per frame
    source_.open();

    failed_.store(false);
    consecutive_failures_.store(0);
    running_.store(true);
    thread_ = std::thread([this]{ run(); });

    std::cerr << "[publisher] started: source=" << source_.name()
              << " encoder=" << encoder_.name()
              << " fps=" << opts_.fps << " quality=" << opts_.quality << "\n";
}

void Publisher::stop() {
    {
        std::lock_guard<std::mutex> lk(sleep_mtx_);
        running_.store(false);
    }
    sleep_cv_.notify_all();

    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }

    if (source_.is_open()) {
        source_.close();
        std::cerr << "[publisher] stopped: published=" << published_.load()
                  << " cycle " << cycle_hist_.summary_ms() << "\n";
    }
}

bool Publisher::run_cycle() {
    auto t0 = SteadyClock::now();

    if (!source_.acquire(raw_)) {
        if (stats_) stats_->capture_failures.fetch_add(1, std::memory_order_relaxed);
        std::cerr << "[publisher] capture failed, skipping cycle\n";
        consecutive_failures_.fetch_add(1);
        return false;
    }

    if (!encoder_.encode(raw_, opts_.quality, encoded_)) {
        if (stats_) stats_->encode_failures.fetch_add(1, std::memory_order_relaxed);
        std::cerr << "[publisher] encode failed, skipping cycle\n";
        consecutive_failures_.fetch_add(1);
        return false;
    }

    slot_.publish(std::move(encoded_));
    encoded_.clear();

    consecutive_failures_.store(0);
    published_.fetch_add(1);
    if (stats_) stats_->frames_published.fetch_add(1, std::memory_order_relaxed);

    auto t1 = SteadyClock::now();
    cycle_hist_.add((uint64_t)std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count());
    return true;
}

void Publisher::run() {
    const auto interval = std::chrono::duration_cast<SteadyClock::duration>(
        std::chrono::duration<double>(1.0 / opts_.fps));
    auto next_tick = SteadyClock::now();

    while (running_.load()) {
        run_cycle();

        const uint64_t fails = consecutive_failures_.load();
        if (opts_.max_consecutive_failures > 0 &&
            fails >= (uint64_t)opts_.max_consecutive_failures) {
            std::string reason = std::to_string(fails) + " consecutive capture/encode failures";
            std::cerr << "[publisher] fatal: " << reason << "\n";
            failed_.store(true);
            running_.store(false);
            if (on_fatal_) on_fatal_(reason);
            break;
        }

        // keep the cadence; if a cycle overran, restart the schedule from now
        next_tick += interval;
        auto now = SteadyClock::now();
        if (next_tick <= now) {
            next_tick = now;
            continue;
        }

        std::unique_lock<std::mutex> lk(sleep_mtx_);
        sleep_cv_.wait_until(lk, next_tick, [&]{ return !running_.load(); });
    }
}

} // namespace vcast
