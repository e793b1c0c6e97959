#include "vcast/stats_reporter.hpp"

#include <iomanip>
#include <iostream>

namespace vcast {

int64_t now_wall_us() {
    using namespace std::chrono;
    return (int64_t)duration_cast<microseconds>(system_clock::now().time_since_epoch()).count();
}

StatsReporter::StatsReporter(FrameHub& hub, std::chrono::milliseconds interval,
                             JsonlWriter* jsonl, PgWriter* pg)
    : hub_(hub), interval_(interval), jsonl_(jsonl), pg_(pg)
    , prev_time_(std::chrono::steady_clock::now()) {}

StatsReporter::~StatsReporter() {
    stop();
}

void StatsReporter::start() {
    if (interval_.count() <= 0) return;
    if (running_.exchange(true)) return;

    prev_ = hub_.stats().sample();
    prev_time_ = std::chrono::steady_clock::now();

    thread_ = std::thread([this]{ run(); });
    if (pg_) pg_thread_ = std::thread([this]{ run_pg(); });
}

void StatsReporter::stop() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!running_.exchange(false)) return;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();

    pg_queue_.close();
    if (pg_thread_.joinable()) pg_thread_.join();
    if (jsonl_) jsonl_->flush();
}

StatsLine StatsReporter::tick() {
    auto now = std::chrono::steady_clock::now();
    StatsLine cur = hub_.stats().sample();
    cur.ts_wall_us = now_wall_us();
    cur.viewers = hub_.viewers();
    compute_rates(cur, prev_, std::chrono::duration<double>(now - prev_time_).count());
    prev_ = cur;
    prev_time_ = now;

    std::cerr << std::fixed << std::setprecision(1)
              << "[stats] version=" << hub_.slot().version()
              << " publish_fps=" << cur.publish_fps
              << " viewers=" << cur.viewers
              << " sent=" << cur.frames_sent
              << " dropped=" << cur.frames_dropped
              << " net=" << cur.send_kbps << "KB/s"
              << " recv_fps=" << cur.ingest_fps
              << " recv=" << cur.ingest_kbps << "KB/s"
              << " capture_fail=" << cur.capture_failures
              << " encode_fail=" << cur.encode_failures << "\n"
              << std::defaultfloat;

    if (jsonl_) jsonl_->write_stats(cur);
    if (pg_) pg_queue_.push(cur);
    return cur;
}

void StatsReporter::run() {
    std::unique_lock<std::mutex> lk(mtx_);
    while (running_.load()) {
        cv_.wait_for(lk, interval_, [&]{ return !running_.load(); });
        if (!running_.load()) break;
        lk.unlock();
        tick();
        lk.lock();
    }
}

void StatsReporter::run_pg() {
    while (!pg_queue_.closed()) {
        auto item = pg_queue_.pop_wait(std::chrono::milliseconds(500));
        if (!item) continue;
        pg_->write_stats(*item);
    }
    std::cerr << "[pg] writer thread exit\n";
}

} // namespace vcast
