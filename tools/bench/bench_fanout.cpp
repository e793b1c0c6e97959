#include "vcast/frame_hub.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace vcast;
using Clock = std::chrono::steady_clock;

// Completes every send inline, or parks it forever when `stalled`.
class BenchTransport : public FrameTransport {
public:
    explicit BenchTransport(bool stalled) : stalled_(stalled) {}

    void async_send(std::shared_ptr<const std::string> payload, Completion done) override {
        bytes_ += payload->size();
        if (stalled_) {
            std::lock_guard<std::mutex> lk(mtx_);
            parked_.push_back(std::move(done));
            return;
        }
        done(true);
    }
    void close() override {}

    uint64_t bytes() const { return bytes_; }

private:
    bool stalled_;
    uint64_t bytes_ = 0;
    std::mutex mtx_;
    std::vector<Completion> parked_;
};

static uint64_t percentile(std::vector<uint64_t>& v, double p) {
    if (v.empty()) return 0;
    std::sort(v.begin(), v.end());
    size_t idx = (size_t)((p / 100.0) * (v.size() - 1));
    return v[idx];
}

int main(int argc, char** argv) {
    int viewers = 100;
    int stalled = 10;               // viewers that never finish a send
    long long frames = 20'000;
    int payload_bytes = 64 * 1024;
    int queue = 4;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--viewers" && i + 1 < argc) viewers = std::stoi(argv[++i]);
        else if (a == "--stalled" && i + 1 < argc) stalled = std::stoi(argv[++i]);
        else if (a == "--frames" && i + 1 < argc) frames = std::stoll(argv[++i]);
        else if (a == "--payload" && i + 1 < argc) payload_bytes = std::stoi(argv[++i]);
        else if (a == "--queue" && i + 1 < argc) queue = std::stoi(argv[++i]);
        else if (a == "--help") {
            std::cout
                << "Usage: bench_fanout [--viewers N] [--stalled N] [--frames N]\n"
                << "                    [--payload BYTES] [--queue N]\n";
            return 0;
        }
    }

    HubOptions opts;
    opts.queue_capacity = (std::size_t)std::max(1, queue);
    FrameHub hub(opts);   // broadcast loop not started: step() is driven by hand below

    std::vector<std::shared_ptr<BenchTransport>> transports;
    for (int v = 0; v < viewers; ++v) {
        auto t = std::make_shared<BenchTransport>(v < stalled);
        transports.push_back(t);
        hub.attach(t);
    }

    const std::string payload(payload_bytes, '\xAB');

    std::vector<uint64_t> lat_ns;
    lat_ns.reserve((size_t)frames);

    auto t0 = Clock::now();
    for (long long f = 0; f < frames; ++f) {
        hub.publish(payload);
        auto s = Clock::now();
        hub.broadcaster().step();
        lat_ns.push_back((uint64_t)std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - s).count());
    }
    uint64_t total_ns = (uint64_t)std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - t0).count();
    double secs = (double)total_ns / 1e9;

    uint64_t p50 = percentile(lat_ns, 50);
    uint64_t p95 = percentile(lat_ns, 95);
    uint64_t p99 = percentile(lat_ns, 99);

    const auto& st = hub.stats();
    std::cout << "Viewers: " << viewers << " (stalled " << stalled << ")\n";
    std::cout << "Frames published: " << frames << " in " << secs << " s ("
              << (uint64_t)(secs > 0 ? frames / secs : 0) << " frames/s)\n";
    std::cout << "Frames sent: " << st.frames_sent.load()
              << "  dropped: " << st.frames_dropped.load() << "\n";
    std::cout << "Fan-out latency (us): p50=" << (p50 / 1000.0)
              << " p95=" << (p95 / 1000.0)
              << " p99=" << (p99 / 1000.0) << "\n";

    hub.shutdown();
    return 0;
}
