#pragma once
#include <cstdint>
#include <sstream>
#include <string>

namespace vcast {

// Log2-bucketed latency histogram. Percentiles are upper bucket bounds,
// so they overestimate by at most 2x. Not thread-safe: one owner thread.
struct Pow2Histogram {
    static constexpr int K = 64;
    uint64_t c[K]{};
    uint64_t n = 0;
    uint64_t max_ns = 0;

    static int bucket(uint64_t ns) {
        if (ns == 0) return 0;
#if defined(__GNUG__) || defined(__clang__)
        int b = 63 - __builtin_clzll(ns);
#else
        int b = 0;
        while ((1ull << (b + 1)) <= ns && b < 63) ++b;
#endif
        if (b < 0) b = 0;
        if (b > 63) b = 63;
        return b;
    }

    void add(uint64_t ns) {
        c[bucket(ns)]++;
        n++;
        if (ns > max_ns) max_ns = ns;
    }

    uint64_t count() const { return n; }

    uint64_t percentile(double p) const {
        if (n == 0) return 0;
        if (p < 0) p = 0;
        if (p > 1) p = 1;

        uint64_t target = static_cast<uint64_t>(p * (double)n);
        if (target == 0) target = 1;

        uint64_t cum = 0;
        for (int b = 0; b < K; ++b) {
            cum += c[b];
            if (cum >= target) {
                if (b >= 63) return (1ull << 63);
                return (1ull << (b + 1));
            }
        }
        return (1ull << 63);
    }

    // "n=.. p50=..ms p95=..ms p99=..ms max=..ms"
    std::string summary_ms() const {
        auto ms = [](uint64_t ns) { return (double)ns / 1e6; };
        std::ostringstream os;
        os << "n=" << n
           << " p50=" << ms(percentile(0.50)) << "ms"
           << " p95=" << ms(percentile(0.95)) << "ms"
           << " p99=" << ms(percentile(0.99)) << "ms"
           << " max=" << ms(max_ns) << "ms";
        return os.str();
    }
};

} // namespace vcast
