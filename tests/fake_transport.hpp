#pragma once
#include "vcast/frame.hpp"
#include "vcast/frame_transport.hpp"

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vcast::test {

inline std::string payload_for(uint64_t v) { return "frame-" + std::to_string(v); }

inline Frame make_frame(uint64_t v) {
    Frame f;
    f.payload = std::make_shared<const std::string>(payload_for(v));
    f.version = v;
    return f;
}

// In-memory transport. Inline mode completes each send immediately;
// Deferred mode parks completions until the test releases them.
class FakeTransport : public FrameTransport {
public:
    enum class Mode { Inline, Deferred };

    explicit FakeTransport(Mode mode = Mode::Inline) : mode_(mode) {}

    // every send of this payload reports failure
    void fail_on(std::string payload) {
        std::lock_guard<std::mutex> lk(mtx_);
        fail_on_ = std::move(payload);
    }

    void async_send(std::shared_ptr<const std::string> payload, Completion done) override {
        bool ok = true;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            attempted_.push_back(*payload);
            ok = !(fail_on_ && *payload == *fail_on_);
            if (mode_ == Mode::Deferred) {
                parked_.push_back(Parked{*payload, ok, std::move(done)});
                return;
            }
            if (ok) delivered_.push_back(*payload);
        }
        done(ok);
    }

    void close() override {
        std::lock_guard<std::mutex> lk(mtx_);
        ++close_calls_;
    }

    // Release the oldest parked send. Returns false if none was parked.
    bool complete_next() {
        Parked p;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (parked_.empty()) return false;
            p = std::move(parked_.front());
            parked_.pop_front();
            if (p.ok) delivered_.push_back(p.payload);
        }
        p.done(p.ok);
        return true;
    }

    // completions may park new sends, keep going until none are left
    int complete_all() {
        int n = 0;
        while (complete_next()) ++n;
        return n;
    }

    std::vector<std::string> attempted() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return attempted_;
    }

    std::vector<std::string> delivered() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return delivered_;
    }

    std::size_t parked() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return parked_.size();
    }

    int close_calls() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return close_calls_;
    }

private:
    struct Parked {
        std::string payload;
        bool ok = true;
        Completion done;
    };

    Mode mode_;
    mutable std::mutex mtx_;
    std::optional<std::string> fail_on_;
    std::vector<std::string> attempted_;
    std::vector<std::string> delivered_;
    std::deque<Parked> parked_;
    int close_calls_ = 0;
};

} // namespace vcast::test
