#include "vcast/publisher.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>

using namespace std::chrono_literals;
using vcast::CaptureSource;
using vcast::Encoder;
using vcast::FrameSlot;
using vcast::JpegEncoder;
using vcast::Publisher;
using vcast::PublisherOptions;
using vcast::RawImage;
using vcast::StreamStats;
using vcast::TestPatternSource;

namespace {

// opens fine, never yields a frame
class DeadSource : public CaptureSource {
public:
    void open() override { open_ = true; }
    bool acquire(RawImage&) override { return false; }
    void close() override { open_ = false; }
    bool is_open() const override { return open_; }
    std::string name() const override { return "dead"; }

private:
    bool open_ = false;
};

class RefusingEncoder : public Encoder {
public:
    bool encode(const RawImage&, int, std::string&) override { return false; }
    std::string name() const override { return "refusing"; }
};

PublisherOptions fast(int max_failures = 150) {
    PublisherOptions o;
    o.fps = 200;
    o.quality = 70;
    o.max_consecutive_failures = max_failures;
    return o;
}

bool looks_like_jpeg(const std::string& s) {
    return s.size() > 4 &&
           (unsigned char)s[0] == 0xFF && (unsigned char)s[1] == 0xD8 &&
           (unsigned char)s[s.size() - 2] == 0xFF && (unsigned char)s[s.size() - 1] == 0xD9;
}

} // namespace

TEST(Publisher, StartThrowsWhenSourceCannotOpen) {
    FrameSlot slot;
    TestPatternSource source(32, 16, 0, true);
    JpegEncoder enc;
    Publisher pub(slot, source, enc, fast());

    EXPECT_THROW(pub.start(), std::runtime_error);
    EXPECT_FALSE(pub.running());
    EXPECT_EQ(slot.version(), 0u);
}

TEST(Publisher, CyclePublishesJpeg) {
    FrameSlot slot;
    TestPatternSource source(32, 16);
    JpegEncoder enc;
    StreamStats stats;
    Publisher pub(slot, source, enc, fast(), &stats);
    source.open();

    ASSERT_TRUE(pub.run_cycle());
    auto f = slot.read();
    EXPECT_EQ(f.version, 1u);
    EXPECT_TRUE(looks_like_jpeg(*f.payload));
    EXPECT_EQ(pub.published(), 1u);
    EXPECT_EQ(stats.frames_published.load(), 1u);
    EXPECT_EQ(pub.cycle_latency().count(), 1u);
}

TEST(Publisher, CaptureFailureKeepsPreviousFrame) {
    FrameSlot slot;
    TestPatternSource source(32, 16, 2);
    JpegEncoder enc;
    StreamStats stats;
    Publisher pub(slot, source, enc, fast(), &stats);
    source.open();

    ASSERT_TRUE(pub.run_cycle());
    auto before = slot.read();

    EXPECT_FALSE(pub.run_cycle());
    EXPECT_EQ(pub.consecutive_failures(), 1u);
    EXPECT_EQ(stats.capture_failures.load(), 1u);

    auto after = slot.read();
    EXPECT_EQ(after.version, before.version);
    EXPECT_EQ(after.payload, before.payload);

    EXPECT_TRUE(pub.run_cycle());
    EXPECT_EQ(slot.version(), 2u);
    EXPECT_EQ(pub.consecutive_failures(), 0u);
}

TEST(Publisher, EncodeFailureSkipsCycle) {
    FrameSlot slot;
    TestPatternSource source(32, 16);
    RefusingEncoder enc;
    StreamStats stats;
    Publisher pub(slot, source, enc, fast(), &stats);
    source.open();

    EXPECT_FALSE(pub.run_cycle());
    EXPECT_TRUE(slot.read().empty());
    EXPECT_EQ(stats.encode_failures.load(), 1u);
}

TEST(Publisher, LoopPublishesUntilStopped) {
    FrameSlot slot;
    TestPatternSource source(64, 48);
    JpegEncoder enc;
    Publisher pub(slot, source, enc, fast());

    pub.start();
    EXPECT_TRUE(pub.running());

    auto deadline = std::chrono::steady_clock::now() + 3s;
    while (slot.version() < 5 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    pub.stop();

    EXPECT_GE(slot.version(), 5u);
    EXPECT_FALSE(pub.running());
    EXPECT_FALSE(source.is_open());

    const uint64_t v = slot.version();
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(slot.version(), v);
}

TEST(Publisher, FatalAfterConsecutiveFailures) {
    FrameSlot slot;
    DeadSource source;
    JpegEncoder enc;
    StreamStats stats;
    Publisher pub(slot, source, enc, fast(5), &stats);

    std::promise<std::string> fatal;
    auto fut = fatal.get_future();
    pub.set_on_fatal([&](const std::string& reason) { fatal.set_value(reason); });

    pub.start();
    ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);
    EXPECT_NE(fut.get().find("5 consecutive"), std::string::npos);

    EXPECT_TRUE(pub.failed());
    EXPECT_EQ(stats.capture_failures.load(), 5u);
    EXPECT_EQ(slot.version(), 0u);

    pub.stop();
    EXPECT_FALSE(source.is_open());
}

TEST(Publisher, StopIsIdempotent) {
    FrameSlot slot;
    TestPatternSource source(16, 16);
    JpegEncoder enc;
    Publisher pub(slot, source, enc, fast());
    pub.start();
    pub.stop();
    pub.stop();
    EXPECT_FALSE(pub.running());
}
