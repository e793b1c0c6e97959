#include "vcast/viewer_session.hpp"
#include "fake_transport.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using vcast::Frame;
using vcast::StreamStats;
using vcast::ViewerSession;
using vcast::test::FakeTransport;
using vcast::test::make_frame;
using vcast::test::payload_for;

namespace {

std::shared_ptr<ViewerSession> make_session(std::shared_ptr<FakeTransport> t,
                                            StreamStats* stats = nullptr) {
    return std::make_shared<ViewerSession>(1, std::move(t), ViewerSession::kDefaultCapacity, stats);
}

} // namespace

TEST(ViewerSession, EmptyFrameIsIgnored) {
    auto t = std::make_shared<FakeTransport>();
    auto s = make_session(t);
    s->start();

    EXPECT_FALSE(s->offer(Frame{}));
    EXPECT_TRUE(t->attempted().empty());
}

TEST(ViewerSession, DeliversOfferedFrame) {
    auto t = std::make_shared<FakeTransport>();
    auto s = make_session(t);
    s->start();

    EXPECT_TRUE(s->offer(make_frame(1)));
    EXPECT_EQ(t->delivered(), (std::vector<std::string>{payload_for(1)}));
    EXPECT_EQ(s->last_sent_version(), 1u);
    EXPECT_EQ(s->frames_sent(), 1u);
    EXPECT_FALSE(s->send_in_flight());
}

TEST(ViewerSession, OfferingSameVersionTwiceQueuesOnce) {
    auto t = std::make_shared<FakeTransport>();
    auto s = make_session(t);

    EXPECT_TRUE(s->offer(make_frame(3)));
    EXPECT_FALSE(s->offer(make_frame(3)));
    EXPECT_EQ(s->pending_versions(), (std::vector<uint64_t>{3}));

    s->start();
    EXPECT_EQ(t->delivered(), (std::vector<std::string>{payload_for(3)}));
}

TEST(ViewerSession, StaleOfferIsNoop) {
    auto t = std::make_shared<FakeTransport>();
    auto s = make_session(t);
    s->start();

    s->offer(make_frame(5));
    ASSERT_EQ(s->last_sent_version(), 5u);

    EXPECT_FALSE(s->offer(make_frame(5)));
    EXPECT_FALSE(s->offer(make_frame(4)));
    EXPECT_EQ(t->attempted().size(), 1u);
    EXPECT_EQ(s->pending(), 0u);
    EXPECT_EQ(s->last_sent_version(), 5u);
}

TEST(ViewerSession, SlowViewerKeepsNewestFrames) {
    auto t = std::make_shared<FakeTransport>();
    StreamStats stats;
    auto s = make_session(t, &stats);

    for (uint64_t v = 1; v <= 10; ++v) s->offer(make_frame(v));
    EXPECT_EQ(s->pending_versions(), (std::vector<uint64_t>{7, 8, 9, 10}));
    EXPECT_EQ(s->dropped(), 6u);
    EXPECT_EQ(stats.frames_dropped.load(), 6u);

    s->start();
    EXPECT_EQ(s->last_sent_version(), 10u);
    EXPECT_EQ(t->delivered(),
              (std::vector<std::string>{payload_for(7), payload_for(8),
                                        payload_for(9), payload_for(10)}));
    EXPECT_EQ(stats.frames_sent.load(), 4u);
}

TEST(ViewerSession, KeepsOneSendInFlight) {
    auto t = std::make_shared<FakeTransport>(FakeTransport::Mode::Deferred);
    auto s = make_session(t);
    s->start();

    for (uint64_t v = 1; v <= 10; ++v) s->offer(make_frame(v));

    EXPECT_TRUE(s->send_in_flight());
    EXPECT_EQ(t->parked(), 1u);
    EXPECT_EQ(s->pending_versions(), (std::vector<uint64_t>{7, 8, 9, 10}));
    EXPECT_EQ(s->last_sent_version(), 0u);

    EXPECT_EQ(t->complete_all(), 5);
    EXPECT_FALSE(s->send_in_flight());
    EXPECT_EQ(s->last_sent_version(), 10u);
    EXPECT_EQ(t->delivered(),
              (std::vector<std::string>{payload_for(1), payload_for(7), payload_for(8),
                                        payload_for(9), payload_for(10)}));
}

TEST(ViewerSession, LastSentNeverDecreases) {
    auto t = std::make_shared<FakeTransport>(FakeTransport::Mode::Deferred);
    auto s = make_session(t);
    s->start();

    uint64_t prev = 0;
    for (uint64_t v = 1; v <= 50; ++v) {
        s->offer(make_frame(v));
        if (v % 3 == 0) t->complete_next();
        uint64_t cur = s->last_sent_version();
        EXPECT_GE(cur, prev);
        EXPECT_LE(cur, v);
        prev = cur;
    }
    t->complete_all();
    EXPECT_EQ(s->last_sent_version(), 50u);
}

TEST(ViewerSession, SendFailureClosesSession) {
    auto t = std::make_shared<FakeTransport>();
    t->fail_on(payload_for(2));
    StreamStats stats;
    auto s = make_session(t, &stats);

    int closed_calls = 0;
    std::string reason;
    s->set_on_closed([&](uint64_t id, const std::string& r) {
        EXPECT_EQ(id, 1u);
        ++closed_calls;
        reason = r;
    });
    s->start();

    s->offer(make_frame(1));
    s->offer(make_frame(2));

    EXPECT_TRUE(s->closed());
    EXPECT_EQ(closed_calls, 1);
    EXPECT_NE(reason.find("version 2"), std::string::npos);
    EXPECT_EQ(t->close_calls(), 1);
    EXPECT_EQ(s->last_sent_version(), 1u);
    EXPECT_EQ(stats.sessions_closed.load(), 1u);

    EXPECT_FALSE(s->offer(make_frame(3)));
    EXPECT_EQ(t->attempted().size(), 2u);
}

TEST(ViewerSession, CloseIsIdempotent) {
    auto t = std::make_shared<FakeTransport>(FakeTransport::Mode::Deferred);
    auto s = make_session(t);
    int closed_calls = 0;
    s->set_on_closed([&](uint64_t, const std::string&) { ++closed_calls; });
    s->start();

    s->offer(make_frame(1));
    s->offer(make_frame(2));
    s->close("viewer left");
    s->close("again");

    EXPECT_EQ(closed_calls, 1);
    EXPECT_EQ(t->close_calls(), 1);
    EXPECT_EQ(s->pending(), 0u);

    // completion of the send that was in flight must not reopen anything
    t->complete_all();
    EXPECT_TRUE(s->closed());
    EXPECT_EQ(t->attempted().size(), 1u);
}
