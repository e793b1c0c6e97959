#include "vcast/broadcast_loop.hpp"
#include "fake_transport.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using vcast::BroadcastLoop;
using vcast::FrameSlot;
using vcast::SessionRegistry;
using vcast::ViewerSession;
using vcast::test::FakeTransport;
using vcast::test::wait_for;

namespace {

struct Viewer {
    std::shared_ptr<FakeTransport> transport;
    std::shared_ptr<ViewerSession> session;
};

Viewer add_viewer(SessionRegistry& reg, uint64_t id) {
    Viewer v;
    v.transport = std::make_shared<FakeTransport>();
    v.session = std::make_shared<ViewerSession>(id, v.transport);
    v.session->start();
    reg.add(v.session);
    return v;
}

} // namespace

TEST(BroadcastLoop, IdleWithoutFrame) {
    FrameSlot slot;
    SessionRegistry reg;
    auto v = add_viewer(reg, 1);
    BroadcastLoop loop(slot, reg, 10ms);

    EXPECT_EQ(loop.step(), 0u);
    EXPECT_EQ(loop.last_broadcast_version(), 0u);
    EXPECT_TRUE(v.transport->attempted().empty());
}

TEST(BroadcastLoop, FansOutEachVersionOnce) {
    FrameSlot slot;
    SessionRegistry reg;
    std::vector<Viewer> viewers;
    for (uint64_t id = 1; id <= 3; ++id) viewers.push_back(add_viewer(reg, id));
    BroadcastLoop loop(slot, reg, 10ms);

    slot.publish("a");
    EXPECT_EQ(loop.step(), 3u);
    EXPECT_EQ(loop.step(), 0u);
    EXPECT_EQ(loop.last_broadcast_version(), 1u);
    EXPECT_EQ(loop.broadcasts(), 1u);

    for (auto& v : viewers) {
        EXPECT_EQ(v.transport->delivered(), (std::vector<std::string>{"a"}));
        EXPECT_EQ(v.session->last_sent_version(), 1u);
    }
}

TEST(BroadcastLoop, SkipsVersionsPublishedBetweenSteps) {
    FrameSlot slot;
    SessionRegistry reg;
    auto v = add_viewer(reg, 1);
    BroadcastLoop loop(slot, reg, 10ms);

    slot.publish("one");
    slot.publish("two");
    slot.publish("three");
    loop.step();

    EXPECT_EQ(v.transport->delivered(), (std::vector<std::string>{"three"}));
    EXPECT_EQ(loop.last_broadcast_version(), 3u);
}

TEST(BroadcastLoop, NoSessionsStillAdvances) {
    FrameSlot slot;
    SessionRegistry reg;
    BroadcastLoop loop(slot, reg, 10ms);

    slot.publish("x");
    EXPECT_EQ(loop.step(), 0u);
    EXPECT_EQ(loop.last_broadcast_version(), 1u);
}

TEST(BroadcastLoop, ThreadDeliversPublishedFrames) {
    FrameSlot slot;
    SessionRegistry reg;
    auto v = add_viewer(reg, 1);
    BroadcastLoop loop(slot, reg, 1000ms);

    loop.start();
    EXPECT_TRUE(loop.running());

    slot.publish("hello");
    EXPECT_TRUE(wait_for([&]{ return v.session->last_sent_version() == 1; }));

    slot.publish("world");
    EXPECT_TRUE(wait_for([&]{ return v.session->last_sent_version() == 2; }));

    loop.stop();
    EXPECT_FALSE(loop.running());
    EXPECT_EQ(v.transport->delivered().back(), "world");
}

TEST(BroadcastLoop, StopReturnsPromptly) {
    FrameSlot slot;
    SessionRegistry reg;
    BroadcastLoop loop(slot, reg, 1000ms);
    loop.start();
    std::this_thread::sleep_for(10ms);

    auto t0 = std::chrono::steady_clock::now();
    loop.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 2s);
    loop.stop();
}
