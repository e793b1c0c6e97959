#include "vcast/frame_slot.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using vcast::Frame;
using vcast::FrameSlot;

TEST(FrameSlot, EmptyBeforeFirstPublish) {
    FrameSlot slot;
    Frame f = slot.read();
    EXPECT_TRUE(f.empty());
    EXPECT_EQ(f.version, 0u);
    EXPECT_EQ(f.payload, nullptr);
    EXPECT_EQ(slot.version(), 0u);
}

TEST(FrameSlot, VersionCountsPublishes) {
    FrameSlot slot;
    for (uint64_t i = 1; i <= 5; ++i) {
        EXPECT_EQ(slot.publish("p" + std::to_string(i)), i);
        Frame f = slot.read();
        ASSERT_FALSE(f.empty());
        EXPECT_EQ(f.version, i);
        EXPECT_EQ(*f.payload, "p" + std::to_string(i));
    }
    EXPECT_EQ(slot.version(), 5u);
}

TEST(FrameSlot, HeldFrameOutlivesOverwrite) {
    FrameSlot slot;
    slot.publish("first");
    Frame held = slot.read();
    slot.publish("second");

    EXPECT_EQ(*held.payload, "first");
    EXPECT_EQ(held.version, 1u);
    EXPECT_EQ(*slot.read().payload, "second");
}

TEST(FrameSlot, WaitNewerTimesOutWithoutPublish) {
    FrameSlot slot;
    EXPECT_FALSE(slot.wait_newer(0, 10ms));
}

TEST(FrameSlot, WaitNewerReturnsImmediatelyWhenAlreadyNewer) {
    FrameSlot slot;
    slot.publish("x");
    auto t0 = std::chrono::steady_clock::now();
    EXPECT_TRUE(slot.wait_newer(0, 5s));
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 1s);
    EXPECT_FALSE(slot.wait_newer(1, 5ms));
}

TEST(FrameSlot, WaitNewerWakesOnPublish) {
    FrameSlot slot;
    std::thread writer([&]{
        std::this_thread::sleep_for(20ms);
        slot.publish("late");
    });
    EXPECT_TRUE(slot.wait_newer(0, 5s));
    writer.join();
}

TEST(FrameSlot, InterruptWakesWaiter) {
    FrameSlot slot;
    std::atomic<bool> woke{false};
    auto t0 = std::chrono::steady_clock::now();
    std::thread waiter([&]{
        bool newer = slot.wait_newer(0, 10s);
        EXPECT_FALSE(newer);
        woke = true;
    });
    std::this_thread::sleep_for(20ms);
    slot.interrupt();
    waiter.join();
    EXPECT_TRUE(woke.load());
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 5s);
}

TEST(FrameSlot, ReadersNeverSeeMismatchedPayloadAndVersion) {
    FrameSlot slot;
    std::atomic<bool> done{false};
    std::atomic<int> mismatches{0};

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&]{
            uint64_t last = 0;
            while (!done.load()) {
                Frame f = slot.read();
                if (f.empty()) continue;
                if (*f.payload != "v" + std::to_string(f.version)) ++mismatches;
                if (f.version < last) ++mismatches;
                last = f.version;
            }
        });
    }

    for (uint64_t i = 1; i <= 20000; ++i) slot.publish("v" + std::to_string(i));
    done = true;
    for (auto& t : readers) t.join();

    EXPECT_EQ(mismatches.load(), 0);
    EXPECT_EQ(slot.version(), 20000u);
}
