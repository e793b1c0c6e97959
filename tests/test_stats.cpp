#include "vcast/frame_hub.hpp"
#include "vcast/jsonl_writer.hpp"
#include "vcast/pow2_histogram.hpp"
#include "vcast/stats_reporter.hpp"
#include "vcast/stream_stats.hpp"
#include "fake_transport.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

using vcast::FrameHub;
using vcast::JsonlWriter;
using vcast::Pow2Histogram;
using vcast::StatsLine;
using vcast::StatsReporter;
using vcast::test::FakeTransport;

TEST(StreamStats, RatesFromTwoSamples) {
    StatsLine prev;
    prev.frames_published = 10;
    prev.bytes_sent = 0;
    prev.ingest_frames = 4;
    prev.ingest_bytes = 1024;

    StatsLine cur;
    cur.frames_published = 70;
    cur.bytes_sent = 20480;
    cur.ingest_frames = 34;
    cur.ingest_bytes = 1024 + 4096;

    vcast::compute_rates(cur, prev, 2.0);
    EXPECT_DOUBLE_EQ(cur.publish_fps, 30.0);
    EXPECT_DOUBLE_EQ(cur.send_kbps, 10.0);
    EXPECT_DOUBLE_EQ(cur.ingest_fps, 15.0);
    EXPECT_DOUBLE_EQ(cur.ingest_kbps, 2.0);
}

TEST(StreamStats, ZeroElapsedLeavesRatesAlone) {
    StatsLine prev, cur;
    cur.frames_published = 5;
    vcast::compute_rates(cur, prev, 0.0);
    EXPECT_DOUBLE_EQ(cur.publish_fps, 0.0);
}

TEST(JsonlWriter, SerializesOneObject) {
    StatsLine s;
    s.ts_wall_us = 123;
    s.frames_published = 7;
    s.viewers = 2;

    std::string j = JsonlWriter::to_json(s);
    EXPECT_EQ(j.front(), '{');
    EXPECT_EQ(j.back(), '}');
    EXPECT_NE(j.find("\"ts_wall_us\":123"), std::string::npos);
    EXPECT_NE(j.find("\"frames_published\":7"), std::string::npos);
    EXPECT_NE(j.find("\"viewers\":2"), std::string::npos);
    EXPECT_EQ(j.find('\n'), std::string::npos);
}

TEST(JsonlWriter, AppendsLinesToFile) {
    auto dir = std::filesystem::temp_directory_path() / "vcast_jsonl_test";
    std::filesystem::remove_all(dir);
    auto path = (dir / "nested" / "stats.jsonl").string();

    {
        JsonlWriter w(path, false);
        ASSERT_TRUE(w.is_open());
        StatsLine s;
        s.frames_sent = 1;
        w.write_stats(s);
        s.frames_sent = 2;
        w.write_stats(s);
    }

    std::ifstream in(path);
    std::string line;
    int lines = 0;
    while (std::getline(in, line)) {
        ++lines;
        EXPECT_NE(line.find("\"frames_sent\":" + std::to_string(lines)), std::string::npos);
    }
    EXPECT_EQ(lines, 2);
    std::filesystem::remove_all(dir);
}

TEST(Pow2Histogram, PercentilesAreUpperBucketBounds) {
    Pow2Histogram h;
    EXPECT_EQ(h.percentile(0.5), 0u);

    for (int i = 0; i < 99; ++i) h.add(1000);   // bucket [512, 1024)
    h.add(1u << 20);

    EXPECT_EQ(h.count(), 100u);
    EXPECT_EQ(h.percentile(0.50), 1024u);
    EXPECT_EQ(h.percentile(1.0), 1u << 21);
    EXPECT_EQ(h.max_ns, 1u << 20);
    EXPECT_NE(h.summary_ms().find("n=100"), std::string::npos);
}

TEST(StatsReporter, TickSamplesHubCounters) {
    FrameHub hub;
    auto t = std::make_shared<FakeTransport>();
    hub.attach(t);
    hub.publish("abc");
    hub.broadcaster().step();

    StatsReporter reporter(hub, std::chrono::milliseconds(0));
    reporter.start();   // zero interval: no thread

    StatsLine s = reporter.tick();
    EXPECT_EQ(s.frames_published, 1u);
    EXPECT_EQ(s.frames_sent, 1u);
    EXPECT_EQ(s.bytes_sent, 3u);
    EXPECT_EQ(s.viewers, 1u);
    EXPECT_EQ(s.sessions_opened, 1u);
    EXPECT_GT(s.ts_wall_us, 0);

    reporter.stop();
}
