#include "vcast/capture_source.hpp"
#include "vcast/encoder.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <random>
#include <string>
#include <vector>

using vcast::JpegEncoder;
using vcast::RawImage;
using vcast::TestPatternSource;

namespace {

RawImage noise_image(int w, int h) {
    RawImage img;
    img.width = w;
    img.height = h;
    img.rgb.resize((std::size_t)w * h * 3);
    std::mt19937 rng(7);
    for (auto& b : img.rgb) b = (uint8_t)(rng() & 0xFF);
    return img;
}

} // namespace

TEST(JpegEncoder, ProducesSoiAndEoiMarkers) {
    TestPatternSource src(64, 32);
    src.open();
    RawImage img;
    ASSERT_TRUE(src.acquire(img));

    JpegEncoder enc;
    std::string out;
    ASSERT_TRUE(enc.encode(img, 80, out)) << enc.last_error();
    ASSERT_GT(out.size(), 4u);
    EXPECT_EQ((unsigned char)out[0], 0xFF);
    EXPECT_EQ((unsigned char)out[1], 0xD8);
    EXPECT_EQ((unsigned char)out[out.size() - 2], 0xFF);
    EXPECT_EQ((unsigned char)out[out.size() - 1], 0xD9);
}

TEST(JpegEncoder, LowerQualityIsSmaller) {
    RawImage img = noise_image(64, 64);
    JpegEncoder enc;
    std::string lo, hi;
    ASSERT_TRUE(enc.encode(img, 10, lo));
    ASSERT_TRUE(enc.encode(img, 95, hi));
    EXPECT_LT(lo.size(), hi.size());
}

TEST(JpegEncoder, RejectsInvalidImage) {
    RawImage img;
    img.width = 8;
    img.height = 8;
    img.rgb.resize(10);

    JpegEncoder enc;
    std::string out = "untouched";
    EXPECT_FALSE(enc.encode(img, 80, out));
    EXPECT_EQ(out, "untouched");
    EXPECT_FALSE(enc.last_error().empty());
}

TEST(YuyvToRgb, NeutralChromaGivesGray) {
    // Y0 U Y1 V
    std::vector<uint8_t> yuyv = {128, 128, 128, 128};
    std::vector<uint8_t> rgb;
    vcast::yuyv_to_rgb(yuyv.data(), 2, 1, rgb);

    ASSERT_EQ(rgb.size(), 6u);
    for (auto c : rgb) EXPECT_NEAR((int)c, 130, 1);
}

TEST(YuyvToRgb, ClampsToByteRange) {
    std::vector<uint8_t> yuyv = {255, 128, 16, 128};
    std::vector<uint8_t> rgb;
    vcast::yuyv_to_rgb(yuyv.data(), 2, 1, rgb);

    ASSERT_EQ(rgb.size(), 6u);
    EXPECT_EQ(rgb[0], 255);
    EXPECT_EQ(rgb[3], 0);
}
