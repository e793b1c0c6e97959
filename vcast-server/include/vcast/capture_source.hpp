#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace vcast {

// Packed 8-bit RGB, row-major, no padding.
struct RawImage {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> rgb;

    bool valid() const {
        return width > 0 && height > 0 &&
               rgb.size() == static_cast<std::size_t>(width) * height * 3;
    }
};

class CaptureSource {
public:
    virtual ~CaptureSource() = default;

    // Throws std::runtime_error if the device cannot be opened.
    virtual void open() = 0;

    // One frame per call; false means "nothing this cycle".
    virtual bool acquire(RawImage& out) = 0;

    virtual void close() = 0;
    virtual bool is_open() const = 0;
    virtual std::string name() const = 0;
};

// Synthetic moving color bars; no hardware required.
// fail_every > 0 makes every Nth acquire() fail, fail_open makes open() throw.
class TestPatternSource : public CaptureSource {
public:
    TestPatternSource(int width, int height, int fail_every = 0, bool fail_open = false);

    void open() override;
    bool acquire(RawImage& out) override;
    void close() override;
    bool is_open() const override { return open_; }
    std::string name() const override { return "pattern"; }

    uint64_t frames() const { return counter_; }

private:
    int width_;
    int height_;
    int fail_every_;
    bool fail_open_;
    bool open_ = false;
    uint64_t counter_ = 0;
};

// Video4Linux2 camera, YUYV mmap streaming, converted to RGB.
// Frames are scaled to the requested size when the driver picks another one.
class V4l2Capture : public CaptureSource {
public:
    V4l2Capture(std::string device, int width, int height, int fps);
    ~V4l2Capture() override;

    V4l2Capture(const V4l2Capture&) = delete;
    V4l2Capture& operator=(const V4l2Capture&) = delete;

    void open() override;
    bool acquire(RawImage& out) override;
    void close() override;
    bool is_open() const override { return fd_ != -1; }
    std::string name() const override { return "v4l2:" + device_; }

    int width() const { return width_; }
    int height() const { return height_; }

private:
    struct Buffer {
        void* start = nullptr;
        std::size_t length = 0;
    };

    void init_mmap();

    std::string device_;
    int width_;
    int height_;
    int fps_;
    // what the driver actually delivers
    int cap_width_ = 0;
    int cap_height_ = 0;
    int fd_ = -1;
    bool streaming_ = false;
    std::vector<Buffer> buffers_;
    RawImage native_;
};

// X11 root window grab (XGetImage) at the screen's native size.
// monitor N selects X screen N-1; 0 or an unknown index means the default screen.
// display empty => $DISPLAY.
class ScreenCapture : public CaptureSource {
public:
    explicit ScreenCapture(int monitor = 1, std::string display = std::string());
    ~ScreenCapture() override;

    ScreenCapture(const ScreenCapture&) = delete;
    ScreenCapture& operator=(const ScreenCapture&) = delete;

    void open() override;
    bool acquire(RawImage& out) override;
    void close() override;
    bool is_open() const override;
    std::string name() const override { return "screen:" + std::to_string(monitor_); }

    int width() const { return width_; }
    int height() const { return height_; }

private:
    struct Impl;

    int monitor_;
    std::string display_name_;
    int width_ = 0;
    int height_ = 0;
    Impl* impl_;
};

// Factory used by the executables: "v4l2", "screen" or "pattern".
// Throws std::runtime_error for anything else.
std::unique_ptr<CaptureSource> make_capture_source(const std::string& kind,
                                                   const std::string& device,
                                                   int width, int height, int fps,
                                                   int monitor = 1);

// YUYV 4:2:2 → packed RGB24 (BT.601, integer math).
void yuyv_to_rgb(const uint8_t* yuyv, int width, int height, std::vector<uint8_t>& rgb);

// Nearest-neighbour resize of packed RGB24. Returns false if src is invalid
// or the target size is not positive.
bool scale_rgb(const RawImage& src, int width, int height, RawImage& dst);

} // namespace vcast
