#include "vcast/capture_source.hpp"

#include <linux/videodev2.h>
#include <sys/ioctl.h>
#include <sys/mman.h>
#include <sys/select.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <initializer_list>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace vcast {

static int xioctl(int fd, unsigned long request, void* arg) {
    int r;
    do {
        r = ioctl(fd, request, arg);
    } while (r == -1 && errno == EINTR);
    return r;
}

static std::runtime_error v4l2_error(const std::string& dev, const std::string& what) {
    return std::runtime_error("v4l2 " + dev + ": " + what + ": " + std::strerror(errno));
}

static inline uint8_t clamp_u8(int v) {
    return (uint8_t)(v < 0 ? 0 : (v > 255 ? 255 : v));
}

void yuyv_to_rgb(const uint8_t* yuyv, int width, int height, std::vector<uint8_t>& rgb) {
    rgb.resize((std::size_t)width * height * 3);
    const std::size_t pairs = (std::size_t)width * height / 2;
    uint8_t* out = rgb.data();
    for (std::size_t i = 0; i < pairs; ++i) {
        const int y0 = yuyv[0] - 16;
        const int u  = yuyv[1] - 128;
        const int y1 = yuyv[2] - 16;
        const int v  = yuyv[3] - 128;
        yuyv += 4;

        for (int y : {y0, y1}) {
            const int c = 298 * y;
            *out++ = clamp_u8((c + 409 * v + 128) >> 8);
            *out++ = clamp_u8((c - 100 * u - 208 * v + 128) >> 8);
            *out++ = clamp_u8((c + 516 * u + 128) >> 8);
        }
    }
}

bool scale_rgb(const RawImage& src, int width, int height, RawImage& dst) {
    if (!src.valid() || width <= 0 || height <= 0) return false;

    dst.width = width;
    dst.height = height;
    dst.rgb.resize((std::size_t)width * height * 3);

    // 16.16 fixed point steps
    const uint32_t step_x = (uint32_t)(((uint64_t)src.width << 16) / (uint64_t)width);
    const uint32_t step_y = (uint32_t)(((uint64_t)src.height << 16) / (uint64_t)height);

    uint8_t* out = dst.rgb.data();
    for (int y = 0; y < height; ++y) {
        const int sy = (int)(((uint64_t)y * step_y) >> 16);
        const uint8_t* row = src.rgb.data() + (std::size_t)sy * src.width * 3;
        for (int x = 0; x < width; ++x) {
            const int sx = (int)(((uint64_t)x * step_x) >> 16);
            const uint8_t* px = row + (std::size_t)sx * 3;
            *out++ = px[0];
            *out++ = px[1];
            *out++ = px[2];
        }
    }
    return true;
}

V4l2Capture::V4l2Capture(std::string device, int width, int height, int fps)
    : device_(std::move(device)), width_(width), height_(height), fps_(fps) {}

V4l2Capture::~V4l2Capture() {
    close();
}

void V4l2Capture::open() {
    if (fd_ != -1) return;

    struct stat st{};
    if (::stat(device_.c_str(), &st) == -1) throw v4l2_error(device_, "cannot stat");
    if (!S_ISCHR(st.st_mode)) throw std::runtime_error("v4l2 " + device_ + ": not a device");

    fd_ = ::open(device_.c_str(), O_RDWR | O_NONBLOCK, 0);
    if (fd_ == -1) throw v4l2_error(device_, "cannot open");

    try {
        v4l2_capability cap{};
        if (xioctl(fd_, VIDIOC_QUERYCAP, &cap) == -1) throw v4l2_error(device_, "VIDIOC_QUERYCAP");
        if (!(cap.capabilities & V4L2_CAP_VIDEO_CAPTURE)) {
            throw std::runtime_error("v4l2 " + device_ + ": not a capture device");
        }
        if (!(cap.capabilities & V4L2_CAP_STREAMING)) {
            throw std::runtime_error("v4l2 " + device_ + ": no streaming i/o");
        }

        v4l2_format fmt{};
        fmt.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
        fmt.fmt.pix.width = (unsigned)width_;
        fmt.fmt.pix.height = (unsigned)height_;
        fmt.fmt.pix.pixelformat = V4L2_PIX_FMT_YUYV;
        fmt.fmt.pix.field = V4L2_FIELD_NONE;
        if (xioctl(fd_, VIDIOC_S_FMT, &fmt) == -1) throw v4l2_error(device_, "VIDIOC_S_FMT");
        if (fmt.fmt.pix.pixelformat != V4L2_PIX_FMT_YUYV) {
            throw std::runtime_error("v4l2 " + device_ + ": YUYV not supported");
        }

        // driver may pick the nearest supported size
        cap_width_ = (int)fmt.fmt.pix.width;
        cap_height_ = (int)fmt.fmt.pix.height;
        if (cap_width_ != width_ || cap_height_ != height_) {
            std::cerr << "[capture] " << device_ << ": driver delivers " << cap_width_ << "x"
                      << cap_height_ << ", scaling to " << width_ << "x" << height_ << "\n";
        }

        // frame rate is a hint; drivers may ignore it
        v4l2_streamparm parm{};
        parm.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
        parm.parm.capture.timeperframe.numerator = 1;
        parm.parm.capture.timeperframe.denominator = (unsigned)(fps_ > 0 ? fps_ : 30);
        if (xioctl(fd_, VIDIOC_S_PARM, &parm) == -1) {
            std::cerr << "[capture] " << device_ << ": VIDIOC_S_PARM ignored\n";
        }

        init_mmap();

        for (unsigned i = 0; i < buffers_.size(); ++i) {
            v4l2_buffer buf{};
            buf.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
            buf.memory = V4L2_MEMORY_MMAP;
            buf.index = i;
            if (xioctl(fd_, VIDIOC_QBUF, &buf) == -1) throw v4l2_error(device_, "VIDIOC_QBUF");
        }

        v4l2_buf_type type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
        if (xioctl(fd_, VIDIOC_STREAMON, &type) == -1) throw v4l2_error(device_, "VIDIOC_STREAMON");
        streaming_ = true;
    } catch (...) {
        close();
        throw;
    }

    std::cerr << "[capture] " << device_ << " opened: " << cap_width_ << "x" << cap_height_
              << " @ " << fps_ << " (requested)\n";
}

void V4l2Capture::init_mmap() {
    v4l2_requestbuffers req{};
    req.count = 4;
    req.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    req.memory = V4L2_MEMORY_MMAP;
    if (xioctl(fd_, VIDIOC_REQBUFS, &req) == -1) throw v4l2_error(device_, "VIDIOC_REQBUFS");
    if (req.count < 2) throw std::runtime_error("v4l2 " + device_ + ": insufficient mmap buffers");

    buffers_.resize(req.count);
    for (unsigned i = 0; i < req.count; ++i) {
        v4l2_buffer buf{};
        buf.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
        buf.memory = V4L2_MEMORY_MMAP;
        buf.index = i;
        if (xioctl(fd_, VIDIOC_QUERYBUF, &buf) == -1) throw v4l2_error(device_, "VIDIOC_QUERYBUF");

        void* p = mmap(nullptr, buf.length, PROT_READ | PROT_WRITE, MAP_SHARED, fd_, buf.m.offset);
        if (p == MAP_FAILED) throw v4l2_error(device_, "mmap");
        buffers_[i].start = p;
        buffers_[i].length = buf.length;
    }
}

bool V4l2Capture::acquire(RawImage& out) {
    if (fd_ == -1) return false;

    fd_set fds;
    FD_ZERO(&fds);
    FD_SET(fd_, &fds);
    timeval tv{};
    tv.tv_sec = 2;

    int r = select(fd_ + 1, &fds, nullptr, nullptr, &tv);
    if (r == -1) {
        if (errno != EINTR) std::cerr << "[capture] select: " << std::strerror(errno) << "\n";
        return false;
    }
    if (r == 0) {
        std::cerr << "[capture] " << device_ << ": select timeout\n";
        return false;
    }

    v4l2_buffer buf{};
    buf.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    buf.memory = V4L2_MEMORY_MMAP;
    if (xioctl(fd_, VIDIOC_DQBUF, &buf) == -1) {
        if (errno != EAGAIN) std::cerr << "[capture] DQBUF: " << std::strerror(errno) << "\n";
        return false;
    }

    bool ok = false;
    const std::size_t need = (std::size_t)cap_width_ * cap_height_ * 2;
    if (buf.index < buffers_.size()) {
        std::size_t valid = buf.bytesused ? buf.bytesused : buffers_[buf.index].length;
        if (valid >= need) {
            const auto* yuyv = static_cast<const uint8_t*>(buffers_[buf.index].start);
            if (cap_width_ == width_ && cap_height_ == height_) {
                yuyv_to_rgb(yuyv, width_, height_, out.rgb);
                out.width = width_;
                out.height = height_;
                ok = true;
            } else {
                yuyv_to_rgb(yuyv, cap_width_, cap_height_, native_.rgb);
                native_.width = cap_width_;
                native_.height = cap_height_;
                ok = scale_rgb(native_, width_, height_, out);
            }
        } else {
            std::cerr << "[capture] short frame: " << valid << " < " << need << " bytes\n";
        }
    }

    if (xioctl(fd_, VIDIOC_QBUF, &buf) == -1) {
        std::cerr << "[capture] QBUF: " << std::strerror(errno) << "\n";
        return false;
    }
    return ok;
}

void V4l2Capture::close() {
    if (fd_ == -1) return;

    if (streaming_) {
        v4l2_buf_type type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
        xioctl(fd_, VIDIOC_STREAMOFF, &type);
        streaming_ = false;
    }
    for (auto& b : buffers_) {
        if (b.start && b.length) munmap(b.start, b.length);
    }
    buffers_.clear();

    ::close(fd_);
    fd_ = -1;
    std::cerr << "[capture] " << device_ << " released\n";
}

std::unique_ptr<CaptureSource> make_capture_source(const std::string& kind,
                                                   const std::string& device,
                                                   int width, int height, int fps,
                                                   int monitor) {
    if (kind == "v4l2") return std::make_unique<V4l2Capture>(device, width, height, fps);
    if (kind == "screen") return std::make_unique<ScreenCapture>(monitor);
    if (kind == "pattern") return std::make_unique<TestPatternSource>(width, height);
    throw std::runtime_error("unknown capture source: " + kind);
}

} // namespace vcast
