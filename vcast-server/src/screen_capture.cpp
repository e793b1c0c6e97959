#include "vcast/capture_source.hpp"

#include <X11/Xlib.h>
#include <X11/Xutil.h>

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace vcast {

// Xlib's default handler exits the process; record the error instead.
static std::atomic<int> g_last_x_error{0};

static int on_x_error(Display*, XErrorEvent* ev) {
    g_last_x_error.store(ev ? ev->error_code : -1);
    return 0;
}

static int mask_shift(unsigned long mask) {
    int s = 0;
    while (mask && !(mask & 1ul)) {
        mask >>= 1;
        ++s;
    }
    return s;
}

struct ScreenCapture::Impl {
    Display* display = nullptr;
    Window root = 0;
    int screen = 0;
};

ScreenCapture::ScreenCapture(int monitor, std::string display)
    : monitor_(monitor), display_name_(std::move(display)), impl_(new Impl) {}

ScreenCapture::~ScreenCapture() {
    close();
    delete impl_;
}

void ScreenCapture::open() {
    if (impl_->display) return;

    XSetErrorHandler(&on_x_error);

    const char* name = display_name_.empty() ? nullptr : display_name_.c_str();
    Display* dpy = XOpenDisplay(name);
    if (!dpy) {
        const char* shown = name ? name : std::getenv("DISPLAY");
        throw std::runtime_error(std::string("screen: cannot open X display '") +
                                 (shown ? shown : "") + "'");
    }

    int screen = DefaultScreen(dpy);
    if (monitor_ >= 1 && monitor_ <= ScreenCount(dpy)) {
        screen = monitor_ - 1;
    } else if (monitor_ != 0 && monitor_ != 1) {
        std::cerr << "[capture] screen: monitor " << monitor_ << " not found ("
                  << ScreenCount(dpy) << " screens), using the default\n";
    }

    Window root = RootWindow(dpy, screen);
    XWindowAttributes attr{};
    if (!XGetWindowAttributes(dpy, root, &attr) || attr.width <= 0 || attr.height <= 0) {
        XCloseDisplay(dpy);
        throw std::runtime_error("screen: cannot query root window size");
    }

    impl_->display = dpy;
    impl_->root = root;
    impl_->screen = screen;
    width_ = attr.width;
    height_ = attr.height;

    std::cerr << "[capture] screen " << screen << " opened: " << width_ << "x" << height_ << "\n";
}

bool ScreenCapture::acquire(RawImage& out) {
    if (!impl_->display) return false;

    g_last_x_error.store(0);
    XImage* img = XGetImage(impl_->display, impl_->root, 0, 0,
                            (unsigned)width_, (unsigned)height_, AllPlanes, ZPixmap);
    if (!img) {
        std::cerr << "[capture] screen: XGetImage failed (X error " << g_last_x_error.load() << ")\n";
        return false;
    }

    const unsigned long rm = img->red_mask, gm = img->green_mask, bm = img->blue_mask;
    const int rs = mask_shift(rm), gs = mask_shift(gm), bs = mask_shift(bm);
    const unsigned long rmax = rm >> rs, gmax = gm >> gs, bmax = bm >> bs;
    if (!rmax || !gmax || !bmax) {
        std::cerr << "[capture] screen: unsupported visual (no color masks)\n";
        XDestroyImage(img);
        return false;
    }

    out.width = width_;
    out.height = height_;
    out.rgb.resize((std::size_t)width_ * height_ * 3);
    uint8_t* dst = out.rgb.data();

    // 32bpp little-endian is the common case; everything else goes through XGetPixel
    const bool fast = img->bits_per_pixel == 32 && img->byte_order == LSBFirst;
    for (int y = 0; y < height_; ++y) {
        const auto* row = reinterpret_cast<const uint8_t*>(img->data) + (std::size_t)y * img->bytes_per_line;
        for (int x = 0; x < width_; ++x) {
            unsigned long p;
            if (fast) {
                const uint8_t* q = row + (std::size_t)x * 4;
                p = (unsigned long)q[0] | ((unsigned long)q[1] << 8) |
                    ((unsigned long)q[2] << 16) | ((unsigned long)q[3] << 24);
            } else {
                p = XGetPixel(img, x, y);
            }
            *dst++ = (uint8_t)(((p & rm) >> rs) * 255 / rmax);
            *dst++ = (uint8_t)(((p & gm) >> gs) * 255 / gmax);
            *dst++ = (uint8_t)(((p & bm) >> bs) * 255 / bmax);
        }
    }

    XDestroyImage(img);
    return true;
}

void ScreenCapture::close() {
    if (!impl_ || !impl_->display) return;
    XCloseDisplay(impl_->display);
    impl_->display = nullptr;
    std::cerr << "[capture] screen " << impl_->screen << " released\n";
}

bool ScreenCapture::is_open() const {
    return impl_ && impl_->display != nullptr;
}

} // namespace vcast
