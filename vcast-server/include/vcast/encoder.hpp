#pragma once
#include "vcast/capture_source.hpp"

#include <string>

namespace vcast {

class Encoder {
public:
    virtual ~Encoder() = default;

    // quality: 1..100. Returns false (and leaves out untouched) on failure.
    virtual bool encode(const RawImage& img, int quality, std::string& out) = 0;

    virtual std::string name() const = 0;
};

// Baseline JPEG through libjpeg, in-memory destination.
class JpegEncoder : public Encoder {
public:
    bool encode(const RawImage& img, int quality, std::string& out) override;
    std::string name() const override { return "jpeg"; }

    const std::string& last_error() const { return last_error_; }

private:
    std::string last_error_;
};

} // namespace vcast
