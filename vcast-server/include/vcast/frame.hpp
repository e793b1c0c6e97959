#pragma once
#include <cstdint>
#include <memory>
#include <string>

namespace vcast {

// One encoded image plus its publication number.
// version 0 means "no frame yet"; payload is never mutated once published.
struct Frame {
    std::shared_ptr<const std::string> payload;
    uint64_t version = 0;

    bool empty() const { return version == 0 || !payload; }
    std::size_t size() const { return payload ? payload->size() : 0; }
};

} // namespace vcast
