#pragma once
#include <functional>
#include <memory>
#include <string>

namespace vcast {

// Message-oriented connection to one remote peer.
// async_send may complete inline or on another thread; at most one send
// is outstanding per transport at any time (the session guarantees it).
class FrameTransport {
public:
    using Completion = std::function<void(bool ok)>;

    virtual ~FrameTransport() = default;

    virtual void async_send(std::shared_ptr<const std::string> payload, Completion done) = 0;
    virtual void close() = 0;

    // Human-readable peer description for logs.
    virtual std::string describe() const { return "peer"; }
};

} // namespace vcast
