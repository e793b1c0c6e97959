#pragma once
#include "vcast/frame_hub.hpp"

#include <boost/asio.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace vcast {

struct WsServerOptions {
    // accept uploaders on /ws/stream and publish what they send
    bool ingest_enabled = true;
    // ping at half the idle timeout; a peer that answers is never idle
    bool keepalive_pings = true;
    // silence allowed before a connection is dropped; 0 = never.
    // Viewers only read, so without pings they are exempt.
    std::chrono::milliseconds idle_timeout{300000};
    std::size_t max_frame_bytes = 8u << 20;
};

class WsListener;

// Start the HTTP/WebSocket front end on address:port (port 0 = ephemeral).
//   GET /        -> small JSON status
//   /ws/view     -> viewer; one binary message per frame
//   /ws/stream   -> uploader; every binary message is published (ingest only)
// Throws std::runtime_error if the port cannot be bound.
std::shared_ptr<WsListener> start_ws_server(boost::asio::io_context& ioc,
                                            FrameHub& hub,
                                            const std::string& address,
                                            unsigned short port,
                                            WsServerOptions opts);

class WsListener : public std::enable_shared_from_this<WsListener> {
public:
    WsListener(boost::asio::io_context& ioc, FrameHub& hub,
               boost::asio::ip::tcp::endpoint ep, WsServerOptions opts);

    void run();

    // Stop accepting; open connections are closed by the hub.
    void stop();

    unsigned short port() const { return port_; }

private:
    void do_accept();
    void on_accept(boost::system::error_code ec, boost::asio::ip::tcp::socket socket);

    boost::asio::io_context& ioc_;
    FrameHub& hub_;
    boost::asio::ip::tcp::acceptor acceptor_;
    WsServerOptions opts_;
    unsigned short port_ = 0;
};

} // namespace vcast
