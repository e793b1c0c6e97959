#pragma once
#include "vcast/frame_transport.hpp"

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/beast/websocket.hpp>

#include <functional>
#include <memory>
#include <string>

namespace vcast {

struct WsUri {
    std::string host;
    std::string port = "80";
    std::string target = "/";
};

// "ws://host[:port][/path]" -> parts. Returns false for anything else.
bool parse_ws_uri(const std::string& uri, WsUri& out);

// Client-side transport: pushes frames to a server's /ws/stream endpoint.
class WsUplink : public FrameTransport,
                 public std::enable_shared_from_this<WsUplink> {
public:
    using DisconnectHandler = std::function<void(const std::string& reason)>;

    explicit WsUplink(boost::asio::io_context& ioc);

    // Blocking resolve + connect + handshake. Throws boost::system::system_error.
    void connect(const WsUri& uri);

    // Watch for server close / errors; the handler runs on the io thread.
    void start_reading(DisconnectHandler h);

    void async_send(std::shared_ptr<const std::string> payload, Completion done) override;
    void close() override;
    std::string describe() const override { return "uplink " + peer_; }

private:
    void do_read();
    void on_read(boost::beast::error_code ec, std::size_t bytes);
    void do_close();

    boost::asio::io_context& ioc_;
    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    boost::beast::flat_buffer read_buf_;
    DisconnectHandler on_disconnect_;
    std::string peer_;
    bool write_in_flight_ = false;
    bool close_after_write_ = false;
    bool closing_ = false;
};

} // namespace vcast
