#include "vcast/ws_uplink.hpp"

#include <iostream>
#include <utility>

namespace vcast {

using boost::asio::ip::tcp;
namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;

bool parse_ws_uri(const std::string& uri, WsUri& out) {
    const std::string scheme = "ws://";
    if (uri.compare(0, scheme.size(), scheme) != 0) return false;

    std::string rest = uri.substr(scheme.size());
    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    out.target = (slash == std::string::npos) ? "/" : rest.substr(slash);

    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        out.host = authority.substr(0, colon);
        out.port = authority.substr(colon + 1);
        if (out.port.empty()) return false;
        for (char c : out.port) {
            if (c < '0' || c > '9') return false;
        }
    } else {
        out.host = authority;
        out.port = "80";
    }
    return !out.host.empty();
}

WsUplink::WsUplink(net::io_context& ioc)
    : ioc_(ioc), ws_(net::make_strand(ioc)) {}

void WsUplink::connect(const WsUri& uri) {
    tcp::resolver resolver(ioc_);
    auto results = resolver.resolve(uri.host, uri.port);

    auto ep = beast::get_lowest_layer(ws_).connect(results);
    beast::get_lowest_layer(ws_).socket().set_option(tcp::no_delay(true));

    peer_ = uri.host + ":" + std::to_string(ep.port()) + uri.target;

    ws_.set_option(websocket::stream_base::decorator(
        [](websocket::request_type& req) {
            req.set(beast::http::field::user_agent, std::string("vcast-grabber"));
        }
    ));
    ws_.handshake(uri.host + ":" + uri.port, uri.target);

    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_.binary(true);
}

void WsUplink::start_reading(DisconnectHandler h) {
    on_disconnect_ = std::move(h);
    net::post(ws_.get_executor(), [self = shared_from_this()] { self->do_read(); });
}

void WsUplink::do_read() {
    ws_.async_read(
        read_buf_,
        beast::bind_front_handler(&WsUplink::on_read, shared_from_this())
    );
}

void WsUplink::on_read(beast::error_code ec, std::size_t) {
    if (ec) {
        std::string reason = (ec == websocket::error::closed)
                                 ? std::string("server closed the connection")
                                 : "read error: " + ec.message();
        if (on_disconnect_) {
            auto h = std::move(on_disconnect_);
            on_disconnect_ = nullptr;
            h(reason);
        }
        return;
    }
    // the server does not talk back; drop whatever arrives
    read_buf_.consume(read_buf_.size());
    do_read();
}

void WsUplink::async_send(std::shared_ptr<const std::string> payload, Completion done) {
    net::post(ws_.get_executor(),
        [self = shared_from_this(), payload = std::move(payload), done = std::move(done)]() mutable {
            if (self->closing_ || !self->ws_.is_open()) {
                done(false);
                return;
            }
            self->write_in_flight_ = true;
            const auto& bytes = *payload;
            self->ws_.async_write(
                net::buffer(bytes),
                [self, payload = std::move(payload), done = std::move(done)]
                (beast::error_code ec, std::size_t) {
                    self->write_in_flight_ = false;
                    if (ec) std::cerr << "[uplink] send error: " << ec.message() << "\n";
                    done(!ec);
                    if (self->close_after_write_) {
                        self->close_after_write_ = false;
                        self->do_close();
                    }
                });
        });
}

void WsUplink::close() {
    net::post(ws_.get_executor(), [self = shared_from_this()] { self->do_close(); });
}

void WsUplink::do_close() {
    if (closing_) return;
    if (write_in_flight_) {
        close_after_write_ = true;
        return;
    }
    closing_ = true;
    if (!ws_.is_open()) return;
    ws_.async_close(websocket::close_code::normal,
        [self = shared_from_this()](beast::error_code) {});
}

} // namespace vcast
