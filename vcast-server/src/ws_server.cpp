#include "vcast/ws_server.hpp"

#include <boost/beast.hpp>
#include <boost/beast/websocket.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace vcast {

using boost::asio::ip::tcp;
namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;

static const char* kServerName = "vcast";

static std::string peer_string(const tcp::socket& s) {
    boost::system::error_code ec;
    auto ep = s.remote_endpoint(ec);
    if (ec) return "unknown";
    std::ostringstream os;
    os << ep;
    return os.str();
}

static void apply_ws_options(websocket::stream<beast::tcp_stream>& ws,
                             const WsServerOptions& opts, bool viewer) {
    auto timeouts = websocket::stream_base::timeout::suggested(beast::role_type::server);
    timeouts.keep_alive_pings = opts.keepalive_pings;
    if (opts.idle_timeout.count() <= 0 || (viewer && !opts.keepalive_pings)) {
        timeouts.idle_timeout = websocket::stream_base::none();
    } else {
        timeouts.idle_timeout = opts.idle_timeout;
    }
    ws.set_option(timeouts);
    ws.set_option(websocket::stream_base::decorator(
        [](websocket::response_type& res) {
            res.set(http::field::server, std::string(kServerName));
        }
    ));
}

// ---------------- Viewer: server -> browser, one JPEG per binary message ----------------

class WsViewerConnection : public FrameTransport,
                           public std::enable_shared_from_this<WsViewerConnection> {
public:
    WsViewerConnection(tcp::socket socket, FrameHub& hub, const WsServerOptions& opts)
        : peer_(peer_string(socket))
        , ws_(std::move(socket))
        , hub_(hub)
        , opts_(opts) {}

    void run(http::request<http::string_body> req) {
        apply_ws_options(ws_, opts_, true);
        ws_.binary(true);
        // viewers only send control noise; keep it small
        ws_.read_message_max(64 * 1024);
        ws_.async_accept(
            req,
            beast::bind_front_handler(&WsViewerConnection::on_accept, shared_from_this())
        );
    }

    // ---- FrameTransport ----
    void async_send(std::shared_ptr<const std::string> payload, Completion done) override {
        net::post(ws_.get_executor(),
            [self = shared_from_this(), payload = std::move(payload), done = std::move(done)]() mutable {
                self->do_write(std::move(payload), std::move(done));
            });
    }

    void close() override {
        net::post(ws_.get_executor(), [self = shared_from_this()] { self->do_close(); });
    }

    std::string describe() const override { return "viewer " + peer_; }

private:
    void on_accept(beast::error_code ec) {
        if (ec) {
            std::cerr << "[ws] viewer " << peer_ << " handshake failed: " << ec.message() << "\n";
            return;
        }
        session_ = hub_.attach(shared_from_this());
        do_read();
    }

    // incoming messages are ignored; the read loop exists to notice disconnects
    void do_read() {
        ws_.async_read(
            read_buf_,
            beast::bind_front_handler(&WsViewerConnection::on_read, shared_from_this())
        );
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec) {
            if (session_) {
                session_->close(ec == websocket::error::closed
                                    ? std::string("viewer disconnected")
                                    : "read error: " + ec.message());
                session_.reset();
            }
            return;
        }
        read_buf_.consume(read_buf_.size());
        do_read();
    }

    void do_write(std::shared_ptr<const std::string> payload, Completion done) {
        if (closing_ || !ws_.is_open()) {
            done(false);
            return;
        }
        write_in_flight_ = true;
        const auto& bytes = *payload;
        ws_.async_write(
            net::buffer(bytes),
            [self = shared_from_this(), payload = std::move(payload), done = std::move(done)]
            (beast::error_code ec, std::size_t) {
                self->write_in_flight_ = false;
                done(!ec);
                if (self->close_after_write_) {
                    self->close_after_write_ = false;
                    self->do_close();
                }
            });
    }

    void do_close() {
        if (closing_) return;
        // close frame is a write; wait for the frame in flight
        if (write_in_flight_) {
            close_after_write_ = true;
            return;
        }
        closing_ = true;
        if (!ws_.is_open()) return;
        ws_.async_close(websocket::close_code::normal,
            [self = shared_from_this()](beast::error_code) {});
    }

    std::string peer_;
    websocket::stream<beast::tcp_stream> ws_;
    FrameHub& hub_;
    WsServerOptions opts_;

    beast::flat_buffer read_buf_;
    std::shared_ptr<ViewerSession> session_;
    bool write_in_flight_ = false;
    bool close_after_write_ = false;
    bool closing_ = false;
};

// ---------------- Uploader: remote producer -> FrameSlot ----------------

class WsIngestConnection : public std::enable_shared_from_this<WsIngestConnection> {
public:
    WsIngestConnection(tcp::socket socket, FrameHub& hub, const WsServerOptions& opts)
        : peer_(peer_string(socket))
        , ws_(std::move(socket))
        , hub_(hub)
        , opts_(opts) {}

    void run(http::request<http::string_body> req) {
        apply_ws_options(ws_, opts_, false);
        ws_.read_message_max(opts_.max_frame_bytes);
        ws_.async_accept(
            req,
            beast::bind_front_handler(&WsIngestConnection::on_accept, shared_from_this())
        );
    }

private:
    void on_accept(beast::error_code ec) {
        if (ec) {
            std::cerr << "[ws] uploader " << peer_ << " handshake failed: " << ec.message() << "\n";
            return;
        }
        std::cerr << "[ws] uploader " << peer_ << " connected\n";
        do_read();
    }

    void do_read() {
        ws_.async_read(
            buf_,
            beast::bind_front_handler(&WsIngestConnection::on_read, shared_from_this())
        );
    }

    void on_read(beast::error_code ec, std::size_t bytes) {
        if (ec == websocket::error::closed) {
            std::cerr << "[ws] uploader " << peer_ << " disconnected (" << frames_ << " frames)\n";
            return;
        }
        if (ec) {
            std::cerr << "[ws] uploader " << peer_ << " read error: " << ec.message()
                      << " (" << frames_ << " frames)\n";
            return;
        }

        if (ws_.got_binary() && bytes > 0) {
            auto& stats = hub_.stats();
            stats.ingest_frames.fetch_add(1, std::memory_order_relaxed);
            stats.ingest_bytes.fetch_add(bytes, std::memory_order_relaxed);
            hub_.publish(beast::buffers_to_string(buf_.data()));
            ++frames_;
        } else if (!warned_text_) {
            std::cerr << "[ws] uploader " << peer_ << " sent a text message; ignoring non-binary data\n";
            warned_text_ = true;
        }
        buf_.consume(buf_.size());
        do_read();
    }

    std::string peer_;
    websocket::stream<beast::tcp_stream> ws_;
    FrameHub& hub_;
    WsServerOptions opts_;
    beast::flat_buffer buf_;
    uint64_t frames_ = 0;
    bool warned_text_ = false;
};

// ---------------- Plain HTTP: routing + upgrade ----------------

class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket, FrameHub& hub, const WsServerOptions& opts)
        : stream_(std::move(socket)), hub_(hub), opts_(opts) {}

    void run() {
        stream_.expires_after(std::chrono::seconds(30));
        http::async_read(
            stream_, buf_, req_,
            beast::bind_front_handler(&HttpConnection::on_request, shared_from_this())
        );
    }

private:
    void on_request(beast::error_code ec, std::size_t) {
        if (ec) return;   // client went away before sending a request

        const std::string target(req_.target());

        if (websocket::is_upgrade(req_)) {
            stream_.expires_never();
            if (target == "/ws/view") {
                std::make_shared<WsViewerConnection>(stream_.release_socket(), hub_, opts_)
                    ->run(std::move(req_));
                return;
            }
            if (target == "/ws/stream" && opts_.ingest_enabled) {
                std::make_shared<WsIngestConnection>(stream_.release_socket(), hub_, opts_)
                    ->run(std::move(req_));
                return;
            }
            respond(http::status::not_found, "{\"error\":\"unknown websocket endpoint\"}");
            return;
        }

        if (req_.method() == http::verb::get && target == "/") {
            std::ostringstream os;
            os << "{\"msg\":\"vcast live JPEG stream. Viewers connect to /ws/view"
               << (opts_.ingest_enabled ? ", uploaders to /ws/stream" : "")
               << "\",\"viewers\":" << hub_.viewers()
               << ",\"version\":" << hub_.slot().version() << "}";
            respond(http::status::ok, os.str());
            return;
        }

        respond(http::status::not_found, "{\"error\":\"not found\"}");
    }

    void respond(http::status status, std::string body) {
        auto res = std::make_shared<http::response<http::string_body>>(status, req_.version());
        res->set(http::field::server, kServerName);
        res->set(http::field::content_type, "application/json");
        res->keep_alive(false);
        res->body() = std::move(body);
        res->prepare_payload();

        http::async_write(
            stream_, *res,
            [self = shared_from_this(), res](beast::error_code, std::size_t) {
                beast::error_code ignored;
                self->stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
            });
    }

    beast::tcp_stream stream_;
    FrameHub& hub_;
    WsServerOptions opts_;
    beast::flat_buffer buf_;
    http::request<http::string_body> req_;
};

// ---------------- Listener ----------------

WsListener::WsListener(net::io_context& ioc, FrameHub& hub, tcp::endpoint ep, WsServerOptions opts)
    : ioc_(ioc), hub_(hub), acceptor_(net::make_strand(ioc)), opts_(opts) {
    beast::error_code ec;

    acceptor_.open(ep.protocol(), ec);
    if (ec) throw std::runtime_error("acceptor.open: " + ec.message());

    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) throw std::runtime_error("acceptor.set_option: " + ec.message());

    acceptor_.bind(ep, ec);
    if (ec) throw std::runtime_error("acceptor.bind: " + ec.message());

    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) throw std::runtime_error("acceptor.listen: " + ec.message());

    port_ = acceptor_.local_endpoint(ec).port();
}

void WsListener::run() { do_accept(); }

void WsListener::stop() {
    net::post(acceptor_.get_executor(), [self = shared_from_this()] {
        beast::error_code ec;
        self->acceptor_.close(ec);
    });
}

void WsListener::do_accept() {
    acceptor_.async_accept(
        net::make_strand(ioc_),
        beast::bind_front_handler(&WsListener::on_accept, shared_from_this())
    );
}

void WsListener::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec == net::error::operation_aborted) return;   // stopped
    if (!ec) {
        socket.set_option(tcp::no_delay(true), ec);
        std::make_shared<HttpConnection>(std::move(socket), hub_, opts_)->run();
    } else {
        std::cerr << "[ws] accept: " << ec.message() << "\n";
    }
    if (acceptor_.is_open()) do_accept();
}

std::shared_ptr<WsListener> start_ws_server(net::io_context& ioc,
                                            FrameHub& hub,
                                            const std::string& address,
                                            unsigned short port,
                                            WsServerOptions opts) {
    beast::error_code ec;
    auto addr = net::ip::make_address(address, ec);
    if (ec) throw std::runtime_error("invalid bind address '" + address + "': " + ec.message());

    auto listener = std::make_shared<WsListener>(ioc, hub, tcp::endpoint(addr, port), opts);
    listener->run();
    return listener;
}

} // namespace vcast
