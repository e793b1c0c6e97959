#include "vcast/app_config.hpp"
#include "vcast/capture_source.hpp"
#include "vcast/encoder.hpp"
#include "vcast/frame_hub.hpp"
#include "vcast/jsonl_writer.hpp"
#include "vcast/pg_writer.hpp"
#include "vcast/publisher.hpp"
#include "vcast/stats_reporter.hpp"
#include "vcast/ws_server.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace vcast;

int main(int argc, char** argv) {
    AppConfig cfg;
    try {
        cfg = parse_config(argc, argv);
        if (cfg.show_help) {
            usage(argv[0]);
            return 0;
        }
        validate_config(cfg);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[config] " << e.what() << "\n";
        usage(argv[0]);
        return 1;
    }

    // ---- Hub: slot + registry + broadcast loop ----
    HubOptions hub_opts;
    hub_opts.queue_capacity = (std::size_t)cfg.queue_capacity;
    hub_opts.poll_interval = std::chrono::milliseconds(cfg.poll_ms);
    FrameHub hub(hub_opts);
    hub.start();

    // ---- Start WebSocket server ----
    boost::asio::io_context ioc(cfg.threads);
    WsServerOptions ws_opts;
    ws_opts.ingest_enabled = (cfg.source == "ingest");
    ws_opts.keepalive_pings = cfg.keepalive_pings;
    ws_opts.idle_timeout = std::chrono::milliseconds(cfg.idle_ms);
    ws_opts.max_frame_bytes = cfg.max_frame_bytes;

    std::shared_ptr<WsListener> listener;
    try {
        listener = start_ws_server(ioc, hub, cfg.bind_address, (unsigned short)cfg.port, ws_opts);
    } catch (const std::exception& e) {
        std::cerr << "[ws] failed to start: " << e.what() << "\n";
        return 1;
    }
    std::cerr << "[ws] listening on " << cfg.bind_address << ":" << listener->port()
              << " (viewers: /ws/view" << (ws_opts.ingest_enabled ? ", uploader: /ws/stream" : "")
              << ", queue " << cfg.queue_capacity << ")\n";

    // ---- Stats sinks (optional) ----
    std::unique_ptr<JsonlWriter> jsonl;
    if (!cfg.stats_log_path.empty()) {
        jsonl = std::make_unique<JsonlWriter>();
        if (jsonl->open(cfg.stats_log_path, /*append=*/true)) {
            std::cerr << "[jsonl] stats to: " << jsonl->path() << "\n";
        } else {
            jsonl.reset();
        }
    }

    std::unique_ptr<PgWriter> pg;
    if (!cfg.pg_conninfo.empty()) {
        pg = std::make_unique<PgWriter>(cfg.pg_conninfo);
        if (pg->connected()) {
            std::cerr << "[pg] enabled\n";
        } else {
            pg.reset();
        }
    } else {
        std::cerr << "[pg] disabled (set PG_CONNINFO)\n";
    }

    StatsReporter reporter(hub, std::chrono::milliseconds(cfg.stats_ms), jsonl.get(), pg.get());
    reporter.start();

    // ---- Local producer (camera / pattern) ----
    std::unique_ptr<CaptureSource> source;
    JpegEncoder encoder;
    std::unique_ptr<Publisher> publisher;
    std::atomic<int> exit_code{0};

    // ---- Scoped shutdown ----
    std::atomic<bool> shutting_down{false};
    boost::asio::steady_timer drain_timer(ioc);
    auto shutdown = [&](const std::string& why) {
        if (shutting_down.exchange(true)) return;
        std::cerr << "[main] shutting down: " << why << "\n";
        if (publisher) publisher->stop();      // releases the capture device
        listener->stop();
        hub.shutdown();                         // broadcast loop + every viewer session
        // give close frames a moment to go out
        drain_timer.expires_after(std::chrono::milliseconds(500));
        drain_timer.async_wait([&](const boost::system::error_code&) { ioc.stop(); });
    };

    if (cfg.source != "ingest") {
        try {
            source = make_capture_source(cfg.source, cfg.device, cfg.width, cfg.height, cfg.fps,
                                         cfg.monitor);
            PublisherOptions popts;
            popts.fps = cfg.fps;
            popts.quality = cfg.quality;
            popts.max_consecutive_failures = cfg.max_consecutive_failures;
            publisher = std::make_unique<Publisher>(hub.slot(), *source, encoder, popts, &hub.stats());
            publisher->set_on_fatal([&](const std::string& reason) {
                exit_code.store(2);
                boost::asio::post(ioc, [&, reason] { shutdown("publisher: " + reason); });
            });
            publisher->start();
        } catch (const std::exception& e) {
            std::cerr << "[publisher] failed to start: " << e.what() << "\n";
            publisher.reset();
            reporter.stop();
            hub.shutdown();
            return 1;
        }
    }

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int sig) {
        if (ec) return;
        shutdown("signal " + std::to_string(sig));
    });

    // ---- Run io threads ----
    std::vector<std::thread> io_threads;
    for (int i = 1; i < cfg.threads; ++i) {
        io_threads.emplace_back([&]{ ioc.run(); });
    }
    ioc.run();
    for (auto& t : io_threads) t.join();

    if (publisher) publisher->stop();
    reporter.stop();
    hub.shutdown();

    std::cerr << "[main] bye (published=" << hub.stats().frames_published.load()
              << " sent=" << hub.stats().frames_sent.load() << ")\n";
    return exit_code.load();
}
