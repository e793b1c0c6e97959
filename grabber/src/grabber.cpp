// vcast_grabber: capture -> JPEG -> upload to a vcast server's /ws/stream.
#include "vcast/capture_source.hpp"
#include "vcast/encoder.hpp"
#include "vcast/frame_hub.hpp"
#include "vcast/publisher.hpp"
#include "vcast/ws_uplink.hpp"

#include <boost/asio.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace vcast;
using SteadyClock = std::chrono::steady_clock;

static void print_usage() {
    std::cout
        << "Usage: vcast_grabber [--uri ws://localhost:9000/ws/stream] [--source v4l2|screen|pattern]\n"
        << "                     [--device /dev/video0] [--screen] [--monitor 1]\n"
        << "                     [--width 640] [--height 480]\n"
        << "                     [--fps 30] [--quality 80] [--queue 4] [--stats-ms 1000]\n"
        << "                     [--max-failures 150]\n";
}

int main(int argc, char** argv) {
    std::string uri = "ws://localhost:9000/ws/stream";
    std::string source_kind = "v4l2";
    std::string device = "/dev/video0";
    int width = 640, height = 480, fps = 30, quality = 80, queue = 4;
    int stats_ms = 1000;
    int monitor = 1;
    int max_failures = 150;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            auto has_next = [&]{ return i + 1 < argc; };
            if (a == "--uri" && has_next()) uri = argv[++i];
            else if (a == "--source" && has_next()) source_kind = argv[++i];
            else if (a == "--device" && has_next()) device = argv[++i];
            else if (a == "--screen") source_kind = "screen";
            else if (a == "--monitor" && has_next()) monitor = std::stoi(argv[++i]);
            else if (a == "--width" && has_next()) width = std::stoi(argv[++i]);
            else if (a == "--height" && has_next()) height = std::stoi(argv[++i]);
            else if (a == "--fps" && has_next()) fps = std::stoi(argv[++i]);
            else if (a == "--quality" && has_next()) quality = std::stoi(argv[++i]);
            else if (a == "--queue" && has_next()) queue = std::stoi(argv[++i]);
            else if (a == "--stats-ms" && has_next()) stats_ms = std::stoi(argv[++i]);
            else if (a == "--max-failures" && has_next()) max_failures = std::stoi(argv[++i]);
            else if (a == "--help") { print_usage(); return 0; }
            else {
                std::cerr << "[grabber] unknown or incomplete option: " << a << "\n";
                print_usage();
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[grabber] bad numeric option: " << e.what() << "\n";
        return 1;
    }

    if (fps < 1) fps = 1;
    if (queue < 1) queue = 1;
    if (quality < 1 || quality > 100) {
        std::cerr << "[grabber] quality must be 1..100\n";
        return 1;
    }

    WsUri target;
    if (!parse_ws_uri(uri, target)) {
        std::cerr << "[grabber] invalid uri: " << uri << " (expected ws://host:port/path)\n";
        return 1;
    }

    std::cerr << "[grabber] source=" << source_kind
              << (source_kind == "v4l2" ? " device=" + device : std::string())
              << (source_kind == "screen" ? " monitor=" + std::to_string(monitor) : std::string())
              << " requested " << width << "x" << height << " @ " << fps << "fps\n";

    // 1. Capture source first: a missing camera is a startup error
    std::unique_ptr<CaptureSource> source;
    try {
        source = make_capture_source(source_kind, device, width, height, fps, monitor);
    } catch (const std::exception& e) {
        std::cerr << "[grabber] " << e.what() << "\n";
        return 1;
    }
    JpegEncoder encoder;

    // 2. Connect
    boost::asio::io_context ioc;
    auto uplink = std::make_shared<WsUplink>(ioc);
    try {
        uplink->connect(target);
    } catch (const std::exception& e) {
        std::cerr << "[grabber] unable to connect to " << uri << ": " << e.what() << "\n";
        return 1;
    }
    std::cerr << "[grabber] connected to " << uri << "\n";

    std::atomic<bool> stop{false};
    std::atomic<int> exit_code{0};

    uplink->start_reading([&](const std::string& reason) {
        std::cerr << "[grabber] " << reason << "\n";
        exit_code.store(1);
        stop.store(true);
    });

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int) {
        if (ec) return;
        std::cerr << "\n[grabber] interrupted, exiting\n";
        stop.store(true);
    });

    std::thread io_thread([&]{ ioc.run(); });

    // 3. Local hub with exactly one session: the uplink (same drop-oldest queue as a viewer)
    HubOptions hub_opts;
    hub_opts.queue_capacity = (std::size_t)queue;
    hub_opts.poll_interval = std::chrono::milliseconds(std::max(1, 500 / fps));
    FrameHub hub(hub_opts);
    hub.start();
    auto session = hub.attach(uplink);

    PublisherOptions popts;
    popts.fps = fps;
    popts.quality = quality;
    popts.max_consecutive_failures = max_failures;
    Publisher publisher(hub.slot(), *source, encoder, popts, &hub.stats());
    publisher.set_on_fatal([&](const std::string&) {
        exit_code.store(2);
        stop.store(true);
    });

    try {
        publisher.start();
    } catch (const std::exception& e) {
        std::cerr << "[grabber] cannot open capture source: " << e.what() << "\n";
        exit_code.store(1);
        stop.store(true);
    }

    // 4. Status loop
    uint64_t last_published = 0;
    auto last_log = SteadyClock::now();
    while (!stop.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));

        if (session->closed()) {
            exit_code.store(1);
            break;
        }

        auto now = SteadyClock::now();
        auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_log).count();
        if (stats_ms > 0 && elapsed_ms >= stats_ms) {
            uint64_t published = publisher.published();
            double produced_fps = (double)(published - last_published) * 1000.0 / (double)elapsed_ms;
            Frame cur = hub.slot().read();
            std::cerr << "[grabber] produced_fps=" << produced_fps
                      << " queue=" << session->pending()
                      << " sent=" << session->frames_sent()
                      << " dropped=" << session->dropped()
                      << " last_size=" << cur.size() << "B\n";
            last_published = published;
            last_log = now;
        }
    }

    // 5. Scoped shutdown: camera first, then the connection
    publisher.stop();
    hub.shutdown();
    signals.cancel();
    std::this_thread::sleep_for(std::chrono::milliseconds(200));   // let the close frame go out
    ioc.stop();
    if (io_thread.joinable()) io_thread.join();

    std::cerr << "[grabber] exiting (published=" << publisher.published()
              << " sent=" << session->frames_sent() << ")\n";
    return exit_code.load();
}
