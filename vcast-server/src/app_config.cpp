#include "vcast/app_config.hpp"

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace vcast {

bool env_truthy(const char* v) {
    if (!v || !*v) return false;
    std::string s(v);
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    return (s == "1" || s == "true" || s == "yes" || s == "y" || s == "on");
}

static int to_int(const std::string& key, const std::string& v) {
    try {
        std::size_t pos = 0;
        int out = std::stoi(v, &pos);
        if (pos != v.size()) throw std::invalid_argument(v);
        return out;
    } catch (const std::exception&) {
        throw std::invalid_argument(key + ": not an integer: '" + v + "'");
    }
}

static void env_int(const char* name, int& out) {
    if (const char* v = std::getenv(name); v && *v) out = to_int(name, v);
}

static void env_str(const char* name, std::string& out) {
    if (const char* v = std::getenv(name); v && *v) out = v;
}

void usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " [options]\n"
        << "  --port N              listen port (9000)\n"
        << "  --bind ADDR           bind address (0.0.0.0)\n"
        << "  --threads N           io threads (2)\n"
        << "  --source KIND         ingest | v4l2 | screen | pattern (ingest)\n"
        << "  --device PATH         v4l2 device (/dev/video0)\n"
        << "  --monitor N           screen to grab, 1 = primary (1)\n"
        << "  --width N --height N  capture size (640x480)\n"
        << "  --fps N               capture rate (30)\n"
        << "  --quality N           jpeg quality 1..100 (80)\n"
        << "  --queue N             per-viewer queue capacity (4)\n"
        << "  --poll-ms N           broadcast poll interval (33)\n"
        << "  --max-failures N      consecutive capture/encode failures before exit, 0=never (150)\n"
        << "  --stats-ms N          stats interval, 0=off (5000)\n"
        << "  --max-frame-bytes N   largest accepted ingest message (8388608)\n"
        << "  --no-pings            disable websocket keep-alive pings\n"
        << "  --idle-ms N           drop connections silent this long, 0=never (300000)\n"
        << "  --help\n"
        << "Env: VCAST_PORT, VCAST_SOURCE, VCAST_DEVICE, VCAST_MONITOR, VCAST_WIDTH, VCAST_HEIGHT,\n"
        << "     VCAST_FPS, VCAST_QUALITY, VCAST_QUEUE, VCAST_POLL_MS, VCAST_STATS_MS,\n"
        << "     VCAST_IDLE_MS, VCAST_PINGS=0\n"
        << "Env: VCAST_STATS_LOG=stats.jsonl (optional)\n"
        << "Env: PG_CONNINFO=\"host=127.0.0.1 port=5432 dbname=vcast user=postgres password=postgres\" (optional)\n";
}

AppConfig parse_config(int argc, char** argv) {
    AppConfig cfg;

    // env
    env_int("VCAST_PORT", cfg.port);
    env_int("VCAST_THREADS", cfg.threads);
    env_str("VCAST_SOURCE", cfg.source);
    env_str("VCAST_DEVICE", cfg.device);
    env_int("VCAST_MONITOR", cfg.monitor);
    env_int("VCAST_WIDTH", cfg.width);
    env_int("VCAST_HEIGHT", cfg.height);
    env_int("VCAST_FPS", cfg.fps);
    env_int("VCAST_QUALITY", cfg.quality);
    env_int("VCAST_QUEUE", cfg.queue_capacity);
    env_int("VCAST_POLL_MS", cfg.poll_ms);
    env_int("VCAST_STATS_MS", cfg.stats_ms);
    env_int("VCAST_MAX_FAILURES", cfg.max_consecutive_failures);
    env_int("VCAST_IDLE_MS", cfg.idle_ms);
    if (const char* v = std::getenv("VCAST_PINGS"); v && *v) cfg.keepalive_pings = env_truthy(v);
    env_str("VCAST_STATS_LOG", cfg.stats_log_path);
    env_str("PG_CONNINFO", cfg.pg_conninfo);

    // CLI
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument(a + ": missing value");
            return argv[++i];
        };

        if (a == "--help" || a == "-h") cfg.show_help = true;
        else if (a == "--port") cfg.port = to_int(a, next());
        else if (a == "--bind") cfg.bind_address = next();
        else if (a == "--threads") cfg.threads = to_int(a, next());
        else if (a == "--source") cfg.source = next();
        else if (a == "--device") cfg.device = next();
        else if (a == "--monitor") cfg.monitor = to_int(a, next());
        else if (a == "--width") cfg.width = to_int(a, next());
        else if (a == "--height") cfg.height = to_int(a, next());
        else if (a == "--fps") cfg.fps = to_int(a, next());
        else if (a == "--quality") cfg.quality = to_int(a, next());
        else if (a == "--queue") cfg.queue_capacity = to_int(a, next());
        else if (a == "--poll-ms") cfg.poll_ms = to_int(a, next());
        else if (a == "--max-failures") cfg.max_consecutive_failures = to_int(a, next());
        else if (a == "--stats-ms") cfg.stats_ms = to_int(a, next());
        else if (a == "--max-frame-bytes") {
            const int v = to_int(a, next());
            if (v <= 0) throw std::invalid_argument(a + " must be positive");
            cfg.max_frame_bytes = (std::size_t)v;
        }
        else if (a == "--idle-ms") cfg.idle_ms = to_int(a, next());
        else if (a == "--pings") cfg.keepalive_pings = true;
        else if (a == "--no-pings") cfg.keepalive_pings = false;
        else throw std::invalid_argument("unknown option: " + a);
    }

    return cfg;
}

void validate_config(const AppConfig& cfg) {
    auto require = [](bool ok, const std::string& msg) {
        if (!ok) throw std::invalid_argument(msg);
    };

    require(cfg.port >= 0 && cfg.port <= 65535, "port must be 0..65535");
    require(cfg.threads >= 1 && cfg.threads <= 64, "threads must be 1..64");
    require(cfg.source == "ingest" || cfg.source == "v4l2" || cfg.source == "screen" ||
            cfg.source == "pattern",
            "source must be ingest, v4l2, screen or pattern");
    require(cfg.monitor >= 0, "monitor must be >= 0");
    require(cfg.idle_ms >= 0, "idle-ms must be >= 0");
    require(cfg.width > 0 && cfg.height > 0, "width/height must be positive");
    require(cfg.fps >= 1 && cfg.fps <= 240, "fps must be 1..240");
    require(cfg.quality >= 1 && cfg.quality <= 100, "quality must be 1..100");
    require(cfg.queue_capacity >= 1, "queue capacity must be >= 1");
    require(cfg.poll_ms >= 1 && cfg.poll_ms <= 1000, "poll-ms must be 1..1000");
    require(cfg.max_consecutive_failures >= 0, "max-failures must be >= 0");
    require(cfg.stats_ms >= 0, "stats-ms must be >= 0");
    require(cfg.max_frame_bytes > 0, "max-frame-bytes must be positive");
}

} // namespace vcast
