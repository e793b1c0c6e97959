#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace vcast {

struct AppConfig {
    // network
    std::string bind_address = "0.0.0.0";
    int port = 9000;
    int threads = 2;
    bool keepalive_pings = true;
    int idle_ms = 300000;              // 0 = never drop a silent connection
    std::size_t max_frame_bytes = 8u << 20;

    // producer
    std::string source = "ingest";     // ingest | v4l2 | screen | pattern
    std::string device = "/dev/video0";
    int monitor = 1;                   // screen source; 1 = primary
    int width = 640;
    int height = 480;
    int fps = 30;
    int quality = 80;
    int max_consecutive_failures = 150;

    // fan-out
    int queue_capacity = 4;
    int poll_ms = 33;

    // diagnostics (env)
    int stats_ms = 5000;
    std::string stats_log_path;        // empty => disabled
    std::string pg_conninfo;           // empty => disabled

    bool show_help = false;
};

// prints usage
void usage(const char* prog);

// env first, then CLI flags on top; throws std::invalid_argument on bad input
AppConfig parse_config(int argc, char** argv);

// throws std::invalid_argument if a value is out of range
void validate_config(const AppConfig& cfg);

bool env_truthy(const char* v);

} // namespace vcast
