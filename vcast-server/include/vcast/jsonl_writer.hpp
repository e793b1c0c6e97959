#pragma once
#include "vcast/stream_stats.hpp"

#include <fstream>
#include <mutex>
#include <string>

namespace vcast {

// Append-only JSON Lines log of stats samples.
class JsonlWriter {
public:
    JsonlWriter() = default;
    explicit JsonlWriter(const std::string& path, bool append = true);
    ~JsonlWriter();

    JsonlWriter(const JsonlWriter&) = delete;
    JsonlWriter& operator=(const JsonlWriter&) = delete;

    bool open(const std::string& path, bool append = true);
    bool is_open() const;
    const std::string& path() const { return path_; }

    void write_stats(const StatsLine& line);

    void flush();

    // One JSON object, no trailing newline.
    static std::string to_json(const StatsLine& line);

private:
    std::string path_;
    mutable std::mutex mtx_;
    std::ofstream ofs_;
};

} // namespace vcast
