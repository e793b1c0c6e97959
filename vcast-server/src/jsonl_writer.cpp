#include "vcast/jsonl_writer.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>

namespace vcast {

JsonlWriter::JsonlWriter(const std::string& path, bool append) {
    open(path, append);
}

JsonlWriter::~JsonlWriter() {
    flush();
}

bool JsonlWriter::open(const std::string& path, bool append) {
    std::lock_guard<std::mutex> lk(mtx_);
    path_ = path;

    std::filesystem::path fp(path);
    std::error_code ec;
    if (fp.has_parent_path()) {
        std::filesystem::create_directories(fp.parent_path(), ec);
    }

    auto mode = std::ios::binary | (append ? std::ios::app : std::ios::trunc);
    ofs_.open(path, mode);

    if (!ofs_) {
        std::cerr << "[jsonl] failed to open: " << path << "\n";
        return false;
    }
    return true;
}

bool JsonlWriter::is_open() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return ofs_.is_open() && ofs_.good();
}

void JsonlWriter::flush() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (ofs_.is_open()) ofs_.flush();
}

std::string JsonlWriter::to_json(const StatsLine& s) {
    std::ostringstream os;
    os << "{"
       << "\"ts_wall_us\":" << s.ts_wall_us
       << ",\"frames_published\":" << s.frames_published
       << ",\"capture_failures\":" << s.capture_failures
       << ",\"encode_failures\":" << s.encode_failures
       << ",\"frames_sent\":" << s.frames_sent
       << ",\"frames_dropped\":" << s.frames_dropped
       << ",\"bytes_sent\":" << s.bytes_sent
       << ",\"ingest_frames\":" << s.ingest_frames
       << ",\"ingest_bytes\":" << s.ingest_bytes
       << ",\"sessions_opened\":" << s.sessions_opened
       << ",\"sessions_closed\":" << s.sessions_closed
       << ",\"viewers\":" << s.viewers
       << ",\"publish_fps\":" << s.publish_fps
       << ",\"send_kbps\":" << s.send_kbps
       << ",\"ingest_fps\":" << s.ingest_fps
       << ",\"ingest_kbps\":" << s.ingest_kbps
       << "}";
    return os.str();
}

void JsonlWriter::write_stats(const StatsLine& line) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!ofs_.is_open() || !ofs_.good()) return;
    ofs_ << to_json(line) << "\n";
}

} // namespace vcast
