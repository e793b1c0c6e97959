#pragma once
#include "vcast/stream_stats.hpp"

#include <cstdint>
#include <string>

namespace vcast {

/**
 * Thin PostgreSQL writer for the stream_stats table
 * - owns DB connection
 * - provides idempotent insert (one row per sample timestamp)
 *
 * CREATE TABLE stream_stats (
 *   ts TIMESTAMPTZ PRIMARY KEY, frames_published BIGINT, frames_sent BIGINT,
 *   frames_dropped BIGINT, bytes_sent BIGINT, ingest_frames BIGINT,
 *   viewers INTEGER, publish_fps DOUBLE PRECISION, send_kbps DOUBLE PRECISION);
 */
class PgWriter {
public:
    // example conninfo:
    // "host=127.0.0.1 port=5432 dbname=vcast user=postgres password=postgres"
    explicit PgWriter(const std::string& conninfo);
    ~PgWriter();

    // non-copyable (DB connection ownership)
    PgWriter(const PgWriter&) = delete;
    PgWriter& operator=(const PgWriter&) = delete;

    bool connected() const;

    // Write one sample (idempotent on ts)
    bool write_stats(const StatsLine& line);

private:
    struct Impl;   // keeps libpq out of the header
    Impl* impl_;
};

} // namespace vcast
