#include "vcast/pg_writer.hpp"

#include <postgresql/libpq-fe.h>

#include <iostream>
#include <string>

namespace vcast {

struct PgWriter::Impl {
    PGconn* conn = nullptr;
    PGresult* prep = nullptr;
};

PgWriter::PgWriter(const std::string& conninfo) : impl_(new Impl) {
    impl_->conn = PQconnectdb(conninfo.c_str());

    if (PQstatus(impl_->conn) != CONNECTION_OK) {
        std::cerr << "[pg] connection failed: "
                  << PQerrorMessage(impl_->conn) << "\n";
        PQfinish(impl_->conn);
        impl_->conn = nullptr;
        return;
    }

    const char* sql =
        "INSERT INTO stream_stats "
        "(ts, frames_published, frames_sent, frames_dropped, bytes_sent, "
        " ingest_frames, viewers, publish_fps, send_kbps) "
        "VALUES (to_timestamp($1 / 1e6), $2, $3, $4, $5, $6, $7, $8, $9) "
        "ON CONFLICT (ts) DO NOTHING";

    impl_->prep = PQprepare(impl_->conn, "insert_stats", sql, 9, nullptr);

    if (PQresultStatus(impl_->prep) != PGRES_COMMAND_OK) {
        std::cerr << "[pg] prepare failed: "
                  << PQerrorMessage(impl_->conn) << "\n";
    }
}

PgWriter::~PgWriter() {
    if (impl_) {
        if (impl_->prep) PQclear(impl_->prep);
        if (impl_->conn) PQfinish(impl_->conn);
        delete impl_;
    }
}

bool PgWriter::connected() const {
    return impl_ && impl_->conn && PQstatus(impl_->conn) == CONNECTION_OK;
}

bool PgWriter::write_stats(const StatsLine& s) {
    if (!impl_ || !impl_->conn) return false;

    const std::string ts          = std::to_string(s.ts_wall_us);
    const std::string published   = std::to_string(s.frames_published);
    const std::string sent        = std::to_string(s.frames_sent);
    const std::string dropped     = std::to_string(s.frames_dropped);
    const std::string bytes       = std::to_string(s.bytes_sent);
    const std::string ingest      = std::to_string(s.ingest_frames);
    const std::string viewers     = std::to_string(s.viewers);
    const std::string publish_fps = std::to_string(s.publish_fps);
    const std::string send_kbps   = std::to_string(s.send_kbps);

    const char* values[] = {
        ts.c_str(), published.c_str(), sent.c_str(), dropped.c_str(), bytes.c_str(),
        ingest.c_str(), viewers.c_str(), publish_fps.c_str(), send_kbps.c_str()
    };

    PGresult* res = PQexecPrepared(impl_->conn, "insert_stats", 9, values,
                                   nullptr, nullptr, 0);

    bool ok = (PQresultStatus(res) == PGRES_COMMAND_OK);
    if (!ok) {
        std::cerr << "[pg] insert failed: "
                  << PQerrorMessage(impl_->conn) << "\n";
    }

    PQclear(res);
    return ok;
}

} // namespace vcast
