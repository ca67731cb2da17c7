#include "tickdb/etl/tailer.hpp"

#include <utility>

#include "tickdb/scid/decoder.hpp"
#include "tickdb/scid/record_file.hpp"
#include "lcr/log/logger.hpp"


namespace tickdb::etl {

namespace {

struct TasStream {
    using Records = TasRecords;
    static constexpr const char* tag = "[TAS]";

    static Status read_header(scid::RecordFile& f) noexcept { return scid::read_tas_header(f); }
    static Status decode(scid::RecordFile& f, Records& out) { return scid::decode_tas(f, out); }
    static uint64_t offset(int64_t rec) noexcept { return scid::tas_offset(rec); }
    static Status insert(sink::Database& db, const std::string& contract, const Records& r) {
        return db.insert_tas(contract, r);
    }
};

struct DepthStream {
    using Records = DepthRecords;
    static constexpr const char* tag = "[Depth]";

    static Status read_header(scid::RecordFile& f) noexcept { return scid::read_depth_header(f); }
    static Status decode(scid::RecordFile& f, Records& out) { return scid::decode_depth(f, out); }
    static uint64_t offset(int64_t rec) noexcept { return scid::depth_offset(rec); }
    static Status insert(sink::Database& db, const std::string& contract, const Records& r) {
        return db.insert_depth(contract, r);
    }
};

template <typename Stream>
[[nodiscard]] TailResult tail_(sink::Database& db, PollControl& control, const TailRequest& req) {
    scid::RecordFile file(req.path);
    Status status = file.open();
    if (status == Status::FILE_NOT_FOUND) {
        TDB_WARN(Stream::tag << " " << req.label << ": File not found: " << req.path);
        return {status, req.start_rec};
    }
    if (status != Status::OK) {
        TDB_ERROR(Stream::tag << " " << req.label << ": Cannot open " << req.path << " (" << to_string(status) << ")");
        return {status, req.start_rec};
    }

    status = Stream::read_header(file);
    if (status != Status::OK) {
        TDB_ERROR(Stream::tag << " " << req.label << ": Invalid header in " << req.path << " (" << to_string(status) << ")");
        return {status, req.start_rec};
    }

    const uint64_t start = Stream::offset(req.start_rec);
    status = file.seek(start);
    if (status != Status::OK) {
        TDB_ERROR(Stream::tag << " " << req.label << ": Cannot seek to offset " << req.start_rec);
        return {status, req.start_rec};
    }
    uint64_t size = 0;
    if (file.file_size(size) == Status::OK && size < start) {
        TDB_WARN(Stream::tag << " " << req.label << ": Checkpoint " << req.start_rec
                 << " lies beyond the end of " << req.path << ", waiting for the file to grow");
    }

    int64_t processed = 0;
    bool idle_reported = false;
    for (;;) {
        typename Stream::Records batch;
        status = Stream::decode(file, batch);
        if (status != Status::OK) {
            TDB_ERROR(Stream::tag << " " << req.label << ": Decode error after offset "
                      << req.start_rec + processed << " (" << to_string(status) << ")");
            return {status, req.start_rec};
        }

        if (!batch.empty()) {
            TDB_INFO(Stream::tag << " " << req.label << ": Processing " << batch.size()
                     << " new records starting after offset " << req.start_rec + processed << ".");
            batch = scid::transform(std::move(batch), req.price_adj);
            status = Stream::insert(db, req.contract, batch);
            if (status != Status::OK) {
                TDB_ERROR(Stream::tag << " " << req.label << ": Load failed, batch rolled back ("
                          << to_string(status) << ")");
                return {status, req.start_rec};
            }
            processed += static_cast<int64_t>(batch.size());
            idle_reported = false;
        }
        else if (!idle_reported) {
            TDB_INFO(Stream::tag << " " << req.label << ": No new records found after offset "
                     << req.start_rec + processed);
            idle_reported = true;
        }

        // A full batch means the backlog is not drained yet
        const bool backlog = batch.size() == scid::DECODE_BATCH_RECORDS;
        if (backlog && !control.stop_requested()) continue;
        if (!req.follow || !control.wait()) break;
    }

    return {Status::OK, req.start_rec + processed};
}

} // namespace


TailResult Tailer::tail_tas(const TailRequest& req) {
    return tail_<TasStream>(db_, control_, req);
}

TailResult Tailer::tail_depth(const TailRequest& req) {
    return tail_<DepthStream>(db_, control_, req);
}

} // namespace tickdb::etl
