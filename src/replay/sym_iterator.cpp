#include "tickdb/replay/sym_iterator.hpp"

#include <algorithm>
#include <utility>

#include "tickdb/core/layout.hpp"
#include "tickdb/scid/decoder.hpp"
#include "lcr/log/logger.hpp"


namespace tickdb::replay {

namespace {

// First record with timestamp >= ts
template <typename Records>
[[nodiscard]] std::size_t lower_bound_ts_(const Records& recs, int64_t ts) noexcept {
    auto it = std::lower_bound(recs.begin(), recs.end(), ts,
        [](const auto& rec, int64_t value) { return rec.timestamp < value; });
    return static_cast<std::size_t>(it - recs.begin());
}

// Decodes batch after batch until the end of file
template <typename Records, typename DecodeFn>
[[nodiscard]] Status drain_(scid::RecordFile& file, Records& out, DecodeFn decode) {
    for (;;) {
        const std::size_t before = out.size();
        Status status = decode(file, out, scid::DECODE_BATCH_RECORDS);
        if (status != Status::OK) return status;
        if (out.size() - before < scid::DECODE_BATCH_RECORDS) return Status::OK;
    }
}

} // namespace


SymIterator::SymIterator(const std::string& sc_root, std::string symbol, std::string date, int64_t ts)
    : symbol_(std::move(symbol))
    , date_(std::move(date))
    , tas_file_(core::tas_path(sc_root, symbol_).string())
    , depth_file_(core::depth_path(sc_root, symbol_, date_).string())
    , ts_(ts)
{
}

Status SymIterator::open() {
    Status status = tas_file_.open();
    if (status != Status::OK) {
        TDB_ERROR("[Replay] Cannot open time and sales file " << tas_file_.filepath() << " (" << to_string(status) << ")");
        return status;
    }
    status = depth_file_.open();
    if (status != Status::OK) {
        TDB_ERROR("[Replay] Cannot open depth file " << depth_file_.filepath() << " (" << to_string(status) << ")");
        tas_file_.close();
        return status;
    }

    status = scid::read_tas_header(tas_file_);
    if (status == Status::OK) status = scid::read_depth_header(depth_file_);
    if (status != Status::OK) {
        TDB_ERROR("[Replay] Error parsing headers for " << symbol_ << " on " << date_ << " (" << to_string(status) << ")");
        tas_file_.close();
        depth_file_.close();
        return status;
    }
    TDB_DEBUG("[Replay] Opened " << symbol_ << " " << date_);
    return synchronize(true);
}

Status SymIterator::pull() {
    if (!is_open()) return Status::READ_FAILED;

    const uint64_t tas_pos = tas_file_.tell();
    const uint64_t depth_pos = depth_file_.tell();
    const std::size_t tas_len = tas_.size();
    const std::size_t depth_len = depth_.size();

    Status status = drain_(tas_file_, tas_, scid::decode_tas);
    if (status == Status::OK) status = drain_(depth_file_, depth_, scid::decode_depth);
    if (status != Status::OK) {
        TDB_ERROR("[Replay] Error parsing new records for " << symbol_ << " on " << date_ << " (" << to_string(status) << ")");
        tas_.resize(tas_len);
        depth_.resize(depth_len);
        if (tas_file_.seek(tas_pos) != Status::OK || depth_file_.seek(depth_pos) != Status::OK) {
            TDB_WARN("[Replay] Could not reset file positions after parsing error");
        }
        return status;
    }
    if (tas_.size() != tas_len || depth_.size() != depth_len) {
        TDB_TRACE("[Replay] " << symbol_ << ": +" << tas_.size() - tas_len << " tas, +"
                  << depth_.size() - depth_len << " depth");
    }
    return Status::OK;
}

Status SymIterator::synchronize(bool update) {
    if (update) {
        Status status = pull();
        if (status != Status::OK) return status;
    }
    synced_ = true;

    if (depth_.empty() && tas_.empty()) {
        depth_index_ = 0;
        tas_index_ = 0;
        return Status::OK;
    }

    if (depth_.empty()) {
        depth_index_ = 0;
        tas_index_ = lower_bound_ts_(tas_, ts_);
        ts_ = (tas_index_ < tas_.size()) ? tas_[tas_index_].timestamp : tas_.back().timestamp;
        return Status::OK;
    }

    depth_index_ = lower_bound_ts_(depth_, ts_);
    ts_ = (depth_index_ < depth_.size()) ? depth_[depth_index_].timestamp : depth_.back().timestamp;
    tas_index_ = tas_.empty() ? 0 : lower_bound_ts_(tas_, ts_);
    return Status::OK;
}

bool SymIterator::next(Record& out) {
    bool has_depth = depth_index_ < depth_.size();
    bool has_tas = tas_index_ < tas_.size();

    if (!has_depth && !has_tas) {
        if (pull() != Status::OK) return false;
        has_depth = depth_index_ < depth_.size();
        has_tas = tas_index_ < tas_.size();
        if (!has_depth && !has_tas) return false;
    }

    // Depth first on equal timestamps
    if (has_depth && (!has_tas || depth_[depth_index_].timestamp <= tas_[tas_index_].timestamp)) {
        const DepthRecord& rec = depth_[depth_index_++];
        ts_ = rec.timestamp;
        out = rec;
    }
    else {
        const TasRecord& rec = tas_[tas_index_++];
        ts_ = rec.timestamp;
        out = rec;
    }
    return true;
}

Status SymIterator::all(Records& out) {
    out.clear();
    const Cursor saved = save_();

    Status status = pull();
    if (status == Status::OK) {
        ts_ = 0;
        tas_index_ = 0;
        depth_index_ = 0;
        out.reserve(tas_.size() + depth_.size());
        Record rec;
        while (next(rec)) {
            out.push_back(rec);
        }
    }

    restore_(saved);
    return status;
}

Status SymIterator::range(int64_t start, std::optional<int64_t> stop, Records& out) {
    out.clear();
    const Cursor saved = save_();

    Status status = seek(start, true);
    if (status == Status::OK) {
        Record rec;
        while (next(rec)) {
            if (stop && timestamp_of(rec) > *stop) break;
            out.push_back(rec);
        }
    }

    restore_(saved);
    return status;
}

} // namespace tickdb::replay
