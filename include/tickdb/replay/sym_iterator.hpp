#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "tickdb/core/status.hpp"
#include "tickdb/core/records.hpp"
#include "tickdb/scid/record_file.hpp"
#include "tickdb/replay/record.hpp"


namespace tickdb::replay {

/*
===============================================================================
SymIterator: time-ordered replay of one contract and one trading date
===============================================================================

Merges {sc_root}/Data/{symbol}.scid with
{sc_root}/Data/MarketDepthData/{symbol}.{date}.depth into a single sequence
ordered by timestamp.

Buffers:
  • Both streams are decoded into in-memory buffers that only ever grow:
    pull() appends whatever the writer added since the previous pull.
  • tas_index() / depth_index() split each buffer into consumed / pending.

Ordering:
  • next() emits the pending record with the smallest timestamp.
  • On equal timestamps the depth record is emitted first.
  • When both sides are exhausted next() pulls once more before ending.

Positioning:
  • seek(ts) places the depth cursor on the first depth record >= ts, moves ts
    to that record, then places the TAS cursor on the first TAS record >= ts.
    With only one stream buffered, that stream alone is positioned.
  • When ts is past the last buffered depth record, ts falls back to that
    record's timestamp and the TAS cursor follows it, so next() may emit TAS
    records older than the requested ts.
  • range() and all() restore the cursors before returning; the buffers may
    have grown.

Both file handles are owned by the iterator and closed on destruction,
including when open() failed half way.
===============================================================================
*/
class SymIterator {
public:
    SymIterator(const std::string& sc_root, std::string symbol, std::string date, int64_t ts = 0);

    SymIterator(const SymIterator&) = delete;
    SymIterator& operator=(const SymIterator&) = delete;

    // Opens both files, validates headers, loads available records and
    // synchronizes to the initial timestamp
    [[nodiscard]] Status open();

    // Appends newly written records of both streams.
    // On failure both file positions are restored and the buffers are unchanged.
    [[nodiscard]] Status pull();

    [[nodiscard]] Status synchronize(bool update = false);

    [[nodiscard]] Status seek(int64_t ts, bool update = false) {
        ts_ = ts;
        return synchronize(update);
    }

    // false when both streams are exhausted, even after a fresh pull
    [[nodiscard]] bool next(Record& out);

    // Whole merged sequence from the first buffered record
    [[nodiscard]] Status all(Records& out);

    // Records with start <= timestamp <= stop (stop omitted: to the end)
    [[nodiscard]] Status range(int64_t start, std::optional<int64_t> stop, Records& out);

    [[nodiscard]] int64_t timestamp() const noexcept { return ts_; }
    [[nodiscard]] std::size_t tas_index() const noexcept { return tas_index_; }
    [[nodiscard]] std::size_t depth_index() const noexcept { return depth_index_; }
    [[nodiscard]] std::size_t tas_buffered() const noexcept { return tas_.size(); }
    [[nodiscard]] std::size_t depth_buffered() const noexcept { return depth_.size(); }
    [[nodiscard]] bool is_synced() const noexcept { return synced_; }
    [[nodiscard]] bool is_open() const noexcept { return tas_file_.is_open() && depth_file_.is_open(); }

    [[nodiscard]] const std::string& symbol() const noexcept { return symbol_; }
    [[nodiscard]] const std::string& date() const noexcept { return date_; }

private:
    struct Cursor {
        int64_t ts;
        std::size_t tas_index;
        std::size_t depth_index;
    };

    std::string symbol_;
    std::string date_;

    scid::RecordFile tas_file_;
    scid::RecordFile depth_file_;

    TasRecords tas_;
    DepthRecords depth_;
    std::size_t tas_index_{0};
    std::size_t depth_index_{0};
    int64_t ts_;
    bool synced_{false};

    [[nodiscard]] Cursor save_() const noexcept { return Cursor{ts_, tas_index_, depth_index_}; }
    void restore_(const Cursor& c) noexcept {
        ts_ = c.ts;
        tas_index_ = c.tas_index;
        depth_index_ = c.depth_index;
    }
};

} // namespace tickdb::replay
