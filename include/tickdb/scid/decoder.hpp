#pragma once

#include <cstddef>
#include <cstdint>

#include "tickdb/core/status.hpp"
#include "tickdb/core/records.hpp"
#include "tickdb/scid/constants.hpp"
#include "tickdb/scid/record_file.hpp"

/*
================================================================================
Sierra Chart Record Decoder
================================================================================

Turns the raw bytes of the two Sierra Chart stream files into typed records.

  .scid   → TasRecord    (header 56 B, record 40 B)
  .depth  → DepthRecord  (header 64 B, record 24 B)

Contract:
  • read_*_header() must be called on a freshly opened file; on success the
    file is positioned just past the header.
  • decode_*() appends the complete records from the current position to the
    current end of file, at most max_records of them, and leaves the position
    after the last one. Fewer than max_records appended means EOF was reached.
  • A trailing partial record is never decoded.
  • The input files are never modified.

Record offsets used by checkpoints translate to byte offsets through
tas_offset() / depth_offset().
================================================================================
*/

namespace tickdb::scid {

[[nodiscard]] Status read_tas_header(RecordFile& file) noexcept;
[[nodiscard]] Status read_depth_header(RecordFile& file) noexcept;

[[nodiscard]] Status decode_tas(RecordFile& file, TasRecords& out,
                                std::size_t max_records = DECODE_BATCH_RECORDS);
[[nodiscard]] Status decode_depth(RecordFile& file, DepthRecords& out,
                                  std::size_t max_records = DECODE_BATCH_RECORDS);

// Scales every price by price_adj
[[nodiscard]] TasRecords transform(TasRecords records, double price_adj);
[[nodiscard]] DepthRecords transform(DepthRecords records, double price_adj);

[[nodiscard]] inline constexpr uint64_t tas_offset(int64_t rec) noexcept {
    return INTRADAY_HEADER_LEN + static_cast<uint64_t>(rec) * INTRADAY_REC_LEN;
}

[[nodiscard]] inline constexpr uint64_t depth_offset(int64_t rec) noexcept {
    return DEPTH_HEADER_LEN + static_cast<uint64_t>(rec) * DEPTH_REC_LEN;
}

// Inverse of the above: whole records between the header and a byte position
[[nodiscard]] inline constexpr int64_t tas_record_index(uint64_t pos) noexcept {
    return pos <= INTRADAY_HEADER_LEN ? 0 : static_cast<int64_t>((pos - INTRADAY_HEADER_LEN) / INTRADAY_REC_LEN);
}

[[nodiscard]] inline constexpr int64_t depth_record_index(uint64_t pos) noexcept {
    return pos <= DEPTH_HEADER_LEN ? 0 : static_cast<int64_t>((pos - DEPTH_HEADER_LEN) / DEPTH_REC_LEN);
}

} // namespace tickdb::scid
