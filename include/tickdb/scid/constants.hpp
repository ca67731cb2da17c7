#pragma once

#include <cstddef>
#include <cstdint>


namespace tickdb::scid {

// -----------------------------------------------------------------------------
// Intraday (.scid) file layout
// -----------------------------------------------------------------------------
inline constexpr std::size_t INTRADAY_HEADER_LEN = 56;
inline constexpr std::size_t INTRADAY_REC_LEN    = 40;
inline constexpr uint32_t    INTRADAY_MAGIC      = 0x44494353;   // "SCID" read little-endian
inline constexpr uint16_t    INTRADAY_VERSION    = 1;

// -----------------------------------------------------------------------------
// Market depth (.depth) file layout
// -----------------------------------------------------------------------------
inline constexpr std::size_t DEPTH_HEADER_LEN = 64;
inline constexpr std::size_t DEPTH_REC_LEN    = 24;
inline constexpr uint32_t    DEPTH_MAGIC      = 0x44444353;      // "SCDD" read little-endian
inline constexpr uint32_t    DEPTH_VERSION    = 1;

// -----------------------------------------------------------------------------
// Decoding
// -----------------------------------------------------------------------------
// Upper bound on the records read by one decode_*() call
inline constexpr std::size_t DECODE_BATCH_RECORDS = 1u << 16;

// Last record of a batch of depth updates carrying the same timestamp
inline constexpr int DEPTH_FLAG_END_OF_BATCH = 0x01;

// Depth record commands
enum class DepthCommand : uint8_t {
    NoCommand       = 0,
    ClearBook       = 1,
    AddBidLevel     = 2,
    AddAskLevel     = 3,
    ModifyBidLevel  = 4,
    ModifyAskLevel  = 5,
    DeleteBidLevel  = 6,
    DeleteAskLevel  = 7
};

[[nodiscard]] inline constexpr const char* to_string(DepthCommand c) noexcept {
    switch (c) {
        case DepthCommand::NoCommand:      return "none";
        case DepthCommand::ClearBook:      return "clear_book";
        case DepthCommand::AddBidLevel:    return "add_bid";
        case DepthCommand::AddAskLevel:    return "add_ask";
        case DepthCommand::ModifyBidLevel: return "modify_bid";
        case DepthCommand::ModifyAskLevel: return "modify_ask";
        case DepthCommand::DeleteBidLevel: return "delete_bid";
        case DepthCommand::DeleteAskLevel: return "delete_ask";
        default:                           return "unknown";
    }
}

// -----------------------------------------------------------------------------
// Timestamps
// -----------------------------------------------------------------------------
// Record timestamps are microseconds since 1899-12-30 00:00:00 UTC.
// 25569 days separate that epoch from 1970-01-01.
inline constexpr int64_t SC_EPOCH_OFFSET_US = 25569LL * 86400LL * 1000000LL;

[[nodiscard]] inline constexpr int64_t to_unix_us(int64_t sc_us) noexcept {
    return sc_us - SC_EPOCH_OFFSET_US;
}

[[nodiscard]] inline constexpr int64_t from_unix_us(int64_t unix_us) noexcept {
    return unix_us + SC_EPOCH_OFFSET_US;
}

} // namespace tickdb::scid
