#pragma once

#include <cstdint>
#include <cstring>

#include "tickdb/core/records.hpp"
#include "tickdb/scid/constants.hpp"
#include "lcr/endian.hpp"


namespace tickdb::scid {

// -----------------------------------------------------------------------------
// Intraday record (40 bytes)
// -----------------------------------------------------------------------------
//   0: i64 datetime (us)
//   8: f32 open     - 0 for single trades
//  12: f32 high     - ask at the time of the trade
//  16: f32 low      - bid at the time of the trade
//  20: f32 close    - trade price
//  24: u32 num_trades
//  28: u32 total_volume
//  32: u32 bid_volume
//  36: u32 ask_volume
// -----------------------------------------------------------------------------
[[nodiscard]] inline TasRecord decode_tas_record(const uint8_t* p) noexcept {
    TasRecord r;
    r.timestamp = lcr::load_le<int64_t>(p + 0);
    r.price     = static_cast<double>(lcr::load_le<float>(p + 20));
    r.qty       = static_cast<int64_t>(lcr::load_le<uint32_t>(p + 28));
    r.side      = (lcr::load_le<uint32_t>(p + 32) > 0) ? TAS_SIDE_BID : TAS_SIDE_ASK;
    return r;
}

inline void encode_tas_record(const TasRecord& r, uint8_t* p) noexcept {
    std::memset(p, 0, INTRADAY_REC_LEN);
    const float px = static_cast<float>(r.price);
    const uint32_t qty = static_cast<uint32_t>(r.qty);
    lcr::store_le<int64_t>(p + 0, r.timestamp);
    lcr::store_le<float>(p + 12, px);
    lcr::store_le<float>(p + 16, px);
    lcr::store_le<float>(p + 20, px);
    lcr::store_le<uint32_t>(p + 24, 1u);
    lcr::store_le<uint32_t>(p + 28, qty);
    lcr::store_le<uint32_t>(p + 32, r.side == TAS_SIDE_BID ? qty : 0u);
    lcr::store_le<uint32_t>(p + 36, r.side == TAS_SIDE_BID ? 0u : qty);
}

// -----------------------------------------------------------------------------
// Market depth record (24 bytes)
// -----------------------------------------------------------------------------
//   0: i64 datetime (us)
//   8: u8  command
//   9: u8  flags
//  10: u16 num_orders
//  12: f32 price
//  16: u32 quantity
//  20: u32 reserved
// -----------------------------------------------------------------------------
[[nodiscard]] inline DepthRecord decode_depth_record(const uint8_t* p) noexcept {
    DepthRecord r;
    r.timestamp  = lcr::load_le<int64_t>(p + 0);
    r.command    = p[8];
    r.flags      = p[9];
    r.num_orders = lcr::load_le<uint16_t>(p + 10);
    r.price      = static_cast<double>(lcr::load_le<float>(p + 12));
    r.qty        = static_cast<int64_t>(lcr::load_le<uint32_t>(p + 16));
    return r;
}

inline void encode_depth_record(const DepthRecord& r, uint8_t* p) noexcept {
    std::memset(p, 0, DEPTH_REC_LEN);
    lcr::store_le<int64_t>(p + 0, r.timestamp);
    p[8] = static_cast<uint8_t>(r.command);
    p[9] = static_cast<uint8_t>(r.flags);
    lcr::store_le<uint16_t>(p + 10, static_cast<uint16_t>(r.num_orders));
    lcr::store_le<float>(p + 12, static_cast<float>(r.price));
    lcr::store_le<uint32_t>(p + 16, static_cast<uint32_t>(r.qty));
}

} // namespace tickdb::scid
