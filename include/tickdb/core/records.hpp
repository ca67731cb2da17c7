#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>
#include <vector>


namespace tickdb {

// -----------------------------------------------------------------------------
// Market depth update (one record of a .depth shard)
// -----------------------------------------------------------------------------
struct DepthRecord {
    int64_t timestamp  = 0;     // microseconds, Sierra Chart epoch
    int     command    = 0;     // see scid::DepthCommand
    int     flags      = 0;     // scid::DEPTH_FLAG_END_OF_BATCH
    int     num_orders = 0;
    double  price      = 0.0;
    int64_t qty        = 0;

    bool operator==(const DepthRecord&) const = default;
};

// -----------------------------------------------------------------------------
// Time-and-sales print (one tick record of a .scid file)
// -----------------------------------------------------------------------------
struct TasRecord {
    int64_t timestamp = 0;      // microseconds, Sierra Chart epoch
    double  price     = 0.0;
    int64_t qty       = 0;
    int     side      = 0;      // TAS_SIDE_BID | TAS_SIDE_ASK

    bool operator==(const TasRecord&) const = default;
};

// Trade printed at the bid (seller initiated) / at the ask (buyer initiated)
inline constexpr int TAS_SIDE_BID = 0;
inline constexpr int TAS_SIDE_ASK = 1;

using DepthRecords = std::vector<DepthRecord>;
using TasRecords   = std::vector<TasRecord>;

// Which of the two streams a record or table belongs to
enum class StreamKind : uint8_t {
    Tas,
    Depth
};

[[nodiscard]] inline constexpr std::string_view to_string(StreamKind k) noexcept {
    return k == StreamKind::Tas ? "tas" : "depth";
}


inline std::ostream& operator<<(std::ostream& os, const DepthRecord& r) {
    return os << "[depth] {ts=" << r.timestamp
              << ", cmd=" << r.command
              << ", flags=" << r.flags
              << ", orders=" << r.num_orders
              << ", price=" << r.price
              << ", qty=" << r.qty << "}";
}

inline std::ostream& operator<<(std::ostream& os, const TasRecord& r) {
    return os << "[tas] {ts=" << r.timestamp
              << ", price=" << r.price
              << ", qty=" << r.qty
              << ", side=" << (r.side == TAS_SIDE_BID ? "bid" : "ask") << "}";
}

} // namespace tickdb
