#pragma once

#include <cstdint>
#include <cstring>

#include "tickdb/core/status.hpp"
#include "tickdb/scid/constants.hpp"
#include "lcr/endian.hpp"
#include "lcr/log/logger.hpp"


namespace tickdb::scid {

// Intraday file header (fixed size: 56 bytes).
//
//   0: 4B  - "SCID"
//   4: 4B  - header size (56)
//   8: 4B  - record size (40)
//  12: 2B  - version
//  14: 2B  - unused
//  16: 4B  - UTC start index
//  20: 36B - reserved
struct IntradayHeader {
    uint32_t magic           = INTRADAY_MAGIC;
    uint32_t header_size     = INTRADAY_HEADER_LEN;
    uint32_t record_size     = INTRADAY_REC_LEN;
    uint16_t version         = INTRADAY_VERSION;
    uint32_t utc_start_index = 0;

    inline void deserialize(const uint8_t* p) noexcept {
        magic           = lcr::load_le<uint32_t>(p + 0);
        header_size     = lcr::load_le<uint32_t>(p + 4);
        record_size     = lcr::load_le<uint32_t>(p + 8);
        version         = lcr::load_le<uint16_t>(p + 12);
        utc_start_index = lcr::load_le<uint32_t>(p + 16);
    }

    inline void serialize(uint8_t* p) const noexcept {
        std::memset(p, 0, INTRADAY_HEADER_LEN);
        lcr::store_le<uint32_t>(p + 0, magic);
        lcr::store_le<uint32_t>(p + 4, header_size);
        lcr::store_le<uint32_t>(p + 8, record_size);
        lcr::store_le<uint16_t>(p + 12, version);
        lcr::store_le<uint32_t>(p + 16, utc_start_index);
    }

    [[nodiscard]] inline Status verify() const noexcept {
        if (magic != INTRADAY_MAGIC) {
            TDB_DEBUG("[!!] Invalid SCID magic: expected " << std::hex << INTRADAY_MAGIC << ", found " << magic << std::dec);
            return Status::INVALID_HEADER;
        }
        if (header_size != INTRADAY_HEADER_LEN || record_size != INTRADAY_REC_LEN) {
            TDB_DEBUG("[!!] Unexpected SCID layout: header=" << header_size << " record=" << record_size);
            return Status::INVALID_HEADER;
        }
        return Status::OK;
    }
};


// Market depth file header (fixed size: 64 bytes).
//
//   0: 4B  - "SCDD"
//   4: 4B  - header size (64)
//   8: 4B  - record size (24)
//  12: 4B  - version
//  16: 48B - reserved
struct DepthHeader {
    uint32_t magic       = DEPTH_MAGIC;
    uint32_t header_size = DEPTH_HEADER_LEN;
    uint32_t record_size = DEPTH_REC_LEN;
    uint32_t version     = DEPTH_VERSION;

    inline void deserialize(const uint8_t* p) noexcept {
        magic       = lcr::load_le<uint32_t>(p + 0);
        header_size = lcr::load_le<uint32_t>(p + 4);
        record_size = lcr::load_le<uint32_t>(p + 8);
        version     = lcr::load_le<uint32_t>(p + 12);
    }

    inline void serialize(uint8_t* p) const noexcept {
        std::memset(p, 0, DEPTH_HEADER_LEN);
        lcr::store_le<uint32_t>(p + 0, magic);
        lcr::store_le<uint32_t>(p + 4, header_size);
        lcr::store_le<uint32_t>(p + 8, record_size);
        lcr::store_le<uint32_t>(p + 12, version);
    }

    [[nodiscard]] inline Status verify() const noexcept {
        if (magic != DEPTH_MAGIC) {
            TDB_DEBUG("[!!] Invalid depth magic: expected " << std::hex << DEPTH_MAGIC << ", found " << magic << std::dec);
            return Status::INVALID_HEADER;
        }
        if (header_size != DEPTH_HEADER_LEN || record_size != DEPTH_REC_LEN) {
            TDB_DEBUG("[!!] Unexpected depth layout: header=" << header_size << " record=" << record_size);
            return Status::INVALID_HEADER;
        }
        return Status::OK;
    }
};

} // namespace tickdb::scid
