#include "tickdb/scid/decoder.hpp"

#include <utility>
#include <vector>

#include "tickdb/scid/codec.hpp"
#include "tickdb/scid/header.hpp"
#include "lcr/log/logger.hpp"


namespace tickdb::scid {

namespace {

template <typename Header, std::size_t HeaderLen>
[[nodiscard]] Status read_header_(RecordFile& file) noexcept {
    uint8_t buf[HeaderLen];
    Status status = file.seek(0);
    if (status != Status::OK) return status;
    status = file.read_exact(buf, HeaderLen);
    if (status != Status::OK) {
        TDB_TRACE("[!!] Short header in " << file.filepath());
        return Status::INVALID_HEADER;
    }
    Header header;
    header.deserialize(buf);
    return header.verify();
}

template <typename Record, std::size_t RecLen, typename DecodeFn>
[[nodiscard]] Status decode_(RecordFile& file, std::vector<Record>& out, std::size_t max_records, DecodeFn decode) {
    std::vector<uint8_t> raw;
    std::size_t count = 0;
    Status status = file.read_records(RecLen, max_records, raw, count);
    if (status != Status::OK) return status;
    out.reserve(out.size() + count);
    for (std::size_t i = 0; i < count; ++i) {
        out.push_back(decode(raw.data() + i * RecLen));
    }
    return Status::OK;
}

} // namespace


Status read_tas_header(RecordFile& file) noexcept {
    return read_header_<IntradayHeader, INTRADAY_HEADER_LEN>(file);
}

Status read_depth_header(RecordFile& file) noexcept {
    return read_header_<DepthHeader, DEPTH_HEADER_LEN>(file);
}

Status decode_tas(RecordFile& file, TasRecords& out, std::size_t max_records) {
    return decode_<TasRecord, INTRADAY_REC_LEN>(file, out, max_records, decode_tas_record);
}

Status decode_depth(RecordFile& file, DepthRecords& out, std::size_t max_records) {
    return decode_<DepthRecord, DEPTH_REC_LEN>(file, out, max_records, decode_depth_record);
}

TasRecords transform(TasRecords records, double price_adj) {
    for (auto& r : records) r.price *= price_adj;
    return records;
}

DepthRecords transform(DepthRecords records, double price_adj) {
    for (auto& r : records) r.price *= price_adj;
    return records;
}

} // namespace tickdb::scid
