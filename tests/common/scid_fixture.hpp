#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>
#include <unistd.h>

#include "tickdb/core/records.hpp"
#include "tickdb/core/layout.hpp"
#include "tickdb/scid/codec.hpp"
#include "tickdb/scid/constants.hpp"
#include "tickdb/scid/header.hpp"

#include "common/test_check.hpp"


namespace tickdb::test {

// -----------------------------------------------------------------------------
// Scratch Sierra Chart root
// -----------------------------------------------------------------------------
// Creates {tmp}/tickdb_{name}_{pid}_{n}/Data/MarketDepthData and removes the
// whole tree on destruction.
class ScidFixture {
public:
    explicit ScidFixture(std::string_view name) {
        static std::atomic<int> counter{0};
        root_ = std::filesystem::temp_directory_path() /
                ("tickdb_" + std::string(name) + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(core::depth_dir(root_.string()));
    }

    ~ScidFixture() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    ScidFixture(const ScidFixture&) = delete;
    ScidFixture& operator=(const ScidFixture&) = delete;

    [[nodiscard]] std::string root() const { return root_.string(); }
    [[nodiscard]] std::string db_path() const { return (root_ / "ticks.db").string(); }

    [[nodiscard]] std::string tas_path(std::string_view contract) const {
        return core::tas_path(root(), contract).string();
    }

    [[nodiscard]] std::string depth_path(std::string_view contract, std::string_view date) const {
        return core::depth_path(root(), contract, date).string();
    }

    // ---- Time and sales ----------------------------------------------------
    std::string write_tas(std::string_view contract, const TasRecords& records) const {
        const std::string path = tas_path(contract);
        std::vector<uint8_t> bytes(scid::INTRADAY_HEADER_LEN, 0);
        scid::IntradayHeader{}.serialize(bytes.data());
        write_(path, bytes, false);
        append_tas(contract, records);
        return path;
    }

    void append_tas(std::string_view contract, const TasRecords& records) const {
        std::vector<uint8_t> bytes(records.size() * scid::INTRADAY_REC_LEN);
        for (std::size_t i = 0; i < records.size(); ++i) {
            scid::encode_tas_record(records[i], bytes.data() + i * scid::INTRADAY_REC_LEN);
        }
        write_(tas_path(contract), bytes, true);
    }

    // ---- Market depth ------------------------------------------------------
    std::string write_depth(std::string_view contract, std::string_view date, const DepthRecords& records) const {
        const std::string path = depth_path(contract, date);
        std::vector<uint8_t> bytes(scid::DEPTH_HEADER_LEN, 0);
        scid::DepthHeader{}.serialize(bytes.data());
        write_(path, bytes, false);
        append_depth(contract, date, records);
        return path;
    }

    void append_depth(std::string_view contract, std::string_view date, const DepthRecords& records) const {
        std::vector<uint8_t> bytes(records.size() * scid::DEPTH_REC_LEN);
        for (std::size_t i = 0; i < records.size(); ++i) {
            scid::encode_depth_record(records[i], bytes.data() + i * scid::DEPTH_REC_LEN);
        }
        write_(depth_path(contract, date), bytes, true);
    }

    // ---- Raw bytes ---------------------------------------------------------
    void write_raw(const std::string& path, const std::vector<uint8_t>& bytes) const { write_(path, bytes, false); }
    void append_raw(const std::string& path, const std::vector<uint8_t>& bytes) const { write_(path, bytes, true); }

private:
    std::filesystem::path root_;

    static void write_(const std::string& path, const std::vector<uint8_t>& bytes, bool append) {
        std::ofstream os(path, std::ios::binary | (append ? std::ios::app : std::ios::trunc));
        TEST_CHECK(os.good());
        os.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        TEST_CHECK(os.good());
    }
};

// -----------------------------------------------------------------------------
// Record builders
// -----------------------------------------------------------------------------
inline DepthRecord depth_at(int64_t ts, double price = 100.0, int64_t qty = 1) {
    DepthRecord r;
    r.timestamp = ts;
    r.command = static_cast<int>(scid::DepthCommand::AddBidLevel);
    r.flags = 0;
    r.num_orders = 1;
    r.price = price;
    r.qty = qty;
    return r;
}

inline TasRecord tas_at(int64_t ts, double price = 100.0, int64_t qty = 1, int side = TAS_SIDE_ASK) {
    TasRecord r;
    r.timestamp = ts;
    r.price = price;
    r.qty = qty;
    r.side = side;
    return r;
}

// n depth records with distinct timestamps base, base+1, ...
inline DepthRecords depth_series(int64_t base, std::size_t n) {
    DepthRecords out;
    for (std::size_t i = 0; i < n; ++i) out.push_back(depth_at(base + static_cast<int64_t>(i)));
    return out;
}

inline TasRecords tas_series(int64_t base, std::size_t n) {
    TasRecords out;
    for (std::size_t i = 0; i < n; ++i) out.push_back(tas_at(base + static_cast<int64_t>(i)));
    return out;
}

} // namespace tickdb::test
