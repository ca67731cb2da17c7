#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "tickdb/core/status.hpp"


namespace tickdb::scid {

// ============================================================================
//  RecordFile
// ----------------------------------------------------------------------------
// Read-only handle on an append-only file of fixed-size records.
//
// - Owns the file descriptor; the destructor always closes it.
// - Move-only.
// - read_records() consumes whole records only: bytes of a record that is
//   still being written stay unread, so a later call picks the record up once
//   the writer has finished it.
// ============================================================================
class RecordFile {
public:
    RecordFile() = default;
    explicit RecordFile(std::string filepath)
        : filepath_(std::move(filepath))
    {
    }

    ~RecordFile() {
        close();
    }

    RecordFile(const RecordFile&) = delete;
    RecordFile& operator=(const RecordFile&) = delete;

    RecordFile(RecordFile&& other) noexcept;
    RecordFile& operator=(RecordFile&& other) noexcept;

    // FILE_NOT_FOUND when the path does not exist, OPEN_FAILED otherwise
    [[nodiscard]] Status open() noexcept;

    void close() noexcept;

    [[nodiscard]] Status seek(uint64_t offset) noexcept;

    // Reads exactly n bytes or fails with READ_FAILED (position unchanged on failure)
    [[nodiscard]] Status read_exact(uint8_t* buf, std::size_t n) noexcept;

    // Appends up to max_records complete records between the current position
    // and the current end of file to out; returns the number of records read.
    [[nodiscard]] Status read_records(std::size_t record_len, std::size_t max_records,
                                      std::vector<uint8_t>& out, std::size_t& count);

    [[nodiscard]] Status file_size(uint64_t& out) const noexcept;

    [[nodiscard]] inline uint64_t tell() const noexcept { return position_; }
    [[nodiscard]] inline bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] inline const std::string& filepath() const noexcept { return filepath_; }

private:
    std::string filepath_;
    int fd_{-1};
    uint64_t position_{0};
};

} // namespace tickdb::scid
