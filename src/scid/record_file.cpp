#include "tickdb/scid/record_file.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <utility>
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>

#include "lcr/log/logger.hpp"


namespace tickdb::scid {

RecordFile::RecordFile(RecordFile&& other) noexcept
    : filepath_(std::move(other.filepath_))
    , fd_(std::exchange(other.fd_, -1))
    , position_(std::exchange(other.position_, 0))
{
}

RecordFile& RecordFile::operator=(RecordFile&& other) noexcept {
    if (this != &other) {
        close();
        filepath_ = std::move(other.filepath_);
        fd_ = std::exchange(other.fd_, -1);
        position_ = std::exchange(other.position_, 0);
    }
    return *this;
}

Status RecordFile::open() noexcept {
    if (fd_ >= 0) return Status::OK;
    fd_ = ::open(filepath_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        int err = errno;
        TDB_TRACE("[!!] open(" << filepath_ << ") failed: " << std::strerror(err));
        return (err == ENOENT) ? Status::FILE_NOT_FOUND : Status::OPEN_FAILED;
    }
    position_ = 0;
    return Status::OK;
}

void RecordFile::close() noexcept {
    if (fd_ < 0) return;
    if (::close(fd_) != 0) {
        TDB_WARN("[!!] close(" << filepath_ << ") failed: " << std::strerror(errno));
    }
    fd_ = -1;
    position_ = 0;
}

Status RecordFile::seek(uint64_t offset) noexcept {
    if (fd_ < 0) return Status::SEEK_FAILED;
    // Positions past the end are legal: the file may still grow up to them.
    position_ = offset;
    return Status::OK;
}

Status RecordFile::file_size(uint64_t& out) const noexcept {
    if (fd_ < 0) return Status::READ_FAILED;
    struct stat st{};
    if (::fstat(fd_, &st) != 0) return Status::READ_FAILED;
    out = static_cast<uint64_t>(st.st_size);
    return Status::OK;
}

Status RecordFile::read_exact(uint8_t* buf, std::size_t n) noexcept {
    if (fd_ < 0) return Status::READ_FAILED;
    std::size_t done = 0;
    while (done < n) {
        ssize_t r = ::pread(fd_, buf + done, n - done, static_cast<off_t>(position_ + done));
        if (r < 0) {
            if (errno == EINTR) continue;
            return Status::READ_FAILED;
        }
        if (r == 0) return Status::READ_FAILED; // short file
        done += static_cast<std::size_t>(r);
    }
    position_ += n;
    return Status::OK;
}

Status RecordFile::read_records(std::size_t record_len, std::size_t max_records,
                                std::vector<uint8_t>& out, std::size_t& count) {
    count = 0;
    if (fd_ < 0 || record_len == 0) return Status::READ_FAILED;
    uint64_t size = 0;
    Status status = file_size(size);
    if (status != Status::OK) return status;
    if (size <= position_) return Status::OK;

    const std::size_t available = std::min(static_cast<std::size_t>((size - position_) / record_len), max_records);
    if (available == 0) return Status::OK;

    const std::size_t first = out.size();
    const std::size_t bytes = available * record_len;
    out.resize(first + bytes);
    std::size_t done = 0;
    while (done < bytes) {
        ssize_t r = ::pread(fd_, out.data() + first + done, bytes - done, static_cast<off_t>(position_ + done));
        if (r < 0) {
            if (errno == EINTR) continue;
            out.resize(first);
            return Status::READ_FAILED;
        }
        if (r == 0) break; // truncated underneath us
        done += static_cast<std::size_t>(r);
    }
    // Keep whole records only
    const std::size_t whole = done / record_len;
    out.resize(first + whole * record_len);
    position_ += whole * record_len;
    count = whole;
    return Status::OK;
}

} // namespace tickdb::scid
