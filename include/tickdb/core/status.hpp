#pragma once

#include <cstdint>


namespace tickdb {

// Status codes for every fallible tickdb operation
enum class Status : uint8_t {
    OK = 0,
    CONFIG_NOT_FOUND,
    CONFIG_INVALID,
    CONFIG_WRITE_FAILED,
    DIRECTORY_NOT_FOUND,
    FILE_NOT_FOUND,
    OPEN_FAILED,
    READ_FAILED,
    SEEK_FAILED,
    INVALID_HEADER,
    STORAGE_OPEN_FAILED,
    STORAGE_FAILED,
    CHECKPOINT_INCONSISTENT
};

// to_string for Status
[[nodiscard]] inline constexpr const char* to_string(Status status) noexcept {
    switch (status) {
        case Status::OK: return "Ok";
        case Status::CONFIG_NOT_FOUND: return "Config Not Found";
        case Status::CONFIG_INVALID: return "Config Invalid";
        case Status::CONFIG_WRITE_FAILED: return "Config Write Failed";
        case Status::DIRECTORY_NOT_FOUND: return "Directory Not Found";
        case Status::FILE_NOT_FOUND: return "File Not Found";
        case Status::OPEN_FAILED: return "Open Failed";
        case Status::READ_FAILED: return "Read Failed";
        case Status::SEEK_FAILED: return "Seek Failed";
        case Status::INVALID_HEADER: return "Invalid Header";
        case Status::STORAGE_OPEN_FAILED: return "Storage Open Failed";
        case Status::STORAGE_FAILED: return "Storage Failed";
        case Status::CHECKPOINT_INCONSISTENT: return "Checkpoint Inconsistent";
        default: return "Unknown Status";
    }
}

// -----------------------------------------------------------------------------
// Error kinds
// -----------------------------------------------------------------------------
//   ConfigError    → CONFIG_*            (fatal at startup)
//   FileNotFound   → FILE_NOT_FOUND      (soft: skip stream/shard)
//   FormatError    → INVALID_HEADER, READ_FAILED, SEEK_FAILED, OPEN_FAILED
//   StorageError   → STORAGE_*           (soft: rollback attempted)
//   CheckpointConsistencyWarning → CHECKPOINT_INCONSISTENT
// -----------------------------------------------------------------------------
[[nodiscard]] inline constexpr bool is_config_error(Status s) noexcept {
    return s == Status::CONFIG_NOT_FOUND || s == Status::CONFIG_INVALID || s == Status::CONFIG_WRITE_FAILED;
}

[[nodiscard]] inline constexpr bool is_format_error(Status s) noexcept {
    return s == Status::INVALID_HEADER || s == Status::READ_FAILED ||
           s == Status::SEEK_FAILED || s == Status::OPEN_FAILED;
}

[[nodiscard]] inline constexpr bool is_storage_error(Status s) noexcept {
    return s == Status::STORAGE_OPEN_FAILED || s == Status::STORAGE_FAILED;
}

} // namespace tickdb
