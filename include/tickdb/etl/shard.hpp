#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "tickdb/core/status.hpp"
#include "tickdb/core/config.hpp"


namespace tickdb::etl {

// One day of depth updates for one contract
struct DepthShard {
    std::string           date;         // "YYYY-MM-DD"
    std::filesystem::path path;
    int64_t               start_rec = 0;  // first record to ingest
};

// Lists "{contract}.{YYYY-MM-DD}.depth" files of dir, sorted by date ascending.
// DIRECTORY_NOT_FOUND when dir does not exist.
[[nodiscard]] Status list_depth_shards(const std::filesystem::path& dir, std::string_view contract,
                                       std::vector<DepthShard>& out);

// Keeps the shard of the checkpoint date (resuming at checkpoint.rec) and every
// later shard (from record 0). Input must be sorted by date.
[[nodiscard]] std::vector<DepthShard> select_shards(const std::vector<DepthShard>& sorted,
                                                    const core::DepthCheckpoint& checkpoint);

} // namespace tickdb::etl
