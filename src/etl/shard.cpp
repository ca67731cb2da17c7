#include "tickdb/etl/shard.hpp"

#include <algorithm>
#include <system_error>

#include "tickdb/core/layout.hpp"
#include "lcr/log/logger.hpp"


namespace tickdb::etl {

namespace fs = std::filesystem;

Status list_depth_shards(const fs::path& dir, std::string_view contract, std::vector<DepthShard>& out) {
    out.clear();
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return Status::DIRECTORY_NOT_FOUND;
    }

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        std::error_code fec;
        if (!entry.is_regular_file(fec)) continue;

        const std::string name = entry.path().filename().string();
        std::string_view file_contract;
        std::string_view date;
        if (!core::parse_depth_filename(name, file_contract, date)) continue;
        if (file_contract != contract) continue;

        out.push_back(DepthShard{std::string(date), entry.path(), 0});
    }
    if (ec) {
        TDB_ERROR("[Depth] Error listing " << dir.string() << ": " << ec.message());
        out.clear();
        return Status::DIRECTORY_NOT_FOUND;
    }

    std::sort(out.begin(), out.end(), [](const DepthShard& a, const DepthShard& b) {
        return a.date < b.date;
    });
    return Status::OK;
}

std::vector<DepthShard> select_shards(const std::vector<DepthShard>& sorted, const core::DepthCheckpoint& checkpoint) {
    std::vector<DepthShard> selected;
    for (const auto& shard : sorted) {
        if (shard.date > checkpoint.date) {
            selected.push_back(DepthShard{shard.date, shard.path, 0});
        }
        else if (shard.date == checkpoint.date) {
            selected.push_back(DepthShard{shard.date, shard.path, checkpoint.rec});
        }
    }
    return selected;
}

} // namespace tickdb::etl
