#include "tickdb/etl/engine.hpp"

#include <future>
#include <system_error>
#include <utility>

#include "tickdb/core/layout.hpp"
#include "lcr/log/logger.hpp"


namespace tickdb::etl {

core::DepthCheckpoint advance_depth_checkpoint(const core::DepthCheckpoint& before,
                                               const std::vector<ShardResult>& results) {
    core::DepthCheckpoint cp = before;
    for (const auto& r : results) {
        if (r.status != Status::OK) break;
        cp.date = r.date;
        cp.rec = r.rec;
    }
    return cp;
}

Status Engine::run(bool continuous) {
    auto tas = std::async(std::launch::async, [this, continuous] { return run_tas(continuous); });
    Status depth_status = run_depth(continuous);
    Status tas_status = tas.get();
    return (tas_status != Status::OK) ? tas_status : depth_status;
}

// ---------------------------------------------------------------------------
// Time and sales
// ---------------------------------------------------------------------------
Status Engine::run_tas(bool continuous) {
    struct Pending {
        core::ContractConfig* contract;
        std::future<TailResult> result;
    };
    std::vector<Pending> pending;

    for (auto& contract : config_.contracts) {
        if (!contract.tas_enabled) {
            TDB_INFO("[TAS] " << contract.id << ": TAS processing disabled, skipping.");
            continue;
        }
        TailRequest req;
        req.contract  = contract.id;
        req.path      = core::tas_path(config_.sc_root, contract.id).string();
        req.label     = contract.id;
        req.price_adj = contract.price_adj;
        req.start_rec = contract.checkpoint_tas;
        req.follow    = continuous;
        pending.push_back(Pending{&contract, std::async(std::launch::async, [this, req] {
            return tailer_.tail_tas(req);
        })});
    }

    for (auto& p : pending) {
        TailResult r = p.result.get();
        if (r.status == Status::OK && r.checkpoint != p.contract->checkpoint_tas) {
            TDB_INFO("[TAS] " << p.contract->id << ": Checkpoint " << p.contract->checkpoint_tas
                     << " -> " << r.checkpoint);
        }
        p.contract->checkpoint_tas = r.checkpoint;
    }
    return Status::OK;
}

// ---------------------------------------------------------------------------
// Market depth
// ---------------------------------------------------------------------------
std::vector<ShardResult> Engine::ingest_shards_(const core::ContractConfig& contract,
                                                const std::vector<DepthShard>& shards,
                                                bool continuous) {
    std::vector<ShardResult> results;
    results.reserve(shards.size());
    for (std::size_t i = 0; i < shards.size(); ++i) {
        const auto& shard = shards[i];
        const bool last = (i + 1 == shards.size());

        TailRequest req;
        req.contract  = contract.id;
        req.path      = shard.path.string();
        req.label     = contract.id + "." + shard.date;
        req.price_adj = contract.price_adj;
        req.start_rec = shard.start_rec;
        req.follow    = continuous && last;

        TailResult r = tailer_.tail_depth(req);
        results.push_back(ShardResult{shard.date, r.status, r.checkpoint});
        if (control_.stop_requested() && !last) {
            TDB_INFO("[Depth] " << contract.id << ": Stop requested, remaining shards left for the next run.");
            break;
        }
    }
    return results;
}

Status Engine::run_depth(bool continuous) {
    bool any_enabled = false;
    for (const auto& contract : config_.contracts) {
        if (contract.depth_enabled) {
            any_enabled = true;
            break;
        }
    }
    const auto dir = core::depth_dir(config_.sc_root);
    if (any_enabled) {
        std::error_code ec;
        if (!std::filesystem::is_directory(dir, ec)) {
            TDB_ERROR("[Depth] Depth directory not found: " << dir.string() << ", skipping depth processing.");
            return Status::DIRECTORY_NOT_FOUND;
        }
    }

    struct Pending {
        core::ContractConfig* contract;
        std::future<std::vector<ShardResult>> results;
    };
    std::vector<Pending> pending;

    for (auto& contract : config_.contracts) {
        if (!contract.depth_enabled) {
            TDB_INFO("[Depth] " << contract.id << ": Depth processing disabled, skipping.");
            continue;
        }

        std::vector<DepthShard> all;
        Status status = list_depth_shards(dir, contract.id, all);
        if (status != Status::OK) {
            TDB_ERROR("[Depth] " << contract.id << ": Cannot list " << dir.string() << " (" << to_string(status) << ")");
            continue;
        }

        auto selected = select_shards(all, contract.checkpoint_depth);
        if (selected.empty()) {
            TDB_INFO("[Depth] " << contract.id << ": No depth files to process after "
                     << (contract.checkpoint_depth.date.empty() ? "<start>" : contract.checkpoint_depth.date));
            continue;
        }
        TDB_DEBUG("[Depth] " << contract.id << ": " << selected.size() << " shard(s) from "
                  << selected.front().date << " to " << selected.back().date);

        const core::ContractConfig& ref = contract;
        pending.push_back(Pending{&contract, std::async(std::launch::async,
            [this, &ref, shards = std::move(selected), continuous] {
                return ingest_shards_(ref, shards, continuous);
            })});
    }

    // Contract by contract: one contract's shard set is resolved before the next
    for (auto& p : pending) {
        std::vector<ShardResult> results = p.results.get();
        core::ContractConfig& contract = *p.contract;
        const core::DepthCheckpoint next = advance_depth_checkpoint(contract.checkpoint_depth, results);

        for (const auto& r : results) {
            if (r.status != Status::OK) {
                TDB_WARN("[Depth] " << contract.id << ": Shard " << r.date << " failed ("
                         << to_string(r.status) << "), checkpoint not advanced past it ("
                         << to_string(Status::CHECKPOINT_INCONSISTENT) << ")");
                break;
            }
        }
        if (!(next == contract.checkpoint_depth)) {
            TDB_INFO("[Depth] " << contract.id << ": Checkpoint {" << contract.checkpoint_depth.date << ", "
                     << contract.checkpoint_depth.rec << "} -> {" << next.date << ", " << next.rec << "}");
        }
        contract.checkpoint_depth = next;
    }

    return Status::OK;
}

} // namespace tickdb::etl
