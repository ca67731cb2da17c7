#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "tickdb/core/status.hpp"
#include "tickdb/core/config.hpp"
#include "tickdb/sink/database.hpp"
#include "tickdb/etl/poll_control.hpp"
#include "tickdb/etl/shard.hpp"
#include "tickdb/etl/tailer.hpp"


namespace tickdb::etl {

// Outcome of one depth shard of a run
struct ShardResult {
    std::string date;
    Status      status = Status::OK;
    int64_t     rec    = 0;
};

// Depth checkpoint after a run: the last shard of the leading run of successful
// shards. Later shards are not credited even if they succeeded.
[[nodiscard]] core::DepthCheckpoint advance_depth_checkpoint(const core::DepthCheckpoint& before,
                                                             const std::vector<ShardResult>& results);

/*
===============================================================================
Engine: ingestion run over every configured contract
===============================================================================

Phases (run concurrently by run()):
  • TAS   : one worker per enabled contract tailing {sc_root}/Data/{id}.scid
  • Depth : one worker per enabled contract draining its selected shards in
            date order; only the last shard is followed in continuous mode

Workers never touch the configuration. Once every worker of a phase has
finished, the calling thread folds the results into the contracts'
checkpoints. Nothing is persisted here: the caller saves the configuration
after run() returns.

Continuous mode ends when PollControl::request_stop() (or signal_stop()) is
called; a one-shot run ends after one pass over every file.
===============================================================================
*/
class Engine {
public:
    Engine(core::Config& config, sink::Database& db, PollControl& control) noexcept
        : config_(config)
        , control_(control)
        , tailer_(db, control)
    {
    }

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // OK, or the first phase-level failure (DIRECTORY_NOT_FOUND).
    // Per-contract failures are logged and leave that contract's checkpoint as is.
    [[nodiscard]] Status run(bool continuous);

    [[nodiscard]] Status run_tas(bool continuous);
    [[nodiscard]] Status run_depth(bool continuous);

private:
    core::Config& config_;
    PollControl& control_;
    Tailer tailer_;

    [[nodiscard]] std::vector<ShardResult> ingest_shards_(const core::ContractConfig& contract,
                                                          const std::vector<DepthShard>& shards,
                                                          bool continuous);
};

} // namespace tickdb::etl
