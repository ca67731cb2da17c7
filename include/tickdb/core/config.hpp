#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "tickdb/core/status.hpp"


namespace tickdb::core {

// -----------------------------------------------------------------------------
// Depth resume position: record offset inside the shard of `date`
// -----------------------------------------------------------------------------
struct DepthCheckpoint {
    std::string date;           // "YYYY-MM-DD", empty = no shard ingested yet
    int64_t     rec = 0;

    bool operator==(const DepthCheckpoint&) const = default;
};

// -----------------------------------------------------------------------------
// Per-contract ingestion settings and checkpoints
// -----------------------------------------------------------------------------
struct ContractConfig {
    std::string     id;
    bool            tas_enabled   = false;
    bool            depth_enabled = false;
    double          price_adj     = 1.0;
    int64_t         checkpoint_tas = 0;
    DepthCheckpoint checkpoint_depth;
};

/*
===============================================================================
Config
===============================================================================

JSON document:

  {
    "sc_root":   "/opt/SierraChart",
    "sleep_int": 1,
    "db_path":   "/var/lib/tickdb/ticks.db",
    "contracts": {
      "ESM25_FUT_CME": {
        "tas": true, "depth": true, "price_adj": 0.01,
        "checkpoint_tas": 0,
        "checkpoint_depth": { "date": "", "rec": 0 }
      }
    }
  }

Contracts keep the order of the file; save() writes them back in that order.
Only the keys above are preserved across a load()/save() cycle.
===============================================================================
*/
struct Config {
    std::string sc_root;
    double      sleep_int = 1.0;    // seconds between tailing passes
    std::string db_path;
    std::vector<ContractConfig> contracts;

    [[nodiscard]] static Status load(const std::string& path, Config& out);
    [[nodiscard]] static Status parse(std::string_view json, Config& out);

    // Writes through a temporary file renamed over path
    [[nodiscard]] Status save(const std::string& path) const;
    [[nodiscard]] std::string to_json() const;

    [[nodiscard]] ContractConfig* find(std::string_view id) noexcept;
    [[nodiscard]] const ContractConfig* find(std::string_view id) const noexcept;
};

} // namespace tickdb::core
