#pragma once

#include <cstdint>
#include <string>

#include "tickdb/core/status.hpp"
#include "tickdb/sink/database.hpp"
#include "tickdb/etl/poll_control.hpp"


namespace tickdb::etl {

/*
===============================================================================
Tailer: resumable ingestion of one append-only record file
===============================================================================

One call tails one file:

  open → validate header → seek(start_rec) → { decode to EOF → transform →
  insert } → [ wait(poll interval) → repeat while follow ]

Result:
  • status OK      : checkpoint = start_rec + records inserted
  • status != OK   : checkpoint = start_rec (no partial credit)

FILE_NOT_FOUND is reported like any other failure; the caller decides how
loud it is. The file is never modified.
===============================================================================
*/
struct TailResult {
    Status  status     = Status::OK;
    int64_t checkpoint = 0;
};

struct TailRequest {
    std::string contract;       // sink table prefix
    std::string path;
    std::string label;          // log tag ("ESM25_FUT_CME" or "ESM25_FUT_CME.2025-04-01")
    double      price_adj = 1.0;
    int64_t     start_rec = 0;
    bool        follow    = false;
};

class Tailer {
public:
    Tailer(sink::Database& db, PollControl& control) noexcept
        : db_(db)
        , control_(control)
    {
    }

    [[nodiscard]] TailResult tail_tas(const TailRequest& req);
    [[nodiscard]] TailResult tail_depth(const TailRequest& req);

private:
    sink::Database& db_;
    PollControl& control_;
};

} // namespace tickdb::etl
