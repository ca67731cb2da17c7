#pragma once

/*
===============================================================================
tickdb: Public API Entry Point
===============================================================================

Tick data ingestion and replay for Sierra Chart intraday (.scid) and market
depth (.depth) files.

  tickdb::etl::Engine          incremental load of every configured contract
                               into the SQLite store, with resumable checkpoints
  tickdb::replay::SymIterator  time-ordered merge of one contract-date's two
                               streams, seekable and growing with the files
===============================================================================
*/

#include <tickdb/core/status.hpp>
#include <tickdb/core/records.hpp>
#include <tickdb/core/config.hpp>
#include <tickdb/core/layout.hpp>
#include <tickdb/scid/decoder.hpp>
#include <tickdb/sink/database.hpp>
#include <tickdb/etl/poll_control.hpp>
#include <tickdb/etl/engine.hpp>
#include <tickdb/replay/sym_iterator.hpp>
