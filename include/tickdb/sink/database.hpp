#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_set>

#include "tickdb/core/status.hpp"
#include "tickdb/core/records.hpp"

struct sqlite3;


namespace tickdb::sink {

/*
===============================================================================
Database: SQLite tick store (one table per contract and stream)
===============================================================================

  {contract}_depth(timestamp INTEGER PRIMARY KEY, command, flags, num_orders,
                   price REAL, qty)
  {contract}_tas  (timestamp INTEGER, price REAL, qty INTEGER, side INTEGER)

Both tables carry an index on timestamp for readers polling the live store.

Insert semantics:
  • insert_depth() deduplicates on timestamp (INSERT OR IGNORE): reloading the
    same byte range of a shard is harmless.
  • insert_tas() appends unconditionally: reloading the same range duplicates
    rows. Callers must not re-send a range they already committed.
  • Every insert call is one transaction, committed before returning. On
    failure the transaction is rolled back and STORAGE_FAILED is returned.

Threading:
  • One connection shared by all ingestion workers; every public call runs
    under an internal mutex.
  • The set of tables already created is per connection.
===============================================================================
*/
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // Opens (or creates) the store and switches it to WAL journaling
    [[nodiscard]] Status open(const std::string& path);
    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return db_ != nullptr; }

    // Idempotent: CREATE TABLE / INDEX IF NOT EXISTS, once per connection
    [[nodiscard]] Status ensure_table(std::string_view contract, StreamKind kind);

    [[nodiscard]] Status insert_depth(std::string_view contract, const DepthRecords& records);
    [[nodiscard]] Status insert_tas(std::string_view contract, const TasRecords& records);

    [[nodiscard]] Status row_count(std::string_view contract, StreamKind kind, int64_t& out);

    [[nodiscard]] static std::string table_name(std::string_view contract, StreamKind kind);

private:
    sqlite3* db_{nullptr};
    std::mutex mutex_;
    std::unordered_set<std::string> touched_;

    [[nodiscard]] Status ensure_table_locked_(std::string_view contract, StreamKind kind);
    [[nodiscard]] Status exec_(const std::string& sql);
    void rollback_(const std::string& table) noexcept;
};

} // namespace tickdb::sink
