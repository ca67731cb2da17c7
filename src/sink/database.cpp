#include "tickdb/sink/database.hpp"

#include <sqlite3.h>

#include "lcr/log/logger.hpp"


namespace tickdb::sink {

namespace {

// Double-quoted SQL identifier (contract ids may contain '.', '-', ...)
std::string quote_ident_(std::string_view name) {
    std::string out;
    out.reserve(name.size() + 2);
    out += '"';
    for (char c : name) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

// Finalizes the statement on every exit path
class Statement {
public:
    Statement() = default;
    ~Statement() { if (stmt_) sqlite3_finalize(stmt_); }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] int prepare(sqlite3* db, const std::string& sql) noexcept {
        return sqlite3_prepare_v2(db, sql.c_str(), static_cast<int>(sql.size()), &stmt_, nullptr);
    }
    [[nodiscard]] sqlite3_stmt* get() const noexcept { return stmt_; }

private:
    sqlite3_stmt* stmt_{nullptr};
};

} // namespace


Database::~Database() {
    close();
}

std::string Database::table_name(std::string_view contract, StreamKind kind) {
    std::string out(contract);
    out += (kind == StreamKind::Depth) ? "_depth" : "_tas";
    return out;
}

Status Database::open(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) return Status::OK;
    TDB_INFO("[DB] Connecting to database: " << path);
    int rc = sqlite3_open_v2(path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        TDB_ERROR("[DB] Failed to open " << path << ": " << (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc)));
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return Status::STORAGE_OPEN_FAILED;
    }
    sqlite3_busy_timeout(db_, 1000);
    if (exec_("PRAGMA journal_mode=WAL;") != Status::OK) {
        sqlite3_close(db_);
        db_ = nullptr;
        return Status::STORAGE_OPEN_FAILED;
    }
    touched_.clear();
    return Status::OK;
}

void Database::close() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return;
    int rc = sqlite3_close(db_);
    if (rc != SQLITE_OK) {
        TDB_ERROR("[DB] Error closing database connection: " << sqlite3_errstr(rc));
        // Statements are always finalized by now; close_v2 defers if not.
        sqlite3_close_v2(db_);
    }
    db_ = nullptr;
    touched_.clear();
    TDB_DEBUG("[DB] Database connection closed.");
}

Status Database::exec_(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        TDB_ERROR("[DB] " << (err ? err : sqlite3_errstr(rc)) << " while executing: " << sql);
        sqlite3_free(err);
        return Status::STORAGE_FAILED;
    }
    return Status::OK;
}

void Database::rollback_(const std::string& table) noexcept {
    if (sqlite3_get_autocommit(db_)) return; // nothing open
    char* err = nullptr;
    if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
        TDB_ERROR("[DB] Rollback failed for " << table << ": " << (err ? err : "unknown error"));
    }
    sqlite3_free(err);
}

Status Database::ensure_table(std::string_view contract, StreamKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    return ensure_table_locked_(contract, kind);
}

Status Database::ensure_table_locked_(std::string_view contract, StreamKind kind) {
    if (!db_) return Status::STORAGE_FAILED;
    const std::string table = table_name(contract, kind);
    if (touched_.count(table)) return Status::OK;

    const std::string ident = quote_ident_(table);
    std::string ddl;
    if (kind == StreamKind::Depth) {
        ddl = "CREATE TABLE IF NOT EXISTS " + ident + " ("
              "timestamp INTEGER PRIMARY KEY, "
              "command INTEGER, "
              "flags INTEGER, "
              "num_orders INTEGER, "
              "price REAL, "
              "qty INTEGER);";
    } else {
        ddl = "CREATE TABLE IF NOT EXISTS " + ident + " ("
              "timestamp INTEGER, "
              "price REAL, "
              "qty INTEGER, "
              "side INTEGER);";
    }
    Status status = exec_(ddl);
    if (status != Status::OK) return status;
    status = exec_("CREATE INDEX IF NOT EXISTS " + quote_ident_("idx_" + table + "_ts") +
                   " ON " + ident + "(timestamp);");
    if (status != Status::OK) return status;
    touched_.insert(table);
    TDB_DEBUG("[DB] Table ready: " << table);
    return Status::OK;
}

Status Database::insert_depth(std::string_view contract, const DepthRecords& records) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        TDB_ERROR("[DB] Connection not available in insert_depth");
        return Status::STORAGE_FAILED;
    }
    Status status = ensure_table_locked_(contract, StreamKind::Depth);
    if (status != Status::OK) return status;
    if (records.empty()) return Status::OK;

    const std::string table = table_name(contract, StreamKind::Depth);
    if (exec_("BEGIN IMMEDIATE;") != Status::OK) return Status::STORAGE_FAILED;

    Statement stmt;
    int rc = stmt.prepare(db_, "INSERT OR IGNORE INTO " + quote_ident_(table) +
                               " (timestamp, command, flags, num_orders, price, qty) VALUES (?, ?, ?, ?, ?, ?);");
    for (std::size_t i = 0; rc == SQLITE_OK && i < records.size(); ++i) {
        const auto& r = records[i];
        sqlite3_stmt* s = stmt.get();
        sqlite3_bind_int64(s, 1, r.timestamp);
        sqlite3_bind_int(s, 2, r.command);
        sqlite3_bind_int(s, 3, r.flags);
        sqlite3_bind_int(s, 4, r.num_orders);
        sqlite3_bind_double(s, 5, r.price);
        sqlite3_bind_int64(s, 6, r.qty);
        rc = sqlite3_step(s);
        rc = (rc == SQLITE_DONE) ? sqlite3_reset(s) : rc;
    }
    if (rc != SQLITE_OK) {
        TDB_ERROR("[DB] Database error during insert_depth for " << table << ": " << sqlite3_errmsg(db_));
        rollback_(table);
        return Status::STORAGE_FAILED;
    }
    if (exec_("COMMIT;") != Status::OK) {
        rollback_(table);
        return Status::STORAGE_FAILED;
    }
    TDB_DEBUG("[DB] Inserted/Ignored " << records.size() << " records into " << table);
    return Status::OK;
}

Status Database::insert_tas(std::string_view contract, const TasRecords& records) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        TDB_ERROR("[DB] Connection not available in insert_tas");
        return Status::STORAGE_FAILED;
    }
    Status status = ensure_table_locked_(contract, StreamKind::Tas);
    if (status != Status::OK) return status;
    if (records.empty()) return Status::OK;

    const std::string table = table_name(contract, StreamKind::Tas);
    if (exec_("BEGIN IMMEDIATE;") != Status::OK) return Status::STORAGE_FAILED;

    Statement stmt;
    int rc = stmt.prepare(db_, "INSERT INTO " + quote_ident_(table) +
                               " (timestamp, price, qty, side) VALUES (?, ?, ?, ?);");
    for (std::size_t i = 0; rc == SQLITE_OK && i < records.size(); ++i) {
        const auto& r = records[i];
        sqlite3_stmt* s = stmt.get();
        sqlite3_bind_int64(s, 1, r.timestamp);
        sqlite3_bind_double(s, 2, r.price);
        sqlite3_bind_int64(s, 3, r.qty);
        sqlite3_bind_int(s, 4, r.side);
        rc = sqlite3_step(s);
        rc = (rc == SQLITE_DONE) ? sqlite3_reset(s) : rc;
    }
    if (rc != SQLITE_OK) {
        TDB_ERROR("[DB] Database error during insert_tas for " << table << ": " << sqlite3_errmsg(db_));
        rollback_(table);
        return Status::STORAGE_FAILED;
    }
    if (exec_("COMMIT;") != Status::OK) {
        rollback_(table);
        return Status::STORAGE_FAILED;
    }
    TDB_DEBUG("[DB] Inserted " << records.size() << " records into " << table);
    return Status::OK;
}

Status Database::row_count(std::string_view contract, StreamKind kind, int64_t& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out = 0;
    if (!db_) return Status::STORAGE_FAILED;
    const std::string table = table_name(contract, kind);
    Statement stmt;
    if (stmt.prepare(db_, "SELECT COUNT(*) FROM " + quote_ident_(table) + ";") != SQLITE_OK) {
        // Table never created: no rows
        if (sqlite3_errcode(db_) == SQLITE_ERROR) return Status::OK;
        TDB_ERROR("[DB] row_count(" << table << "): " << sqlite3_errmsg(db_));
        return Status::STORAGE_FAILED;
    }
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        TDB_ERROR("[DB] row_count(" << table << "): " << sqlite3_errmsg(db_));
        return Status::STORAGE_FAILED;
    }
    out = sqlite3_column_int64(stmt.get(), 0);
    return Status::OK;
}

} // namespace tickdb::sink
