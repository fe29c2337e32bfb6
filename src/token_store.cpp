#include "gigvault/token_store.hpp"
#include "gigvault/archive_api.hpp"
#include "gigvault/log.hpp"

#include <chrono>
#include <cstdlib>
#include <sqlite3.h>
#include <stdexcept>
#include <thread>

namespace gigvault {

namespace {

constexpr const char* TOKEN_SCHEMA = R"(
CREATE TABLE IF NOT EXISTS delete_tokens (
    host TEXT NOT NULL,
    file_id INTEGER NOT NULL,
    delete_token TEXT NOT NULL,
    created_at INTEGER NOT NULL,
    event_date TEXT NOT NULL DEFAULT '',
    org_name TEXT NOT NULL DEFAULT '',
    event_type TEXT NOT NULL DEFAULT '',
    label TEXT NOT NULL DEFAULT '',
    file_name TEXT NOT NULL DEFAULT '',
    file_type TEXT NOT NULL DEFAULT '',
    PRIMARY KEY (host, file_id)
) WITHOUT ROWID;

CREATE INDEX IF NOT EXISTS idx_host_created
    ON delete_tokens(host, created_at DESC);
)";

constexpr const char* SELECT_COLUMNS =
    "SELECT host, file_id, delete_token, created_at, event_date, org_name, "
    "event_type, label, file_name, file_type FROM delete_tokens ";

int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// Execute a SQL statement with retry on SQLITE_BUSY
bool sql_exec(sqlite3* db, const char* sql) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        if (rc == SQLITE_OK) return true;
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            if (err) sqlite3_free(err);
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
            continue;
        }
        if (err) {
            log_error("SQL error: %s (rc=%d)", err, rc);
            sqlite3_free(err);
        }
        return false;
    }
    log_error("SQL timed out after retries");
    return false;
}

// Step a prepared statement with SQLITE_BUSY retry
int sql_step_retry(sqlite3_stmt* stmt) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED) return rc;
        sqlite3_reset(stmt);
        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
    }
    return SQLITE_BUSY;
}

std::string column_string(sqlite3_stmt* stmt, int col) {
    auto text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

void prepare(sqlite3* db, const std::string& sql, sqlite3_stmt** stmt) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Cannot prepare statement: " + std::string(sqlite3_errmsg(db)));
    }
}

}  // namespace

StoredUpload StoredUpload::from_record(const std::string& host, const FinalizeRecord& record) {
    StoredUpload e;
    e.host = host;
    e.file_id = record.id;
    e.delete_token = record.delete_token;
    e.created_at = now_epoch_ms();
    e.event_date = record.event_date;
    e.org_name = record.org_name;
    e.event_type = record.event_type;
    e.label = record.label;
    e.file_name = record.file_name;
    e.file_type = record.file_type;
    return e;
}

DeleteTokenStore::DeleteTokenStore(const std::filesystem::path& db_path) {
    if (db_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(db_path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Cannot create " + db_path.parent_path().string() + ": " +
                                     ec.message());
        }
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot open token store " + db_path.string() + ": " + msg);
    }

    sql_exec(db_, "PRAGMA journal_mode=WAL");
    sql_exec(db_, "PRAGMA busy_timeout=5000");
    if (!sql_exec(db_, TOKEN_SCHEMA)) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot create token store schema in " + db_path.string());
    }

    try {
        prepare(db_,
            "INSERT OR REPLACE INTO delete_tokens (host, file_id, delete_token, created_at, "
            "event_date, org_name, event_type, label, file_name, file_type) "
            "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)",
            &stmt_upsert_);
        prepare(db_, std::string(SELECT_COLUMNS) +
            "WHERE host = ?1 ORDER BY created_at DESC, file_id DESC", &stmt_list_);
        prepare(db_, std::string(SELECT_COLUMNS) +
            "ORDER BY host ASC, created_at DESC, file_id DESC", &stmt_list_all_);
        prepare(db_, std::string(SELECT_COLUMNS) +
            "WHERE host = ?1 AND file_id = ?2", &stmt_find_);
        prepare(db_, "DELETE FROM delete_tokens WHERE host = ?1 AND file_id = ?2", &stmt_remove_);
        prepare(db_, "DELETE FROM delete_tokens WHERE host = ?1", &stmt_clear_);
    } catch (const std::exception&) {
        close_handles();
        throw;
    }
}

DeleteTokenStore::~DeleteTokenStore() {
    close_handles();
}

void DeleteTokenStore::close_handles() {
    for (sqlite3_stmt** stmt : {&stmt_upsert_, &stmt_list_, &stmt_list_all_, &stmt_find_,
                                &stmt_remove_, &stmt_clear_}) {
        if (*stmt) {
            sqlite3_finalize(*stmt);
            *stmt = nullptr;
        }
    }
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

std::filesystem::path DeleteTokenStore::default_path() {
    const char* home = std::getenv("HOME");
    std::filesystem::path base = (home && *home) ? std::filesystem::path(home) : std::filesystem::path(".");
    return base / ".gigvault" / "tokens.db";
}

bool DeleteTokenStore::upsert(const StoredUpload& entry) {
    std::lock_guard lock(mutex_);
    sqlite3_reset(stmt_upsert_);
    sqlite3_bind_text(stmt_upsert_, 1, entry.host.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt_upsert_, 2, entry.file_id);
    sqlite3_bind_text(stmt_upsert_, 3, entry.delete_token.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt_upsert_, 4, entry.created_at);
    sqlite3_bind_text(stmt_upsert_, 5, entry.event_date.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_upsert_, 6, entry.org_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_upsert_, 7, entry.event_type.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_upsert_, 8, entry.label.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_upsert_, 9, entry.file_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_upsert_, 10, entry.file_type.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sql_step_retry(stmt_upsert_);
    if (rc != SQLITE_DONE) {
        log_error("Failed to store delete token for %s/%lld: %s", entry.host.c_str(),
                  static_cast<long long>(entry.file_id), sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<StoredUpload> DeleteTokenStore::collect(sqlite3_stmt* stmt) const {
    std::vector<StoredUpload> out;
    while (sql_step_retry(stmt) == SQLITE_ROW) {
        StoredUpload e;
        e.host = column_string(stmt, 0);
        e.file_id = sqlite3_column_int64(stmt, 1);
        e.delete_token = column_string(stmt, 2);
        e.created_at = sqlite3_column_int64(stmt, 3);
        e.event_date = column_string(stmt, 4);
        e.org_name = column_string(stmt, 5);
        e.event_type = column_string(stmt, 6);
        e.label = column_string(stmt, 7);
        e.file_name = column_string(stmt, 8);
        e.file_type = column_string(stmt, 9);
        out.push_back(std::move(e));
    }
    return out;
}

std::vector<StoredUpload> DeleteTokenStore::list(const std::string& host) const {
    std::lock_guard lock(mutex_);
    sqlite3_reset(stmt_list_);
    sqlite3_bind_text(stmt_list_, 1, host.c_str(), -1, SQLITE_TRANSIENT);
    return collect(stmt_list_);
}

std::vector<StoredUpload> DeleteTokenStore::list_all() const {
    std::lock_guard lock(mutex_);
    sqlite3_reset(stmt_list_all_);
    return collect(stmt_list_all_);
}

bool DeleteTokenStore::find(const std::string& host, int64_t file_id, StoredUpload& out) const {
    std::lock_guard lock(mutex_);
    sqlite3_reset(stmt_find_);
    sqlite3_bind_text(stmt_find_, 1, host.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt_find_, 2, file_id);
    auto rows = collect(stmt_find_);
    if (rows.empty()) return false;
    out = std::move(rows.front());
    return true;
}

bool DeleteTokenStore::remove(const std::string& host, int64_t file_id) {
    std::lock_guard lock(mutex_);
    sqlite3_reset(stmt_remove_);
    sqlite3_bind_text(stmt_remove_, 1, host.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt_remove_, 2, file_id);
    if (sql_step_retry(stmt_remove_) != SQLITE_DONE) {
        log_error("Failed to remove delete token %s/%lld: %s", host.c_str(),
                  static_cast<long long>(file_id), sqlite3_errmsg(db_));
        return false;
    }
    return sqlite3_changes(db_) > 0;
}

bool DeleteTokenStore::clear(const std::string& host) {
    std::lock_guard lock(mutex_);
    sqlite3_reset(stmt_clear_);
    sqlite3_bind_text(stmt_clear_, 1, host.c_str(), -1, SQLITE_TRANSIENT);
    if (sql_step_retry(stmt_clear_) != SQLITE_DONE) {
        log_error("Failed to clear delete tokens for %s: %s", host.c_str(), sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

}  // namespace gigvault
