#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace gigvault {

struct FinalizeRecord;

/// One locally remembered upload and the token that can delete it.
struct StoredUpload {
    std::string host;
    int64_t file_id = 0;
    std::string delete_token;
    int64_t created_at = 0;  // epoch milliseconds
    std::string event_date;
    std::string org_name;
    std::string event_type;
    std::string label;
    std::string file_name;
    std::string file_type;

    static StoredUpload from_record(const std::string& host, const FinalizeRecord& record);
};

/// Per-host persistence of delete tokens, backed by SQLite.
///
/// Rows are keyed by (host, file_id); upsert replaces an existing row and
/// list() returns newest first. All methods are thread-safe.
class DeleteTokenStore {
public:
    /// @throws std::runtime_error if the database cannot be opened.
    explicit DeleteTokenStore(const std::filesystem::path& db_path);
    ~DeleteTokenStore();

    DeleteTokenStore(const DeleteTokenStore&) = delete;
    DeleteTokenStore& operator=(const DeleteTokenStore&) = delete;

    bool upsert(const StoredUpload& entry);
    std::vector<StoredUpload> list(const std::string& host) const;
    std::vector<StoredUpload> list_all() const;
    bool find(const std::string& host, int64_t file_id, StoredUpload& out) const;
    bool remove(const std::string& host, int64_t file_id);
    bool clear(const std::string& host);

    /// ~/.gigvault/tokens.db (or ./.gigvault/tokens.db without HOME).
    static std::filesystem::path default_path();

private:
    void close_handles();
    std::vector<StoredUpload> collect(sqlite3_stmt* stmt) const;

    mutable std::mutex mutex_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_upsert_ = nullptr;
    sqlite3_stmt* stmt_list_ = nullptr;
    sqlite3_stmt* stmt_list_all_ = nullptr;
    sqlite3_stmt* stmt_find_ = nullptr;
    sqlite3_stmt* stmt_remove_ = nullptr;
    sqlite3_stmt* stmt_clear_ = nullptr;
};

}  // namespace gigvault
