#pragma once

#include "gigvault/http.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gigvault {

class Transport;

/// Server base URL plus Basic credentials injected into every request.
struct ServerEndpoint {
    std::string base_url;   // e.g. https://archive.example.org/
    std::string username;
    std::string password;

    /// base_url joined with a relative path ("api/uploads/finalize").
    std::string url_for(const std::string& path) const;

    /// Host key used by the delete-token store ("host" or "host:port").
    std::string host_key() const;

    /// Adds Authorization (when credentials are set) and Accept.
    void authorize(HttpHeaders& headers) const;
};

// ============================================================================
// Upload metadata
// ============================================================================

struct UploadMetadata {
    std::string event_date;   // yyyy-MM-dd
    std::string org_name;
    std::string event_type;
    std::string label;

    std::optional<std::string> participants;
    std::optional<std::string> keywords;
    std::optional<std::string> location;
    std::optional<std::string> rating;
    std::optional<std::string> notes;

    /// Mandatory fields trimmed, optional fields trimmed and dropped when empty.
    UploadMetadata normalized() const;

    /// Empty string when the mandatory fields are present and well formed.
    std::string validate() const;

    /// Ordered (key, value) pairs shared by tus Upload-Metadata and the
    /// multipart form: mandatory fields first, then the optional ones present.
    std::vector<std::pair<std::string, std::string>> fields() const;
};

/// True for a calendar-valid yyyy-MM-dd string.
bool is_valid_event_date(const std::string& date);

/// Today's local date as yyyy-MM-dd.
std::string today_event_date();

// ============================================================================
// Finalize
// ============================================================================

/// Server record created by finalize. delete_token is empty when the
/// server merged the upload into existing identical content.
struct FinalizeRecord {
    int64_t id = 0;
    std::string file_name;
    std::string file_type;
    std::string mime_type;
    uint64_t size_bytes = 0;
    std::string checksum_sha256;
    std::string event_date;
    std::string org_name;
    std::string event_type;
    std::string label;
    std::string delete_token;

    bool is_duplicate() const { return delete_token.empty(); }
};

/// Body of a 409 finalize response.
struct DuplicateConflict {
    int64_t existing_id = 0;
    std::string checksum_sha256;
    std::string message;
};

/// JSON body for POST api/uploads/finalize.
std::string build_finalize_body(const std::string& upload_id, const UploadMetadata& metadata);

/// @return the record, or nullopt with error set when the body is not a
/// JSON object carrying at least a numeric id.
std::optional<FinalizeRecord> parse_finalize_record(const std::string& body, std::string& error);

/// Best-effort decode of a 409 body; missing fields stay empty.
DuplicateConflict parse_duplicate_conflict(const std::string& body);

// ============================================================================
// Delete
// ============================================================================

struct DeleteResult {
    bool success = false;
    int deleted_count = 0;
    int error_count = 0;

    int http_status = 0;
    bool invalid_token = false;   // 403
    bool preflight_failed = false;
    std::string error_message;
};

/// Requests against the archive's JSON API.
class ArchiveClient {
public:
    ArchiveClient(Transport& transport, ServerEndpoint endpoint);

    HttpRequest finalize_request(const std::string& upload_id, const UploadMetadata& metadata) const;
    HttpRequest delete_request(int64_t file_id, const std::string& delete_token) const;

    /// POST api/delete. Validates file_id and token before any network I/O.
    DeleteResult delete_media(int64_t file_id, const std::string& delete_token);

    const ServerEndpoint& endpoint() const { return endpoint_; }

private:
    Transport& transport_;
    ServerEndpoint endpoint_;
};

}  // namespace gigvault
