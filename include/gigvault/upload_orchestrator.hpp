#pragma once

#include "gigvault/archive_api.hpp"
#include "gigvault/http.hpp"
#include "gigvault/transport.hpp"
#include "gigvault/tus_session.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace gigvault {

class DeleteTokenStore;
class MetricsExporter;

constexpr uint64_t kDefaultMaxUploadBytes = 6442450944ULL;  // 6 GiB

enum class UploadStrategy {
    Resumable,  // tus transfer, then POST api/uploads/finalize
    Multipart   // one streamed multipart/form-data POST
};

const char* upload_strategy_name(UploadStrategy strategy);
std::optional<UploadStrategy> parse_upload_strategy(const std::string& name);

enum class UploadStatus {
    Success,
    DuplicateMerged,  // stored, but merged into existing content; no delete token
    Cancelled,
    Failed
};

enum class UploadError {
    None,
    Preflight,
    Transport,
    Permission,         // 401 / 403
    DuplicateConflict,  // 409 from finalize
    PayloadTooLarge,    // 413
    BadRequest,         // 400 and any other unexpected status
    Protocol,           // malformed 2xx body or tus protocol violation
    Io                  // local file became unreadable
};

const char* upload_status_name(UploadStatus status);
const char* upload_error_name(UploadError error);

struct UploadOutcome {
    UploadStatus status = UploadStatus::Failed;
    UploadError error = UploadError::None;
    int http_status = 0;
    std::string message;
    std::string response_body;

    std::optional<FinalizeRecord> record;
    std::optional<DuplicateConflict> conflict;

    /// tus upload URL; set whenever a resource was created, so a cancelled
    /// or failed transfer can be resumed.
    std::string location;
    uint64_t bytes_acked = 0;
    uint64_t total_bytes = 0;

    /// Set when the local SHA-256 was compared with the server's checksum.
    std::optional<bool> checksum_verified;

    bool ok() const {
        return status == UploadStatus::Success || status == UploadStatus::DuplicateMerged;
    }
};

struct OrchestratorOptions {
    UploadStrategy strategy = UploadStrategy::Resumable;

    /// tus creation endpoint; empty means <base>/files/.
    std::string tus_endpoint;
    size_t chunk_size = kDefaultChunkSize;
    uint64_t max_upload_bytes = kDefaultMaxUploadBytes;

    /// Whole-request limit for one chunk or for the multipart POST.
    std::chrono::milliseconds resource_timeout{600000};

    /// Hash the file after a successful upload and compare it with the
    /// checksum the server reports.
    bool verify_checksum = false;
};

/// Map a non-2xx upload or finalize status onto the error taxonomy.
UploadError classify_http_status(int status);

/// Interpret a finalize (or multipart upload) response. Network failures,
/// status mapping and body decoding all land in the returned outcome.
UploadOutcome interpret_finalize_response(const HttpResponse& response);

/// Two-phase upload of one local file: bytes first (tus or multipart), then
/// registration of the upload with its metadata.
///
/// upload() and resume() block the calling thread until a terminal outcome.
/// cancel() may be called from any other thread; it aborts whichever
/// request is in flight and guarantees finalize is never sent afterwards.
/// Cancellation is sticky: later operations return Cancelled immediately.
class UploadOrchestrator {
public:
    /// metrics and store are optional.
    UploadOrchestrator(Transport& transport, ServerEndpoint endpoint, OrchestratorOptions options,
                       MetricsExporter* metrics = nullptr, DeleteTokenStore* store = nullptr);

    UploadOrchestrator(const UploadOrchestrator&) = delete;
    UploadOrchestrator& operator=(const UploadOrchestrator&) = delete;

    UploadOutcome upload(const std::filesystem::path& file, const UploadMetadata& metadata,
                         ProgressCallback on_progress);

    /// Continue an interrupted tus upload at `location`, then finalize.
    UploadOutcome resume(const std::string& location, const std::filesystem::path& file,
                         const UploadMetadata& metadata, ProgressCallback on_progress);

    void cancel();
    bool cancel_requested() const;

    /// Local checks only: metadata, file type and size. Empty when ok.
    std::string preflight(const std::filesystem::path& file, const UploadMetadata& metadata) const;

    const OrchestratorOptions& options() const { return options_; }
    std::string tus_endpoint() const;

private:
    UploadOutcome run(const std::string* resume_location, const std::filesystem::path& file,
                      const UploadMetadata& metadata, ProgressCallback on_progress);
    UploadOutcome run_resumable(const std::string* resume_location,
                                const std::filesystem::path& file,
                                const UploadMetadata& metadata, ProgressCallback on_progress);
    UploadOutcome run_multipart(const std::filesystem::path& file, const UploadMetadata& metadata,
                                ProgressCallback on_progress);

    /// Send one buffered request that cancel() can abort. Returns nullopt
    /// when cancel() got there first.
    std::optional<HttpResponse> exchange(HttpRequest request, UploadProgress on_upload_progress);

    UploadOutcome outcome_from_session(const SessionResult& result) const;
    void verify_checksum(const std::filesystem::path& file, UploadOutcome& outcome) const;
    void record_outcome(const UploadOutcome& outcome);

    Transport& transport_;
    ArchiveClient api_;
    const OrchestratorOptions options_;
    MetricsExporter* metrics_;
    DeleteTokenStore* store_;

    mutable std::mutex mutex_;
    bool cancel_requested_ = false;
    std::shared_ptr<ResumableUploadSession> session_;
    std::shared_ptr<PendingExchange> pending_;
};

}  // namespace gigvault
