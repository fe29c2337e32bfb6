#pragma once

#include "gigvault/byte_source.hpp"
#include "gigvault/completion_latch.hpp"
#include "gigvault/http.hpp"
#include "gigvault/transport.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gigvault {

constexpr const char* kTusVersion = "1.0.0";
constexpr size_t kDefaultChunkSize = 5 * 1024 * 1024;

enum class SessionStatus {
    Idle,
    Created,
    Uploading,
    Completed,
    Cancelled,
    Failed
};

const char* session_status_name(SessionStatus status);

enum class SessionErrorKind {
    None,
    Cancelled,
    Transport,   // DNS, TLS, timeout, reset
    HttpStatus,  // unexpected status from the tus server
    Protocol,    // malformed or inconsistent server response
    Io           // local file could not be read
};

const char* session_error_name(SessionErrorKind kind);

/// Snapshot of a session; mutated only by the session's own send loop.
struct UploadSessionState {
    SessionStatus status = SessionStatus::Idle;
    std::optional<std::string> upload_id;
    std::string location;
    uint64_t bytes_acked = 0;
    uint64_t total_bytes = 0;
    std::string failure_reason;
};

/// Terminal result, delivered exactly once per session.
struct SessionResult {
    SessionStatus status = SessionStatus::Failed;
    SessionErrorKind error = SessionErrorKind::None;
    int http_status = 0;
    std::string message;
    std::string response_body;

    std::string upload_id;
    std::string location;
    uint64_t bytes_acked = 0;
    uint64_t total_bytes = 0;

    bool ok() const { return status == SessionStatus::Completed; }
    bool cancelled() const { return status == SessionStatus::Cancelled; }
};

using ProgressCallback = std::function<void(uint64_t bytes_acked, uint64_t total_bytes)>;

struct SessionOptions {
    /// Creation endpoint, e.g. https://host/files/
    std::string endpoint;
    size_t chunk_size = kDefaultChunkSize;

    /// Added to every request (Authorization, Accept).
    HttpHeaders headers;

    /// Whole-request limit for one chunk; 0 = transport default.
    std::chrono::milliseconds chunk_timeout{0};

    /// Called after every acknowledged chunk with its size and duration.
    std::function<void(uint64_t bytes, double seconds)> chunk_observer;
};

/// Client side of the tus 1.0.0 core + creation protocol for one file.
///
/// start() creates the upload resource and then PATCHes the source in
/// chunk_size pieces, one in flight at a time. resume() skips creation and
/// continues from the offset reported by HEAD. The completion callback fires
/// exactly once with Completed, Cancelled or Failed; the source is closed
/// before it fires.
///
/// Driven entirely from transport callbacks, so the transport must deliver
/// completion asynchronously (never from inside start()).
class ResumableUploadSession : public std::enable_shared_from_this<ResumableUploadSession> {
public:
    using CompletionCallback = std::function<void(const SessionResult&)>;
    using Metadata = std::vector<std::pair<std::string, std::string>>;

    static std::shared_ptr<ResumableUploadSession> create(Transport& transport,
                                                          SessionOptions options,
                                                          std::shared_ptr<ByteSource> source,
                                                          Metadata metadata);

    ResumableUploadSession(const ResumableUploadSession&) = delete;
    ResumableUploadSession& operator=(const ResumableUploadSession&) = delete;

    void start(ProgressCallback on_progress, CompletionCallback on_complete);
    void resume(const std::string& location, ProgressCallback on_progress,
                CompletionCallback on_complete);

    /// Blocking forms of start()/resume().
    SessionResult upload(ProgressCallback on_progress);
    SessionResult resume_upload(const std::string& location, ProgressCallback on_progress);

    /// Abort the in-flight request and stop sending. Safe from any thread,
    /// any number of times; a no-op once the session has completed.
    void cancel();

    /// Block until the terminal result has been delivered.
    SessionResult wait() const { return latch_.wait(); }

    UploadSessionState state() const;
    bool cancel_requested() const;

    /// "k1 base64(v1),k2 base64(v2)" for the Upload-Metadata header.
    static std::string encode_metadata(const Metadata& metadata);

private:
    ResumableUploadSession(Transport& transport, SessionOptions options,
                           std::shared_ptr<ByteSource> source, Metadata metadata);

    enum class HeadPurpose { Resume, Resync };

    bool begin(ProgressCallback on_progress, CompletionCallback on_complete);
    void send_create();
    void send_next_chunk();
    void send_head(HeadPurpose purpose);

    void on_create_done(const HttpResponse& response);
    void on_chunk_done(const HttpResponse& response, uint64_t sent_from, uint64_t sent_len,
                       std::chrono::steady_clock::time_point started);
    void on_head_done(const HttpResponse& response, HeadPurpose purpose);

    /// Start a buffered request and route its result to `done`. Returns
    /// false (and finishes Cancelled) when cancel() got there first.
    bool dispatch(HttpRequest request, std::function<void(const HttpResponse&)> done);

    HttpRequest make_request(HttpMethod method, const std::string& url) const;

    void fail_from_response(const HttpResponse& response, const char* step);
    void finish(SessionResult result);
    void report_progress();

    Transport& transport_;
    const SessionOptions options_;
    std::shared_ptr<ByteSource> source_;
    const Metadata metadata_;

    ProgressCallback on_progress_;
    CompletionLatch<SessionResult> latch_;

    mutable std::mutex mutex_;
    UploadSessionState state_;
    std::shared_ptr<TransportTask> task_;
    bool started_ = false;
    bool cancel_requested_ = false;
    bool source_open_ = false;
    bool resynced_ = false;
};

}  // namespace gigvault
