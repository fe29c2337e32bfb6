#include "gigvault/tus_session.hpp"
#include "gigvault/log.hpp"

#include <algorithm>
#include <cctype>

namespace gigvault {

const char* session_status_name(SessionStatus status) {
    switch (status) {
        case SessionStatus::Idle: return "idle";
        case SessionStatus::Created: return "created";
        case SessionStatus::Uploading: return "uploading";
        case SessionStatus::Completed: return "completed";
        case SessionStatus::Cancelled: return "cancelled";
        case SessionStatus::Failed: return "failed";
    }
    return "unknown";
}

const char* session_error_name(SessionErrorKind kind) {
    switch (kind) {
        case SessionErrorKind::None: return "none";
        case SessionErrorKind::Cancelled: return "cancelled";
        case SessionErrorKind::Transport: return "transport";
        case SessionErrorKind::HttpStatus: return "http-status";
        case SessionErrorKind::Protocol: return "protocol";
        case SessionErrorKind::Io: return "io";
    }
    return "unknown";
}

namespace {

std::optional<uint64_t> parse_offset_header(const HttpHeaders& headers, const char* name) {
    auto value = headers.get(name);
    if (!value) return std::nullopt;
    std::string v = trim(*value);
    if (v.empty() || !std::all_of(v.begin(), v.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    try {
        return std::stoull(v);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

std::shared_ptr<ResumableUploadSession> ResumableUploadSession::create(
    Transport& transport, SessionOptions options, std::shared_ptr<ByteSource> source,
    Metadata metadata) {
    if (!source) {
        throw std::invalid_argument("upload session requires a byte source");
    }
    if (options.chunk_size == 0) {
        throw std::invalid_argument("chunk size must be > 0");
    }
    return std::shared_ptr<ResumableUploadSession>(new ResumableUploadSession(
        transport, std::move(options), std::move(source), std::move(metadata)));
}

ResumableUploadSession::ResumableUploadSession(Transport& transport, SessionOptions options,
                                               std::shared_ptr<ByteSource> source,
                                               Metadata metadata)
    : transport_(transport)
    , options_(std::move(options))
    , source_(std::move(source))
    , metadata_(std::move(metadata)) {
    state_.total_bytes = source_->length();
}

std::string ResumableUploadSession::encode_metadata(const Metadata& metadata) {
    std::string out;
    for (const auto& [key, value] : metadata) {
        if (!out.empty()) out += ",";
        out += key;
        if (!value.empty()) {
            out += " " + base64_encode(value);
        }
    }
    return out;
}

UploadSessionState ResumableUploadSession::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool ResumableUploadSession::cancel_requested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancel_requested_;
}

// ============================================================================
// Public entry points
// ============================================================================

bool ResumableUploadSession::begin(ProgressCallback on_progress, CompletionCallback on_complete) {
    bool cancelled_early = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_early = cancel_requested_;
        if (!cancelled_early) {
            if (state_.status != SessionStatus::Idle) {
                throw std::logic_error("upload session already started");
            }
            on_progress_ = std::move(on_progress);
            started_ = true;
        }
    }
    if (cancelled_early) {
        // cancel() already delivered the terminal result
        if (on_complete) on_complete(latch_.wait());
        return false;
    }
    latch_.arm(std::move(on_complete));

    try {
        source_->open();
        std::lock_guard<std::mutex> lock(mutex_);
        source_open_ = true;
    } catch (const IoError& e) {
        SessionResult r;
        r.status = SessionStatus::Failed;
        r.error = SessionErrorKind::Io;
        r.message = e.what();
        finish(std::move(r));
        return false;
    }
    return true;
}

void ResumableUploadSession::start(ProgressCallback on_progress, CompletionCallback on_complete) {
    if (!begin(std::move(on_progress), std::move(on_complete))) return;
    send_create();
}

void ResumableUploadSession::resume(const std::string& location, ProgressCallback on_progress,
                                    CompletionCallback on_complete) {
    if (!begin(std::move(on_progress), std::move(on_complete))) return;

    auto parsed = ParsedUrl::parse(location);
    if (!parsed || parsed->last_path_segment().empty()) {
        SessionResult r;
        r.status = SessionStatus::Failed;
        r.error = SessionErrorKind::Protocol;
        r.message = "not an upload URL: " + location;
        finish(std::move(r));
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.location = location;
        state_.upload_id = parsed->last_path_segment();
        state_.status = SessionStatus::Created;
    }
    log_info("Resuming upload %s", location.c_str());
    send_head(HeadPurpose::Resume);
}

SessionResult ResumableUploadSession::upload(ProgressCallback on_progress) {
    start(std::move(on_progress), nullptr);
    return latch_.wait();
}

SessionResult ResumableUploadSession::resume_upload(const std::string& location,
                                                    ProgressCallback on_progress) {
    resume(location, std::move(on_progress), nullptr);
    return latch_.wait();
}

void ResumableUploadSession::cancel() {
    std::shared_ptr<TransportTask> task;
    bool idle = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancel_requested_) return;
        cancel_requested_ = true;
        task = task_;
        idle = !started_;
    }

    if (idle) {
        SessionResult r;
        r.status = SessionStatus::Cancelled;
        r.error = SessionErrorKind::Cancelled;
        r.message = "cancelled before start";
        finish(std::move(r));
        return;
    }
    if (task) {
        // The task's completion (Cancelled) drives the terminal result
        task->cancel();
    }
}

// ============================================================================
// Send loop
// ============================================================================

HttpRequest ResumableUploadSession::make_request(HttpMethod method, const std::string& url) const {
    HttpRequest req;
    req.method = method;
    req.url = url;
    req.headers = options_.headers;
    req.headers.set("Tus-Resumable", kTusVersion);
    return req;
}

bool ResumableUploadSession::dispatch(HttpRequest request,
                                      std::function<void(const HttpResponse&)> done) {
    auto self = shared_from_this();
    std::unique_lock<std::mutex> lock(mutex_);
    if (cancel_requested_) {
        lock.unlock();
        SessionResult r;
        r.status = SessionStatus::Cancelled;
        r.error = SessionErrorKind::Cancelled;
        r.message = "cancelled";
        finish(std::move(r));
        return false;
    }
    // Held across start() so cancel() always sees the task it must abort
    task_ = start_buffered(transport_, std::move(request),
                           [self, done = std::move(done)](HttpResponse response) {
                               // self keeps the session alive until the step completes
                               (void)self;
                               done(response);
                           });
    return true;
}

void ResumableUploadSession::send_create() {
    uint64_t total = source_->length();
    HttpRequest req = make_request(HttpMethod::POST, options_.endpoint);
    req.headers.set("Upload-Length", std::to_string(total));
    if (!metadata_.empty()) {
        req.headers.set("Upload-Metadata", encode_metadata(metadata_));
    }
    req.headers.set_content_length(0);

    log_debug("Creating upload of %llu bytes at %s", static_cast<unsigned long long>(total),
              options_.endpoint.c_str());
    dispatch(std::move(req), [this](const HttpResponse& response) { on_create_done(response); });
}

void ResumableUploadSession::on_create_done(const HttpResponse& response) {
    if (!response.error.empty() || (response.status_code != 201 && response.status_code != 200)) {
        fail_from_response(response, "create");
        return;
    }

    auto location = response.headers.get("Location");
    if (!location || trim(*location).empty()) {
        SessionResult r;
        r.status = SessionStatus::Failed;
        r.error = SessionErrorKind::Protocol;
        r.http_status = response.status_code;
        r.message = "creation response has no Location header";
        finish(std::move(r));
        return;
    }

    std::string url = resolve_url(options_.endpoint, trim(*location));
    auto parsed = ParsedUrl::parse(url);
    std::string upload_id = parsed ? parsed->last_path_segment() : "";
    if (upload_id.empty()) {
        SessionResult r;
        r.status = SessionStatus::Failed;
        r.error = SessionErrorKind::Protocol;
        r.http_status = response.status_code;
        r.message = "creation Location is not an upload URL: " + *location;
        finish(std::move(r));
        return;
    }

    uint64_t total = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.location = url;
        state_.upload_id = upload_id;
        state_.status = SessionStatus::Created;
        total = state_.total_bytes;
    }
    log_info("Upload created: %s", url.c_str());

    if (total == 0) {
        report_progress();
        SessionResult r;
        r.status = SessionStatus::Completed;
        finish(std::move(r));
        return;
    }
    send_next_chunk();
}

void ResumableUploadSession::send_next_chunk() {
    uint64_t offset = 0;
    uint64_t total = 0;
    std::string location;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        offset = state_.bytes_acked;
        total = state_.total_bytes;
        location = state_.location;
        state_.status = SessionStatus::Uploading;
    }

    size_t len = static_cast<size_t>(std::min<uint64_t>(options_.chunk_size, total - offset));
    std::vector<uint8_t> chunk(len);
    try {
        source_->seek(offset);
        size_t got = 0;
        while (got < len) {
            size_t n = source_->read(chunk.data() + got, len - got);
            if (n == 0) {
                throw IoError("file ended at offset " + std::to_string(offset + got) +
                              " of " + std::to_string(total));
            }
            got += n;
        }
    } catch (const IoError& e) {
        SessionResult r;
        r.status = SessionStatus::Failed;
        r.error = SessionErrorKind::Io;
        r.message = e.what();
        finish(std::move(r));
        return;
    }

    HttpRequest req = make_request(HttpMethod::PATCH, location);
    req.headers.set("Upload-Offset", std::to_string(offset));
    req.headers.set_content_type("application/offset+octet-stream");
    req.body = std::move(chunk);
    req.total_timeout = options_.chunk_timeout;

    auto started = std::chrono::steady_clock::now();
    dispatch(std::move(req), [this, offset, len, started](const HttpResponse& response) {
        on_chunk_done(response, offset, len, started);
    });
}

void ResumableUploadSession::on_chunk_done(const HttpResponse& response, uint64_t sent_from,
                                           uint64_t sent_len,
                                           std::chrono::steady_clock::time_point started) {
    if (response.error.empty() && response.status_code == 409) {
        bool first = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            first = !resynced_;
            resynced_ = true;
        }
        if (first) {
            log_warn("Offset mismatch at %llu; asking the server for its offset",
                     static_cast<unsigned long long>(sent_from));
            send_head(HeadPurpose::Resync);
            return;
        }
    }

    if (!response.error.empty() || (response.status_code != 204 && response.status_code != 200)) {
        fail_from_response(response, "chunk");
        return;
    }

    auto acked = parse_offset_header(response.headers, "Upload-Offset");
    uint64_t total = state().total_bytes;
    if (!acked || *acked <= sent_from || *acked > total) {
        SessionResult r;
        r.status = SessionStatus::Failed;
        r.error = SessionErrorKind::Protocol;
        r.http_status = response.status_code;
        r.message = acked
            ? "server acknowledged offset " + std::to_string(*acked) + " after sending " +
                  std::to_string(sent_len) + " bytes from " + std::to_string(sent_from) +
                  " (total " + std::to_string(total) + ")"
            : "chunk response has no valid Upload-Offset";
        finish(std::move(r));
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.bytes_acked = *acked;
        resynced_ = false;
    }

    if (options_.chunk_observer) {
        double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
        options_.chunk_observer(*acked - sent_from, secs);
    }
    report_progress();

    if (*acked == total) {
        SessionResult r;
        r.status = SessionStatus::Completed;
        finish(std::move(r));
        return;
    }
    send_next_chunk();
}

void ResumableUploadSession::send_head(HeadPurpose purpose) {
    HttpRequest req = make_request(HttpMethod::HEAD, state().location);
    dispatch(std::move(req), [this, purpose](const HttpResponse& response) {
        on_head_done(response, purpose);
    });
}

void ResumableUploadSession::on_head_done(const HttpResponse& response, HeadPurpose purpose) {
    if (!response.error.empty() || (response.status_code != 200 && response.status_code != 204)) {
        fail_from_response(response, purpose == HeadPurpose::Resume ? "resume" : "resync");
        return;
    }

    uint64_t total = state().total_bytes;
    auto offset = parse_offset_header(response.headers, "Upload-Offset");
    auto length = parse_offset_header(response.headers, "Upload-Length");

    std::string problem;
    if (!offset) {
        problem = "offset response has no valid Upload-Offset";
    } else if (*offset > total) {
        problem = "server offset " + std::to_string(*offset) + " exceeds file size " +
                  std::to_string(total);
    } else if (length && *length != total) {
        problem = "server expects " + std::to_string(*length) + " bytes but the file has " +
                  std::to_string(total);
    }
    if (!problem.empty()) {
        SessionResult r;
        r.status = SessionStatus::Failed;
        r.error = SessionErrorKind::Protocol;
        r.http_status = response.status_code;
        r.message = problem;
        finish(std::move(r));
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.bytes_acked = *offset;
    }
    log_info("Server offset %llu of %llu", static_cast<unsigned long long>(*offset),
             static_cast<unsigned long long>(total));

    if (purpose == HeadPurpose::Resume || *offset == total) {
        report_progress();
    }
    if (*offset == total) {
        SessionResult r;
        r.status = SessionStatus::Completed;
        finish(std::move(r));
        return;
    }
    send_next_chunk();
}

// ============================================================================
// Completion
// ============================================================================

void ResumableUploadSession::report_progress() {
    uint64_t acked = 0;
    uint64_t total = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        acked = state_.bytes_acked;
        total = state_.total_bytes;
    }
    if (on_progress_) {
        on_progress_(acked, total);
    }
}

void ResumableUploadSession::fail_from_response(const HttpResponse& response, const char* step) {
    SessionResult r;
    r.http_status = response.status_code;
    r.response_body = response.body_string();

    if (response.cancelled) {
        r.status = SessionStatus::Cancelled;
        r.error = SessionErrorKind::Cancelled;
        r.message = "cancelled";
    } else if (!response.error.empty()) {
        r.status = SessionStatus::Failed;
        r.error = SessionErrorKind::Transport;
        r.message = std::string(step) + " request failed: " + response.error;
    } else {
        r.status = SessionStatus::Failed;
        r.error = SessionErrorKind::HttpStatus;
        r.message = std::string(step) + " request returned HTTP " +
                    std::to_string(response.status_code);
    }
    finish(std::move(r));
}

void ResumableUploadSession::finish(SessionResult result) {
    bool close_source = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (latch_.fired()) return;

        // A cancel that raced a failure still reports as a cancellation
        if (cancel_requested_ && result.status == SessionStatus::Failed &&
            result.error == SessionErrorKind::Transport) {
            result.status = SessionStatus::Cancelled;
            result.error = SessionErrorKind::Cancelled;
            result.message = "cancelled";
        }

        state_.status = result.status;
        if (result.status == SessionStatus::Failed) {
            state_.failure_reason = result.message;
        }
        result.upload_id = state_.upload_id.value_or("");
        result.location = state_.location;
        result.bytes_acked = state_.bytes_acked;
        result.total_bytes = state_.total_bytes;
        close_source = source_open_;
        source_open_ = false;
        task_.reset();
    }

    if (close_source) {
        source_->close();
    }

    switch (result.status) {
        case SessionStatus::Completed:
            log_info("Upload %s complete (%llu bytes)", result.upload_id.c_str(),
                     static_cast<unsigned long long>(result.total_bytes));
            break;
        case SessionStatus::Cancelled:
            log_info("Upload cancelled at %llu/%llu bytes%s%s",
                     static_cast<unsigned long long>(result.bytes_acked),
                     static_cast<unsigned long long>(result.total_bytes),
                     result.location.empty() ? "" : "; resume with ",
                     result.location.c_str());
            break;
        default:
            log_error("Upload failed (%s): %s", session_error_name(result.error),
                      result.message.c_str());
            break;
    }

    latch_.fire(std::move(result));
}

}  // namespace gigvault
