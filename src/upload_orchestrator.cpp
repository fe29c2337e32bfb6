#include "gigvault/upload_orchestrator.hpp"
#include "gigvault/checksum.hpp"
#include "gigvault/chunk_source.hpp"
#include "gigvault/log.hpp"
#include "gigvault/media_types.hpp"
#include "gigvault/metrics.hpp"
#include "gigvault/multipart_stream.hpp"
#include "gigvault/token_store.hpp"

#include <algorithm>
#include <cctype>

namespace gigvault {

const char* upload_strategy_name(UploadStrategy strategy) {
    switch (strategy) {
        case UploadStrategy::Resumable: return "resumable";
        case UploadStrategy::Multipart: return "multipart";
    }
    return "unknown";
}

std::optional<UploadStrategy> parse_upload_strategy(const std::string& name) {
    std::string n = trim(name);
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c) { return std::tolower(c); });
    if (n == "resumable" || n == "tus") return UploadStrategy::Resumable;
    if (n == "multipart") return UploadStrategy::Multipart;
    return std::nullopt;
}

const char* upload_status_name(UploadStatus status) {
    switch (status) {
        case UploadStatus::Success: return "success";
        case UploadStatus::DuplicateMerged: return "duplicate";
        case UploadStatus::Cancelled: return "cancelled";
        case UploadStatus::Failed: return "failed";
    }
    return "unknown";
}

const char* upload_error_name(UploadError error) {
    switch (error) {
        case UploadError::None: return "none";
        case UploadError::Preflight: return "preflight";
        case UploadError::Transport: return "transport";
        case UploadError::Permission: return "permission";
        case UploadError::DuplicateConflict: return "duplicate-conflict";
        case UploadError::PayloadTooLarge: return "payload-too-large";
        case UploadError::BadRequest: return "bad-request";
        case UploadError::Protocol: return "protocol";
        case UploadError::Io: return "io";
    }
    return "unknown";
}

UploadError classify_http_status(int status) {
    switch (status) {
        case 401:
        case 403:
            return UploadError::Permission;
        case 409:
            return UploadError::DuplicateConflict;
        case 413:
            return UploadError::PayloadTooLarge;
        default:
            return UploadError::BadRequest;
    }
}

namespace {

UploadOutcome failed(UploadError error, std::string message) {
    UploadOutcome o;
    o.status = UploadStatus::Failed;
    o.error = error;
    o.message = std::move(message);
    return o;
}

UploadOutcome cancelled_outcome() {
    UploadOutcome o;
    o.status = UploadStatus::Cancelled;
    o.message = "cancelled";
    return o;
}

std::string status_message(int status, const std::string& body) {
    std::string text = trim(body);
    if (text.size() > 512) text = text.substr(0, 512) + "...";
    std::string msg = "HTTP " + std::to_string(status);
    if (!text.empty()) msg += ": " + text;
    return msg;
}

}  // namespace

UploadOutcome interpret_finalize_response(const HttpResponse& response) {
    if (response.cancelled) {
        return cancelled_outcome();
    }
    if (!response.error.empty()) {
        return failed(UploadError::Transport, "finalize request failed: " + response.error);
    }

    UploadOutcome o;
    o.http_status = response.status_code;
    o.response_body = response.body_string();

    if (!response.ok()) {
        o.status = UploadStatus::Failed;
        o.error = classify_http_status(response.status_code);
        if (o.error == UploadError::DuplicateConflict) {
            o.conflict = parse_duplicate_conflict(o.response_body);
            o.message = "content already stored as file " +
                        std::to_string(o.conflict->existing_id);
            if (!o.conflict->message.empty()) o.message += ": " + o.conflict->message;
        } else if (o.error == UploadError::Permission) {
            o.message = "not permitted (HTTP " + std::to_string(response.status_code) + ")";
        } else {
            o.message = status_message(response.status_code, o.response_body);
        }
        return o;
    }

    std::string error;
    auto record = parse_finalize_record(o.response_body, error);
    if (!record) {
        o.status = UploadStatus::Failed;
        o.error = UploadError::Protocol;
        o.message = error;
        return o;
    }

    o.status = record->is_duplicate() ? UploadStatus::DuplicateMerged : UploadStatus::Success;
    o.record = std::move(record);
    return o;
}

// ============================================================================
// UploadOrchestrator
// ============================================================================

UploadOrchestrator::UploadOrchestrator(Transport& transport, ServerEndpoint endpoint,
                                       OrchestratorOptions options, MetricsExporter* metrics,
                                       DeleteTokenStore* store)
    : transport_(transport)
    , api_(transport, std::move(endpoint))
    , options_(std::move(options))
    , metrics_(metrics)
    , store_(store) {}

std::string UploadOrchestrator::tus_endpoint() const {
    if (!options_.tus_endpoint.empty()) return options_.tus_endpoint;
    return api_.endpoint().url_for("files/");
}

void UploadOrchestrator::cancel() {
    std::shared_ptr<ResumableUploadSession> session;
    std::shared_ptr<PendingExchange> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancel_requested_) return;
        cancel_requested_ = true;
        session = session_;
        pending = pending_;
    }
    log_info("Cancelling upload");
    if (session) session->cancel();
    if (pending) pending->cancel();
}

bool UploadOrchestrator::cancel_requested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancel_requested_;
}

std::string UploadOrchestrator::preflight(const std::filesystem::path& file,
                                          const UploadMetadata& metadata) const {
    std::string err = metadata.validate();
    if (!err.empty()) return err;

    std::error_code ec;
    auto status = std::filesystem::status(file, ec);
    if (ec || !std::filesystem::exists(status)) {
        return "file not found: " + file.string();
    }
    if (!std::filesystem::is_regular_file(status)) {
        return "not a regular file: " + file.string();
    }
    uint64_t size = std::filesystem::file_size(file, ec);
    if (ec) {
        return "cannot stat " + file.string() + ": " + ec.message();
    }
    if (size > options_.max_upload_bytes) {
        return "file is " + std::to_string(size) + " bytes; the limit is " +
               std::to_string(options_.max_upload_bytes);
    }
    return {};
}

UploadOutcome UploadOrchestrator::upload(const std::filesystem::path& file,
                                         const UploadMetadata& metadata,
                                         ProgressCallback on_progress) {
    return run(nullptr, file, metadata, std::move(on_progress));
}

UploadOutcome UploadOrchestrator::resume(const std::string& location,
                                         const std::filesystem::path& file,
                                         const UploadMetadata& metadata,
                                         ProgressCallback on_progress) {
    return run(&location, file, metadata, std::move(on_progress));
}

UploadOutcome UploadOrchestrator::run(const std::string* resume_location,
                                      const std::filesystem::path& file,
                                      const UploadMetadata& metadata,
                                      ProgressCallback on_progress) {
    auto started = std::chrono::steady_clock::now();

    UploadOutcome outcome;
    std::string err = preflight(file, metadata);
    if (!err.empty()) {
        outcome = failed(UploadError::Preflight, err);
    } else if (cancel_requested()) {
        outcome = cancelled_outcome();
    } else if (resume_location || options_.strategy == UploadStrategy::Resumable) {
        outcome = run_resumable(resume_location, file, metadata, std::move(on_progress));
    } else {
        outcome = run_multipart(file, metadata, std::move(on_progress));
    }

    if (outcome.ok() && options_.verify_checksum) {
        verify_checksum(file, outcome);
    }

    if (metrics_ && outcome.error != UploadError::Preflight) {
        metrics_->upload_duration().Observe(
            std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count());
    }
    record_outcome(outcome);
    return outcome;
}

std::optional<HttpResponse> UploadOrchestrator::exchange(HttpRequest request,
                                                         UploadProgress on_upload_progress) {
    std::shared_ptr<PendingExchange> pending;
    {
        // Held across start() so cancel() always sees the exchange it must abort
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancel_requested_) return std::nullopt;
        pending_ = PendingExchange::start(transport_, std::move(request),
                                          std::move(on_upload_progress));
        pending = pending_;
    }
    HttpResponse response = pending->wait();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.reset();
    }
    if (metrics_ && !response.cancelled) {
        metrics_->finalize_status(response.error.empty() ? response.status_code : 0).Increment();
    }
    return response;
}

UploadOutcome UploadOrchestrator::run_resumable(const std::string* resume_location,
                                                const std::filesystem::path& file,
                                                const UploadMetadata& metadata,
                                                ProgressCallback on_progress) {
    std::shared_ptr<ChunkSource> source;
    try {
        source = std::make_shared<ChunkSource>(file);
    } catch (const IoError& e) {
        return failed(UploadError::Io, e.what());
    }

    std::string file_name = file.filename().string();
    ResumableUploadSession::Metadata tus_metadata = {
        {"filename", file_name},
        {"filetype", guess_mime_type(file_name)},
    };
    for (auto& field : metadata.fields()) {
        tus_metadata.push_back(std::move(field));
    }

    SessionOptions session_options;
    session_options.endpoint = tus_endpoint();
    session_options.chunk_size = options_.chunk_size;
    session_options.chunk_timeout = options_.resource_timeout;
    api_.endpoint().authorize(session_options.headers);
    if (metrics_) {
        MetricsExporter* metrics = metrics_;
        session_options.chunk_observer = [metrics](uint64_t bytes, double seconds) {
            metrics->upload_chunks_total().Increment();
            metrics->upload_bytes_total().Increment(static_cast<double>(bytes));
            metrics->chunk_duration().Observe(seconds);
        };
    }

    auto session = ResumableUploadSession::create(transport_, std::move(session_options), source,
                                                  std::move(tus_metadata));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancel_requested_) return cancelled_outcome();
        session_ = session;
    }

    log_info("Uploading %s (%llu bytes) to %s", file.c_str(),
             static_cast<unsigned long long>(source->length()), tus_endpoint().c_str());
    SessionResult result = resume_location
        ? session->resume_upload(*resume_location, std::move(on_progress))
        : session->upload(std::move(on_progress));

    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_.reset();
    }

    if (!result.ok()) {
        return outcome_from_session(result);
    }

    // The transfer finished; a cancel that lands now still stops finalize
    auto response = exchange(api_.finalize_request(result.upload_id, metadata), nullptr);
    UploadOutcome outcome = response ? interpret_finalize_response(*response) : cancelled_outcome();
    outcome.location = result.location;
    outcome.bytes_acked = result.bytes_acked;
    outcome.total_bytes = result.total_bytes;
    return outcome;
}

UploadOutcome UploadOrchestrator::run_multipart(const std::filesystem::path& file,
                                                const UploadMetadata& metadata,
                                                ProgressCallback on_progress) {
    std::shared_ptr<ChunkSource> source;
    try {
        source = std::make_shared<ChunkSource>(file);
    } catch (const IoError& e) {
        return failed(UploadError::Io, e.what());
    }

    MultipartFilePart part;
    part.file_name = file.filename().string();
    part.mime_type = guess_mime_type(part.file_name);
    part.source = source;
    auto body = std::make_shared<MultipartBodyStream>(MultipartBodyStream::make_boundary(),
                                                      metadata.fields(), std::move(part));

    HttpRequest req;
    req.method = HttpMethod::POST;
    req.url = api_.endpoint().url_for("api/uploads.php?ui=json");
    api_.endpoint().authorize(req.headers);
    req.headers.set_content_type(body->content_type());
    req.headers.set_content_length(body->content_length());
    req.body_source = body;
    req.total_timeout = options_.resource_timeout;

    uint64_t file_size = source->length();
    log_info("Uploading %s (%llu bytes, multipart body %llu bytes) to %s", file.c_str(),
             static_cast<unsigned long long>(file_size),
             static_cast<unsigned long long>(body->content_length()), req.url.c_str());

    UploadProgress progress;
    if (on_progress) {
        // Report file bytes rather than body bytes, never moving backwards
        auto last = std::make_shared<uint64_t>(0);
        uint64_t body_len = body->content_length();
        progress = [on_progress, last, file_size, body_len](uint64_t sent, uint64_t) {
            uint64_t done = body_len == 0 ? 0 : sent * file_size / body_len;
            if (done > *last) {
                *last = done;
                on_progress(done, file_size);
            }
        };
    }

    std::optional<HttpResponse> response;
    try {
        SourceGuard guard(*body);
        response = exchange(std::move(req), progress);
    } catch (const IoError& e) {
        return failed(UploadError::Io, e.what());
    }
    if (!response) return cancelled_outcome();

    UploadOutcome outcome = interpret_finalize_response(*response);
    if (outcome.ok()) {
        if (on_progress) on_progress(file_size, file_size);
        if (metrics_) metrics_->upload_bytes_total().Increment(static_cast<double>(file_size));
        outcome.bytes_acked = file_size;
    } else if (outcome.error == UploadError::Transport && body->phase() == MultipartBodyStream::Phase::Failed) {
        outcome.error = UploadError::Io;
    }
    outcome.total_bytes = file_size;
    return outcome;
}

UploadOutcome UploadOrchestrator::outcome_from_session(const SessionResult& result) const {
    UploadOutcome o;
    o.http_status = result.http_status;
    o.response_body = result.response_body;
    o.message = result.message;
    o.location = result.location;
    o.bytes_acked = result.bytes_acked;
    o.total_bytes = result.total_bytes;

    if (result.cancelled()) {
        o.status = UploadStatus::Cancelled;
        return o;
    }
    o.status = UploadStatus::Failed;
    switch (result.error) {
        case SessionErrorKind::HttpStatus:
            o.error = classify_http_status(result.http_status);
            // 409 from the tus server is an offset conflict, not duplicate content
            if (o.error == UploadError::DuplicateConflict) o.error = UploadError::Protocol;
            break;
        case SessionErrorKind::Protocol: o.error = UploadError::Protocol; break;
        case SessionErrorKind::Io: o.error = UploadError::Io; break;
        default: o.error = UploadError::Transport; break;
    }
    return o;
}

void UploadOrchestrator::verify_checksum(const std::filesystem::path& file,
                                         UploadOutcome& outcome) const {
    const std::string& remote = outcome.record->checksum_sha256;
    if (remote.empty()) {
        log_warn("Server reported no checksum for file %lld; skipping verification",
                 static_cast<long long>(outcome.record->id));
        return;
    }
    try {
        ChunkSource source(file);
        std::string local = sha256_hex(source);
        std::string expected = remote;
        std::transform(expected.begin(), expected.end(), expected.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        outcome.checksum_verified = local == expected;
        if (!*outcome.checksum_verified) {
            log_warn("Checksum mismatch for file %lld: local %s, server %s",
                     static_cast<long long>(outcome.record->id), local.c_str(), remote.c_str());
        }
    } catch (const IoError& e) {
        log_warn("Cannot hash %s for verification: %s", file.c_str(), e.what());
    }
}

void UploadOrchestrator::record_outcome(const UploadOutcome& outcome) {
    switch (outcome.status) {
        case UploadStatus::Success:
            log_info("Upload stored as file %lld (sha256 %s)",
                     static_cast<long long>(outcome.record->id),
                     outcome.record->checksum_sha256.c_str());
            if (metrics_) metrics_->uploads_success().Increment();
            if (store_ && !store_->upsert(StoredUpload::from_record(api_.endpoint().host_key(),
                                                                    *outcome.record))) {
                log_warn("Delete token for file %lld was not saved",
                         static_cast<long long>(outcome.record->id));
            }
            break;
        case UploadStatus::DuplicateMerged:
            log_info("Upload merged into existing file %lld; it cannot be deleted from here",
                     static_cast<long long>(outcome.record->id));
            if (metrics_) metrics_->uploads_duplicate().Increment();
            break;
        case UploadStatus::Cancelled:
            if (metrics_) metrics_->uploads_cancelled().Increment();
            break;
        case UploadStatus::Failed:
            log_error("Upload failed (%s): %s", upload_error_name(outcome.error),
                      outcome.message.c_str());
            if (metrics_) metrics_->uploads_failure().Increment();
            break;
    }
}

}  // namespace gigvault
