#pragma once

#include "gigvault/completion_latch.hpp"
#include "gigvault/http.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace gigvault {

// ============================================================================
// Transport abstraction
// ============================================================================

struct TransportError {
    enum class Kind {
        None,
        Cancelled,  // TransportTask::cancel()
        Aborted,    // a handler returned false
        Timeout,
        Tls,
        Network,
        Io          // request body source failed
    };

    Kind kind = Kind::None;
    std::string message;

    bool ok() const { return kind == Kind::None; }

    static TransportError cancelled() { return {Kind::Cancelled, "cancelled"}; }
};

const char* transport_error_kind_name(TransportError::Kind kind);

/// Final response head (1xx and followed redirects are not reported).
struct TransportResponse {
    int status_code = 0;
    HttpHeaders headers;
};

/// Callbacks for one streamed exchange, invoked on a transport thread.
///
/// on_response fires at most once, before any on_data. on_complete fires
/// exactly once per started task, including after cancel() or an abort.
struct TransportHandlers {
    std::function<bool(const TransportResponse&)> on_response;
    std::function<bool(const uint8_t* data, size_t length)> on_data;
    std::function<void(uint64_t sent, uint64_t total)> on_upload_progress;
    std::function<void(const TransportError&)> on_complete;
};

class TransportTask {
public:
    virtual ~TransportTask() = default;

    /// Abort the in-flight exchange. on_complete still fires (Cancelled)
    /// unless the exchange already finished.
    virtual void cancel() = 0;
    virtual uint64_t id() const = 0;
};

enum class TrustPolicy {
    Verify,     // system trust store (or ca_bundle)
    AcceptAll   // user opted in to self-signed servers
};

const char* trust_policy_name(TrustPolicy policy);

class Transport {
public:
    virtual ~Transport() = default;

    /// Begin an exchange. Never blocks on the network; failures are
    /// reported through handlers.on_complete.
    virtual std::shared_ptr<TransportTask> start(HttpRequest request,
                                                 TransportHandlers handlers) = 0;

    virtual TrustPolicy trust_policy() const = 0;

    /// Blocking convenience over start(): buffers the whole response.
    HttpResponse execute(HttpRequest request);
};

using UploadProgress = std::function<void(uint64_t sent, uint64_t total)>;

/// start() with the whole response buffered and handed to `done` once the
/// exchange ends. Transport failures land in HttpResponse::error.
std::shared_ptr<TransportTask> start_buffered(Transport& transport, HttpRequest request,
                                              std::function<void(HttpResponse)> done,
                                              UploadProgress on_upload_progress = nullptr);

/// A buffered exchange that one thread waits on and another may cancel.
class PendingExchange {
public:
    static std::shared_ptr<PendingExchange> start(Transport& transport, HttpRequest request,
                                                  UploadProgress on_upload_progress = nullptr);

    HttpResponse wait();
    void cancel();
    bool done() const { return latch_.fired(); }

private:
    PendingExchange() = default;

    CompletionLatch<HttpResponse> latch_;
    std::mutex mutex_;
    std::shared_ptr<TransportTask> task_;
};

// ============================================================================
// libcurl transport
// ============================================================================

struct TransportConfig {
    TrustPolicy trust = TrustPolicy::Verify;
    std::string ca_bundle;

    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds idle_timeout{120000};
    std::chrono::milliseconds total_timeout{0};  // 0 = unlimited

    std::string user_agent = "gigvault/1.0";
    bool verbose = false;
};

/// One easy handle and one worker thread per task.
///
/// The trust policy is fixed at construction. The destructor cancels and
/// joins every task still running.
class CurlTransport : public Transport {
public:
    explicit CurlTransport(TransportConfig config);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    std::shared_ptr<TransportTask> start(HttpRequest request,
                                         TransportHandlers handlers) override;

    TrustPolicy trust_policy() const override { return config_.trust; }
    const TransportConfig& config() const { return config_; }

private:
    class Task;

    void reap_finished_locked();

    const TransportConfig config_;
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<Task>> tasks_;
    std::atomic<uint64_t> next_id_{1};
};

}  // namespace gigvault
