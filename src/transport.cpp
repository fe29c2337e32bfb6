#include "gigvault/transport.hpp"

namespace gigvault {

const char* transport_error_kind_name(TransportError::Kind kind) {
    switch (kind) {
        case TransportError::Kind::None: return "none";
        case TransportError::Kind::Cancelled: return "cancelled";
        case TransportError::Kind::Aborted: return "aborted";
        case TransportError::Kind::Timeout: return "timeout";
        case TransportError::Kind::Tls: return "tls";
        case TransportError::Kind::Network: return "network";
        case TransportError::Kind::Io: return "io";
    }
    return "unknown";
}

const char* trust_policy_name(TrustPolicy policy) {
    switch (policy) {
        case TrustPolicy::Verify: return "verify";
        case TrustPolicy::AcceptAll: return "accept-all";
    }
    return "unknown";
}

HttpResponse Transport::execute(HttpRequest request) {
    return PendingExchange::start(*this, std::move(request))->wait();
}

// ============================================================================
// Buffered exchanges
// ============================================================================

std::shared_ptr<TransportTask> start_buffered(Transport& transport, HttpRequest request,
                                              std::function<void(HttpResponse)> done,
                                              UploadProgress on_upload_progress) {
    struct Buffer {
        std::mutex mutex;
        HttpResponse response;
        std::chrono::steady_clock::time_point started = std::chrono::steady_clock::now();
    };
    auto buffer = std::make_shared<Buffer>();

    TransportHandlers handlers;
    handlers.on_response = [buffer](const TransportResponse& head) {
        std::lock_guard<std::mutex> lock(buffer->mutex);
        buffer->response.status_code = head.status_code;
        buffer->response.headers = head.headers;
        return true;
    };
    handlers.on_data = [buffer](const uint8_t* data, size_t length) {
        std::lock_guard<std::mutex> lock(buffer->mutex);
        buffer->response.body.insert(buffer->response.body.end(), data, data + length);
        return true;
    };
    handlers.on_upload_progress = std::move(on_upload_progress);
    handlers.on_complete = [buffer, done = std::move(done)](const TransportError& error) {
        HttpResponse result;
        {
            std::lock_guard<std::mutex> lock(buffer->mutex);
            result = std::move(buffer->response);
        }
        result.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - buffer->started);
        if (!error.ok()) {
            result.error = error.message;
            result.cancelled = error.kind == TransportError::Kind::Cancelled;
            result.is_network_error = !result.cancelled;
        }
        if (done) {
            done(std::move(result));
        }
    };

    return transport.start(std::move(request), std::move(handlers));
}

std::shared_ptr<PendingExchange> PendingExchange::start(Transport& transport, HttpRequest request,
                                                        UploadProgress on_upload_progress) {
    std::shared_ptr<PendingExchange> exchange(new PendingExchange());

    // The task must not keep the exchange alive once the caller is gone
    std::weak_ptr<PendingExchange> weak = exchange;
    auto task = start_buffered(transport, std::move(request), [weak](HttpResponse response) {
        if (auto self = weak.lock()) {
            self->latch_.fire(std::move(response));
        }
    }, std::move(on_upload_progress));

    std::lock_guard<std::mutex> lock(exchange->mutex_);
    exchange->task_ = std::move(task);
    return exchange;
}

HttpResponse PendingExchange::wait() {
    return latch_.wait();
}

void PendingExchange::cancel() {
    std::shared_ptr<TransportTask> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        task = task_;
    }
    if (task) {
        task->cancel();
    }
}

}  // namespace gigvault
