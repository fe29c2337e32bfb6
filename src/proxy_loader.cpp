#include "gigvault/proxy_loader.hpp"
#include "gigvault/log.hpp"
#include "gigvault/media_types.hpp"
#include "gigvault/metrics.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace gigvault {

const char* proxy_error_kind_name(ProxyError::Kind kind) {
    switch (kind) {
        case ProxyError::Kind::BadUrl: return "bad-url";
        case ProxyError::Kind::HttpStatus: return "http-status";
        case ProxyError::Kind::Transport: return "transport";
    }
    return "unknown";
}

namespace {

std::string replace_scheme(const std::string& url, const std::string& scheme) {
    size_t sep = url.find("://");
    return scheme + url.substr(sep);
}

std::optional<uint64_t> parse_u64(const std::string& text) {
    std::string v = trim(text);
    if (v.empty() || !std::all_of(v.begin(), v.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    try {
        return std::stoull(v);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

ContentInformation content_information_for(const TransportResponse& head,
                                           const std::string& origin_url) {
    ContentInformation info;

    auto accept_ranges = head.headers.get("Accept-Ranges");
    if (accept_ranges) {
        std::string v = *accept_ranges;
        std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
        info.byte_range_access_supported = v.find("bytes") != std::string::npos;
    }

    // "bytes 100-199/1000": the total after the slash wins over Content-Length
    std::optional<uint64_t> total;
    if (auto range = head.headers.get("Content-Range")) {
        size_t slash = range->rfind('/');
        if (slash != std::string::npos) {
            total = parse_u64(range->substr(slash + 1));
        }
    }
    if (!total) {
        total = parse_u64(head.headers.get("Content-Length").value_or(""));
    }
    info.content_length = total.value_or(0);

    std::string mime = normalize_mime_type(head.headers.get("Content-Type").value_or(""));
    if (mime.empty()) {
        auto parsed = ParsedUrl::parse(origin_url);
        mime = guess_mime_type(parsed ? parsed->last_path_segment() : origin_url);
    }
    info.content_type = mime;
    return info;
}

}  // namespace

std::optional<std::string> to_origin_url(const std::string& url) {
    auto parsed = ParsedUrl::parse(url);
    if (!parsed || parsed->host.empty()) return std::nullopt;
    if (parsed->scheme == kProxyScheme) {
        return replace_scheme(url, "https");
    }
    return url;
}

std::string to_proxy_url(const std::string& origin_url) {
    auto parsed = ParsedUrl::parse(origin_url);
    if (!parsed || parsed->scheme != "https") return origin_url;
    return replace_scheme(origin_url, kProxyScheme);
}

// ============================================================================
// Request state
// ============================================================================

struct StreamingProxyLoader::RequestState {
    uint64_t id = 0;
    std::shared_ptr<LoadingRequest> request;
    std::string origin_url;
    uint64_t requested_offset = 0;
    uint64_t requested_length = 0;

    std::mutex mutex;
    bool finished = false;
    uint64_t bytes_delivered = 0;
    uint64_t skip_remaining = 0;
    bool first_byte_seen = false;
    bool completed = false;
    std::shared_ptr<TransportTask> task;
    std::chrono::steady_clock::time_point started = std::chrono::steady_clock::now();
};

StreamingProxyLoader::StreamingProxyLoader(Transport& transport, ProxyLoaderOptions options,
                                           MetricsExporter* metrics)
    : transport_(transport)
    , options_(std::move(options))
    , metrics_(metrics) {}

StreamingProxyLoader::~StreamingProxyLoader() {
    queue_.post([this] {
        std::vector<std::shared_ptr<LoadingRequest>> pending;
        for (auto& [key, state] : registry_) {
            pending.push_back(state->request);
        }
        for (auto& request : pending) {
            cancel(request);
        }
    });
    // Starts queued ahead of the cancel have now registered their tasks
    queue_.drain();

    // Upstream tasks call back into this object until their on_complete ran
    {
        std::unique_lock<std::mutex> lock(in_flight_mutex_);
        in_flight_cv_.wait(lock, [this] { return in_flight_ == 0; });
    }
    queue_.shutdown();
}

bool StreamingProxyLoader::should_wait_for_loading(std::shared_ptr<LoadingRequest> request) {
    queue_.post([this, request] { start(request); });
    return true;
}

void StreamingProxyLoader::did_cancel(const std::shared_ptr<LoadingRequest>& request) {
    queue_.post([this, request] { cancel(request); });
}

// ============================================================================
// Queue-side operations
// ============================================================================

void StreamingProxyLoader::start(const std::shared_ptr<LoadingRequest>& request) {
    std::string url = request->url();
    auto origin = to_origin_url(url);
    if (!origin) {
        log_warn("Proxy: rejecting unparsable URL %s", url.c_str());
        if (metrics_) metrics_->proxy_error().Increment();
        request->finish_loading_with_error({ProxyError::Kind::BadUrl, 0, "bad URL: " + url});
        return;
    }

    auto state = std::make_shared<RequestState>();
    state->id = next_id_++;
    state->request = request;
    state->origin_url = *origin;
    state->requested_offset = request->requested_offset();
    state->requested_length = request->requested_length();

    HttpRequest req = HttpRequest::get(*origin);
    if (!options_.username.empty() || !options_.password.empty()) {
        req.headers.set_basic_auth(options_.username, options_.password);
    }
    std::string range = "bytes=" + std::to_string(state->requested_offset) + "-";
    if (state->requested_length > 0) {
        range += std::to_string(state->requested_offset + state->requested_length - 1);
    }
    req.headers.set("Range", range);
    req.idle_timeout = options_.idle_timeout;

    log_debug("Proxy #%llu: %s -> GET %s Range: %s", static_cast<unsigned long long>(state->id),
              url.c_str(), origin->c_str(), range.c_str());

    TransportHandlers handlers;
    handlers.on_response = [this, state](const TransportResponse& head) {
        return on_response(*state, head);
    };
    handlers.on_data = [this, state](const uint8_t* data, size_t length) {
        return on_data(*state, data, length);
    };
    handlers.on_complete = [this, state](const TransportError& error) {
        on_complete(*state, error);
        queue_.post([this, state] { release(state); });

        std::lock_guard<std::mutex> lock(in_flight_mutex_);
        --in_flight_;
        in_flight_cv_.notify_all();
    };

    registry_[request.get()] = state;
    active_.store(registry_.size());
    {
        std::lock_guard<std::mutex> lock(in_flight_mutex_);
        ++in_flight_;
    }

    auto task = transport_.start(std::move(req), std::move(handlers));
    std::lock_guard<std::mutex> lock(state->mutex);
    if (!state->completed) state->task = std::move(task);
}

void StreamingProxyLoader::cancel(const std::shared_ptr<LoadingRequest>& request) {
    auto it = registry_.find(request.get());
    if (it == registry_.end()) return;
    auto state = it->second;
    registry_.erase(it);
    active_.store(registry_.size());

    std::shared_ptr<TransportTask> task;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->finished) return;
        state->finished = true;
        task = state->task;
        state->request->finish_loading();
    }
    if (task) task->cancel();

    log_debug("Proxy #%llu: cancelled by player after %llu bytes",
              static_cast<unsigned long long>(state->id),
              static_cast<unsigned long long>(state->bytes_delivered));
    if (metrics_) metrics_->proxy_cancelled().Increment();
}

void StreamingProxyLoader::release(const std::shared_ptr<RequestState>& state) {
    auto it = registry_.find(state->request.get());
    if (it != registry_.end() && it->second == state) {
        registry_.erase(it);
        active_.store(registry_.size());
    }
}

// ============================================================================
// Transport callbacks
// ============================================================================

bool StreamingProxyLoader::on_response(RequestState& state, const TransportResponse& head) {
    std::lock_guard<std::mutex> lock(state.mutex);
    if (state.finished) return false;

    log_debug("Proxy #%llu: HTTP %d", static_cast<unsigned long long>(state.id), head.status_code);

    if (!is_success_status(head.status_code)) {
        state.finished = true;
        log_warn("Proxy: %s answered HTTP %d", state.origin_url.c_str(), head.status_code);
        state.request->finish_loading_with_error(
            {ProxyError::Kind::HttpStatus, head.status_code,
             "upstream returned HTTP " + std::to_string(head.status_code)});
        if (metrics_) metrics_->proxy_error().Increment();
        return false;
    }

    // Origin ignored Range and sent the whole body
    if (head.status_code == 200 && state.requested_offset > 0) {
        state.skip_remaining = state.requested_offset;
    }

    if (state.request->wants_content_information()) {
        state.request->set_content_information(content_information_for(head, state.origin_url));
    }
    return true;
}

bool StreamingProxyLoader::on_data(RequestState& state, const uint8_t* data, size_t length) {
    std::lock_guard<std::mutex> lock(state.mutex);
    if (state.finished) return false;

    if (!state.first_byte_seen) {
        state.first_byte_seen = true;
        if (metrics_) {
            metrics_->proxy_first_byte().Observe(std::chrono::duration<double>(
                std::chrono::steady_clock::now() - state.started).count());
        }
    }

    if (state.skip_remaining > 0) {
        size_t skip = static_cast<size_t>(std::min<uint64_t>(state.skip_remaining, length));
        state.skip_remaining -= skip;
        data += skip;
        length -= skip;
        if (length == 0) return true;
    }

    if (state.requested_length > 0) {
        length = static_cast<size_t>(
            std::min<uint64_t>(length, state.requested_length - state.bytes_delivered));
    }

    bool wanted = state.request->respond_with_data(data, length);
    state.bytes_delivered += length;
    if (metrics_) metrics_->proxy_bytes_total().Increment(static_cast<double>(length));

    if (!wanted) {
        state.finished = true;
        state.request->finish_loading();
        if (metrics_) metrics_->proxy_cancelled().Increment();
        return false;
    }
    if (state.requested_length > 0 && state.bytes_delivered >= state.requested_length) {
        // Satisfied; returning false aborts the upstream transfer
        state.finished = true;
        state.request->finish_loading();
        log_debug("Proxy #%llu: delivered %llu bytes", static_cast<unsigned long long>(state.id),
                  static_cast<unsigned long long>(state.bytes_delivered));
        if (metrics_) metrics_->proxy_finished().Increment();
        return false;
    }
    return true;
}

void StreamingProxyLoader::on_complete(RequestState& state, const TransportError& error) {
    std::lock_guard<std::mutex> lock(state.mutex);
    state.completed = true;
    state.task.reset();
    if (state.finished) return;
    state.finished = true;

    if (error.ok()) {
        state.request->finish_loading();
        log_debug("Proxy #%llu: complete, %llu bytes", static_cast<unsigned long long>(state.id),
                  static_cast<unsigned long long>(state.bytes_delivered));
        if (metrics_) metrics_->proxy_finished().Increment();
    } else if (error.kind == TransportError::Kind::Cancelled ||
               error.kind == TransportError::Kind::Aborted) {
        state.request->finish_loading();
        if (metrics_) metrics_->proxy_cancelled().Increment();
    } else {
        log_warn("Proxy: %s failed: %s", state.origin_url.c_str(), error.message.c_str());
        state.request->finish_loading_with_error(
            {ProxyError::Kind::Transport, 0, error.message});
        if (metrics_) metrics_->proxy_error().Increment();
    }
}

}  // namespace gigvault
