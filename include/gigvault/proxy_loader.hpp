#pragma once

#include "gigvault/serial_queue.hpp"
#include "gigvault/transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace gigvault {

class MetricsExporter;

constexpr const char* kProxyScheme = "proxy";

/// What the player learns about the resource from the first response head.
struct ContentInformation {
    uint64_t content_length = 0;  // 0 = unknown
    bool byte_range_access_supported = false;
    std::string content_type;     // MIME type
};

struct ProxyError {
    enum class Kind {
        BadUrl,
        HttpStatus,  // upstream answered non-2xx
        Transport
    };

    Kind kind = Kind::Transport;
    int http_status = 0;
    std::string message;
};

const char* proxy_error_kind_name(ProxyError::Kind kind);

/// One pending range request from a media player.
///
/// Exactly one of finish_loading() / finish_loading_with_error() is called,
/// and respond_with_data() is never called after it. Calls for one request
/// are serialized.
class LoadingRequest {
public:
    virtual ~LoadingRequest() = default;

    virtual std::string url() const = 0;
    virtual uint64_t requested_offset() const = 0;
    /// 0 means "to the end of the resource".
    virtual uint64_t requested_length() const = 0;
    virtual bool wants_content_information() const = 0;

    virtual void set_content_information(const ContentInformation& info) = 0;
    /// @return false when the player is gone and no more data is wanted.
    virtual bool respond_with_data(const uint8_t* data, size_t length) = 0;
    virtual void finish_loading() = 0;
    virtual void finish_loading_with_error(const ProxyError& error) = 0;
};

/// proxy://host/path -> https://host/path; other schemes are returned
/// unchanged. nullopt when the URL cannot be parsed or has no host.
std::optional<std::string> to_origin_url(const std::string& url);

/// https://host/path -> proxy://host/path; other schemes are returned unchanged.
std::string to_proxy_url(const std::string& origin_url);

struct ProxyLoaderOptions {
    std::string username;
    std::string password;

    /// Abort an upstream request that stalls this long; 0 = transport default.
    std::chrono::milliseconds idle_timeout{0};
};

/// Serves player range requests for proxy:// URLs from the authenticated origin.
///
/// Each request becomes one upstream GET with Authorization and Range on the
/// given transport (whose trust policy applies). Response bytes are handed
/// to the player as they arrive. Bounded requests are trimmed to exactly the
/// requested length, after which the upstream task is cancelled.
///
/// The request registry is only touched on an internal serial queue; byte
/// delivery happens on transport threads under a per-request lock.
class StreamingProxyLoader {
public:
    StreamingProxyLoader(Transport& transport, ProxyLoaderOptions options,
                         MetricsExporter* metrics = nullptr);

    /// Cancels every request still in flight and waits for them to finish.
    ~StreamingProxyLoader();

    StreamingProxyLoader(const StreamingProxyLoader&) = delete;
    StreamingProxyLoader& operator=(const StreamingProxyLoader&) = delete;

    /// Take ownership of a player request. Always true: every accepted
    /// request is finished exactly once, possibly with an error.
    bool should_wait_for_loading(std::shared_ptr<LoadingRequest> request);

    /// The player no longer wants the request. It is finished without error.
    void did_cancel(const std::shared_ptr<LoadingRequest>& request);

    size_t active_requests() const { return active_.load(); }

    /// Block until every start/cancel posted so far has been processed.
    void drain() { queue_.drain(); }

    TrustPolicy trust_policy() const { return transport_.trust_policy(); }

private:
    struct RequestState;

    void start(const std::shared_ptr<LoadingRequest>& request);
    void cancel(const std::shared_ptr<LoadingRequest>& request);
    void release(const std::shared_ptr<RequestState>& state);

    bool on_response(RequestState& state, const TransportResponse& head);
    bool on_data(RequestState& state, const uint8_t* data, size_t length);
    void on_complete(RequestState& state, const TransportError& error);

    Transport& transport_;
    const ProxyLoaderOptions options_;
    MetricsExporter* metrics_;

    // Owned by queue_
    std::map<LoadingRequest*, std::shared_ptr<RequestState>> registry_;
    uint64_t next_id_ = 1;

    std::atomic<size_t> active_{0};

    std::mutex in_flight_mutex_;
    std::condition_variable in_flight_cv_;
    size_t in_flight_ = 0;

    SerialQueue queue_;
};

}  // namespace gigvault
