#pragma once

#include "gigvault/proxy_loader.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace gigvault {

/// A parsed player request line plus its Range header.
struct RelayRequest {
    bool head_only = false;
    std::string proxy_url;   // proxy://host[:port]/path?query
    bool has_range = false;
    uint64_t offset = 0;
    uint64_t length = 0;     // 0 = to the end
};

/// Parse "GET /proxy/<host>[:port]/<path>?<query> HTTP/1.1" and its headers.
/// @return nullopt with error set for anything the relay cannot serve.
std::optional<RelayRequest> parse_relay_request(const std::string& head, std::string& error);

/// Loopback HTTP endpoint that lets any HTTP-capable player read proxied media.
///
/// Each connection carries one GET (or HEAD) which is handed to the
/// StreamingProxyLoader as a LoadingRequest backed by the socket. The reply
/// is 206 for range requests (200 otherwise), 502 when the upstream fails
/// before any header was written and 400 for malformed requests.
class ProxyRelayServer {
public:
    /// port 0 picks an ephemeral port (see port() after start()).
    /// A player that stops reading for send_timeout loses its request.
    ProxyRelayServer(StreamingProxyLoader& loader, uint16_t port,
                     std::chrono::milliseconds send_timeout = std::chrono::seconds(30));
    ~ProxyRelayServer();

    ProxyRelayServer(const ProxyRelayServer&) = delete;
    ProxyRelayServer& operator=(const ProxyRelayServer&) = delete;

    /// Bind 127.0.0.1 and start accepting. Returns an error message or "".
    std::string start();
    void stop();

    uint16_t port() const { return port_; }

    /// Relay URL for an https origin URL; empty when the URL cannot be parsed.
    std::string proxy_url_for(const std::string& origin_url) const;

private:
    struct Connection {
        std::thread thread;
        std::atomic<bool> done{false};
    };

    void accept_loop();
    void serve(int client_fd);
    void reap_connections(bool all);

    StreamingProxyLoader& loader_;
    uint16_t port_;
    const std::chrono::milliseconds send_timeout_;
    int listen_fd_ = -1;
    std::atomic<bool> running_{false};
    std::thread accept_thread_;

    std::mutex connections_mutex_;
    std::list<std::unique_ptr<Connection>> connections_;
    // fd -> request being served (null until the request line is parsed)
    std::map<int, std::shared_ptr<LoadingRequest>> clients_;
};

}  // namespace gigvault
