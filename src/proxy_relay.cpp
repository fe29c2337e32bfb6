#include "gigvault/proxy_relay.hpp"
#include "gigvault/completion_latch.hpp"
#include "gigvault/http.hpp"
#include "gigvault/log.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <sstream>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace gigvault {

namespace {

constexpr size_t kMaxRequestHead = 16 * 1024;

bool send_all(int fd, const char* data, size_t length) {
    while (length > 0) {
        ssize_t n = send(fd, data, length, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        length -= static_cast<size_t>(n);
    }
    return true;
}

bool send_all(int fd, const std::string& data) {
    return send_all(fd, data.data(), data.size());
}

const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 206: return "Partial Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 502: return "Bad Gateway";
        default: return "Error";
    }
}

std::string simple_response(int status, const std::string& message) {
    std::string body = message + "\n";
    std::ostringstream out;
    out << "HTTP/1.1 " << status << " " << reason_phrase(status) << "\r\n"
        << "Content-Type: text/plain\r\n"
        << "Content-Length: " << body.size() << "\r\n"
        << "Connection: close\r\n\r\n"
        << body;
    return out.str();
}

bool parse_u64(const std::string& text, uint64_t& out) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    try {
        out = std::stoull(text);
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

/// LoadingRequest that writes the HTTP reply straight to a client socket.
class SocketLoadingRequest : public LoadingRequest {
public:
    SocketLoadingRequest(int fd, RelayRequest request)
        : fd_(fd), request_(std::move(request)) {}

    std::string url() const override { return request_.proxy_url; }
    uint64_t requested_offset() const override { return request_.offset; }
    uint64_t requested_length() const override { return request_.length; }
    bool wants_content_information() const override { return true; }

    void set_content_information(const ContentInformation& info) override {
        std::ostringstream out;
        uint64_t total = info.content_length;
        if (request_.has_range && total > 0) {
            uint64_t end = total - 1;
            if (request_.length > 0) {
                end = std::min(end, request_.offset + request_.length - 1);
            }
            out << "HTTP/1.1 206 Partial Content\r\n"
                << "Content-Range: bytes " << request_.offset << "-" << end << "/" << total << "\r\n"
                << "Content-Length: " << (end >= request_.offset ? end - request_.offset + 1 : 0) << "\r\n";
        } else {
            out << "HTTP/1.1 200 OK\r\n";
            if (total > 0) out << "Content-Length: " << total << "\r\n";
        }
        if (info.byte_range_access_supported) out << "Accept-Ranges: bytes\r\n";
        if (!info.content_type.empty()) out << "Content-Type: " << info.content_type << "\r\n";
        out << "Connection: close\r\n\r\n";

        headers_sent_ = true;
        write_ok_ = send_all(fd_, out.str());
    }

    bool respond_with_data(const uint8_t* data, size_t length) override {
        if (!write_ok_ || request_.head_only) return false;
        write_ok_ = send_all(fd_, reinterpret_cast<const char*>(data), length);
        if (!write_ok_) {
            log_debug("Relay: player stopped reading %s: %s", request_.proxy_url.c_str(),
                      strerror(errno));
        }
        return write_ok_;
    }

    void finish_loading() override {
        latch_.fire(true);
    }

    void finish_loading_with_error(const ProxyError& error) override {
        if (!headers_sent_) {
            int status = error.kind == ProxyError::Kind::BadUrl ? 400 : 502;
            std::string message = error.message;
            if (error.kind == ProxyError::Kind::HttpStatus) {
                message = "upstream returned HTTP " + std::to_string(error.http_status);
            }
            (void)send_all(fd_, simple_response(status, message));
        }
        latch_.fire(false);
    }

    /// Blocks until the loader finished the request.
    bool wait() const { return latch_.wait(); }

private:
    int fd_;
    RelayRequest request_;
    bool headers_sent_ = false;
    bool write_ok_ = true;
    CompletionLatch<bool> latch_;
};

}  // namespace

std::optional<RelayRequest> parse_relay_request(const std::string& head, std::string& error) {
    RelayRequest out;

    size_t line_end = head.find("\r\n");
    std::string line = head.substr(0, line_end);
    std::istringstream request_line(line);
    std::string method, target, version;
    request_line >> method >> target >> version;
    if (method.empty() || target.empty() || version.rfind("HTTP/", 0) != 0) {
        error = "malformed request line";
        return std::nullopt;
    }
    if (method == "HEAD") {
        out.head_only = true;
    } else if (method != "GET") {
        error = "unsupported method " + method;
        return std::nullopt;
    }

    const std::string prefix = "/proxy/";
    if (target.rfind(prefix, 0) != 0 || target.size() == prefix.size()) {
        error = "path must start with /proxy/<host>/";
        return std::nullopt;
    }
    out.proxy_url = std::string(kProxyScheme) + "://" + target.substr(prefix.size());
    auto parsed = ParsedUrl::parse(out.proxy_url);
    if (!parsed || parsed->host.empty()) {
        error = "bad target " + target;
        return std::nullopt;
    }

    // Headers: only Range matters
    size_t pos = line_end == std::string::npos ? head.size() : line_end + 2;
    while (pos < head.size()) {
        size_t end = head.find("\r\n", pos);
        if (end == std::string::npos) end = head.size();
        std::string header = head.substr(pos, end - pos);
        pos = end + 2;

        size_t colon = header.find(':');
        if (colon == std::string::npos) continue;
        std::string name = header.substr(0, colon);
        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return std::tolower(c); });
        if (name != "range") continue;

        std::string value = trim(header.substr(colon + 1));
        if (value.rfind("bytes=", 0) != 0 || value.find(',') != std::string::npos) {
            error = "unsupported Range " + value;
            return std::nullopt;
        }
        std::string bounds = value.substr(6);
        size_t dash = bounds.find('-');
        uint64_t first = 0;
        if (dash == std::string::npos || !parse_u64(trim(bounds.substr(0, dash)), first)) {
            error = "unsupported Range " + value;
            return std::nullopt;
        }
        std::string last_text = trim(bounds.substr(dash + 1));
        uint64_t last = 0;
        if (!last_text.empty()) {
            if (!parse_u64(last_text, last) || last < first) {
                error = "invalid Range " + value;
                return std::nullopt;
            }
            out.length = last - first + 1;
        }
        out.offset = first;
        out.has_range = true;
    }
    return out;
}

// ============================================================================
// ProxyRelayServer
// ============================================================================

ProxyRelayServer::ProxyRelayServer(StreamingProxyLoader& loader, uint16_t port,
                                   std::chrono::milliseconds send_timeout)
    : loader_(loader), port_(port), send_timeout_(send_timeout) {}

ProxyRelayServer::~ProxyRelayServer() {
    stop();
}

std::string ProxyRelayServer::start() {
    if (running_.load()) return "relay already running";

    listen_fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (listen_fd_ < 0) {
        return std::string("Failed to create relay socket: ") + strerror(errno);
    }
    int one = 1;
    setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(port_);

    if (bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string err = std::string("Failed to bind relay socket: ") + strerror(errno);
        close(listen_fd_);
        listen_fd_ = -1;
        return err;
    }
    if (listen(listen_fd_, 64) < 0) {
        std::string err = std::string("Failed to listen on relay socket: ") + strerror(errno);
        close(listen_fd_);
        listen_fd_ = -1;
        return err;
    }

    socklen_t len = sizeof(addr);
    if (getsockname(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
        port_ = ntohs(addr.sin_port);
    }

    running_ = true;
    accept_thread_ = std::thread(&ProxyRelayServer::accept_loop, this);
    log_info("Relay listening on http://127.0.0.1:%u/proxy/", static_cast<unsigned>(port_));
    return {};
}

void ProxyRelayServer::stop() {
    if (!running_.exchange(false)) return;

    // Close the listening socket to unblock accept()
    if (listen_fd_ >= 0) {
        shutdown(listen_fd_, SHUT_RDWR);
        close(listen_fd_);
        listen_fd_ = -1;
    }
    if (accept_thread_.joinable()) accept_thread_.join();

    // Hang up on players and cancel what they were waiting for
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto& [fd, request] : clients_) {
            shutdown(fd, SHUT_RDWR);
            if (request) loader_.did_cancel(request);
        }
    }
    reap_connections(true);
    log_info("Relay stopped");
}

std::string ProxyRelayServer::proxy_url_for(const std::string& origin_url) const {
    auto parsed = ParsedUrl::parse(origin_url);
    if (!parsed || parsed->host.empty()) return {};

    std::string url = "http://127.0.0.1:" + std::to_string(port_) + "/proxy/" + parsed->host;
    if (parsed->port != 0) url += ":" + std::to_string(parsed->port);
    url += parsed->path.empty() ? "/" : parsed->path;
    if (!parsed->query.empty()) url += "?" + parsed->query;
    return url;
}

void ProxyRelayServer::accept_loop() {
    while (running_.load(std::memory_order_relaxed)) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);
        int client_fd = accept(listen_fd_, reinterpret_cast<struct sockaddr*>(&client_addr), &client_len);
        if (client_fd < 0) {
            if (errno == EINTR || errno == ECONNABORTED) continue;
            if (!running_.load()) break;
            log_error("Relay accept failed: %s", strerror(errno));
            continue;
        }

        // Set read timeout
        struct timeval tv;
        tv.tv_sec = 30;
        tv.tv_usec = 0;
        setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        // A stalled player must not hold the loader's per-request lock forever
        struct timeval send_tv;
        send_tv.tv_sec = static_cast<time_t>(send_timeout_.count() / 1000);
        send_tv.tv_usec = static_cast<suseconds_t>((send_timeout_.count() % 1000) * 1000);
        setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &send_tv, sizeof(send_tv));

        reap_connections(false);

        std::lock_guard<std::mutex> lock(connections_mutex_);
        clients_[client_fd] = nullptr;
        auto conn = std::make_unique<Connection>();
        Connection* raw = conn.get();
        conn->thread = std::thread([this, client_fd, raw] {
            serve(client_fd);
            {
                std::lock_guard<std::mutex> fds_lock(connections_mutex_);
                clients_.erase(client_fd);
            }
            close(client_fd);
            raw->done = true;
        });
        connections_.push_back(std::move(conn));
    }
}

void ProxyRelayServer::reap_connections(bool all) {
    std::list<std::unique_ptr<Connection>> finished;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto it = connections_.begin(); it != connections_.end();) {
            if (all || (*it)->done.load()) {
                finished.push_back(std::move(*it));
                it = connections_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& conn : finished) {
        if (conn->thread.joinable()) conn->thread.join();
    }
}

void ProxyRelayServer::serve(int client_fd) {
    std::string head;
    char buf[4096];
    while (head.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = recv(client_fd, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return;
        head.append(buf, static_cast<size_t>(n));
        if (head.size() > kMaxRequestHead) {
            (void)send_all(client_fd, simple_response(400, "request header too large"));
            return;
        }
    }
    head.resize(head.find("\r\n\r\n"));

    std::string error;
    auto parsed = parse_relay_request(head, error);
    if (!parsed) {
        log_warn("Relay: rejecting request: %s", error.c_str());
        (void)send_all(client_fd, simple_response(400, error));
        return;
    }

    log_debug("Relay: %s %s offset=%llu length=%llu", parsed->head_only ? "HEAD" : "GET",
              parsed->proxy_url.c_str(), static_cast<unsigned long long>(parsed->offset),
              static_cast<unsigned long long>(parsed->length));

    auto request = std::make_shared<SocketLoadingRequest>(client_fd, std::move(*parsed));
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        if (!running_.load()) return;
        clients_[client_fd] = request;
    }
    loader_.should_wait_for_loading(request);
    request->wait();
}

}  // namespace gigvault
