#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gigvault {

class ByteSource;

// HTTP methods
enum class HttpMethod {
    GET,
    POST,
    PUT,
    PATCH,
    HEAD,
    DELETE
};

const char* http_method_to_string(HttpMethod method);

bool is_success_status(int status);
bool is_redirect_status(int status);

// HTTP headers (case-insensitive)
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    void remove(const std::string& name);
    void clear() { headers_.clear(); }

    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;

    using HeaderPair = std::pair<std::string, std::string>;
    std::vector<HeaderPair> all() const;

    void set_content_type(const std::string& content_type);
    void set_content_length(uint64_t length);
    void set_basic_auth(const std::string& username, const std::string& password);

    std::optional<uint64_t> content_length() const;

private:
    // lowercase name -> values
    std::map<std::string, std::vector<std::string>> headers_;

    static std::string normalize_name(const std::string& name);
};

// HTTP request
//
// The body is either held in memory (`body`) or pulled incrementally from
// `body_source`, which must report its length up front so Content-Length can
// be sent before the first byte.
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;
    std::shared_ptr<ByteSource> body_source;

    // Zero means "use the transport default".
    std::chrono::milliseconds connect_timeout{0};
    // Abort when no bytes move for this long.
    std::chrono::milliseconds idle_timeout{0};
    // Abort when the whole exchange takes longer than this.
    std::chrono::milliseconds total_timeout{0};

    bool follow_redirects = true;

    static HttpRequest get(const std::string& url);

    void set_json_body(const std::string& json);
    uint64_t body_length() const;
};

// Fully buffered HTTP response
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    std::chrono::milliseconds total_time{0};

    bool ok() const { return is_success_status(status_code); }
    std::string body_string() const;

    // Error info (for failed requests)
    std::string error;
    bool is_network_error = false;  // True if error was network-level, not HTTP status
    bool cancelled = false;
};

// URL parsing helper
struct ParsedUrl {
    std::string scheme;
    std::string host;
    int port = 0;         // 0 = default for scheme
    std::string path;
    std::string query;
    std::string fragment;
    std::string userinfo;

    std::string to_string() const;

    /// Last non-empty path segment ("" when the path is empty or "/").
    std::string last_path_segment() const;

    static std::optional<ParsedUrl> parse(const std::string& url);
};

/// Resolve a possibly relative reference (e.g. a Location header) against a base URL.
std::string resolve_url(const std::string& base, const std::string& reference);

std::string base64_encode(const std::vector<uint8_t>& data);
std::string base64_encode(const std::string& str);

/// Strip leading/trailing ASCII whitespace.
std::string trim(const std::string& s);

/// Mask credentials in a header value for logging.
std::string mask_header_value(const std::string& name, const std::string& value);

}  // namespace gigvault
