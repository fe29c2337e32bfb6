#include "gigvault/http.hpp"
#include "gigvault/byte_source.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace gigvault {

// ============================================================================
// Utility functions
// ============================================================================

const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::PATCH: return "PATCH";
        case HttpMethod::HEAD: return "HEAD";
        case HttpMethod::DELETE: return "DELETE";
    }
    return "GET";
}

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

bool is_redirect_status(int status) {
    return status >= 300 && status < 400;
}

static const char* base64_chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(const std::vector<uint8_t>& data) {
    std::string result;
    result.reserve((data.size() + 2) / 3 * 4);

    for (size_t i = 0; i < data.size(); i += 3) {
        size_t remaining = data.size() - i;
        uint32_t triple = static_cast<uint32_t>(data[i]) << 16;
        if (remaining > 1) triple |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (remaining > 2) triple |= static_cast<uint32_t>(data[i + 2]);

        result += base64_chars[(triple >> 18) & 0x3F];
        result += base64_chars[(triple >> 12) & 0x3F];
        result += remaining > 1 ? base64_chars[(triple >> 6) & 0x3F] : '=';
        result += remaining > 2 ? base64_chars[triple & 0x3F] : '=';
    }

    return result;
}

std::string base64_encode(const std::string& str) {
    return base64_encode(std::vector<uint8_t>(str.begin(), str.end()));
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string mask_header_value(const std::string& name, const std::string& value) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower != "authorization" && lower != "proxy-authorization" && lower != "cookie") {
        return value;
    }
    // Keep the scheme so logs still show which auth was used
    size_t space = value.find(' ');
    if (space == std::string::npos) return "****";
    return value.substr(0, space) + " ****";
}

// ============================================================================
// HttpHeaders
// ============================================================================

std::string HttpHeaders::normalize_name(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)].push_back(value);
}

void HttpHeaders::remove(const std::string& name) {
    headers_.erase(normalize_name(name));
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it != headers_.end() && !it->second.empty()) {
        return it->second[0];
    }
    return std::nullopt;
}

bool HttpHeaders::has(const std::string& name) const {
    return headers_.find(normalize_name(name)) != headers_.end();
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> result;
    for (const auto& [name, values] : headers_) {
        for (const auto& value : values) {
            result.emplace_back(name, value);
        }
    }
    return result;
}

void HttpHeaders::set_content_type(const std::string& content_type) {
    set("Content-Type", content_type);
}

void HttpHeaders::set_content_length(uint64_t length) {
    set("Content-Length", std::to_string(length));
}

void HttpHeaders::set_basic_auth(const std::string& username, const std::string& password) {
    set("Authorization", "Basic " + base64_encode(username + ":" + password));
}

std::optional<uint64_t> HttpHeaders::content_length() const {
    auto val = get("Content-Length");
    if (val) {
        try {
            return std::stoull(*val);
        } catch (const std::invalid_argument&) {
            // Invalid Content-Length header format
        } catch (const std::out_of_range&) {
            // Content-Length value out of range
        }
    }
    return std::nullopt;
}

// ============================================================================
// HttpRequest
// ============================================================================

HttpRequest HttpRequest::get(const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::GET;
    req.url = url;
    return req;
}

void HttpRequest::set_json_body(const std::string& json) {
    body.assign(json.begin(), json.end());
    headers.set_content_type("application/json");
}

uint64_t HttpRequest::body_length() const {
    if (body_source) return body_source->length();
    return body.size();
}

// ============================================================================
// HttpResponse
// ============================================================================

std::string HttpResponse::body_string() const {
    return std::string(body.begin(), body.end());
}

// ============================================================================
// ParsedUrl
// ============================================================================

std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
    ParsedUrl result;

    size_t pos = 0;

    // Scheme
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return std::nullopt;
    }
    result.scheme = url.substr(0, scheme_end);
    std::transform(result.scheme.begin(), result.scheme.end(), result.scheme.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    pos = scheme_end + 3;

    // Userinfo (optional)
    size_t at_pos = url.find('@', pos);
    size_t authority_end = url.find_first_of("/?#", pos);
    if (at_pos != std::string::npos && (authority_end == std::string::npos || at_pos < authority_end)) {
        result.userinfo = url.substr(pos, at_pos - pos);
        pos = at_pos + 1;
    }

    // Host and port
    size_t host_end = url.find_first_of("/?#", pos);
    if (host_end == std::string::npos) {
        host_end = url.size();
    }

    std::string host_port = url.substr(pos, host_end - pos);
    if (host_port.empty()) {
        return std::nullopt;
    }

    auto parse_port = [&result](const std::string& digits) {
        if (digits.empty() ||
            !std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return false;
        }
        try {
            int port = std::stoi(digits);
            if (port <= 0 || port > 65535) return false;
            result.port = port;
        } catch (const std::exception&) {
            return false;
        }
        return true;
    };

    if (host_port.front() == '[') {
        // IPv6 literal
        size_t bracket_end = host_port.find(']');
        if (bracket_end == std::string::npos) {
            return std::nullopt;
        }
        result.host = host_port.substr(1, bracket_end - 1);
        if (bracket_end + 1 < host_port.size()) {
            if (host_port[bracket_end + 1] != ':' || !parse_port(host_port.substr(bracket_end + 2))) {
                return std::nullopt;
            }
        }
    } else {
        size_t colon_pos = host_port.rfind(':');
        if (colon_pos != std::string::npos) {
            result.host = host_port.substr(0, colon_pos);
            if (!parse_port(host_port.substr(colon_pos + 1))) {
                return std::nullopt;
            }
        } else {
            result.host = host_port;
        }
    }

    if (result.host.empty()) {
        return std::nullopt;
    }

    pos = host_end;

    // Path
    if (pos < url.size() && url[pos] == '/') {
        size_t path_end = url.find_first_of("?#", pos);
        if (path_end == std::string::npos) {
            path_end = url.size();
        }
        result.path = url.substr(pos, path_end - pos);
        pos = path_end;
    }

    // Query
    if (pos < url.size() && url[pos] == '?') {
        size_t query_end = url.find('#', pos);
        if (query_end == std::string::npos) {
            query_end = url.size();
        }
        result.query = url.substr(pos + 1, query_end - pos - 1);
        pos = query_end;
    }

    // Fragment
    if (pos < url.size() && url[pos] == '#') {
        result.fragment = url.substr(pos + 1);
    }

    return result;
}

std::string ParsedUrl::to_string() const {
    std::ostringstream oss;
    oss << scheme << "://";

    if (!userinfo.empty()) {
        oss << userinfo << "@";
    }

    if (host.find(':') != std::string::npos) {
        oss << "[" << host << "]";
    } else {
        oss << host;
    }

    if (port != 0) {
        oss << ":" << port;
    }

    oss << path;

    if (!query.empty()) {
        oss << "?" << query;
    }

    if (!fragment.empty()) {
        oss << "#" << fragment;
    }

    return oss.str();
}

std::string ParsedUrl::last_path_segment() const {
    size_t end = path.find_last_not_of('/');
    if (end == std::string::npos) return "";
    size_t start = path.rfind('/', end);
    start = (start == std::string::npos) ? 0 : start + 1;
    return path.substr(start, end - start + 1);
}

// Collapse "." and ".." segments of an absolute path.
static std::string remove_dot_segments(const std::string& path) {
    std::vector<std::string> segments;
    std::string segment;
    std::istringstream iss(path);
    while (std::getline(iss, segment, '/')) {
        if (segment.empty() || segment == ".") continue;
        if (segment == "..") {
            if (!segments.empty()) segments.pop_back();
            continue;
        }
        segments.push_back(segment);
    }

    std::string result;
    for (const auto& s : segments) {
        result += "/" + s;
    }
    bool trailing = !path.empty() && (path.back() == '/' ||
                    path.ends_with("/.") || path.ends_with("/.."));
    if (result.empty() || trailing) result += "/";
    return result;
}

std::string resolve_url(const std::string& base, const std::string& reference) {
    if (reference.empty()) return base;
    if (reference.find("://") != std::string::npos) return reference;

    auto parsed = ParsedUrl::parse(base);
    if (!parsed) return reference;

    ParsedUrl out = *parsed;
    out.fragment.clear();

    if (reference.starts_with("//")) {
        return out.scheme + ":" + reference;
    }

    std::string ref_path = reference;
    std::string ref_query;
    size_t q = ref_path.find('?');
    if (q != std::string::npos) {
        ref_query = ref_path.substr(q + 1);
        ref_path = ref_path.substr(0, q);
    }

    if (ref_path.empty()) {
        out.query = ref_query;
        return out.to_string();
    }

    if (ref_path.front() == '/') {
        out.path = remove_dot_segments(ref_path);
    } else {
        std::string dir = out.path.empty() ? "/" : out.path.substr(0, out.path.rfind('/') + 1);
        out.path = remove_dot_segments(dir + ref_path);
    }
    out.query = ref_query;
    return out.to_string();
}

}  // namespace gigvault
