#include "gigvault/archive_api.hpp"
#include "gigvault/log.hpp"
#include "gigvault/transport.hpp"

#include <ctime>
#include <nlohmann/json.hpp>

namespace gigvault {

namespace {

constexpr const char* kAcceptHeader = "application/json,text/html;q=0.9";

std::optional<std::string> trimmed_or_empty(const std::optional<std::string>& v) {
    if (!v) return std::nullopt;
    std::string t = trim(*v);
    if (t.empty()) return std::nullopt;
    return t;
}

std::string json_string(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return {};
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

// Accept both 42 and "42"; PHP backends are not consistent about it.
std::optional<int64_t> json_int(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (it->is_number_integer()) return it->get<int64_t>();
    if (it->is_number_unsigned()) return static_cast<int64_t>(it->get<uint64_t>());
    if (it->is_string()) {
        const auto& s = it->get_ref<const std::string&>();
        try {
            size_t idx = 0;
            int64_t v = std::stoll(s, &idx);
            if (idx == s.size()) return v;
        } catch (const std::exception&) {
        }
    }
    return std::nullopt;
}

}  // namespace

// ============================================================================
// ServerEndpoint
// ============================================================================

std::string ServerEndpoint::url_for(const std::string& path) const {
    std::string base = base_url;
    if (base.empty() || base.back() != '/') base += '/';
    std::string rel = path;
    while (!rel.empty() && rel.front() == '/') rel.erase(0, 1);
    return base + rel;
}

std::string ServerEndpoint::host_key() const {
    auto parsed = ParsedUrl::parse(base_url);
    if (!parsed) return base_url;
    if (parsed->port != 0) {
        return parsed->host + ":" + std::to_string(parsed->port);
    }
    return parsed->host;
}

void ServerEndpoint::authorize(HttpHeaders& headers) const {
    if (!username.empty() || !password.empty()) {
        headers.set_basic_auth(username, password);
    }
    if (!headers.has("Accept")) {
        headers.set("Accept", kAcceptHeader);
    }
}

// ============================================================================
// UploadMetadata
// ============================================================================

UploadMetadata UploadMetadata::normalized() const {
    UploadMetadata out;
    out.event_date = trim(event_date);
    out.org_name = trim(org_name);
    out.event_type = trim(event_type);
    out.label = trim(label);
    out.participants = trimmed_or_empty(participants);
    out.keywords = trimmed_or_empty(keywords);
    out.location = trimmed_or_empty(location);
    out.rating = trimmed_or_empty(rating);
    out.notes = trimmed_or_empty(notes);
    return out;
}

std::string UploadMetadata::validate() const {
    if (trim(label).empty()) return "label is required";
    if (trim(org_name).empty()) return "org_name is required";
    if (trim(event_type).empty()) return "event_type is required";
    if (!is_valid_event_date(trim(event_date))) {
        return "event_date must be yyyy-MM-dd (got '" + event_date + "')";
    }
    return {};
}

std::vector<std::pair<std::string, std::string>> UploadMetadata::fields() const {
    UploadMetadata n = normalized();
    std::vector<std::pair<std::string, std::string>> out = {
        {"event_date", n.event_date},
        {"org_name", n.org_name},
        {"event_type", n.event_type},
        {"label", n.label},
    };
    if (n.participants) out.emplace_back("participants", *n.participants);
    if (n.keywords) out.emplace_back("keywords", *n.keywords);
    if (n.location) out.emplace_back("location", *n.location);
    if (n.rating) out.emplace_back("rating", *n.rating);
    if (n.notes) out.emplace_back("notes", *n.notes);
    return out;
}

bool is_valid_event_date(const std::string& date) {
    if (date.size() != 10 || date[4] != '-' || date[7] != '-') return false;
    for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
        if (date[i] < '0' || date[i] > '9') return false;
    }
    int year = std::stoi(date.substr(0, 4));
    int month = std::stoi(date.substr(5, 2));
    int day = std::stoi(date.substr(8, 2));
    if (month < 1 || month > 12 || day < 1) return false;

    static const int days_in_month[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    int max_day = days_in_month[month - 1];
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    if (month == 2 && leap) max_day = 29;
    return day <= max_day;
}

std::string today_event_date() {
    time_t t = time(nullptr);
    struct tm tm_val;
    localtime_r(&t, &tm_val);
    char buf[16];
    strftime(buf, sizeof(buf), "%Y-%m-%d", &tm_val);
    return buf;
}

// ============================================================================
// Finalize
// ============================================================================

std::string build_finalize_body(const std::string& upload_id, const UploadMetadata& metadata) {
    nlohmann::json j;
    j["upload_id"] = upload_id;
    for (const auto& [key, value] : metadata.fields()) {
        j[key] = value;
    }
    return j.dump();
}

std::optional<FinalizeRecord> parse_finalize_record(const std::string& body, std::string& error) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        error = std::string("finalize response is not JSON: ") + e.what();
        return std::nullopt;
    }
    if (!j.is_object()) {
        error = "finalize response is not a JSON object";
        return std::nullopt;
    }

    auto id = json_int(j, "id");
    if (!id) {
        error = "finalize response has no numeric id";
        return std::nullopt;
    }

    FinalizeRecord rec;
    rec.id = *id;
    rec.file_name = json_string(j, "file_name");
    rec.file_type = json_string(j, "file_type");
    rec.mime_type = json_string(j, "mime_type");
    rec.size_bytes = static_cast<uint64_t>(json_int(j, "size_bytes").value_or(0));
    rec.checksum_sha256 = json_string(j, "checksum_sha256");
    rec.event_date = json_string(j, "event_date");
    rec.org_name = json_string(j, "org_name");
    rec.event_type = json_string(j, "event_type");
    rec.label = json_string(j, "label");
    rec.delete_token = trim(json_string(j, "delete_token"));
    return rec;
}

DuplicateConflict parse_duplicate_conflict(const std::string& body) {
    DuplicateConflict conflict;
    try {
        auto j = nlohmann::json::parse(body);
        if (!j.is_object()) return conflict;
        auto id = json_int(j, "existing_id");
        if (!id) id = json_int(j, "id");
        conflict.existing_id = id.value_or(0);
        conflict.checksum_sha256 = json_string(j, "checksum_sha256");
        conflict.message = json_string(j, "error");
        if (conflict.message.empty()) conflict.message = json_string(j, "message");
    } catch (const nlohmann::json::parse_error&) {
        conflict.message = trim(body);
    }
    return conflict;
}

// ============================================================================
// ArchiveClient
// ============================================================================

ArchiveClient::ArchiveClient(Transport& transport, ServerEndpoint endpoint)
    : transport_(transport), endpoint_(std::move(endpoint)) {}

HttpRequest ArchiveClient::finalize_request(const std::string& upload_id,
                                            const UploadMetadata& metadata) const {
    HttpRequest req;
    req.method = HttpMethod::POST;
    req.url = endpoint_.url_for("api/uploads/finalize");
    req.set_json_body(build_finalize_body(upload_id, metadata));
    endpoint_.authorize(req.headers);
    return req;
}

HttpRequest ArchiveClient::delete_request(int64_t file_id, const std::string& delete_token) const {
    nlohmann::json j;
    j["file_id"] = file_id;
    j["delete_token"] = trim(delete_token);

    HttpRequest req;
    req.method = HttpMethod::POST;
    req.url = endpoint_.url_for("api/delete");
    req.set_json_body(j.dump());
    endpoint_.authorize(req.headers);
    return req;
}

DeleteResult ArchiveClient::delete_media(int64_t file_id, const std::string& delete_token) {
    DeleteResult result;

    if (file_id <= 0) {
        result.preflight_failed = true;
        result.error_message = "invalid file_id " + std::to_string(file_id);
        return result;
    }
    if (trim(delete_token).empty()) {
        result.preflight_failed = true;
        result.error_message = "missing delete_token";
        return result;
    }

    auto response = transport_.execute(delete_request(file_id, delete_token));
    result.http_status = response.status_code;

    if (!response.error.empty()) {
        result.error_message = "delete request failed: " + response.error;
        log_error("Delete of file %lld failed: %s", static_cast<long long>(file_id),
                  response.error.c_str());
        return result;
    }

    if (response.status_code != 200) {
        result.invalid_token = response.status_code == 403;
        std::string body = trim(response.body_string());
        result.error_message = result.invalid_token
            ? "delete token rejected (403)"
            : (body.empty() ? "HTTP " + std::to_string(response.status_code) : body);
        log_error("Delete of file %lld returned HTTP %d", static_cast<long long>(file_id),
                  response.status_code);
        return result;
    }

    try {
        auto j = nlohmann::json::parse(response.body_string());
        result.success = j.value("success", false);
        result.deleted_count = j.value("deleted_count", 0);
        result.error_count = j.value("error_count", 0);
    } catch (const nlohmann::json::exception& e) {
        result.error_message = std::string("invalid delete response: ") + e.what();
        return result;
    }

    if (!result.success && result.error_message.empty()) {
        result.error_message = "server reported failure (" + std::to_string(result.error_count) +
                               " errors)";
    }
    log_info("Delete of file %lld: success=%s deleted=%d errors=%d",
             static_cast<long long>(file_id), result.success ? "true" : "false",
             result.deleted_count, result.error_count);
    return result;
}

}  // namespace gigvault
