// Test suite for gigvault.
//
// Tests:
//   1. ChunkSource and MultipartBodyStream framing
//   2. CompletionLatch and SerialQueue
//   3. Upload metadata, finalize parsing, media types, checksums
//   4. ResumableUploadSession against an in-process tus server
//   5. UploadOrchestrator: both strategies, error mapping, cancel, resume
//   6. Delete API and the delete-token store
//   7. StreamingProxyLoader range handling and cancellation
//   8. ProxyRelayServer request parsing and loopback serving
//   9. ClientConfig CLI / JSON / validation
//  10. Metrics export

#include "gigvault/archive_api.hpp"
#include "gigvault/checksum.hpp"
#include "gigvault/chunk_source.hpp"
#include "gigvault/client_config.hpp"
#include "gigvault/completion_latch.hpp"
#include "gigvault/media_types.hpp"
#include "gigvault/metrics.hpp"
#include "gigvault/multipart_stream.hpp"
#include "gigvault/proxy_loader.hpp"
#include "gigvault/proxy_relay.hpp"
#include "gigvault/serial_queue.hpp"
#include "gigvault/token_store.hpp"
#include "gigvault/transport.hpp"
#include "gigvault/tus_session.hpp"
#include "gigvault/upload_orchestrator.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <netinet/in.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <sys/socket.h>
#include <sys/time.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using namespace gigvault;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name)                                                    \
    do {                                                              \
        std::cout << "  " << #name << "... " << std::flush;          \
    } while (0)

#define PASS()                                                        \
    do {                                                              \
        std::cout << "OK" << std::endl;                               \
        ++tests_passed;                                               \
    } while (0)

#define FAIL(msg)                                                     \
    do {                                                              \
        std::cout << "FAIL: " << msg << std::endl;                    \
        ++tests_failed;                                               \
    } while (0)

#define ASSERT_TRUE(cond, msg)                                        \
    do {                                                              \
        if (!(cond)) { FAIL(msg); return; }                           \
    } while (0)

#define ASSERT_EQ(a, b, msg)                                          \
    do {                                                              \
        if ((a) != (b)) {                                             \
            std::cout << "FAIL: " << msg << " (got \"" << (a)        \
                      << "\", expected \"" << (b) << "\")"            \
                      << std::endl;                                   \
            ++tests_failed;                                           \
            return;                                                   \
        }                                                             \
    } while (0)

#define ASSERT_EMPTY(s, msg)                                          \
    ASSERT_TRUE((s).empty(), msg ": " + (s))

#define ASSERT_NOT_EMPTY(s, msg)                                      \
    ASSERT_TRUE(!(s).empty(), msg)

/// Create a unique temp directory under /tmp.
static fs::path make_temp_dir(const std::string& prefix) {
    auto path = fs::temp_directory_path() / (prefix + "-XXXXXX");
    std::string tpl = path.string();
    char* result = mkdtemp(tpl.data());
    if (!result) throw std::runtime_error("mkdtemp failed");
    return fs::path(result);
}

/// Write binary content to a file.
static void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs.write(content.data(), content.size());
}

/// Read entire file into a string.
static std::string read_file(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)),
                       std::istreambuf_iterator<char>());
}

/// Wait for a condition with timeout (milliseconds). Returns true if met.
static bool wait_for(std::function<bool()> cond, int timeout_ms = 5000) {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (cond()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return cond();
}

/// Deterministic non-text bytes.
static std::string pattern_bytes(size_t n, unsigned seed = 0) {
    std::string out(n, '\0');
    for (size_t i = 0; i < n; ++i) {
        out[i] = static_cast<char>((i * 31 + seed) & 0xff);
    }
    return out;
}

static UploadMetadata sample_metadata() {
    UploadMetadata m;
    m.event_date = "2024-06-01";
    m.org_name = "The Tuesday Band";
    m.event_type = "band";
    m.label = "Spring set";
    m.participants = "Ana, Ben";
    return m;
}

static ServerEndpoint sample_endpoint() {
    ServerEndpoint ep;
    ep.base_url = "https://archive.test/";
    ep.username = "ana";
    ep.password = "secret";
    return ep;
}

// ---------------------------------------------------------------------------
// In-process transport
// ---------------------------------------------------------------------------

/// What a fake server answers to one request.
struct FakeReply {
    int status = 200;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    TransportError error;      // non-ok: fail before any response head
    bool hang = false;         // no answer until the task is cancelled
    int delay_ms = 0;
    size_t data_chunk = 64 * 1024;
};

static FakeReply reply(int status, std::string body = {}) {
    FakeReply r;
    r.status = status;
    r.body = std::move(body);
    return r;
}

static FakeReply json_reply(int status, const nlohmann::json& j) {
    FakeReply r = reply(status, j.dump());
    r.headers.emplace_back("Content-Type", "application/json");
    return r;
}

static FakeReply hang_reply() {
    FakeReply r;
    r.hang = true;
    return r;
}

struct RecordedRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    size_t body_size = 0;
};

using FakeHandler = std::function<FakeReply(const HttpRequest&, const std::string& body)>;

/// Transport that runs every exchange on its own thread and answers from a
/// handler, so completion is always asynchronous like the real one.
class FakeTransport : public Transport {
public:
    explicit FakeTransport(FakeHandler handler, TrustPolicy trust = TrustPolicy::Verify)
        : handler_(std::move(handler)), trust_(trust) {}

    ~FakeTransport() override {
        while (true) {
            std::vector<std::thread> threads;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                threads.swap(threads_);
            }
            if (threads.empty()) break;
            for (auto& t : threads) t.join();
        }
    }

    std::shared_ptr<TransportTask> start(HttpRequest request, TransportHandlers handlers) override {
        auto task = std::make_shared<Task>(next_id_++);
        std::lock_guard<std::mutex> lock(mutex_);
        ++started_;
        ++active_;
        threads_.emplace_back([this, task, request = std::move(request),
                               handlers = std::move(handlers)]() mutable {
            run(*task, request, handlers);
            std::lock_guard<std::mutex> done_lock(mutex_);
            --active_;
            idle_cv_.notify_all();
        });
        return task;
    }

    TrustPolicy trust_policy() const override { return trust_; }

    size_t started() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return started_;
    }

    std::vector<RecordedRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    bool wait_idle(int timeout_ms = 5000) {
        std::unique_lock<std::mutex> lock(mutex_);
        return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                 [this] { return active_ == 0; });
    }

private:
    class Task : public TransportTask {
    public:
        explicit Task(uint64_t id) : id_(id) {}

        void cancel() override {
            std::lock_guard<std::mutex> lock(mutex);
            cancelled = true;
            cv.notify_all();
        }
        uint64_t id() const override { return id_; }

        bool is_cancelled() {
            std::lock_guard<std::mutex> lock(mutex);
            return cancelled;
        }

        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;

    private:
        uint64_t id_;
    };

    void run(Task& task, const HttpRequest& request, TransportHandlers& handlers) {
        auto complete = [&handlers](const TransportError& error) {
            auto on_complete = std::move(handlers.on_complete);
            handlers = TransportHandlers{};
            if (on_complete) on_complete(error);
        };

        std::string body;
        try {
            if (request.body_source) {
                uint64_t total = request.body_source->length();
                std::vector<uint8_t> buf(64 * 1024);
                while (true) {
                    size_t n = request.body_source->read(buf.data(), buf.size());
                    if (n == 0) break;
                    body.append(reinterpret_cast<const char*>(buf.data()), n);
                    if (handlers.on_upload_progress) handlers.on_upload_progress(body.size(), total);
                }
            } else if (!request.body.empty()) {
                body.assign(request.body.begin(), request.body.end());
                if (handlers.on_upload_progress) handlers.on_upload_progress(body.size(), body.size());
            }
        } catch (const IoError& e) {
            complete({TransportError::Kind::Io, e.what()});
            return;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back({request.method, request.url, request.headers, body.size()});
        }

        FakeReply answer = handler_(request, body);
        {
            std::unique_lock<std::mutex> lock(task.mutex);
            if (answer.hang) {
                task.cv.wait(lock, [&task] { return task.cancelled; });
            } else if (answer.delay_ms > 0) {
                task.cv.wait_for(lock, std::chrono::milliseconds(answer.delay_ms),
                                 [&task] { return task.cancelled; });
            }
        }
        if (task.is_cancelled()) {
            complete(TransportError::cancelled());
            return;
        }
        if (!answer.error.ok()) {
            complete(answer.error);
            return;
        }

        TransportResponse head;
        head.status_code = answer.status;
        for (const auto& [name, value] : answer.headers) {
            head.headers.add(name, value);
        }
        if (handlers.on_response && !handlers.on_response(head)) {
            complete({TransportError::Kind::Aborted, "aborted by handler"});
            return;
        }

        size_t pos = 0;
        while (pos < answer.body.size()) {
            if (task.is_cancelled()) {
                complete(TransportError::cancelled());
                return;
            }
            size_t n = std::min(answer.data_chunk, answer.body.size() - pos);
            const auto* data = reinterpret_cast<const uint8_t*>(answer.body.data() + pos);
            if (handlers.on_data && !handlers.on_data(data, n)) {
                complete({TransportError::Kind::Aborted, "aborted by handler"});
                return;
            }
            pos += n;
        }
        complete(TransportError{});
    }

    FakeHandler handler_;
    TrustPolicy trust_;
    std::atomic<uint64_t> next_id_{1};

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::vector<std::thread> threads_;
    std::vector<RecordedRequest> requests_;
    size_t started_ = 0;
    size_t active_ = 0;
};

// ---------------------------------------------------------------------------
// Fake archive server: tus creation/core, finalize, multipart, delete
// ---------------------------------------------------------------------------

class FakeArchiveServer {
public:
    struct Upload {
        uint64_t length = 0;
        std::string data;
        std::string metadata;
    };

    FakeReply handle(const HttpRequest& req, const std::string& body) {
        std::lock_guard<std::mutex> lock(mutex);
        auto url = ParsedUrl::parse(req.url);
        if (!url) return reply(400, "bad url");
        const std::string& path = url->path;
        if (auto auth = req.headers.get("Authorization")) last_authorization = *auth;

        if (req.method == HttpMethod::POST && path == "/files/") return create(req);
        if (path.rfind("/files/", 0) == 0) return upload_request(req, body, path.substr(7));
        if (req.method == HttpMethod::POST && path == "/api/uploads/finalize") return finalize(body);
        if (req.method == HttpMethod::POST && path == "/api/uploads.php") return multipart(req, body);
        if (req.method == HttpMethod::POST && path == "/api/delete") return remove(body);
        return reply(404, "not found");
    }

    std::mutex mutex;
    std::map<std::string, Upload> uploads;
    std::map<std::string, int64_t> by_checksum;
    std::map<int64_t, std::string> tokens;
    int next_upload = 1;
    int64_t next_file_id = 100;

    // Counters
    int patch_calls = 0;
    int head_calls = 0;
    int finalize_calls = 0;
    int multipart_calls = 0;

    // Behaviour switches
    int hang_on_patch = 0;        // 1-based PATCH number that never answers
    bool hang_on_finalize = false;
    bool conflict_once = false;   // first PATCH answers 409
    bool omit_location = false;
    bool fail_create_network = false;
    int finalize_status = 0;      // forced status for finalize / multipart
    int create_status = 0;        // forced status for tus creation
    int patch_status = 0;         // forced status for every PATCH
    bool conflict_on_duplicate = false;
    bool wrong_checksum = false;
    int patch_delay_ms = 0;
    std::atomic<bool> hung{false};

    // Observations
    std::string last_authorization;
    std::string last_metadata;
    std::string last_finalize;
    std::string multipart_file;
    nlohmann::json multipart_fields;

private:
    FakeReply create(const HttpRequest& req) {
        if (fail_create_network) {
            FakeReply r;
            r.error = {TransportError::Kind::Network, "connection refused"};
            return r;
        }
        if (create_status != 0) return json_reply(create_status, {{"error", "rejected"}});
        auto length = req.headers.get("Upload-Length");
        if (!length) return reply(400, "missing Upload-Length");
        std::string id = "u" + std::to_string(next_upload++);
        Upload& u = uploads[id];
        u.length = std::stoull(*length);
        u.metadata = req.headers.get("Upload-Metadata").value_or("");
        last_metadata = u.metadata;

        FakeReply r = reply(201);
        if (!omit_location) r.headers.emplace_back("Location", "/files/" + id);
        r.headers.emplace_back("Tus-Resumable", "1.0.0");
        return r;
    }

    FakeReply upload_request(const HttpRequest& req, const std::string& body, const std::string& id) {
        auto it = uploads.find(id);
        if (it == uploads.end()) return reply(404);
        Upload& u = it->second;

        if (req.method == HttpMethod::HEAD) {
            ++head_calls;
            FakeReply r = reply(200);
            r.headers.emplace_back("Upload-Offset", std::to_string(u.data.size()));
            r.headers.emplace_back("Upload-Length", std::to_string(u.length));
            r.headers.emplace_back("Cache-Control", "no-store");
            return r;
        }
        if (req.method != HttpMethod::PATCH) return reply(405);

        ++patch_calls;
        if (hang_on_patch == patch_calls) {
            hung = true;
            return hang_reply();
        }
        if (patch_status != 0) return reply(patch_status, "rejected");
        if (conflict_once) {
            conflict_once = false;
            return reply(409, "offset conflict");
        }
        auto offset = req.headers.get("Upload-Offset");
        if (!offset || std::stoull(*offset) != u.data.size()) return reply(409, "offset conflict");
        if (u.data.size() + body.size() > u.length) return reply(400, "too much data");
        u.data += body;

        FakeReply r = reply(204);
        r.headers.emplace_back("Upload-Offset", std::to_string(u.data.size()));
        r.delay_ms = patch_delay_ms;
        return r;
    }

    FakeReply finalize(const std::string& body) {
        ++finalize_calls;
        last_finalize = body;
        if (hang_on_finalize) {
            hung = true;
            return hang_reply();
        }
        if (finalize_status != 0) return json_reply(finalize_status, {{"error", "rejected"}});

        auto j = nlohmann::json::parse(body, nullptr, false);
        if (j.is_discarded() || !j.contains("upload_id")) return reply(400, "bad body");
        auto it = uploads.find(j["upload_id"].get<std::string>());
        if (it == uploads.end() || it->second.data.size() != it->second.length) {
            return reply(400, "incomplete upload");
        }
        return store(it->second.data, j);
    }

    FakeReply multipart(const HttpRequest& req, const std::string& body) {
        ++multipart_calls;
        if (finalize_status != 0) return json_reply(finalize_status, {{"error", "rejected"}});

        std::string content_type = req.headers.get("Content-Type").value_or("");
        size_t b = content_type.find("boundary=");
        if (b == std::string::npos) return reply(400, "no boundary");
        std::string delim = "--" + content_type.substr(b + 9);

        nlohmann::json fields = nlohmann::json::object();
        std::string file;
        size_t pos = 0;
        while (true) {
            size_t start = body.find(delim, pos);
            if (start == std::string::npos) return reply(400, "unterminated body");
            start += delim.size();
            if (body.compare(start, 2, "--") == 0) break;
            start += 2;
            size_t head_end = body.find("\r\n\r\n", start);
            if (head_end == std::string::npos) return reply(400, "bad part");
            size_t content_start = head_end + 4;
            size_t next = body.find("\r\n" + delim, content_start);
            if (next == std::string::npos) return reply(400, "bad part");

            std::string head = body.substr(start, head_end - start);
            std::string content = body.substr(content_start, next - content_start);
            size_t name_pos = head.find("name=\"");
            if (name_pos == std::string::npos) return reply(400, "unnamed part");
            name_pos += 6;
            std::string name = head.substr(name_pos, head.find('"', name_pos) - name_pos);
            if (name == "file") {
                file = content;
            } else {
                fields[name] = content;
            }
            pos = next + 2;
        }
        multipart_file = file;
        multipart_fields = fields;
        if (!fields.contains("label")) return reply(400, "label missing");
        return store(file, fields);
    }

    FakeReply remove(const std::string& body) {
        auto j = nlohmann::json::parse(body, nullptr, false);
        if (j.is_discarded()) return reply(400, "bad body");
        int64_t id = j.value("file_id", int64_t{0});
        std::string token = j.value("delete_token", "");
        auto it = tokens.find(id);
        if (it == tokens.end() || it->second != token) {
            return json_reply(403, {{"error", "invalid delete token"}});
        }
        tokens.erase(it);
        for (auto c = by_checksum.begin(); c != by_checksum.end(); ++c) {
            if (c->second == id) {
                by_checksum.erase(c);
                break;
            }
        }
        return json_reply(200, {{"success", true}, {"deleted_count", 1}, {"error_count", 0}});
    }

    FakeReply store(const std::string& data, const nlohmann::json& meta) {
        std::string sha = sha256_hex(data);
        auto existing = by_checksum.find(sha);
        if (existing != by_checksum.end()) {
            if (conflict_on_duplicate) {
                return json_reply(409, {{"error", "duplicate content"},
                                        {"existing_id", existing->second},
                                        {"checksum_sha256", sha}});
            }
            return json_reply(200, record_json(existing->second, data.size(), sha, meta, ""));
        }

        int64_t id = next_file_id++;
        by_checksum[sha] = id;
        std::string token = "tok-" + std::to_string(id);
        tokens[id] = token;
        std::string reported = wrong_checksum ? sha256_hex(std::string("other content")) : sha;
        return json_reply(201, record_json(id, data.size(), reported, meta, token));
    }

    static nlohmann::json record_json(int64_t id, size_t size, const std::string& sha,
                                      const nlohmann::json& meta, const std::string& token) {
        return {
            {"id", id},
            {"file_name", "clip.mp4"},
            {"file_type", "video"},
            {"mime_type", "video/mp4"},
            {"size_bytes", size},
            {"checksum_sha256", sha},
            {"event_date", meta.value("event_date", "")},
            {"org_name", meta.value("org_name", "")},
            {"event_type", meta.value("event_type", "")},
            {"label", meta.value("label", "")},
            {"delete_token", token},
        };
    }
};

static FakeHandler serve_archive(FakeArchiveServer& server) {
    return [&server](const HttpRequest& req, const std::string& body) {
        return server.handle(req, body);
    };
}

// ---------------------------------------------------------------------------
// Fake media origin and player request
// ---------------------------------------------------------------------------

class FakeOrigin {
public:
    FakeReply handle(const HttpRequest& req, const std::string&) {
        std::lock_guard<std::mutex> lock(mutex);
        ++requests;
        last_range = req.headers.get("Range").value_or("");
        last_authorization = req.headers.get("Authorization").value_or("");

        if (hang) return hang_reply();
        if (fail) {
            FakeReply r;
            r.error = {TransportError::Kind::Network, "connection reset by peer"};
            return r;
        }
        if (status_override != 0) return reply(status_override, "nope");

        FakeReply r;
        r.data_chunk = chunk;
        if (!content_type.empty()) r.headers.emplace_back("Content-Type", content_type);

        uint64_t first = 0;
        uint64_t last = resource.size() - 1;
        bool ranged = !ignore_range && last_range.rfind("bytes=", 0) == 0;
        if (ranged) {
            std::string bounds = last_range.substr(6);
            size_t dash = bounds.find('-');
            first = std::stoull(bounds.substr(0, dash));
            std::string end = bounds.substr(dash + 1);
            if (!end.empty()) last = std::min<uint64_t>(last, std::stoull(end));
        }

        if (ranged) {
            r.status = 206;
            r.headers.emplace_back("Accept-Ranges", "bytes");
            r.headers.emplace_back("Content-Range", "bytes " + std::to_string(first) + "-" +
                                                        std::to_string(last) + "/" +
                                                        std::to_string(resource.size()));
            r.body = resource.substr(first, last - first + 1);
        } else {
            r.status = 200;
            r.body = resource;
        }
        r.headers.emplace_back("Content-Length", std::to_string(r.body.size()));
        return r;
    }

    std::mutex mutex;
    std::string resource = pattern_bytes(1000, 7);
    std::string content_type = "video/mp4";
    bool ignore_range = false;
    bool hang = false;
    bool fail = false;
    int status_override = 0;
    size_t chunk = 64;

    int requests = 0;
    std::string last_range;
    std::string last_authorization;
};

static FakeHandler serve_origin(FakeOrigin& origin) {
    return [&origin](const HttpRequest& req, const std::string& body) {
        return origin.handle(req, body);
    };
}

/// Player-side request that records everything the loader tells it.
class RecordingRequest : public LoadingRequest {
public:
    RecordingRequest(std::string url, uint64_t offset, uint64_t length, size_t accept_limit = 0)
        : url_(std::move(url)), offset_(offset), length_(length), accept_limit_(accept_limit) {}

    std::string url() const override { return url_; }
    uint64_t requested_offset() const override { return offset_; }
    uint64_t requested_length() const override { return length_; }
    bool wants_content_information() const override { return true; }

    void set_content_information(const ContentInformation& info) override {
        std::lock_guard<std::mutex> lock(mutex_);
        info_ = info;
    }

    bool respond_with_data(const uint8_t* data, size_t length) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (terminal_calls_ > 0) ++data_after_finish_;
        data_.append(reinterpret_cast<const char*>(data), length);
        return accept_limit_ == 0 || data_.size() < accept_limit_;
    }

    void finish_loading() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++terminal_calls_;
        }
        done_.fire(true);
    }

    void finish_loading_with_error(const ProxyError& error) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++terminal_calls_;
            error_ = error;
        }
        done_.fire(false);
    }

    /// true when finished without error; nullopt on timeout.
    std::optional<bool> wait(int timeout_ms = 5000) const {
        return done_.wait_for(std::chrono::milliseconds(timeout_ms));
    }

    std::string data() const { std::lock_guard<std::mutex> lock(mutex_); return data_; }
    std::optional<ContentInformation> info() const { std::lock_guard<std::mutex> lock(mutex_); return info_; }
    std::optional<ProxyError> error() const { std::lock_guard<std::mutex> lock(mutex_); return error_; }
    int terminal_calls() const { std::lock_guard<std::mutex> lock(mutex_); return terminal_calls_; }
    int data_after_finish() const { std::lock_guard<std::mutex> lock(mutex_); return data_after_finish_; }

private:
    std::string url_;
    uint64_t offset_;
    uint64_t length_;
    size_t accept_limit_;

    mutable std::mutex mutex_;
    std::string data_;
    std::optional<ContentInformation> info_;
    std::optional<ProxyError> error_;
    int terminal_calls_ = 0;
    int data_after_finish_ = 0;
    CompletionLatch<bool> done_;
};

/// Byte source whose stat size promises more than it delivers.
class ShortSource : public ByteSource {
public:
    void open() override { cursor_ = 0; }
    size_t read(uint8_t* buffer, size_t max_length) override {
        size_t n = std::min<size_t>(max_length, 50 - cursor_);
        std::memset(buffer, 'x', n);
        cursor_ += n;
        return n;
    }
    void close() noexcept override {}
    uint64_t length() const override { return 100; }
    void seek(uint64_t offset) override { cursor_ = static_cast<size_t>(offset); }

private:
    size_t cursor_ = 0;
};

static std::string drain_source(ByteSource& source, size_t read_size) {
    std::string out;
    std::vector<uint8_t> buf(read_size);
    while (true) {
        size_t n = source.read(buf.data(), buf.size());
        if (n == 0) break;
        out.append(reinterpret_cast<const char*>(buf.data()), n);
    }
    return out;
}

/// One HTTP exchange with the loopback relay; returns the raw response.
static std::string http_exchange(uint16_t port, const std::string& request) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return "ERROR socket()";

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        close(fd);
        return "ERROR connect()";
    }

    struct timeval tv;
    tv.tv_sec = 10;
    tv.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    if (write(fd, request.data(), request.size()) != static_cast<ssize_t>(request.size())) {
        close(fd);
        return "ERROR write()";
    }

    std::string response;
    char buf[4096];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n <= 0) break;
        response.append(buf, static_cast<size_t>(n));
    }
    close(fd);
    return response;
}

static std::string response_body(const std::string& response) {
    size_t sep = response.find("\r\n\r\n");
    return sep == std::string::npos ? std::string() : response.substr(sep + 4);
}

// ---------------------------------------------------------------------------
// 1. Byte sources
// ---------------------------------------------------------------------------

static void test_byte_sources() {
    std::cout << "\n=== Byte sources ===" << std::endl;

    auto tmpdir = make_temp_dir("gigvault-sources");
    auto file = tmpdir / "clip.mp4";
    std::string content = pattern_bytes(2500);
    write_file(file, content);

    {
        TEST(chunk_source_sequential_reads);
        ChunkSource source(file);
        ASSERT_EQ(source.length(), 2500ULL, "length known before open");
        source.open();
        auto a = source.read(1000);
        auto b = source.read(1000);
        auto c = source.read(1000);
        auto d = source.read(1000);
        ASSERT_EQ(a.size(), 1000u, "first read");
        ASSERT_EQ(b.size(), 1000u, "second read");
        ASSERT_EQ(c.size(), 500u, "short final read");
        ASSERT_TRUE(d.empty(), "empty read at end of file");
        ASSERT_TRUE(std::string(c.begin(), c.end()) == content.substr(2000), "bytes match the file");
        source.close();
        ASSERT_TRUE(!source.is_open(), "closed");
        PASS();
    }
    {
        TEST(chunk_source_seek);
        ChunkSource source(file);
        source.open();
        source.seek(2400);
        auto tail = source.read(1000);
        ASSERT_EQ(tail.size(), 100u, "tail size");
        ASSERT_EQ(source.cursor(), 2500ULL, "cursor at end");
        ASSERT_TRUE(std::string(tail.begin(), tail.end()) == content.substr(2400), "tail bytes");
        PASS();
    }
    {
        TEST(chunk_source_missing_file_throws);
        bool threw = false;
        try {
            ChunkSource source(tmpdir / "missing.mp4");
        } catch (const IoError&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "missing file should throw IoError");
        PASS();
    }

    std::vector<MultipartBodyStream::Field> fields = {
        {"event_date", "2024-06-01"},
        {"label", "Spring set"},
    };
    std::string file_bytes = pattern_bytes(10000, 3);

    auto make_stream = [&]() {
        MultipartFilePart part;
        part.file_name = "clip.mp4";
        part.mime_type = "video/mp4";
        part.source = std::make_shared<MemorySource>(file_bytes);
        return std::make_unique<MultipartBodyStream>("Boundary-test", fields, std::move(part));
    };

    {
        TEST(multipart_length_matches_any_read_size);
        std::string reference;
        for (size_t read_size : {size_t{1}, size_t{7}, size_t{1} << 20}) {
            auto stream = make_stream();
            stream->open();
            std::string body = drain_source(*stream, read_size);
            stream->close();
            ASSERT_EQ(body.size(), stream->content_length(), "drained bytes == content_length");
            ASSERT_TRUE(stream->phase() == MultipartBodyStream::Phase::Complete, "phase complete");
            if (reference.empty()) {
                reference = body;
            } else {
                ASSERT_TRUE(body == reference, "body independent of read size");
            }
        }
        ASSERT_TRUE(reference.rfind("--Boundary-test\r\nContent-Disposition: form-data; name=\"event_date\"\r\n\r\n2024-06-01\r\n", 0) == 0,
                    "first field rendered first");
        ASSERT_TRUE(reference.find("name=\"file\"; filename=\"clip.mp4\"\r\nContent-Type: video/mp4\r\n\r\n") != std::string::npos,
                    "file part headers");
        ASSERT_TRUE(reference.find(file_bytes) != std::string::npos, "file bytes embedded verbatim");
        std::string footer = "\r\n--Boundary-test--\r\n";
        ASSERT_TRUE(reference.size() > footer.size() &&
                    reference.compare(reference.size() - footer.size(), footer.size(), footer) == 0,
                    "closing delimiter");
        PASS();
    }
    {
        TEST(multipart_rewind_replays_body);
        auto stream = make_stream();
        stream->open();
        std::string first = drain_source(*stream, 4096);
        stream->seek(0);
        std::string second = drain_source(*stream, 333);
        ASSERT_TRUE(first == second, "rewind yields identical body");
        bool threw = false;
        try {
            stream->seek(5);
        } catch (const IoError&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "seek to non-zero offset should throw");
        PASS();
    }
    {
        TEST(multipart_short_file_fails);
        MultipartFilePart part;
        part.file_name = "short.mp4";
        part.source = std::make_shared<ShortSource>();
        MultipartBodyStream stream("Boundary-short", {}, std::move(part));
        stream.open();
        bool threw = false;
        try {
            drain_source(stream, 4096);
        } catch (const IoError&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "short file should raise IoError");
        ASSERT_TRUE(stream.phase() == MultipartBodyStream::Phase::Failed, "phase failed");
        PASS();
    }
    {
        TEST(multipart_boundary_and_content_type);
        auto a = MultipartBodyStream::make_boundary();
        auto b = MultipartBodyStream::make_boundary();
        ASSERT_EQ(a.size(), 41u, "Boundary- plus 32 hex digits");
        ASSERT_TRUE(a.rfind("Boundary-", 0) == 0, "prefix");
        ASSERT_TRUE(a != b, "boundaries differ");
        auto stream = make_stream();
        ASSERT_EQ(stream->content_type(), "multipart/form-data; boundary=Boundary-test", "content type");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 2. Concurrency primitives
// ---------------------------------------------------------------------------

static void test_concurrency_primitives() {
    std::cout << "\n=== CompletionLatch / SerialQueue ===" << std::endl;

    {
        TEST(latch_first_fire_wins);
        CompletionLatch<int> latch;
        std::atomic<int> callbacks{0};
        latch.arm([&callbacks](const int&) { ++callbacks; });

        std::atomic<int> winners{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&latch, &winners, i] {
                if (latch.fire(i)) ++winners;
            });
        }
        for (auto& t : threads) t.join();

        ASSERT_EQ(winners.load(), 1, "exactly one fire() delivers");
        ASSERT_EQ(callbacks.load(), 1, "callback invoked once");
        int value = latch.wait();
        ASSERT_TRUE(value >= 0 && value < 8, "value from the winner");
        ASSERT_TRUE(!latch.fire(42), "later fire() is a no-op");
        ASSERT_EQ(latch.wait(), value, "value unchanged");
        PASS();
    }
    {
        TEST(latch_wait_for_times_out);
        CompletionLatch<int> latch;
        ASSERT_TRUE(!latch.wait_for(std::chrono::milliseconds(20)).has_value(), "no value yet");
        ASSERT_TRUE(!latch.fired(), "not fired");
        PASS();
    }
    {
        TEST(serial_queue_runs_in_order);
        SerialQueue queue;
        std::vector<int> seen;
        std::atomic<bool> on_worker{true};
        for (int i = 0; i < 100; ++i) {
            queue.post([&seen, &queue, &on_worker, i] {
                if (!queue.on_worker_thread()) on_worker = false;
                seen.push_back(i);
            });
        }
        queue.drain();
        ASSERT_EQ(seen.size(), 100u, "all jobs ran");
        for (int i = 0; i < 100; ++i) {
            ASSERT_EQ(seen[i], i, "job order");
        }
        ASSERT_TRUE(on_worker.load(), "jobs run on the worker thread");
        ASSERT_TRUE(!queue.on_worker_thread(), "test thread is not the worker");
        PASS();
    }
    {
        TEST(serial_queue_drops_after_shutdown);
        SerialQueue queue;
        std::atomic<int> ran{0};
        queue.post([&ran] { ++ran; });
        queue.shutdown();
        queue.post([&ran] { ++ran; });
        queue.shutdown();
        ASSERT_EQ(ran.load(), 1, "only the job posted before shutdown ran");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 3. Metadata, finalize parsing, media types, checksums
// ---------------------------------------------------------------------------

static void test_archive_api() {
    std::cout << "\n=== Metadata / finalize / media types ===" << std::endl;

    {
        TEST(event_date_validation);
        ASSERT_TRUE(is_valid_event_date("2024-02-29"), "leap day");
        ASSERT_TRUE(!is_valid_event_date("2023-02-29"), "not a leap year");
        ASSERT_TRUE(!is_valid_event_date("2024-13-01"), "month 13");
        ASSERT_TRUE(!is_valid_event_date("2024-6-01"), "missing padding");
        ASSERT_TRUE(is_valid_event_date(today_event_date()), "today is valid");
        PASS();
    }
    {
        TEST(metadata_validate_and_fields);
        UploadMetadata m = sample_metadata();
        ASSERT_EMPTY(m.validate(), "sample metadata should validate");
        m.keywords = "   ";
        m.notes = "  encore  ";
        auto fields = m.fields();
        ASSERT_EQ(fields.size(), 6u, "4 mandatory + participants + notes");
        ASSERT_EQ(fields[0].first, "event_date", "first field");
        ASSERT_EQ(fields[3].first, "label", "fourth field");
        ASSERT_EQ(fields[5].second, "encore", "optional value trimmed");

        UploadMetadata missing = sample_metadata();
        missing.label = "  ";
        ASSERT_NOT_EMPTY(missing.validate(), "blank label rejected");
        missing = sample_metadata();
        missing.event_date = "01/06/2024";
        ASSERT_NOT_EMPTY(missing.validate(), "bad date rejected");
        PASS();
    }
    {
        TEST(finalize_body_and_record);
        auto body = nlohmann::json::parse(build_finalize_body("abc123", sample_metadata()));
        ASSERT_EQ(body["upload_id"].get<std::string>(), "abc123", "upload_id");
        ASSERT_EQ(body["org_name"].get<std::string>(), "The Tuesday Band", "org_name");
        ASSERT_EQ(body["participants"].get<std::string>(), "Ana, Ben", "participants");
        ASSERT_TRUE(!body.contains("keywords"), "absent optional omitted");

        std::string error;
        auto rec = parse_finalize_record(
            R"({"id":"42","checksum_sha256":"ab","delete_token":" t0k ","size_bytes":10})", error);
        ASSERT_TRUE(rec.has_value(), "string id accepted");
        ASSERT_EQ(rec->id, 42, "id");
        ASSERT_EQ(rec->delete_token, "t0k", "token trimmed");
        ASSERT_EQ(rec->size_bytes, 10ULL, "size");
        ASSERT_TRUE(!rec->is_duplicate(), "has a token");

        auto dup = parse_finalize_record(R"({"id":7,"delete_token":""})", error);
        ASSERT_TRUE(dup.has_value() && dup->is_duplicate(), "empty token means merged duplicate");

        ASSERT_TRUE(!parse_finalize_record("<html>", error).has_value(), "non-JSON rejected");
        ASSERT_NOT_EMPTY(error, "error set");
        ASSERT_TRUE(!parse_finalize_record(R"({"ok":true})", error).has_value(), "missing id rejected");
        PASS();
    }
    {
        TEST(duplicate_conflict_body);
        auto c = parse_duplicate_conflict(R"({"error":"duplicate","existing_id":9,"checksum_sha256":"ff"})");
        ASSERT_EQ(c.existing_id, 9, "existing id");
        ASSERT_EQ(c.checksum_sha256, "ff", "checksum");
        ASSERT_EQ(c.message, "duplicate", "message");
        auto plain = parse_duplicate_conflict("already there");
        ASSERT_EQ(plain.message, "already there", "plain text body kept");
        PASS();
    }
    {
        TEST(finalize_response_interpretation);
        HttpResponse ok;
        ok.status_code = 200;
        std::string json = R"({"id":5,"delete_token":"t"})";
        ok.body.assign(json.begin(), json.end());
        auto o = interpret_finalize_response(ok);
        ASSERT_EQ(std::string(upload_status_name(o.status)), "success", "2xx with token");

        HttpResponse garbage;
        garbage.status_code = 200;
        std::string html = "<html>ok</html>";
        garbage.body.assign(html.begin(), html.end());
        o = interpret_finalize_response(garbage);
        ASSERT_EQ(std::string(upload_error_name(o.error)), "protocol", "2xx with bad body");

        HttpResponse net;
        net.error = "connection reset";
        net.is_network_error = true;
        o = interpret_finalize_response(net);
        ASSERT_EQ(std::string(upload_error_name(o.error)), "transport", "network failure");

        HttpResponse cancelled;
        cancelled.error = "cancelled";
        cancelled.cancelled = true;
        o = interpret_finalize_response(cancelled);
        ASSERT_EQ(std::string(upload_status_name(o.status)), "cancelled", "cancelled");
        PASS();
    }
    {
        TEST(http_status_classification);
        ASSERT_TRUE(classify_http_status(401) == UploadError::Permission, "401");
        ASSERT_TRUE(classify_http_status(403) == UploadError::Permission, "403");
        ASSERT_TRUE(classify_http_status(409) == UploadError::DuplicateConflict, "409");
        ASSERT_TRUE(classify_http_status(413) == UploadError::PayloadTooLarge, "413");
        ASSERT_TRUE(classify_http_status(400) == UploadError::BadRequest, "400");
        ASSERT_TRUE(classify_http_status(502) == UploadError::BadRequest, "502");
        PASS();
    }
    {
        TEST(media_types);
        ASSERT_EQ(guess_mime_type("clip.MP4"), "video/mp4", "mp4 case-insensitive");
        ASSERT_EQ(guess_mime_type("take.mov"), "video/quicktime", "mov");
        ASSERT_EQ(guess_mime_type("song.m4a"), "audio/m4a", "m4a");
        ASSERT_EQ(guess_mime_type("/media/clip.webm?token=1"), "video/webm", "query ignored");
        ASSERT_EQ(guess_mime_type("dir.v1/README"), "application/octet-stream", "no extension");
        ASSERT_EQ(normalize_mime_type(" Video/MP4; charset=binary"), "video/mp4", "normalized");
        PASS();
    }
    {
        TEST(strategy_names);
        ASSERT_TRUE(parse_upload_strategy("resumable") == UploadStrategy::Resumable, "resumable");
        ASSERT_TRUE(parse_upload_strategy(" TUS ") == UploadStrategy::Resumable, "tus alias");
        ASSERT_TRUE(parse_upload_strategy("multipart") == UploadStrategy::Multipart, "multipart");
        ASSERT_TRUE(!parse_upload_strategy("ftp").has_value(), "unknown");
        PASS();
    }
    {
        TEST(sha256_helpers);
        ASSERT_EQ(sha256_hex(std::string("abc")),
                  "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", "abc");
        ASSERT_EQ(sha256_hex(std::string()),
                  "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855", "empty");
        std::string big = pattern_bytes(3 * 1024 * 1024 + 17, 11);
        MemorySource source(big);
        ASSERT_EQ(sha256_hex(source), sha256_hex(big), "streamed digest matches one-shot");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 4. Resumable upload session
// ---------------------------------------------------------------------------

static SessionOptions session_options(size_t chunk_size) {
    SessionOptions opts;
    opts.endpoint = "https://archive.test/files/";
    opts.chunk_size = chunk_size;
    sample_endpoint().authorize(opts.headers);
    return opts;
}

static void test_tus_session() {
    std::cout << "\n=== ResumableUploadSession ===" << std::endl;

    {
        TEST(encode_metadata);
        ResumableUploadSession::Metadata meta = {{"filename", "a.mp4"}, {"empty", ""}};
        ASSERT_EQ(ResumableUploadSession::encode_metadata(meta),
                  "filename " + base64_encode(std::string("a.mp4")) + ",empty", "encoding");
        PASS();
    }
    {
        TEST(upload_in_chunks_resolves_relative_location);
        FakeArchiveServer server;
        FakeTransport transport(serve_archive(server));
        std::string content = pattern_bytes(4500, 1);
        auto session = ResumableUploadSession::create(
            transport, session_options(1000), std::make_shared<MemorySource>(content),
            {{"filename", "clip.mp4"}});

        std::vector<uint64_t> progress;
        auto result = session->upload([&progress](uint64_t acked, uint64_t) {
            progress.push_back(acked);
        });
        ASSERT_TRUE(result.ok(), "upload should complete: " + result.message);
        ASSERT_EQ(result.upload_id, "u1", "upload id from Location");
        ASSERT_EQ(result.location, "https://archive.test/files/u1", "relative Location resolved");
        ASSERT_EQ(server.uploads["u1"].data.size(), content.size(), "server received everything");
        ASSERT_TRUE(server.uploads["u1"].data == content, "bytes identical");
        ASSERT_EQ(progress.size(), 5u, "one progress call per chunk");
        ASSERT_EQ(progress.back(), 4500ULL, "final progress == total");
        ASSERT_TRUE(server.last_metadata.find("filename ") == 0, "Upload-Metadata sent");
        ASSERT_TRUE(server.last_authorization.rfind("Basic ", 0) == 0, "credentials sent");
        ASSERT_TRUE(session->state().status == SessionStatus::Completed, "state completed");
        PASS();
    }
    {
        TEST(offset_conflict_resyncs_once);
        FakeArchiveServer server;
        server.conflict_once = true;
        FakeTransport transport(serve_archive(server));
        std::string content = pattern_bytes(3000, 2);
        auto session = ResumableUploadSession::create(
            transport, session_options(1000), std::make_shared<MemorySource>(content), {});
        auto result = session->upload(nullptr);
        ASSERT_TRUE(result.ok(), "should recover from one 409: " + result.message);
        ASSERT_EQ(server.head_calls, 1, "one HEAD to learn the offset");
        ASSERT_TRUE(server.uploads["u1"].data == content, "bytes identical");
        PASS();
    }
    {
        TEST(missing_location_is_protocol_error);
        FakeArchiveServer server;
        server.omit_location = true;
        FakeTransport transport(serve_archive(server));
        auto session = ResumableUploadSession::create(
            transport, session_options(1000), std::make_shared<MemorySource>(std::string("data")), {});
        auto result = session->upload(nullptr);
        ASSERT_TRUE(result.status == SessionStatus::Failed, "failed");
        ASSERT_TRUE(result.error == SessionErrorKind::Protocol, "protocol error");
        PASS();
    }
    {
        TEST(cancel_race_delivers_exactly_once);
        FakeArchiveServer server;
        server.patch_delay_ms = 1;
        FakeTransport transport(serve_archive(server));
        std::string content = pattern_bytes(4000, 4);

        for (int i = 0; i < 25; ++i) {
            auto session = ResumableUploadSession::create(
                transport, session_options(1000), std::make_shared<MemorySource>(content), {});
            std::atomic<int> completions{0};
            CompletionLatch<SessionStatus> done;
            session->start(nullptr, [&completions, &done](const SessionResult& r) {
                ++completions;
                done.fire(r.status);
            });
            std::this_thread::sleep_for(std::chrono::milliseconds(i % 6));
            session->cancel();
            session->cancel();

            auto status = done.wait_for(std::chrono::seconds(5));
            ASSERT_TRUE(status.has_value(), "terminal result delivered");
            ASSERT_TRUE(*status == SessionStatus::Completed || *status == SessionStatus::Cancelled,
                        "completed or cancelled");
            ASSERT_TRUE(transport.wait_idle(), "transport idle");
            ASSERT_EQ(completions.load(), 1, "exactly one terminal callback");
        }
        PASS();
    }
    {
        TEST(cancel_before_start);
        FakeArchiveServer server;
        FakeTransport transport(serve_archive(server));
        auto session = ResumableUploadSession::create(
            transport, session_options(1000), std::make_shared<MemorySource>(std::string("abc")), {});
        session->cancel();
        auto result = session->upload(nullptr);
        ASSERT_TRUE(result.cancelled(), "cancelled");
        ASSERT_EQ(transport.started(), 0u, "no request sent");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 5. Upload orchestrator
// ---------------------------------------------------------------------------

static OrchestratorOptions orchestrator_options(size_t chunk_size) {
    OrchestratorOptions opts;
    opts.chunk_size = chunk_size;
    return opts;
}

static void test_upload_orchestrator() {
    std::cout << "\n=== UploadOrchestrator ===" << std::endl;

    auto tmpdir = make_temp_dir("gigvault-upload");
    auto small = tmpdir / "small.mp4";
    std::string small_content = pattern_bytes(5000, 5);
    write_file(small, small_content);

    {
        TEST(ten_megabytes_in_one_megabyte_chunks);
        auto big = tmpdir / "big.mp4";
        std::string content = pattern_bytes(10000000, 9);
        write_file(big, content);

        FakeArchiveServer server;
        FakeTransport transport(serve_archive(server));
        DeleteTokenStore store(tmpdir / "tokens.db");
        UploadOrchestrator orchestrator(transport, sample_endpoint(), orchestrator_options(1000000),
                                        nullptr, &store);

        std::mutex progress_mutex;
        std::vector<uint64_t> progress;
        auto outcome = orchestrator.upload(big, sample_metadata(),
                                           [&](uint64_t acked, uint64_t total) {
                                               std::lock_guard<std::mutex> lock(progress_mutex);
                                               if (total == 10000000ULL) progress.push_back(acked);
                                           });
        ASSERT_TRUE(outcome.ok(), "upload should succeed: " + outcome.message);
        ASSERT_EQ(std::string(upload_status_name(outcome.status)), "success", "status");
        ASSERT_EQ(outcome.http_status, 201, "finalize answered 201");
        ASSERT_EQ(progress.size(), 10u, "ten progress callbacks");
        for (size_t i = 1; i < progress.size(); ++i) {
            ASSERT_TRUE(progress[i] > progress[i - 1], "progress strictly increasing");
        }
        ASSERT_EQ(progress.back(), 10000000ULL, "final progress");
        ASSERT_EQ(server.patch_calls, 10, "ten PATCH requests");
        ASSERT_EQ(server.finalize_calls, 1, "exactly one finalize");
        ASSERT_TRUE(server.uploads["u1"].data == content, "server bytes identical");

        auto finalize = nlohmann::json::parse(server.last_finalize);
        ASSERT_EQ(finalize["upload_id"].get<std::string>(), "u1", "finalize names the upload");
        ASSERT_EQ(finalize["label"].get<std::string>(), "Spring set", "finalize carries metadata");

        ASSERT_EQ(outcome.record->delete_token, "tok-100", "delete token");
        auto stored = store.list("archive.test");
        ASSERT_EQ(stored.size(), 1u, "token stored for the host");
        ASSERT_EQ(stored[0].file_id, 100, "stored file id");
        ASSERT_EQ(stored[0].delete_token, "tok-100", "stored token");
        PASS();
    }
    {
        TEST(tus_metadata_carries_filename_and_fields);
        FakeArchiveServer server;
        FakeTransport transport(serve_archive(server));
        UploadOrchestrator orchestrator(transport, sample_endpoint(), orchestrator_options(4096));
        auto outcome = orchestrator.upload(small, sample_metadata(), nullptr);
        ASSERT_TRUE(outcome.ok(), "upload should succeed: " + outcome.message);
        ASSERT_TRUE(server.last_metadata.find("filename " + base64_encode(std::string("small.mp4"))) == 0,
                    "filename first");
        ASSERT_TRUE(server.last_metadata.find("filetype " + base64_encode(std::string("video/mp4"))) != std::string::npos,
                    "filetype");
        ASSERT_TRUE(server.last_metadata.find("label " + base64_encode(std::string("Spring set"))) != std::string::npos,
                    "label");
        ASSERT_EQ(orchestrator.tus_endpoint(), "https://archive.test/files/", "default endpoint");
        PASS();
    }
    {
        TEST(identical_content_merges_as_duplicate);
        FakeArchiveServer server;
        FakeTransport transport(serve_archive(server));
        DeleteTokenStore store(tmpdir / "dup.db");
        UploadOrchestrator orchestrator(transport, sample_endpoint(), orchestrator_options(2048),
                                        nullptr, &store);
        auto first = orchestrator.upload(small, sample_metadata(), nullptr);
        auto second = orchestrator.upload(small, sample_metadata(), nullptr);
        ASSERT_EQ(std::string(upload_status_name(first.status)), "success", "first stored");
        ASSERT_EQ(std::string(upload_status_name(second.status)), "duplicate", "second merged");
        ASSERT_TRUE(second.ok(), "merge is not a failure");
        ASSERT_EQ(second.record->id, first.record->id, "same server record");
        ASSERT_EQ(second.record->checksum_sha256, first.record->checksum_sha256, "same checksum");
        ASSERT_EQ(first.record->checksum_sha256, sha256_hex(small_content), "checksum of the file");
        ASSERT_TRUE(second.record->delete_token.empty(), "no token for a merge");
        ASSERT_EQ(store.list("archive.test").size(), 1u, "only the first upload is deletable");
        PASS();
    }
    {
        TEST(duplicate_conflict_reports_existing_id);
        FakeArchiveServer server;
        server.conflict_on_duplicate = true;
        FakeTransport transport(serve_archive(server));
        UploadOrchestrator orchestrator(transport, sample_endpoint(), orchestrator_options(2048));
        auto first = orchestrator.upload(small, sample_metadata(), nullptr);
        auto second = orchestrator.upload(small, sample_metadata(), nullptr);
        ASSERT_TRUE(first.ok(), "first stored");
        ASSERT_EQ(std::string(upload_error_name(second.error)), "duplicate-conflict", "409 mapped");
        ASSERT_TRUE(second.conflict.has_value(), "conflict parsed");
        ASSERT_EQ(second.conflict->existing_id, first.record->id, "existing id");
        ASSERT_EQ(second.conflict->checksum_sha256, sha256_hex(small_content), "checksum");
        PASS();
    }
    {
        TEST(finalize_status_mapping);
        FakeArchiveServer server;
        FakeTransport transport(serve_archive(server));
        UploadOrchestrator orchestrator(transport, sample_endpoint(), orchestrator_options(8192));
        std::vector<std::pair<int, std::string>> cases = {
            {401, "permission"}, {403, "permission"}, {409, "duplicate-conflict"},
            {413, "payload-too-large"}, {400, "bad-request"}, {500, "bad-request"},
        };
        for (const auto& [status, expected] : cases) {
            server.finalize_status = status;
            auto outcome = orchestrator.upload(small, sample_metadata(), nullptr);
            ASSERT_EQ(std::string(upload_status_name(outcome.status)), "failed", "failed");
            ASSERT_EQ(std::string(upload_error_name(outcome.error)), expected, "error for status");
            ASSERT_EQ(outcome.http_status, status, "http status kept");
        }
        PASS();
    }
    {
        TEST(tus_status_mapping);
        struct Case {
            bool on_create;
            int status;
            std::string expected;
        };
        std::vector<Case> cases = {
            {true, 401, "permission"}, {true, 403, "permission"}, {true, 413, "payload-too-large"},
            {false, 401, "permission"}, {false, 403, "permission"}, {false, 413, "payload-too-large"},
            {false, 409, "protocol"},
        };
        for (const auto& c : cases) {
            FakeArchiveServer server;
            if (c.on_create) {
                server.create_status = c.status;
            } else {
                server.patch_status = c.status;
            }
            FakeTransport transport(serve_archive(server));
            UploadOrchestrator orchestrator(transport, sample_endpoint(), orchestrator_options(1024));
            auto outcome = orchestrator.upload(small, sample_metadata(), nullptr);
            std::string where = (c.on_create ? "create " : "PATCH ") + std::to_string(c.status);
            ASSERT_EQ(std::string(upload_status_name(outcome.status)), "failed", where);
            ASSERT_EQ(std::string(upload_error_name(outcome.error)), c.expected, where);
            ASSERT_EQ(outcome.http_status, c.status, where + " status kept");
            ASSERT_EQ(server.finalize_calls, 0, where + " never finalizes");
            if (c.status == 409) {
                ASSERT_EQ(server.head_calls, 1, "one offset resync before giving up");
                ASSERT_EQ(server.patch_calls, 2, "second conflicting PATCH fails");
            }
        }
        PASS();
    }
    {
        TEST(oversize_file_fails_preflight_without_network);
        FakeArchiveServer server;
        FakeTransport transport(serve_archive(server));
        OrchestratorOptions opts = orchestrator_options(1024);
        opts.max_upload_bytes = 4999;
        UploadOrchestrator orchestrator(transport, sample_endpoint(), opts);
        auto outcome = orchestrator.upload(small, sample_metadata(), nullptr);
        ASSERT_EQ(std::string(upload_error_name(outcome.error)), "preflight", "preflight error");
        ASSERT_EQ(transport.started(), 0u, "no network request");

        UploadMetadata bad = sample_metadata();
        bad.org_name.clear();
        outcome = orchestrator.upload(tmpdir / "small.mp4", bad, nullptr);
        ASSERT_EQ(std::string(upload_error_name(outcome.error)), "preflight", "metadata checked first");
        outcome = orchestrator.upload(tmpdir / "nope.mp4", sample_metadata(), nullptr);
        ASSERT_EQ(std::string(upload_error_name(outcome.error)), "preflight", "missing file");
        outcome = orchestrator.upload(tmpdir, sample_metadata(), nullptr);
        ASSERT_EQ(std::string(upload_error_name(outcome.error)), "preflight", "directory");
        ASSERT_EQ(transport.started(), 0u, "still no network request");
        PASS();
    }
    {
        TEST(create_network_failure_maps_to_transport);
        FakeArchiveServer server;
        server.fail_create_network = true;
        FakeTransport transport(serve_archive(server));
        UploadOrchestrator orchestrator(transport, sample_endpoint(), orchestrator_options(1024));
        auto outcome = orchestrator.upload(small, sample_metadata(), nullptr);
        ASSERT_EQ(std::string(upload_error_name(outcome.error)), "transport", "transport error");
        ASSERT_EQ(server.finalize_calls, 0, "no finalize");
        PASS();
    }
    {
        TEST(cancel_during_transfer_never_finalizes_then_resume);
        FakeArchiveServer server;
        server.hang_on_patch = 2;
        FakeTransport transport(serve_archive(server));
        UploadOrchestrator orchestrator(transport, sample_endpoint(), orchestrator_options(1000));

        UploadOutcome outcome;
        std::thread uploader([&] { outcome = orchestrator.upload(small, sample_metadata(), nullptr); });
        ASSERT_TRUE(wait_for([&] { return server.hung.load(); }), "second PATCH in flight");
        orchestrator.cancel();
        uploader.join();

        ASSERT_EQ(std::string(upload_status_name(outcome.status)), "cancelled", "cancelled");
        ASSERT_EQ(outcome.bytes_acked, 1000ULL, "one chunk acknowledged");
        ASSERT_EQ(outcome.location, "https://archive.test/files/u1", "resumable location");
        ASSERT_TRUE(transport.wait_idle(), "transport idle");
        ASSERT_EQ(server.finalize_calls, 0, "finalize never sent after cancel");

        size_t before = transport.started();
        auto again = orchestrator.upload(small, sample_metadata(), nullptr);
        ASSERT_EQ(std::string(upload_status_name(again.status)), "cancelled", "cancel is sticky");
        ASSERT_EQ(transport.started(), before, "no request after cancel");

        {
            std::lock_guard<std::mutex> lock(server.mutex);
            server.hang_on_patch = 0;
        }
        UploadOrchestrator resumer(transport, sample_endpoint(), orchestrator_options(1000));
        std::vector<uint64_t> progress;
        auto resumed = resumer.resume(outcome.location, small, sample_metadata(),
                                      [&progress](uint64_t acked, uint64_t) { progress.push_back(acked); });
        ASSERT_TRUE(resumed.ok(), "resume should succeed: " + resumed.message);
        ASSERT_EQ(server.head_calls, 1, "offset fetched with HEAD");
        ASSERT_TRUE(!progress.empty(), "progress reported");
        ASSERT_EQ(progress.front(), 1000ULL, "resume starts at the server offset");
        ASSERT_EQ(progress.back(), 5000ULL, "resume ends at the total");
        ASSERT_TRUE(server.uploads["u1"].data == small_content, "bytes identical after resume");
        ASSERT_EQ(server.finalize_calls, 1, "finalized once");
        PASS();
    }
    {
        TEST(cancel_during_finalize);
        FakeArchiveServer server;
        server.hang_on_finalize = true;
        FakeTransport transport(serve_archive(server));
        DeleteTokenStore store(tmpdir / "cancel.db");
        UploadOrchestrator orchestrator(transport, sample_endpoint(), orchestrator_options(4096),
                                        nullptr, &store);
        UploadOutcome outcome;
        std::thread uploader([&] { outcome = orchestrator.upload(small, sample_metadata(), nullptr); });
        ASSERT_TRUE(wait_for([&] { return server.hung.load(); }), "finalize in flight");
        orchestrator.cancel();
        uploader.join();
        ASSERT_EQ(std::string(upload_status_name(outcome.status)), "cancelled", "cancelled");
        ASSERT_TRUE(store.list("archive.test").empty(), "nothing stored");
        PASS();
    }
    {
        TEST(multipart_strategy_streams_one_request);
        auto medium = tmpdir / "medium.mov";
        std::string content = pattern_bytes(300000, 13);
        write_file(medium, content);

        FakeArchiveServer server;
        FakeTransport transport(serve_archive(server));
        OrchestratorOptions opts = orchestrator_options(1024);
        opts.strategy = UploadStrategy::Multipart;
        UploadOrchestrator orchestrator(transport, sample_endpoint(), opts);

        std::mutex progress_mutex;
        std::vector<uint64_t> progress;
        auto outcome = orchestrator.upload(medium, sample_metadata(), [&](uint64_t done, uint64_t total) {
            std::lock_guard<std::mutex> lock(progress_mutex);
            if (total == content.size()) progress.push_back(done);
        });
        ASSERT_TRUE(outcome.ok(), "multipart upload should succeed: " + outcome.message);
        ASSERT_EQ(server.multipart_calls, 1, "one POST");
        ASSERT_EQ(server.patch_calls, 0, "no tus traffic");
        ASSERT_EQ(server.finalize_calls, 0, "no separate finalize");
        ASSERT_TRUE(server.multipart_file == content, "file part intact");
        ASSERT_EQ(server.multipart_fields["label"].get<std::string>(), "Spring set", "label field");
        ASSERT_EQ(server.multipart_fields["participants"].get<std::string>(), "Ana, Ben", "optional field");
        ASSERT_TRUE(progress.size() >= 2, "several progress callbacks");
        for (size_t i = 1; i < progress.size(); ++i) {
            ASSERT_TRUE(progress[i] >= progress[i - 1], "progress never decreases");
        }
        ASSERT_EQ(progress.back(), 300000ULL, "final progress == file size");

        auto requests = transport.requests();
        ASSERT_EQ(requests.size(), 1u, "one request");
        ASSERT_EQ(requests[0].url, "https://archive.test/api/uploads.php?ui=json", "multipart URL");
        ASSERT_EQ(requests[0].headers.content_length().value_or(0), requests[0].body_size,
                  "Content-Length matches bytes sent");
        PASS();
    }
    {
        TEST(multipart_payload_too_large);
        FakeArchiveServer server;
        server.finalize_status = 413;
        FakeTransport transport(serve_archive(server));
        OrchestratorOptions opts = orchestrator_options(1024);
        opts.strategy = UploadStrategy::Multipart;
        UploadOrchestrator orchestrator(transport, sample_endpoint(), opts);
        auto outcome = orchestrator.upload(small, sample_metadata(), nullptr);
        ASSERT_EQ(std::string(upload_error_name(outcome.error)), "payload-too-large", "413 mapped");
        PASS();
    }
    {
        TEST(checksum_verification);
        FakeArchiveServer server;
        FakeTransport transport(serve_archive(server));
        OrchestratorOptions opts = orchestrator_options(2048);
        opts.verify_checksum = true;
        UploadOrchestrator orchestrator(transport, sample_endpoint(), opts);
        auto outcome = orchestrator.upload(small, sample_metadata(), nullptr);
        ASSERT_TRUE(outcome.ok(), "upload should succeed");
        ASSERT_TRUE(outcome.checksum_verified.has_value() && *outcome.checksum_verified,
                    "local checksum matches");

        auto other = tmpdir / "other.mp4";
        write_file(other, pattern_bytes(777, 21));
        server.wrong_checksum = true;
        outcome = orchestrator.upload(other, sample_metadata(), nullptr);
        ASSERT_TRUE(outcome.ok(), "mismatch does not fail the upload");
        ASSERT_TRUE(outcome.checksum_verified.has_value() && !*outcome.checksum_verified,
                    "mismatch detected");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 6. Delete API and token store
// ---------------------------------------------------------------------------

static void test_delete_and_tokens() {
    std::cout << "\n=== Delete / DeleteTokenStore ===" << std::endl;

    auto tmpdir = make_temp_dir("gigvault-tokens");

    {
        TEST(store_upsert_list_remove_clear);
        DeleteTokenStore store(tmpdir / "nested" / "tokens.db");
        auto entry = [](const std::string& host, int64_t id, int64_t created) {
            StoredUpload e;
            e.host = host;
            e.file_id = id;
            e.delete_token = "t" + std::to_string(id);
            e.created_at = created;
            e.label = "label " + std::to_string(id);
            return e;
        };
        ASSERT_TRUE(store.upsert(entry("a.test", 1, 1000)), "upsert 1");
        ASSERT_TRUE(store.upsert(entry("a.test", 2, 3000)), "upsert 2");
        ASSERT_TRUE(store.upsert(entry("a.test", 3, 2000)), "upsert 3");
        ASSERT_TRUE(store.upsert(entry("b.test", 1, 5000)), "other host");

        auto list = store.list("a.test");
        ASSERT_EQ(list.size(), 3u, "three for a.test");
        ASSERT_EQ(list[0].file_id, 2, "newest first");
        ASSERT_EQ(list[1].file_id, 3, "then middle");
        ASSERT_EQ(list[2].file_id, 1, "oldest last");
        ASSERT_EQ(store.list_all().size(), 4u, "all hosts");

        auto replaced = entry("a.test", 1, 1000);
        replaced.delete_token = "fresh";
        ASSERT_TRUE(store.upsert(replaced), "replace");
        StoredUpload found;
        ASSERT_TRUE(store.find("a.test", 1, found), "find");
        ASSERT_EQ(found.delete_token, "fresh", "token replaced");
        ASSERT_EQ(found.label, "label 1", "fields round trip");
        ASSERT_EQ(store.list("a.test").size(), 3u, "no duplicate row");

        ASSERT_TRUE(store.remove("a.test", 1), "remove existing");
        ASSERT_TRUE(!store.remove("a.test", 1), "remove again reports nothing removed");
        ASSERT_TRUE(!store.find("a.test", 1, found), "gone");

        ASSERT_TRUE(store.clear("a.test"), "clear");
        ASSERT_TRUE(store.list("a.test").empty(), "host cleared");
        ASSERT_EQ(store.list("b.test").size(), 1u, "other host untouched");
        PASS();
    }
    {
        TEST(store_persists_across_reopen);
        auto path = tmpdir / "persist.db";
        {
            DeleteTokenStore store(path);
            StoredUpload e;
            e.host = "archive.test";
            e.file_id = 77;
            e.delete_token = "keep";
            ASSERT_TRUE(store.upsert(e), "upsert");
        }
        DeleteTokenStore reopened(path);
        StoredUpload found;
        ASSERT_TRUE(reopened.find("archive.test", 77, found), "found after reopen");
        ASSERT_EQ(found.delete_token, "keep", "token");
        PASS();
    }
    {
        TEST(store_rejects_foreign_table_and_releases_db);
        auto path = tmpdir / "foreign.db";
        {
            sqlite3* db = nullptr;
            ASSERT_TRUE(sqlite3_open(path.c_str(), &db) == SQLITE_OK, "open raw db");
            int rc = sqlite3_exec(db, "CREATE TABLE delete_tokens (host TEXT, created_at INTEGER)",
                                  nullptr, nullptr, nullptr);
            sqlite3_close(db);
            ASSERT_TRUE(rc == SQLITE_OK, "create foreign table");
        }
        bool threw = false;
        try {
            DeleteTokenStore store(path);
        } catch (const std::runtime_error& e) {
            threw = std::string(e.what()).find("prepare") != std::string::npos;
        }
        ASSERT_TRUE(threw, "statements against the wrong columns fail to prepare");

        // The failed store released its handle, so the file can be replaced
        fs::remove(path);
        fs::remove(path.string() + "-wal");
        fs::remove(path.string() + "-shm");
        DeleteTokenStore fresh(path);
        StoredUpload e;
        e.host = "archive.test";
        e.file_id = 5;
        e.delete_token = "t5";
        ASSERT_TRUE(fresh.upsert(e), "fresh store usable");
        PASS();
    }
    {
        TEST(delete_with_stored_token);
        auto file = tmpdir / "clip.mp4";
        write_file(file, pattern_bytes(3000, 17));
        FakeArchiveServer server;
        FakeTransport transport(serve_archive(server));
        UploadOrchestrator orchestrator(transport, sample_endpoint(), orchestrator_options(1024));
        auto outcome = orchestrator.upload(file, sample_metadata(), nullptr);
        ASSERT_TRUE(outcome.ok(), "upload");

        ArchiveClient api(transport, sample_endpoint());
        auto wrong = api.delete_media(outcome.record->id, "not-the-token");
        ASSERT_TRUE(!wrong.success, "wrong token refused");
        ASSERT_TRUE(wrong.invalid_token, "403 flagged as invalid token");

        auto result = api.delete_media(outcome.record->id, outcome.record->delete_token);
        ASSERT_TRUE(result.success, "delete succeeds: " + result.error_message);
        ASSERT_EQ(result.deleted_count, 1, "deleted count");

        auto again = api.delete_media(outcome.record->id, outcome.record->delete_token);
        ASSERT_TRUE(!again.success && again.invalid_token, "token is single use");
        PASS();
    }
    {
        TEST(delete_preflight_without_network);
        FakeArchiveServer server;
        FakeTransport transport(serve_archive(server));
        ArchiveClient api(transport, sample_endpoint());
        auto zero = api.delete_media(0, "token");
        ASSERT_TRUE(zero.preflight_failed, "file id 0 rejected");
        auto blank = api.delete_media(5, "   ");
        ASSERT_TRUE(blank.preflight_failed, "blank token rejected");
        ASSERT_EQ(transport.started(), 0u, "no request sent");

        auto req = api.delete_request(5, " tok ");
        auto body = nlohmann::json::parse(std::string(req.body.begin(), req.body.end()));
        ASSERT_EQ(body["file_id"].get<int64_t>(), 5, "file_id");
        ASSERT_EQ(body["delete_token"].get<std::string>(), "tok", "token trimmed");
        ASSERT_EQ(req.url, "https://archive.test/api/delete", "delete URL");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 7. Streaming proxy loader
// ---------------------------------------------------------------------------

static ProxyLoaderOptions proxy_options() {
    ProxyLoaderOptions opts;
    opts.username = "ana";
    opts.password = "secret";
    return opts;
}

static const char* kProxyClip = "proxy://media.test/videos/clip.mp4";

static void test_proxy_loader() {
    std::cout << "\n=== StreamingProxyLoader ===" << std::endl;

    {
        TEST(scheme_round_trip);
        ASSERT_EQ(to_proxy_url("https://media.test/v/clip.mp4?t=1"), "proxy://media.test/v/clip.mp4?t=1",
                  "https -> proxy");
        ASSERT_EQ(to_origin_url("proxy://media.test/v/clip.mp4?t=1").value_or(""),
                  "https://media.test/v/clip.mp4?t=1", "proxy -> https");
        ASSERT_EQ(to_proxy_url("http://media.test/a.mp4"), "http://media.test/a.mp4", "http unchanged");
        ASSERT_EQ(to_origin_url("http://media.test/a.mp4").value_or(""), "http://media.test/a.mp4",
                  "non-proxy scheme unchanged");
        ASSERT_TRUE(!to_origin_url("not a url").has_value(), "garbage rejected");
        PASS();
    }
    {
        TEST(bounded_range_delivers_exact_bytes);
        FakeOrigin origin;
        FakeTransport transport(serve_origin(origin));
        StreamingProxyLoader loader(transport, proxy_options());

        auto request = std::make_shared<RecordingRequest>(kProxyClip, 100, 100);
        ASSERT_TRUE(loader.should_wait_for_loading(request), "accepted");
        auto ok = request->wait();
        ASSERT_TRUE(ok.has_value() && *ok, "finished without error");
        ASSERT_TRUE(transport.wait_idle(), "transport idle");
        loader.drain();

        ASSERT_EQ(request->data().size(), 100u, "exactly 100 bytes");
        ASSERT_TRUE(request->data() == origin.resource.substr(100, 100), "bytes 100..199");
        auto info = request->info();
        ASSERT_TRUE(info.has_value(), "content information set");
        ASSERT_EQ(info->content_length, 1000ULL, "total length from Content-Range");
        ASSERT_TRUE(info->byte_range_access_supported, "range access supported");
        ASSERT_EQ(info->content_type, "video/mp4", "content type");
        ASSERT_EQ(origin.last_range, "bytes=100-199", "Range header");
        ASSERT_EQ(origin.last_authorization, "Basic " + base64_encode(std::string("ana:secret")),
                  "credentials forwarded");
        ASSERT_EQ(request->terminal_calls(), 1, "finished once");
        ASSERT_EQ(request->data_after_finish(), 0, "no data after finish");
        ASSERT_EQ(loader.active_requests(), 0u, "registry empty");
        ASSERT_TRUE(loader.trust_policy() == TrustPolicy::Verify, "shares transport trust policy");
        PASS();
    }
    {
        TEST(origin_ignoring_range_is_trimmed);
        FakeOrigin origin;
        origin.ignore_range = true;
        FakeTransport transport(serve_origin(origin));
        StreamingProxyLoader loader(transport, proxy_options());
        auto request = std::make_shared<RecordingRequest>(kProxyClip, 130, 70);
        loader.should_wait_for_loading(request);
        auto ok = request->wait();
        ASSERT_TRUE(ok.has_value() && *ok, "finished");
        ASSERT_TRUE(request->data() == origin.resource.substr(130, 70), "prefix skipped, tail trimmed");
        ASSERT_EQ(request->info()->content_length, 1000ULL, "length from Content-Length");
        ASSERT_TRUE(!request->info()->byte_range_access_supported, "no Accept-Ranges");
        PASS();
    }
    {
        TEST(open_ended_range_reads_to_end);
        FakeOrigin origin;
        origin.content_type.clear();
        FakeTransport transport(serve_origin(origin));
        StreamingProxyLoader loader(transport, proxy_options());
        auto request = std::make_shared<RecordingRequest>("proxy://media.test/videos/clip.webm", 900, 0);
        loader.should_wait_for_loading(request);
        auto ok = request->wait();
        ASSERT_TRUE(ok.has_value() && *ok, "finished");
        ASSERT_EQ(origin.last_range, "bytes=900-", "open-ended Range");
        ASSERT_TRUE(request->data() == origin.resource.substr(900), "last 100 bytes");
        ASSERT_EQ(request->info()->content_type, "video/webm", "type guessed from the path");
        PASS();
    }
    {
        TEST(non_2xx_fails_request);
        FakeOrigin origin;
        origin.status_override = 404;
        FakeTransport transport(serve_origin(origin));
        StreamingProxyLoader loader(transport, proxy_options());
        auto request = std::make_shared<RecordingRequest>(kProxyClip, 0, 100);
        loader.should_wait_for_loading(request);
        auto ok = request->wait();
        ASSERT_TRUE(ok.has_value() && !*ok, "finished with error");
        auto error = request->error();
        ASSERT_TRUE(error->kind == ProxyError::Kind::HttpStatus, "http status error");
        ASSERT_EQ(error->http_status, 404, "status carried");
        ASSERT_TRUE(request->data().empty(), "no data delivered");
        ASSERT_TRUE(!request->info().has_value(), "no content information");
        ASSERT_TRUE(transport.wait_idle(), "transport idle");
        ASSERT_EQ(request->terminal_calls(), 1, "finished once");
        PASS();
    }
    {
        TEST(transport_failure_fails_request);
        FakeOrigin origin;
        origin.fail = true;
        FakeTransport transport(serve_origin(origin));
        StreamingProxyLoader loader(transport, proxy_options());
        auto request = std::make_shared<RecordingRequest>(kProxyClip, 0, 100);
        loader.should_wait_for_loading(request);
        auto ok = request->wait();
        ASSERT_TRUE(ok.has_value() && !*ok, "finished with error");
        ASSERT_TRUE(request->error()->kind == ProxyError::Kind::Transport, "transport error");
        PASS();
    }
    {
        TEST(bad_url_rejected);
        FakeOrigin origin;
        FakeTransport transport(serve_origin(origin));
        StreamingProxyLoader loader(transport, proxy_options());
        auto request = std::make_shared<RecordingRequest>("proxy:nohost", 0, 0);
        loader.should_wait_for_loading(request);
        auto ok = request->wait();
        ASSERT_TRUE(ok.has_value() && !*ok, "finished with error");
        ASSERT_TRUE(request->error()->kind == ProxyError::Kind::BadUrl, "bad url");
        ASSERT_EQ(transport.started(), 0u, "nothing sent upstream");
        PASS();
    }
    {
        TEST(player_cancel_finishes_once_without_error);
        FakeOrigin origin;
        origin.hang = true;
        FakeTransport transport(serve_origin(origin));
        StreamingProxyLoader loader(transport, proxy_options());
        auto request = std::make_shared<RecordingRequest>(kProxyClip, 0, 500);
        loader.should_wait_for_loading(request);
        ASSERT_TRUE(wait_for([&] { return transport.started() == 1; }), "upstream started");
        ASSERT_TRUE(wait_for([&] { return loader.active_requests() == 1; }), "request registered");
        loader.did_cancel(request);
        auto ok = request->wait();
        ASSERT_TRUE(ok.has_value() && *ok, "finished without error");
        ASSERT_TRUE(transport.wait_idle(), "upstream task cancelled");
        loader.drain();
        ASSERT_EQ(request->terminal_calls(), 1, "finished exactly once");
        ASSERT_TRUE(!request->error().has_value(), "no error");
        ASSERT_EQ(loader.active_requests(), 0u, "registry empty");

        loader.did_cancel(request);
        loader.drain();
        ASSERT_EQ(request->terminal_calls(), 1, "second cancel ignored");
        PASS();
    }
    {
        TEST(player_gone_stops_delivery);
        FakeOrigin origin;
        FakeTransport transport(serve_origin(origin));
        StreamingProxyLoader loader(transport, proxy_options());
        auto request = std::make_shared<RecordingRequest>(kProxyClip, 0, 0, 64);
        loader.should_wait_for_loading(request);
        auto ok = request->wait();
        ASSERT_TRUE(ok.has_value() && *ok, "finished without error");
        ASSERT_TRUE(transport.wait_idle(), "transport idle");
        ASSERT_EQ(request->data().size(), 64u, "no data after the player declined");
        ASSERT_EQ(request->terminal_calls(), 1, "finished once");
        PASS();
    }
    {
        TEST(destructor_cancels_in_flight);
        FakeOrigin origin;
        origin.hang = true;
        FakeTransport transport(serve_origin(origin));
        auto request = std::make_shared<RecordingRequest>(kProxyClip, 0, 100);
        {
            StreamingProxyLoader loader(transport, proxy_options());
            loader.should_wait_for_loading(request);
            ASSERT_TRUE(wait_for([&] { return transport.started() == 1; }), "upstream started");
        }
        ASSERT_EQ(request->terminal_calls(), 1, "finished by teardown");
        ASSERT_TRUE(!request->error().has_value(), "without error");
        PASS();
    }
    {
        TEST(destructor_right_after_request);
        FakeOrigin origin;
        origin.hang = true;
        FakeTransport transport(serve_origin(origin));
        for (int round = 0; round < 20; ++round) {
            auto request = std::make_shared<RecordingRequest>(kProxyClip, 0, 100);
            {
                StreamingProxyLoader loader(transport, proxy_options());
                loader.should_wait_for_loading(request);
            }
            // Every upstream task already reported back to the loader
            ASSERT_TRUE(transport.wait_idle(), "no upstream task outlives the loader");
            ASSERT_EQ(request->terminal_calls(), 1, "finished by teardown");
            ASSERT_TRUE(!request->error().has_value(), "without error");
        }
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 8. Relay server
// ---------------------------------------------------------------------------

static void test_proxy_relay() {
    std::cout << "\n=== ProxyRelayServer ===" << std::endl;

    {
        TEST(parse_range_requests);
        std::string error;
        auto r = parse_relay_request(
            "GET /proxy/media.test/videos/clip.mp4?t=1 HTTP/1.1\r\nHost: x\r\nRange: bytes=100-199", error);
        ASSERT_TRUE(r.has_value(), "parsed: " + error);
        ASSERT_EQ(r->proxy_url, "proxy://media.test/videos/clip.mp4?t=1", "proxy URL");
        ASSERT_TRUE(r->has_range, "has range");
        ASSERT_EQ(r->offset, 100ULL, "offset");
        ASSERT_EQ(r->length, 100ULL, "length");
        ASSERT_TRUE(!r->head_only, "GET");

        auto open = parse_relay_request("HEAD /proxy/media.test:8443/a.mp4 HTTP/1.1\r\nrange: bytes=5-", error);
        ASSERT_TRUE(open.has_value(), "open-ended parsed");
        ASSERT_TRUE(open->head_only, "HEAD");
        ASSERT_EQ(open->offset, 5ULL, "offset");
        ASSERT_EQ(open->length, 0ULL, "to the end");
        ASSERT_EQ(open->proxy_url, "proxy://media.test:8443/a.mp4", "port kept");

        auto plain = parse_relay_request("GET /proxy/media.test/a.mp4 HTTP/1.1", error);
        ASSERT_TRUE(plain.has_value() && !plain->has_range, "no Range header");
        PASS();
    }
    {
        TEST(parse_rejects_unsupported);
        std::string error;
        ASSERT_TRUE(!parse_relay_request("POST /proxy/media.test/a HTTP/1.1", error), "POST");
        ASSERT_TRUE(!parse_relay_request("GET /other/a HTTP/1.1", error), "wrong prefix");
        ASSERT_TRUE(!parse_relay_request("GET /proxy/ HTTP/1.1", error), "no host");
        ASSERT_TRUE(!parse_relay_request("garbage", error), "malformed line");
        ASSERT_TRUE(!parse_relay_request("GET /proxy/m.test/a HTTP/1.1\r\nRange: bytes=-500", error),
                    "suffix range");
        ASSERT_TRUE(!parse_relay_request("GET /proxy/m.test/a HTTP/1.1\r\nRange: bytes=0-1,5-9", error),
                    "multi range");
        ASSERT_TRUE(!parse_relay_request("GET /proxy/m.test/a HTTP/1.1\r\nRange: bytes=9-5", error),
                    "inverted range");
        ASSERT_NOT_EMPTY(error, "error set");
        PASS();
    }
    {
        TEST(loopback_range_and_head);
        FakeOrigin origin;
        FakeTransport transport(serve_origin(origin));
        StreamingProxyLoader loader(transport, proxy_options());
        ProxyRelayServer relay(loader, 0);
        auto err = relay.start();
        ASSERT_EMPTY(err, "relay should start");
        ASSERT_TRUE(relay.port() != 0, "ephemeral port assigned");

        std::string url = relay.proxy_url_for("https://media.test/videos/clip.mp4");
        ASSERT_EQ(url, "http://127.0.0.1:" + std::to_string(relay.port()) + "/proxy/media.test/videos/clip.mp4",
                  "relay URL");

        auto response = http_exchange(relay.port(),
            "GET /proxy/media.test/videos/clip.mp4 HTTP/1.1\r\nHost: 127.0.0.1\r\nRange: bytes=100-199\r\n\r\n");
        ASSERT_TRUE(response.rfind("HTTP/1.1 206", 0) == 0, "206 status: " + response.substr(0, 40));
        ASSERT_TRUE(response.find("Content-Range: bytes 100-199/1000\r\n") != std::string::npos, "Content-Range");
        ASSERT_TRUE(response.find("Content-Length: 100\r\n") != std::string::npos, "Content-Length");
        ASSERT_TRUE(response.find("Accept-Ranges: bytes\r\n") != std::string::npos, "Accept-Ranges");
        ASSERT_TRUE(response_body(response) == origin.resource.substr(100, 100), "body bytes");

        auto head = http_exchange(relay.port(),
            "HEAD /proxy/media.test/videos/clip.mp4 HTTP/1.1\r\nHost: 127.0.0.1\r\n\r\n");
        ASSERT_TRUE(head.rfind("HTTP/1.1 200", 0) == 0, "HEAD status");
        ASSERT_TRUE(head.find("Content-Length: 1000\r\n") != std::string::npos, "HEAD length");
        ASSERT_TRUE(response_body(head).empty(), "HEAD has no body");

        auto bad = http_exchange(relay.port(), "GET /elsewhere HTTP/1.1\r\n\r\n");
        ASSERT_TRUE(bad.rfind("HTTP/1.1 400", 0) == 0, "malformed request -> 400");

        relay.stop();
        PASS();
    }
    {
        TEST(stalled_player_times_out_send);
        FakeOrigin origin;
        origin.resource = pattern_bytes(32 * 1024 * 1024, 3);
        origin.chunk = 64 * 1024;
        FakeTransport transport(serve_origin(origin));
        StreamingProxyLoader loader(transport, proxy_options());
        ProxyRelayServer relay(loader, 0, std::chrono::milliseconds(200));
        auto err = relay.start();
        ASSERT_EMPTY(err, "relay should start");

        // Connect with a tiny receive window and never read
        int fd = socket(AF_INET, SOCK_STREAM, 0);
        ASSERT_TRUE(fd >= 0, "socket");
        int rcvbuf = 4096;
        setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &rcvbuf, sizeof(rcvbuf));
        struct sockaddr_in addr;
        memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(relay.port());
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        if (connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
            close(fd);
            FAIL("connect");
            return;
        }
        std::string request = "GET /proxy/media.test/videos/clip.mp4 HTTP/1.1\r\nHost: 127.0.0.1\r\n\r\n";
        bool sent = write(fd, request.data(), request.size()) == static_cast<ssize_t>(request.size());

        bool started = sent && wait_for([&] { return loader.active_requests() == 1; });
        bool released = started && wait_for([&] { return loader.active_requests() == 0; }, 10000);
        close(fd);
        ASSERT_TRUE(sent, "request written");
        ASSERT_TRUE(started, "upstream request registered");
        ASSERT_TRUE(released, "request released while the player still holds the socket");
        relay.stop();
        PASS();
    }
    {
        TEST(upstream_error_becomes_502);
        FakeOrigin origin;
        origin.status_override = 403;
        FakeTransport transport(serve_origin(origin));
        StreamingProxyLoader loader(transport, proxy_options());
        ProxyRelayServer relay(loader, 0);
        auto err = relay.start();
        ASSERT_EMPTY(err, "relay should start");
        auto response = http_exchange(relay.port(),
            "GET /proxy/media.test/videos/clip.mp4 HTTP/1.1\r\nRange: bytes=0-9\r\n\r\n");
        ASSERT_TRUE(response.rfind("HTTP/1.1 502", 0) == 0, "502 status");
        ASSERT_TRUE(response.find("HTTP 403") != std::string::npos, "upstream status in body");
        relay.stop();
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 9. ClientConfig
// ---------------------------------------------------------------------------

static void test_client_config() {
    std::cout << "\n=== ClientConfig ===" << std::endl;

    auto tmpdir = make_temp_dir("gigvault-config");

    {
        TEST(upload_args);
        const char* args[] = {
            "gigvault", "upload", "/tmp/clip.mp4",
            "--server", "https://archive.test",
            "--user", "ana",
            "--org", "The Tuesday Band",
            "--event-type", "band",
            "--label", "Spring set",
            "--keywords", "live",
            "--chunk-size", "1048576",
            "--strategy", "multipart",
            "--verify",
            "--token-db", "/tmp/gv-tokens.db",
        };
        auto cfg = ClientConfig::from_args(22, const_cast<char**>(args));
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_TRUE(cfg->command == ClientConfig::Command::Upload, "command");
        ASSERT_EQ(cfg->positional.size(), 1u, "one positional");
        ASSERT_EQ(cfg->positional[0], "/tmp/clip.mp4", "file");
        ASSERT_EQ(cfg->chunk_size, 1048576u, "chunk size");
        ASSERT_EQ(cfg->tus_endpoint, "https://archive.test/files/", "default tus endpoint");
        ASSERT_EQ(cfg->metadata.event_date, today_event_date(), "event date defaults to today");
        ASSERT_EQ(cfg->metadata.keywords.value_or(""), "live", "optional metadata");
        ASSERT_EQ(cfg->token_db.string(), "/tmp/gv-tokens.db", "token db");
        ASSERT_EMPTY(cfg->validate(), "should validate");

        auto opts = cfg->orchestrator_options();
        ASSERT_TRUE(opts.strategy == UploadStrategy::Multipart, "strategy");
        ASSERT_TRUE(opts.verify_checksum, "verify flag");
        ASSERT_EQ(cfg->endpoint().host_key(), "archive.test", "host key");
        PASS();
    }
    {
        TEST(rejects_bad_args);
        const char* unknown_cmd[] = {"gigvault", "explode"};
        ASSERT_TRUE(!ClientConfig::from_args(2, const_cast<char**>(unknown_cmd)), "unknown command");
        const char* unknown_opt[] = {"gigvault", "tokens", "--frobnicate"};
        ASSERT_TRUE(!ClientConfig::from_args(3, const_cast<char**>(unknown_opt)), "unknown option");
        const char* bad_number[] = {"gigvault", "upload", "f", "--chunk-size", "lots"};
        ASSERT_TRUE(!ClientConfig::from_args(5, const_cast<char**>(bad_number)), "bad number");
        const char* missing_value[] = {"gigvault", "tokens", "--server"};
        ASSERT_TRUE(!ClientConfig::from_args(3, const_cast<char**>(missing_value)), "missing value");
        PASS();
    }
    {
        TEST(validation_per_command);
        ClientConfig cfg;
        ASSERT_NOT_EMPTY(cfg.validate(), "command required");
        cfg.command = ClientConfig::Command::Tokens;
        ASSERT_NOT_EMPTY(cfg.validate(), "server required");
        cfg.server_url = "ftp://archive.test";
        ASSERT_NOT_EMPTY(cfg.validate(), "scheme checked");
        cfg.server_url = "https://archive.test";
        ASSERT_EMPTY(cfg.validate(), "tokens ok");

        cfg.command = ClientConfig::Command::Delete;
        cfg.positional = {"abc"};
        ASSERT_NOT_EMPTY(cfg.validate(), "non-numeric file id");
        cfg.positional = {"0"};
        ASSERT_NOT_EMPTY(cfg.validate(), "zero file id");
        cfg.positional = {"99999999999999999999"};
        ASSERT_NOT_EMPTY(cfg.validate(), "file id beyond int64 range");
        ASSERT_TRUE(!cfg.delete_file_id().has_value(), "overflow yields no id");
        cfg.positional = {"9223372036854775807"};
        ASSERT_EMPTY(cfg.validate(), "largest int64 file id");
        cfg.positional = {"42"};
        ASSERT_EMPTY(cfg.validate(), "delete ok");
        ASSERT_EQ(cfg.delete_file_id().value_or(0), 42, "parsed file id");

        cfg.command = ClientConfig::Command::Resume;
        cfg.positional = {"https://archive.test/files/u1"};
        cfg.metadata = sample_metadata();
        ASSERT_NOT_EMPTY(cfg.validate(), "resume needs location and file");
        cfg.positional.push_back("/tmp/clip.mp4");
        ASSERT_EMPTY(cfg.validate(), "resume ok");
        cfg.metadata.event_date = "2024-13-01";
        ASSERT_NOT_EMPTY(cfg.validate(), "bad date");
        cfg.metadata = sample_metadata();
        cfg.strategy = "carrier-pigeon";
        ASSERT_NOT_EMPTY(cfg.validate(), "unknown strategy");
        PASS();
    }
    {
        TEST(json_overlay);
        auto path = tmpdir / "gigvault.json";
        write_file(path, R"({
            "server_url": "https://archive.test/",
            "allow_insecure_tls": true,
            "strategy": "tus",
            "chunk_size": 2097152,
            "verify_checksum": true,
            "relay_port": 8099,
            "metadata": {"org_name": "Choir", "event_type": "concert", "notes": "balcony mic"}
        })");
        ClientConfig cfg;
        ASSERT_TRUE(cfg.load_json(path), "load_json");
        ASSERT_EQ(cfg.server_url, "https://archive.test/", "server");
        ASSERT_TRUE(cfg.allow_insecure_tls, "insecure");
        ASSERT_EQ(cfg.chunk_size, 2097152u, "chunk size");
        ASSERT_EQ(cfg.relay_port, 8099u, "relay port");
        ASSERT_EQ(cfg.metadata.org_name, "Choir", "metadata org");
        ASSERT_EQ(cfg.metadata.notes.value_or(""), "balcony mic", "metadata notes");
        ASSERT_TRUE(cfg.orchestrator_options().strategy == UploadStrategy::Resumable, "tus alias");
        ASSERT_TRUE(cfg.transport_config().trust == TrustPolicy::AcceptAll, "accept-all trust");

        write_file(tmpdir / "broken.json", "{ not json");
        ClientConfig broken;
        ASSERT_TRUE(!broken.load_json(tmpdir / "broken.json"), "parse error reported");
        ASSERT_TRUE(!broken.load_json(tmpdir / "absent.json"), "missing file reported");
        PASS();
    }
    {
        TEST(credentials_from_environment);
        setenv("GIGVAULT_USER", "envuser", 1);
        setenv("GIGVAULT_PASSWORD", "envpass", 1);
        const char* args[] = {"gigvault", "tokens", "--server", "https://archive.test", "--user", "cli"};
        auto cfg = ClientConfig::from_args(6, const_cast<char**>(args));
        unsetenv("GIGVAULT_USER");
        unsetenv("GIGVAULT_PASSWORD");
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->username, "cli", "command line wins");
        ASSERT_EQ(cfg->password, "envpass", "password from environment");
        ASSERT_TRUE(cfg->transport_config().trust == TrustPolicy::Verify, "verify by default");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 10. Metrics
// ---------------------------------------------------------------------------

static void test_metrics() {
    std::cout << "\n=== Metrics ===" << std::endl;

    auto tmpdir = make_temp_dir("gigvault-metrics");
    auto prom_path = tmpdir / "gigvault.prom";

    {
        TEST(creates_prom_file);
        MetricsExporter exporter(prom_path, std::chrono::seconds(1), {{"host", "archive.test"}});
        exporter.start();
        bool created = wait_for([&] { return fs::exists(prom_path); }, 5000);
        exporter.stop();

        ASSERT_TRUE(created, ".prom file should be created");
        auto content = read_file(prom_path);
        ASSERT_TRUE(content.find("gigvault_uploads_total") != std::string::npos, "uploads counter");
        ASSERT_TRUE(content.find("gigvault_proxy_requests_total") != std::string::npos, "proxy counter");
        ASSERT_TRUE(content.find("gigvault_upload_duration_seconds") != std::string::npos, "duration histogram");
        ASSERT_TRUE(content.find("host=\"archive.test\"") != std::string::npos, "constant label");
        auto tmp_path = prom_path;
        tmp_path += ".tmp";
        ASSERT_TRUE(!fs::exists(tmp_path), ".tmp file should not persist");
        PASS();
    }

    fs::remove(prom_path);

    {
        TEST(upload_and_proxy_outcomes_recorded);
        auto file = tmpdir / "clip.mp4";
        write_file(file, pattern_bytes(2500, 23));

        MetricsExporter exporter(prom_path, std::chrono::seconds(60), {});
        {
            FakeArchiveServer server;
            FakeTransport transport(serve_archive(server));
            UploadOrchestrator orchestrator(transport, sample_endpoint(), orchestrator_options(1000),
                                            &exporter);
            auto outcome = orchestrator.upload(file, sample_metadata(), nullptr);
            ASSERT_TRUE(outcome.ok(), "upload");
        }
        {
            FakeOrigin origin;
            FakeTransport transport(serve_origin(origin));
            StreamingProxyLoader loader(transport, proxy_options(), &exporter);
            exporter.set_active_requests_source([&loader] { return loader.active_requests(); });
            auto request = std::make_shared<RecordingRequest>(kProxyClip, 0, 10);
            loader.should_wait_for_loading(request);
            ASSERT_TRUE(request->wait().has_value(), "proxy request finished");
            ASSERT_TRUE(transport.wait_idle(), "transport idle");
            loader.drain();
            exporter.set_active_requests_source(nullptr);
        }

        auto text = exporter.serialize();
        ASSERT_TRUE(text.find("gigvault_finalize_total{status=\"201\"}") != std::string::npos,
                    "finalize status counted");
        ASSERT_TRUE(text.find("gigvault_upload_chunks_total") != std::string::npos, "chunks counter");

        exporter.stop();
        auto content = read_file(prom_path);
        ASSERT_TRUE(content.find("result=\"success\"") != std::string::npos, "success label");
        ASSERT_TRUE(content.find("result=\"finished\"") != std::string::npos, "proxy finished label");
        ASSERT_TRUE(content.find("gigvault_upload_duration_seconds_count 1") != std::string::npos,
                    "one upload observed");
        ASSERT_TRUE(content.find("gigvault_chunk_duration_seconds_count 3") != std::string::npos,
                    "three chunks observed");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main() {
    std::cout << "gigvault test suite" << std::endl;
    std::cout << "===================" << std::endl;

    test_byte_sources();
    test_concurrency_primitives();
    test_archive_api();
    test_tus_session();
    test_upload_orchestrator();
    test_delete_and_tokens();
    test_proxy_loader();
    test_proxy_relay();
    test_client_config();
    test_metrics();

    std::cout << "\n===================" << std::endl;
    std::cout << "Results: " << tests_passed << " passed, "
              << tests_failed << " failed" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
