#include "gigvault/transport.hpp"
#include "gigvault/byte_source.hpp"
#include "gigvault/log.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cstring>
#include <thread>

namespace gigvault {

// ============================================================================
// Per-task transfer state shared with the CURL callbacks
// ============================================================================

namespace {

struct TransferState {
    TransportHandlers* handlers = nullptr;
    const std::atomic<bool>* cancelled = nullptr;
    ByteSource* body_source = nullptr;
    bool follow_redirects = true;

    // Head of the response currently being received. Reset on every status
    // line because interim (1xx) and redirect responses come first.
    TransportResponse head;
    bool head_delivered = false;

    bool aborted_by_handler = false;
    std::string io_error;
};

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* st = static_cast<TransferState*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    if (line.starts_with("HTTP/")) {
        st->head = TransportResponse{};
        size_t sp = line.find(' ');
        if (sp != std::string::npos) {
            try {
                st->head.status_code = std::stoi(line.substr(sp + 1, 3));
            } catch (const std::exception&) {
                st->head.status_code = 0;
            }
        }
        return bytes;
    }

    if (line.empty()) {
        int status = st->head.status_code;
        if (status >= 100 && status < 200) {
            return bytes;
        }
        if (is_redirect_status(status) && st->follow_redirects && st->head.headers.has("Location")) {
            return bytes;
        }
        if (st->head_delivered) {
            return bytes;
        }
        st->head_delivered = true;
        if (st->handlers->on_response && !st->handlers->on_response(st->head)) {
            st->aborted_by_handler = true;
            return 0;
        }
        return bytes;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        st->head.headers.add(line.substr(0, colon), trim(line.substr(colon + 1)));
    }
    return bytes;
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* st = static_cast<TransferState*>(userdata);
    size_t bytes = size * nmemb;

    if (st->cancelled->load()) {
        return 0;
    }
    if (st->handlers->on_data &&
        !st->handlers->on_data(reinterpret_cast<const uint8_t*>(ptr), bytes)) {
        st->aborted_by_handler = true;
        return 0;
    }
    return bytes;
}

size_t read_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* st = static_cast<TransferState*>(userdata);
    if (st->cancelled->load()) {
        return CURL_READFUNC_ABORT;
    }
    try {
        return st->body_source->read(reinterpret_cast<uint8_t*>(buffer), size * nitems);
    } catch (const IoError& e) {
        st->io_error = e.what();
        return CURL_READFUNC_ABORT;
    }
}

int seek_callback(void* userdata, curl_off_t offset, int origin) {
    auto* st = static_cast<TransferState*>(userdata);
    if (origin != SEEK_SET) {
        return CURL_SEEKFUNC_CANTSEEK;
    }
    try {
        st->body_source->seek(static_cast<uint64_t>(offset));
    } catch (const IoError& e) {
        st->io_error = e.what();
        return CURL_SEEKFUNC_FAIL;
    }
    return CURL_SEEKFUNC_OK;
}

int xferinfo_callback(void* clientp, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                      curl_off_t ultotal, curl_off_t ulnow) {
    auto* st = static_cast<TransferState*>(clientp);
    // Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK
    if (st->cancelled->load()) {
        return 1;
    }
    if (st->handlers->on_upload_progress && ultotal > 0) {
        st->handlers->on_upload_progress(static_cast<uint64_t>(ulnow),
                                         static_cast<uint64_t>(ultotal));
    }
    return 0;
}

TransportError map_curl_error(CURLcode res, const TransferState& st,
                              const std::atomic<bool>& cancelled, const char* errbuf) {
    std::string detail = errbuf[0] ? errbuf : curl_easy_strerror(res);

    if (!st.io_error.empty()) {
        return {TransportError::Kind::Io, "request body read failed: " + st.io_error};
    }
    if (st.aborted_by_handler) {
        return {TransportError::Kind::Aborted, "aborted by receiver"};
    }
    if (cancelled.load()) {
        return TransportError::cancelled();
    }

    switch (res) {
        case CURLE_OPERATION_TIMEDOUT:
            return {TransportError::Kind::Timeout, "timed out: " + detail};
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CACERT_BADFILE:
            return {TransportError::Kind::Tls, "TLS failure: " + detail};
        default:
            return {TransportError::Kind::Network, detail};
    }
}

long to_curl_ms(std::chrono::milliseconds ms) {
    return static_cast<long>(ms.count());
}

}  // namespace

// ============================================================================
// CurlTransport::Task
// ============================================================================

class CurlTransport::Task : public TransportTask {
public:
    Task(uint64_t id, const TransportConfig& config, HttpRequest request, TransportHandlers handlers)
        : id_(id), config_(config), request_(std::move(request)), handlers_(std::move(handlers)) {}

    ~Task() override {
        cancel();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    void launch() {
        thread_ = std::thread([this]() { run(); });
    }

    void cancel() override { cancelled_.store(true); }
    uint64_t id() const override { return id_; }

    bool finished() const { return finished_.load(); }

    void join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    void run();
    TransportError perform(CURL* curl);

    const uint64_t id_;
    const TransportConfig& config_;
    HttpRequest request_;
    TransportHandlers handlers_;
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> finished_{false};
    std::thread thread_;
};

void CurlTransport::Task::run() {
    TransportError result;

    if (cancelled_.load()) {
        result = TransportError::cancelled();
    } else {
        CURL* curl = curl_easy_init();
        if (!curl) {
            result = {TransportError::Kind::Network, "curl_easy_init failed"};
        } else {
            result = perform(curl);
            curl_easy_cleanup(curl);
        }
    }

    if (handlers_.on_complete) {
        handlers_.on_complete(result);
    }
    // Drop captured state (and anything it keeps alive) as soon as we are done
    handlers_ = TransportHandlers{};
    finished_.store(true);
}

TransportError CurlTransport::Task::perform(CURL* curl) {
    TransferState st;
    st.handlers = &handlers_;
    st.cancelled = &cancelled_;
    st.body_source = request_.body_source.get();
    st.follow_redirects = request_.follow_redirects;

    char errbuf[CURL_ERROR_SIZE];
    errbuf[0] = '\0';

    curl_easy_setopt(curl, CURLOPT_URL, request_.url.c_str());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // Method and body
    const char* method = http_method_to_string(request_.method);
    switch (request_.method) {
        case HttpMethod::GET:
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::HEAD:
            curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
            break;
        case HttpMethod::POST:
        case HttpMethod::PUT:
        case HttpMethod::PATCH:
        case HttpMethod::DELETE:
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            if (request_.method != HttpMethod::POST) {
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method);
            }
            if (request_.body_source) {
                curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
                curl_easy_setopt(curl, CURLOPT_READDATA, &st);
                curl_easy_setopt(curl, CURLOPT_SEEKFUNCTION, seek_callback);
                curl_easy_setopt(curl, CURLOPT_SEEKDATA, &st);
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                                 static_cast<curl_off_t>(request_.body_source->length()));
            } else {
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                                 static_cast<curl_off_t>(request_.body.size()));
                curl_easy_setopt(curl, CURLOPT_POSTFIELDS,
                                 request_.body.empty() ? "" : reinterpret_cast<const char*>(request_.body.data()));
            }
            break;
    }

    // Headers
    struct curl_slist* headers_list = nullptr;
    for (const auto& [name, value] : request_.headers.all()) {
        std::string header = name + ": " + value;
        headers_list = curl_slist_append(headers_list, header.c_str());
    }
    // No 100-continue round trip before chunk bodies
    headers_list = curl_slist_append(headers_list, "Expect:");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers_list);

    if (!config_.user_agent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
    }

    // Response callbacks
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &st);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &st);

    // Progress callback doubles as the cancellation check
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &st);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

    // Timeouts
    auto connect_timeout = request_.connect_timeout.count() > 0 ? request_.connect_timeout
                                                                 : config_.connect_timeout;
    auto idle_timeout = request_.idle_timeout.count() > 0 ? request_.idle_timeout
                                                           : config_.idle_timeout;
    auto total_timeout = request_.total_timeout.count() > 0 ? request_.total_timeout
                                                             : config_.total_timeout;
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, to_curl_ms(connect_timeout));
    if (idle_timeout.count() > 0) {
        long secs = std::max<long>(1, static_cast<long>((idle_timeout.count() + 999) / 1000));
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, secs);
    }
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, to_curl_ms(total_timeout));

    // Trust policy
    if (config_.trust == TrustPolicy::AcceptAll) {
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
    } else {
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
        if (!config_.ca_bundle.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, config_.ca_bundle.c_str());
        }
    }

    if (request_.follow_redirects) {
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
        // Keep the method and body across 301/302/303
        curl_easy_setopt(curl, CURLOPT_POSTREDIR, static_cast<long>(CURL_REDIR_POST_ALL));
    }

    if (config_.verbose) {
        curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
    }

    if (verbose_logging()) {
        log_debug("[task %llu] %s %s (body %llu bytes)", static_cast<unsigned long long>(id_),
                  method, request_.url.c_str(),
                  static_cast<unsigned long long>(request_.body_length()));
        for (const auto& [name, value] : request_.headers.all()) {
            log_debug("[task %llu]   %s: %s", static_cast<unsigned long long>(id_),
                      name.c_str(), mask_header_value(name, value).c_str());
        }
    }

    CURLcode res = curl_easy_perform(curl);

    curl_slist_free_all(headers_list);

    if (res == CURLE_OK) {
        // Body-less responses never hit the blank-line path in some cases
        // (e.g. HTTP/2 HEAD); make sure the head is reported.
        if (!st.head_delivered) {
            long code = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
            st.head.status_code = static_cast<int>(code);
            st.head_delivered = true;
            if (handlers_.on_response && !handlers_.on_response(st.head)) {
                return {TransportError::Kind::Aborted, "aborted by receiver"};
            }
        }
        log_debug("[task %llu] -> %d", static_cast<unsigned long long>(id_), st.head.status_code);
        return {};
    }

    TransportError error = map_curl_error(res, st, cancelled_, errbuf);
    if (error.kind != TransportError::Kind::Cancelled && error.kind != TransportError::Kind::Aborted) {
        log_debug("[task %llu] %s %s failed: %s", static_cast<unsigned long long>(id_),
                  method, request_.url.c_str(), error.message.c_str());
    }
    return error;
}

// ============================================================================
// CurlTransport
// ============================================================================

CurlTransport::CurlTransport(TransportConfig config) : config_(std::move(config)) {
    static std::once_flag curl_init_flag;
    std::call_once(curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_ALL);
    });

    if (config_.trust == TrustPolicy::AcceptAll) {
        static std::once_flag warning_flag;
        std::call_once(warning_flag, []() {
            log_warn("SECURITY WARNING: TLS certificate verification disabled via configuration. "
                     "This exposes connections to man-in-the-middle attacks.");
        });
    }
}

CurlTransport::~CurlTransport() {
    std::vector<std::shared_ptr<Task>> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks.swap(tasks_);
    }
    for (auto& task : tasks) {
        task->cancel();
    }
    for (auto& task : tasks) {
        task->join();
    }
}

std::shared_ptr<TransportTask> CurlTransport::start(HttpRequest request, TransportHandlers handlers) {
    auto task = std::make_shared<Task>(next_id_.fetch_add(1), config_,
                                       std::move(request), std::move(handlers));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reap_finished_locked();
        tasks_.push_back(task);
    }
    task->launch();
    return task;
}

void CurlTransport::reap_finished_locked() {
    auto it = std::remove_if(tasks_.begin(), tasks_.end(), [](const std::shared_ptr<Task>& t) {
        if (!t->finished()) return false;
        t->join();
        return true;
    });
    tasks_.erase(it, tasks_.end());
}

}  // namespace gigvault
