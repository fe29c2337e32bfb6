#include "gigvault/client_config.hpp"
#include "gigvault/log.hpp"
#include "gigvault/metrics.hpp"
#include "gigvault/proxy_loader.hpp"
#include "gigvault/proxy_relay.hpp"
#include "gigvault/token_store.hpp"
#include "gigvault/upload_orchestrator.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <memory>
#include <thread>
#include <unistd.h>

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;

constexpr int kExitCancelled = 130;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}

void install_signal_handlers() {
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

std::unique_ptr<gigvault::DeleteTokenStore> open_token_store(const gigvault::ClientConfig& config) {
    try {
        return std::make_unique<gigvault::DeleteTokenStore>(config.token_db);
    } catch (const std::exception& e) {
        gigvault::log_error("%s", e.what());
        return nullptr;
    }
}

std::string format_time(int64_t epoch_ms) {
    time_t t = static_cast<time_t>(epoch_ms / 1000);
    struct tm tm_val;
    localtime_r(&t, &tm_val);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm_val);
    return buf;
}

// --- upload / resume ---

int run_upload(const gigvault::ClientConfig& config, gigvault::Transport& transport,
               gigvault::MetricsExporter& metrics) {
    auto store = open_token_store(config);
    gigvault::UploadOrchestrator orchestrator(transport, config.endpoint(),
                                              config.orchestrator_options(), &metrics, store.get());

    // Cancel from a normal thread, never from signal context
    std::atomic<bool> done{false};
    std::thread watcher([&] {
        while (!done.load()) {
            if (g_shutdown_requested) {
                orchestrator.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    });

    int last_percent = -1;
    auto on_progress = [&last_percent](uint64_t acked, uint64_t total) {
        int percent = total == 0 ? 100 : static_cast<int>(acked * 100 / total);
        if (percent / 5 != last_percent / 5 || acked == total) {
            last_percent = percent;
            gigvault::log_info("Progress: %llu/%llu bytes (%d%%)",
                               static_cast<unsigned long long>(acked),
                               static_cast<unsigned long long>(total), percent);
        }
    };

    gigvault::UploadOutcome outcome;
    if (config.command == gigvault::ClientConfig::Command::Resume) {
        outcome = orchestrator.resume(config.positional[0], config.positional[1], config.metadata,
                                      on_progress);
    } else {
        outcome = orchestrator.upload(config.positional[0], config.metadata, on_progress);
    }
    done = true;
    watcher.join();

    if (outcome.checksum_verified && !*outcome.checksum_verified) {
        std::cerr << "Warning: server checksum does not match the local file" << std::endl;
    }

    switch (outcome.status) {
        case gigvault::UploadStatus::Success:
            std::cout << "Uploaded: id=" << outcome.record->id
                      << " sha256=" << outcome.record->checksum_sha256
                      << " delete_token=" << outcome.record->delete_token << std::endl;
            return 0;
        case gigvault::UploadStatus::DuplicateMerged:
            std::cout << "Already stored: id=" << outcome.record->id
                      << " sha256=" << outcome.record->checksum_sha256
                      << " (duplicate content, cannot be deleted)" << std::endl;
            return 0;
        case gigvault::UploadStatus::Cancelled:
            std::cout << "Cancelled";
            if (!outcome.location.empty()) {
                std::cout << "; resume with: gigvault resume " << outcome.location << " "
                          << config.positional.back();
            }
            std::cout << std::endl;
            return kExitCancelled;
        case gigvault::UploadStatus::Failed:
            break;
    }

    std::cerr << "Upload failed (" << gigvault::upload_error_name(outcome.error) << "): "
              << outcome.message << std::endl;
    if (outcome.conflict) {
        std::cerr << "  existing file id: " << outcome.conflict->existing_id
                  << " sha256=" << outcome.conflict->checksum_sha256 << std::endl;
    }
    if (!outcome.location.empty() && outcome.bytes_acked < outcome.total_bytes) {
        std::cerr << "  resume with: gigvault resume " << outcome.location << " "
                  << config.positional.back() << std::endl;
    }
    return 1;
}

// --- delete ---

int run_delete(const gigvault::ClientConfig& config, gigvault::Transport& transport) {
    auto parsed_id = config.delete_file_id();
    if (!parsed_id) {
        std::cerr << "Invalid file_id: " << config.positional.front() << std::endl;
        return 1;
    }
    int64_t file_id = *parsed_id;
    std::string host = config.endpoint().host_key();
    auto store = open_token_store(config);

    std::string token = config.delete_token;
    if (token.empty()) {
        gigvault::StoredUpload entry;
        if (!store || !store->find(host, file_id, entry)) {
            std::cerr << "No delete token stored for file " << file_id << " on " << host
                      << " (use --token)" << std::endl;
            return 1;
        }
        token = entry.delete_token;
    }

    gigvault::ArchiveClient api(transport, config.endpoint());
    auto result = api.delete_media(file_id, token);
    if (!result.success) {
        if (result.invalid_token) {
            std::cerr << "Delete refused: the token for file " << file_id
                      << " is invalid or stale" << std::endl;
        } else {
            std::cerr << "Delete failed: " << result.error_message << std::endl;
        }
        return 1;
    }

    if (store) store->remove(host, file_id);
    std::cout << "Deleted file " << file_id << " (" << result.deleted_count << " deleted, "
              << result.error_count << " errors)" << std::endl;
    return 0;
}

// --- tokens ---

int run_tokens(const gigvault::ClientConfig& config) {
    auto store = open_token_store(config);
    if (!store) return 1;
    std::string host = config.endpoint().host_key();

    if (config.clear_tokens) {
        if (!store->clear(host)) return 1;
        std::cout << "Cleared delete tokens for " << host << std::endl;
        return 0;
    }

    auto entries = store->list(host);
    if (entries.empty()) {
        std::cout << "No stored uploads for " << host << std::endl;
        return 0;
    }
    for (const auto& e : entries) {
        std::cout << e.file_id << "\t" << format_time(e.created_at) << "\t" << e.event_date
                  << "\t" << e.org_name << "\t" << e.label << "\t" << e.file_name << std::endl;
    }
    return 0;
}

// --- serve ---

int run_serve(const gigvault::ClientConfig& config, gigvault::Transport& transport,
              gigvault::MetricsExporter& metrics) {
    gigvault::ProxyLoaderOptions options;
    options.username = config.username;
    options.password = config.password;
    options.idle_timeout = std::chrono::seconds(config.request_timeout_secs);

    gigvault::StreamingProxyLoader loader(transport, options, &metrics);
    metrics.set_active_requests_source([&loader] { return loader.active_requests(); });

    gigvault::ProxyRelayServer relay(loader, static_cast<uint16_t>(config.relay_port));
    auto err = relay.start();
    if (!err.empty()) {
        std::cerr << "Failed to start relay: " << err << std::endl;
        metrics.set_active_requests_source(nullptr);
        return 1;
    }

    for (const auto& url : config.positional) {
        auto relay_url = relay.proxy_url_for(url);
        if (relay_url.empty()) {
            std::cerr << "Not a URL: " << url << std::endl;
        } else {
            std::cout << url << " -> " << relay_url << std::endl;
        }
    }
    std::cout << "gigvault relay running on 127.0.0.1:" << relay.port() << " (PID " << getpid()
              << ")" << std::endl;

    // Wait until shutdown signal, then stop outside signal context.
    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    relay.stop();
    loader.drain();
    metrics.set_active_requests_source(nullptr);
    std::cout << "gigvault relay exited cleanly" << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = gigvault::ClientConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    // Redirect log output if log file specified
    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(
            std::filesystem::path(config.log_file).parent_path(), ec);
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (log) {
            dup2(fileno(log), STDOUT_FILENO);
            dup2(fileno(log), STDERR_FILENO);
            fclose(log);
        }
    }

    gigvault::set_verbose_logging(config.verbose);
    gigvault::log_debug("gigvault %s: server=%s user=%s password=%s trust=%s",
                        gigvault::command_name(config.command), config.server_url.c_str(),
                        config.username.empty() ? "(none)" : config.username.c_str(),
                        config.password.empty() ? "(none)" : "****",
                        config.allow_insecure_tls ? "accept-all" : "verify");

    install_signal_handlers();

    gigvault::MetricsExporter metrics(config.metrics_file,
                                      std::chrono::seconds(config.metrics_interval_secs),
                                      {{"host", config.endpoint().host_key()}});
    metrics.start();

    int rc = 0;
    {
        gigvault::CurlTransport transport(config.transport_config());
        switch (config.command) {
            case gigvault::ClientConfig::Command::Upload:
            case gigvault::ClientConfig::Command::Resume:
                rc = run_upload(config, transport, metrics);
                break;
            case gigvault::ClientConfig::Command::Delete:
                rc = run_delete(config, transport);
                break;
            case gigvault::ClientConfig::Command::Tokens:
                rc = run_tokens(config);
                break;
            case gigvault::ClientConfig::Command::Serve:
                rc = run_serve(config, transport, metrics);
                break;
            case gigvault::ClientConfig::Command::None:
                rc = 1;
                break;
        }
    }

    metrics.stop();
    return rc;
}
