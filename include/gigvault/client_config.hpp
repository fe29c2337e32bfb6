#pragma once

#include "gigvault/archive_api.hpp"
#include "gigvault/transport.hpp"
#include "gigvault/upload_orchestrator.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gigvault {

/// Configuration for one gigvault invocation.
struct ClientConfig {
    enum class Command { None, Upload, Resume, Delete, Tokens, Serve };

    Command command = Command::None;
    // upload: <file>; resume: <location> <file>; delete: <file_id>; serve: [media URL...]
    std::vector<std::string> positional;

    // Server
    std::string server_url;
    std::string username;   // or GIGVAULT_USER
    std::string password;   // or GIGVAULT_PASSWORD
    bool allow_insecure_tls = false;
    std::filesystem::path ca_bundle;

    // Upload
    std::string strategy = "resumable";
    std::string tus_endpoint;  // Default: <server_url>/files/
    size_t chunk_size = kDefaultChunkSize;
    uint64_t max_upload_bytes = kDefaultMaxUploadBytes;
    UploadMetadata metadata;   // event_date defaults to today
    bool verify_checksum = false;

    // Timeouts
    size_t connect_timeout_secs = 30;
    size_t request_timeout_secs = 120;   // idle: no bytes moving
    size_t resource_timeout_secs = 600;  // whole chunk / multipart POST

    // Delete-token store
    std::filesystem::path token_db;  // Default: ~/.gigvault/tokens.db
    std::string delete_token;        // delete: override the stored token
    bool clear_tokens = false;       // tokens: forget this server's entries

    // Relay
    size_t relay_port = 0;  // 0 = ephemeral

    // Logging
    bool verbose = false;
    std::filesystem::path log_file;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = 15;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error (prints usage to stderr).
    static std::optional<ClientConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill in defaults (tus_endpoint, token_db, event_date).
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;

    /// delete: the positional file id. nullopt unless it is a positive
    /// decimal that fits in int64_t.
    std::optional<int64_t> delete_file_id() const;

    ServerEndpoint endpoint() const;
    TransportConfig transport_config() const;
    OrchestratorOptions orchestrator_options() const;
};

const char* command_name(ClientConfig::Command command);

}  // namespace gigvault
