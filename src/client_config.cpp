#include "gigvault/client_config.hpp"
#include "gigvault/token_store.hpp"

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace gigvault {

const char* command_name(ClientConfig::Command command) {
    switch (command) {
        case ClientConfig::Command::None: return "none";
        case ClientConfig::Command::Upload: return "upload";
        case ClientConfig::Command::Resume: return "resume";
        case ClientConfig::Command::Delete: return "delete";
        case ClientConfig::Command::Tokens: return "tokens";
        case ClientConfig::Command::Serve: return "serve";
    }
    return "unknown";
}

namespace {

std::optional<ClientConfig::Command> parse_command(const std::string& name) {
    if (name == "upload") return ClientConfig::Command::Upload;
    if (name == "resume") return ClientConfig::Command::Resume;
    if (name == "delete") return ClientConfig::Command::Delete;
    if (name == "tokens") return ClientConfig::Command::Tokens;
    if (name == "serve") return ClientConfig::Command::Serve;
    return std::nullopt;
}

void print_usage() {
    std::cerr <<
        "Usage: gigvault <command> [options]\n"
        "\n"
        "Commands:\n"
        "  upload <file>                    Upload a media file, then register it\n"
        "  resume <location> <file>         Continue an interrupted upload\n"
        "  delete <file_id>                 Delete an upload using its stored token\n"
        "  tokens                           List stored delete tokens for the server\n"
        "  serve [media URL...]             Run the playback relay\n"
        "\n"
        "Server:\n"
        "  --server <url>                   Archive base URL (required)\n"
        "  --user <name>                    Basic auth user (or GIGVAULT_USER env)\n"
        "  --password <pass>                Basic auth password (or GIGVAULT_PASSWORD env)\n"
        "  --insecure                       Accept self-signed TLS certificates\n"
        "  --ca-bundle <path>               CA bundle used to verify the server\n"
        "\n"
        "Upload metadata:\n"
        "  --date <yyyy-MM-dd>              Event date (default: today)\n"
        "  --org <name>                     Band or organisation (required)\n"
        "  --event-type <type>              e.g. band, wedding (required)\n"
        "  --label <text>                   Title of the recording (required)\n"
        "  --participants <text>            Optional\n"
        "  --keywords <text>                Optional\n"
        "  --location <text>                Optional\n"
        "  --rating <text>                  Optional\n"
        "  --notes <text>                   Optional\n"
        "\n"
        "Upload options:\n"
        "  --strategy <resumable|multipart> Transfer strategy (default: resumable)\n"
        "  --tus-endpoint <url>             Upload creation URL (default: <server>/files/)\n"
        "  --chunk-size <bytes>             Resumable chunk size (default: 5242880)\n"
        "  --max-upload-bytes <N>           Refuse larger files (default: 6442450944)\n"
        "  --verify                         Compare the local SHA-256 with the server's\n"
        "  --connect-timeout <secs>         Connect timeout (default: 30)\n"
        "  --request-timeout <secs>         Abort when no bytes move (default: 120)\n"
        "  --resource-timeout <secs>        Whole-request limit for uploads (default: 600)\n"
        "\n"
        "Other options:\n"
        "  --config <path>                  JSON config file\n"
        "  --token-db <path>                Delete-token database (default: ~/.gigvault/tokens.db)\n"
        "  --token <token>                  delete: use this token instead of the stored one\n"
        "  --clear                          tokens: forget every token for the server\n"
        "  --relay-port <port>              serve: loopback port (default: ephemeral)\n"
        "  --verbose                        Verbose output\n"
        "  --log-file <path>                Log file path\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --help                           Show this help\n";
}

}  // namespace

std::optional<ClientConfig> ClientConfig::from_args(int argc, char* argv[]) {
    ClientConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg.empty() || arg[0] != '-') {
                if (config.command == Command::None) {
                    auto cmd = parse_command(arg);
                    if (!cmd) {
                        std::cerr << "Error: unknown command: " << arg << "\n";
                        return std::nullopt;
                    }
                    config.command = *cmd;
                } else {
                    config.positional.push_back(arg);
                }
                continue;
            }

            if (arg == "--server") {
                auto* v = next_arg(i, "--server");
                if (!v) return std::nullopt;
                config.server_url = v;
            } else if (arg == "--user") {
                auto* v = next_arg(i, "--user");
                if (!v) return std::nullopt;
                config.username = v;
            } else if (arg == "--password") {
                auto* v = next_arg(i, "--password");
                if (!v) return std::nullopt;
                config.password = v;
            } else if (arg == "--insecure") {
                config.allow_insecure_tls = true;
            } else if (arg == "--ca-bundle") {
                auto* v = next_arg(i, "--ca-bundle");
                if (!v) return std::nullopt;
                config.ca_bundle = v;
            } else if (arg == "--date") {
                auto* v = next_arg(i, "--date");
                if (!v) return std::nullopt;
                config.metadata.event_date = v;
            } else if (arg == "--org") {
                auto* v = next_arg(i, "--org");
                if (!v) return std::nullopt;
                config.metadata.org_name = v;
            } else if (arg == "--event-type") {
                auto* v = next_arg(i, "--event-type");
                if (!v) return std::nullopt;
                config.metadata.event_type = v;
            } else if (arg == "--label") {
                auto* v = next_arg(i, "--label");
                if (!v) return std::nullopt;
                config.metadata.label = v;
            } else if (arg == "--participants") {
                auto* v = next_arg(i, "--participants");
                if (!v) return std::nullopt;
                config.metadata.participants = v;
            } else if (arg == "--keywords") {
                auto* v = next_arg(i, "--keywords");
                if (!v) return std::nullopt;
                config.metadata.keywords = v;
            } else if (arg == "--location") {
                auto* v = next_arg(i, "--location");
                if (!v) return std::nullopt;
                config.metadata.location = v;
            } else if (arg == "--rating") {
                auto* v = next_arg(i, "--rating");
                if (!v) return std::nullopt;
                config.metadata.rating = v;
            } else if (arg == "--notes") {
                auto* v = next_arg(i, "--notes");
                if (!v) return std::nullopt;
                config.metadata.notes = v;
            } else if (arg == "--strategy") {
                auto* v = next_arg(i, "--strategy");
                if (!v) return std::nullopt;
                config.strategy = v;
            } else if (arg == "--tus-endpoint") {
                auto* v = next_arg(i, "--tus-endpoint");
                if (!v) return std::nullopt;
                config.tus_endpoint = v;
            } else if (arg == "--chunk-size") {
                auto* v = next_arg(i, "--chunk-size");
                if (!v) return std::nullopt;
                config.chunk_size = std::stoull(v);
            } else if (arg == "--verify") {
                config.verify_checksum = true;
            } else if (arg == "--max-upload-bytes") {
                auto* v = next_arg(i, "--max-upload-bytes");
                if (!v) return std::nullopt;
                config.max_upload_bytes = std::stoull(v);
            } else if (arg == "--connect-timeout") {
                auto* v = next_arg(i, "--connect-timeout");
                if (!v) return std::nullopt;
                config.connect_timeout_secs = std::stoull(v);
            } else if (arg == "--request-timeout") {
                auto* v = next_arg(i, "--request-timeout");
                if (!v) return std::nullopt;
                config.request_timeout_secs = std::stoull(v);
            } else if (arg == "--resource-timeout") {
                auto* v = next_arg(i, "--resource-timeout");
                if (!v) return std::nullopt;
                config.resource_timeout_secs = std::stoull(v);
            } else if (arg == "--config") {
                auto* v = next_arg(i, "--config");
                if (!v) return std::nullopt;
                if (!config.load_json(v)) return std::nullopt;
            } else if (arg == "--token-db") {
                auto* v = next_arg(i, "--token-db");
                if (!v) return std::nullopt;
                config.token_db = v;
            } else if (arg == "--token") {
                auto* v = next_arg(i, "--token");
                if (!v) return std::nullopt;
                config.delete_token = v;
            } else if (arg == "--clear") {
                config.clear_tokens = true;
            } else if (arg == "--relay-port") {
                auto* v = next_arg(i, "--relay-port");
                if (!v) return std::nullopt;
                config.relay_port = std::stoull(v);
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else if (arg == "--log-file") {
                auto* v = next_arg(i, "--log-file");
                if (!v) return std::nullopt;
                config.log_file = v;
            } else if (arg == "--metrics-file") {
                auto* v = next_arg(i, "--metrics-file");
                if (!v) return std::nullopt;
                config.metrics_file = v;
            } else if (arg == "--metrics-interval") {
                auto* v = next_arg(i, "--metrics-interval");
                if (!v) return std::nullopt;
                config.metrics_interval_secs = std::stoull(v);
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return std::nullopt;
            } else {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid number: " << e.what() << "\n";
        return std::nullopt;
    }

    // Credentials from the environment when not given on the command line
    if (config.username.empty()) {
        if (const char* v = std::getenv("GIGVAULT_USER")) config.username = v;
    }
    if (config.password.empty()) {
        if (const char* v = std::getenv("GIGVAULT_PASSWORD")) config.password = v;
    }

    config.apply_defaults();
    return config;
}

bool ClientConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("server_url")) server_url = j["server_url"].get<std::string>();
        if (j.contains("username")) username = j["username"].get<std::string>();
        if (j.contains("password")) password = j["password"].get<std::string>();
        if (j.contains("allow_insecure_tls")) allow_insecure_tls = j["allow_insecure_tls"].get<bool>();
        if (j.contains("ca_bundle")) ca_bundle = j["ca_bundle"].get<std::string>();
        if (j.contains("strategy")) strategy = j["strategy"].get<std::string>();
        if (j.contains("tus_endpoint")) tus_endpoint = j["tus_endpoint"].get<std::string>();
        if (j.contains("chunk_size")) chunk_size = j["chunk_size"].get<size_t>();
        if (j.contains("max_upload_bytes")) max_upload_bytes = j["max_upload_bytes"].get<uint64_t>();
        if (j.contains("verify_checksum")) verify_checksum = j["verify_checksum"].get<bool>();
        if (j.contains("connect_timeout_secs"))
            connect_timeout_secs = j["connect_timeout_secs"].get<size_t>();
        if (j.contains("request_timeout_secs"))
            request_timeout_secs = j["request_timeout_secs"].get<size_t>();
        if (j.contains("resource_timeout_secs"))
            resource_timeout_secs = j["resource_timeout_secs"].get<size_t>();
        if (j.contains("token_db")) token_db = j["token_db"].get<std::string>();
        if (j.contains("relay_port")) relay_port = j["relay_port"].get<size_t>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval_secs"))
            metrics_interval_secs = j["metrics_interval_secs"].get<size_t>();

        // Default metadata for every upload from this config
        if (j.contains("metadata") && j["metadata"].is_object()) {
            auto& jm = j["metadata"];
            if (jm.contains("event_date")) metadata.event_date = jm["event_date"].get<std::string>();
            if (jm.contains("org_name")) metadata.org_name = jm["org_name"].get<std::string>();
            if (jm.contains("event_type")) metadata.event_type = jm["event_type"].get<std::string>();
            if (jm.contains("label")) metadata.label = jm["label"].get<std::string>();
            if (jm.contains("participants")) metadata.participants = jm["participants"].get<std::string>();
            if (jm.contains("keywords")) metadata.keywords = jm["keywords"].get<std::string>();
            if (jm.contains("location")) metadata.location = jm["location"].get<std::string>();
            if (jm.contains("rating")) metadata.rating = jm["rating"].get<std::string>();
            if (jm.contains("notes")) metadata.notes = jm["notes"].get<std::string>();
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void ClientConfig::apply_defaults() {
    if (tus_endpoint.empty() && !server_url.empty()) {
        tus_endpoint = endpoint().url_for("files/");
    }
    if (token_db.empty()) {
        token_db = DeleteTokenStore::default_path();
    }
    if (trim(metadata.event_date).empty() &&
        (command == Command::Upload || command == Command::Resume)) {
        metadata.event_date = today_event_date();
    }
}

std::string ClientConfig::validate() const {
    if (command == Command::None) return "a command is required (upload, resume, delete, tokens, serve)";
    if (server_url.empty()) return "server_url is required (--server)";
    auto parsed = ParsedUrl::parse(server_url);
    if (!parsed || (parsed->scheme != "https" && parsed->scheme != "http")) {
        return "server_url must be an http(s) URL: " + server_url;
    }
    if (!ca_bundle.empty() && !std::filesystem::exists(ca_bundle)) {
        return "ca_bundle does not exist: " + ca_bundle.string();
    }
    if (!parse_upload_strategy(strategy)) return "unknown strategy: " + strategy;
    if (chunk_size == 0) return "chunk_size must be > 0";
    if (max_upload_bytes == 0) return "max_upload_bytes must be > 0";
    if (connect_timeout_secs == 0) return "connect_timeout_secs must be > 0";
    if (relay_port > 65535) return "relay_port must be <= 65535";

    switch (command) {
        case Command::Upload:
        case Command::Resume: {
            size_t want = command == Command::Upload ? 1 : 2;
            if (positional.size() != want) {
                return command == Command::Upload ? "upload takes exactly one file"
                                                  : "resume takes <location> <file>";
            }
            auto err = metadata.validate();
            if (!err.empty()) return err;
            break;
        }
        case Command::Delete: {
            if (positional.size() != 1) return "delete takes exactly one file_id";
            if (!delete_file_id()) {
                return "file_id must be a positive integer: " + positional[0];
            }
            break;
        }
        case Command::Tokens:
            if (!positional.empty()) return "tokens takes no arguments";
            break;
        case Command::Serve:
        case Command::None:
            break;
    }
    return {};
}

std::optional<int64_t> ClientConfig::delete_file_id() const {
    if (positional.size() != 1) return std::nullopt;
    const std::string& id = positional[0];
    if (id.empty() || id.find_first_not_of("0123456789") != std::string::npos) return std::nullopt;

    int64_t value = 0;
    auto [end, ec] = std::from_chars(id.data(), id.data() + id.size(), value);
    if (ec != std::errc() || end != id.data() + id.size() || value <= 0) return std::nullopt;
    return value;
}

ServerEndpoint ClientConfig::endpoint() const {
    ServerEndpoint ep;
    ep.base_url = server_url;
    ep.username = username;
    ep.password = password;
    return ep;
}

TransportConfig ClientConfig::transport_config() const {
    TransportConfig tc;
    tc.trust = allow_insecure_tls ? TrustPolicy::AcceptAll : TrustPolicy::Verify;
    tc.ca_bundle = ca_bundle.string();
    tc.connect_timeout = std::chrono::seconds(connect_timeout_secs);
    tc.idle_timeout = std::chrono::seconds(request_timeout_secs);
    tc.verbose = verbose;
    return tc;
}

OrchestratorOptions ClientConfig::orchestrator_options() const {
    OrchestratorOptions opts;
    opts.strategy = parse_upload_strategy(strategy).value_or(UploadStrategy::Resumable);
    opts.tus_endpoint = tus_endpoint;
    opts.chunk_size = chunk_size;
    opts.max_upload_bytes = max_upload_bytes;
    opts.resource_timeout = std::chrono::seconds(resource_timeout_secs);
    opts.verify_checksum = verify_checksum;
    return opts;
}

}  // namespace gigvault
