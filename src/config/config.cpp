#include "config/config.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace testsieve {

namespace {

const char* env_or_null(const char* name) {
    const char* value = std::getenv(name);
    if (value && *value) return value;
    return nullptr;
}

bool parse_bool(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value == "true" || value == "1" || value == "yes";
}

template <typename T>
void parse_number(const char* name, T& out) {
    const char* value = env_or_null(name);
    if (!value) return;
    try {
        long long parsed = std::stoll(value);
        if (parsed < 0) {
            spdlog::warn("Ignoring negative value for {}: {}", name, value);
            return;
        }
        out = static_cast<T>(parsed);
    } catch (const std::exception&) {
        spdlog::warn("Ignoring non-numeric value for {}: {}", name, value);
    }
}

// "host:port" or bare "host"
void parse_server(const std::string& value, Config& cfg) {
    auto colon = value.rfind(':');
    if (colon == std::string::npos) {
        cfg.server_host = value;
        return;
    }
    cfg.server_host = value.substr(0, colon);
    try {
        int port = std::stoi(value.substr(colon + 1));
        if (port > 0 && port < 65536) {
            cfg.server_port = static_cast<uint16_t>(port);
        }
    } catch (const std::exception&) {
        spdlog::warn("Ignoring invalid port in TESTSIEVE_SERVER: {}", value);
    }
}

}  // namespace

bool Config::network_store_configured() const {
    return net_enabled && !server_host.empty() && !repo_id.empty() && !job_id.empty();
}

Config& get_config() {
    static Config cfg = Config::from_env();
    return cfg;
}

Config Config::from_env() {
    Config cfg;

    if (const char* v = env_or_null("TESTSIEVE_DATAFILE")) cfg.data_file = v;
    if (const char* v = env_or_null("TESTSIEVE_ENVIRONMENT")) cfg.environment = v;
    if (const char* v = env_or_null("TESTSIEVE_LOG_LEVEL")) cfg.log_level = v;
    if (const char* v = env_or_null("TESTSIEVE_CONSISTENCY_CHECK")) cfg.consistency_check = parse_bool(v);

    parse_number("TESTSIEVE_BATCH_SIZE", cfg.batch_size);
    if (cfg.batch_size == 0) cfg.batch_size = 1;

    if (const char* v = env_or_null("TESTSIEVE_NET_ENABLED")) cfg.net_enabled = parse_bool(v);
    if (const char* v = env_or_null("TESTSIEVE_SERVER")) parse_server(v, cfg);

    if (const char* v = env_or_null("REPO_ID")) {
        cfg.repo_id = v;
    } else if (const char* gh = env_or_null("GITHUB_REPOSITORY")) {
        cfg.repo_id = gh;
    }
    if (const char* v = env_or_null("JOB_ID")) cfg.job_id = v;
    if (const char* v = env_or_null("TESTSIEVE_AUTH_TOKEN")) cfg.auth_token = v;
    if (const char* v = env_or_null("RUN_ID")) {
        cfg.run_id = v;
    } else if (const char* gh = env_or_null("GITHUB_RUN_ID")) {
        cfg.run_id = gh;
    }

    int64_t timeout_ms = cfg.net_timeout.count();
    parse_number("TESTSIEVE_NET_TIMEOUT_MS", timeout_ms);
    cfg.net_timeout = std::chrono::milliseconds(timeout_ms);
    parse_number("TESTSIEVE_NET_RETRIES", cfg.net_retries);

    if (const char* v = env_or_null("TESTSIEVE_BIND")) cfg.bind_address = v;
    int port = cfg.port;
    parse_number("TESTSIEVE_PORT", port);
    if (port > 0 && port < 65536) cfg.port = static_cast<uint16_t>(port);
    if (const char* v = env_or_null("TESTSIEVE_SERVER_DATA_DIR")) cfg.server_data_dir = v;

    if (cfg.net_enabled && !cfg.network_store_configured()) {
        if (cfg.server_host.empty()) {
            spdlog::warn("TESTSIEVE_NET_ENABLED is true but TESTSIEVE_SERVER is not set");
        } else if (cfg.repo_id.empty()) {
            spdlog::warn("TESTSIEVE_NET_ENABLED is true but REPO_ID/GITHUB_REPOSITORY is not set");
        } else {
            spdlog::warn("TESTSIEVE_NET_ENABLED is true but JOB_ID is not set");
        }
    }

    return cfg;
}

void configure_logging(const Config& config) {
    spdlog::set_level(spdlog::level::from_str(config.log_level));
    spdlog::set_pattern("%l: %v");
}

}  // namespace testsieve
