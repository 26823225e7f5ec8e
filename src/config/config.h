#pragma once
#ifndef TESTSIEVE_CONFIG_H
#define TESTSIEVE_CONFIG_H

#include <string>
#include <cstdint>
#include <chrono>

namespace testsieve {

struct Config {
    // Selection client
    std::string data_file = ".testsievedata";
    std::string environment = "default";
    size_t batch_size = 250;
    std::string log_level = "info";
    bool consistency_check = false;

    // Network store client
    bool net_enabled = false;
    std::string server_host;
    uint16_t server_port = 7878;
    std::string repo_id;
    std::string job_id;
    std::string auth_token;
    std::string run_id;
    std::chrono::milliseconds net_timeout{60000};
    int net_retries = 3;

    // Network store server
    std::string bind_address = "0.0.0.0";
    uint16_t port = 7878;
    std::string server_data_dir = "/tmp/testsieve";

    // True when every setting needed by the network store is present.
    bool network_store_configured() const;

    // Unparseable numeric values keep their defaults.
    static Config from_env();
};

Config& get_config();

void configure_logging(const Config& config);

}  // namespace testsieve

#endif  // TESTSIEVE_CONFIG_H
