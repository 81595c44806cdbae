#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

#include <mcpbridge/connection_manager.hpp>
#include <mcpbridge/log.hpp>
#include <mcpbridge/types.hpp>

using json = nlohmann::json;

namespace mcpbridge {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Bridge configuration. Every field has a default; a config file only
// needs the keys it overrides.
struct BridgeConfig {
    std::string host = "localhost";
    int port = 3003;
    std::string instance_id;
    bool enabled = true;

    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    std::chrono::milliseconds keepalive_interval{20000};
    std::chrono::milliseconds connect_timeout{5000};

    ServerInfo server_info;

    LogLevel log_level = LogLevel::INFO;
    std::string log_file;

    ConnectionOptions connection_options() const;
};

// Applies the keys present in config on top of base. Throws ConfigError for
// wrongly typed or out of range values.
BridgeConfig parse_config(const json& config, BridgeConfig base = BridgeConfig());

// Reads and parses a JSON config file. Throws ConfigError.
BridgeConfig load_config(const std::string& path);

} // namespace mcpbridge
