#include <mcpbridge/config.hpp>

#include <fstream>

namespace mcpbridge {

namespace {

std::string read_string(const json& config, const char* key, const std::string& fallback) {
    auto it = config.find(key);
    if (it == config.end()) {
        return fallback;
    }
    if (!it->is_string()) {
        throw ConfigError(std::string("'") + key + "' must be a string");
    }
    return it->get<std::string>();
}

bool read_bool(const json& config, const char* key, bool fallback) {
    auto it = config.find(key);
    if (it == config.end()) {
        return fallback;
    }
    if (!it->is_boolean()) {
        throw ConfigError(std::string("'") + key + "' must be a boolean");
    }
    return it->get<bool>();
}

long long read_integer(const json& config, const char* key, long long fallback, long long min, long long max) {
    auto it = config.find(key);
    if (it == config.end()) {
        return fallback;
    }
    if (!it->is_number_integer()) {
        throw ConfigError(std::string("'") + key + "' must be an integer");
    }
    long long value = it->get<long long>();
    if (value < min || value > max) {
        throw ConfigError(std::string("'") + key + "' is out of range: " + std::to_string(value));
    }
    return value;
}

std::chrono::milliseconds read_millis(const json& config, const char* key, std::chrono::milliseconds fallback,
                                      long long min) {
    return std::chrono::milliseconds(read_integer(config, key, fallback.count(), min, 24LL * 3600 * 1000));
}

const json& section(const json& config, const char* key) {
    static const json empty = json::object();
    auto it = config.find(key);
    if (it == config.end()) {
        return empty;
    }
    if (!it->is_object()) {
        throw ConfigError(std::string("'") + key + "' must be an object");
    }
    return *it;
}

} // namespace

ConnectionOptions BridgeConfig::connection_options() const {
    ConnectionOptions options;
    options.host = host;
    options.port = port;
    options.instance_id = instance_id;
    options.base_delay = base_delay;
    options.max_delay = max_delay;
    return options;
}

BridgeConfig parse_config(const json& config, BridgeConfig base) {
    if (!config.is_object()) {
        throw ConfigError("configuration must be a JSON object");
    }

    BridgeConfig result = std::move(base);
    result.host = read_string(config, "host", result.host);
    result.port = static_cast<int>(read_integer(config, "port", result.port, 1, 65535));
    result.instance_id = read_string(config, "instance_id", result.instance_id);
    result.enabled = read_bool(config, "enabled", result.enabled);

    const json& reconnect = section(config, "reconnect");
    result.base_delay = read_millis(reconnect, "base_delay_ms", result.base_delay, 1);
    result.max_delay = read_millis(reconnect, "max_delay_ms", result.max_delay, 1);
    if (result.max_delay < result.base_delay) {
        throw ConfigError("'reconnect.max_delay_ms' must not be below 'reconnect.base_delay_ms'");
    }

    result.keepalive_interval = read_millis(config, "keepalive_interval_ms", result.keepalive_interval, 1);
    result.connect_timeout = read_millis(config, "connect_timeout_ms", result.connect_timeout, 1);

    const json& server_info = section(config, "server_info");
    result.server_info.name = read_string(server_info, "name", result.server_info.name);
    result.server_info.version = read_string(server_info, "version", result.server_info.version);

    auto level_it = config.find("log_level");
    if (level_it != config.end()) {
        if (!level_it->is_string()) {
            throw ConfigError("'log_level' must be a string");
        }
        try {
            result.log_level = parse_log_level(level_it->get<std::string>());
        } catch (const std::invalid_argument& e) {
            throw ConfigError(e.what());
        }
    }
    result.log_file = read_string(config, "log_file", result.log_file);

    if (result.host.empty()) {
        throw ConfigError("'host' must not be empty");
    }
    return result;
}

BridgeConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Failed to open config file: " + path);
    }

    json config;
    try {
        file >> config;
    } catch (const json::parse_error& e) {
        throw ConfigError("Failed to parse config file " + path + ": " + e.what());
    }
    return parse_config(config);
}

} // namespace mcpbridge
