/*
 * MCP Bridge
 * ==========
 * Connects to an MCP relay over WebSocket and serves a small set of demo
 * tools, a status resource and a greeting prompt until interrupted.
 *
 * Usage:
 *   ./mcp-bridge --instance my-app
 *   ./mcp-bridge --config bridge.json --log-level debug
 */

#include <mcpbridge/bridge.hpp>
#include <mcpbridge/log.hpp>

#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

using namespace mcpbridge;

namespace {

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config FILE       Path to bridge configuration JSON file\n"
              << "  --host HOST         Relay host (default: localhost)\n"
              << "  --port PORT         Relay port (default: 3003)\n"
              << "  --instance ID       Instance identifier (default: default)\n"
              << "  --log-level LEVEL   trace, debug, info, warn, error or off (default: info)\n"
              << "  --disabled          Start without connecting\n"
              << "  --help              Show this help message\n\n"
              << "Examples:\n"
              << "  " << program_name << " --instance my-app\n"
              << "  " << program_name << " --config bridge.json --port 4000\n"
              << std::endl;
}

json number_pair_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"a", {{"type", "number"}, {"description", "First number"}}},
            {"b", {{"type", "number"}, {"description", "Second number"}}}
        }},
        {"required", {"a", "b"}}
    };
}

double number_argument(const json& args, const char* key) {
    auto it = args.find(key);
    if (it == args.end() || !it->is_number()) {
        throw std::invalid_argument(std::string("Argument '") + key + "' must be a number");
    }
    return it->get<double>();
}

void register_demo_capabilities(McpBridge& bridge, std::chrono::steady_clock::time_point started) {
    // Tools
    bridge.register_tool(
        {"add", "Add two numbers together", number_pair_schema()},
        [](const json& args) -> json {
            return number_argument(args, "a") + number_argument(args, "b");
        }
    );

    bridge.register_tool(
        {"multiply", "Multiply two numbers", number_pair_schema()},
        [](const json& args) -> json {
            return number_argument(args, "a") * number_argument(args, "b");
        }
    );

    bridge.register_tool(
        {"echo", "Echo a message back",
         {
             {"type", "object"},
             {"properties", {
                 {"message", {{"type", "string"}, {"description", "Message to echo"}}}
             }},
             {"required", {"message"}}
         }},
        [](const json& args) -> json {
            auto it = args.find("message");
            if (it == args.end() || !it->is_string()) {
                throw std::invalid_argument("Argument 'message' must be a string");
            }
            return text_result(it->get<std::string>());
        }
    );

    // Resources
    ResourceDescriptor status;
    status.uri = "bridge://status";
    status.name = "Bridge status";
    status.description = "Connection status and registered capabilities";
    status.mime_type = "application/json";
    bridge.register_resource(status, [&bridge, started]() {
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - started);
        json body = {
            {"status", to_string(bridge.status())},
            {"uptime_seconds", uptime.count()},
            {"tools", bridge.registry().tool_count()},
            {"resources", bridge.registry().resource_count()},
            {"prompts", bridge.registry().prompt_count()}
        };

        ResourceContent content;
        content.uri = "bridge://status";
        content.mime_type = "application/json";
        content.text = body.dump(2);
        return std::vector<ResourceContent>{content};
    });

    // Prompts
    PromptDescriptor greeting;
    greeting.name = "greeting";
    greeting.description = "Greet someone by name";
    greeting.arguments.push_back({"name", std::string("Who to greet"), true});
    bridge.register_prompt(greeting, [](const std::optional<PromptArguments>& args) {
        std::string name = "there";
        if (args) {
            auto it = args->find("name");
            if (it != args->end() && !it->second.empty()) {
                name = it->second;
            }
        }

        PromptResult result;
        result.description = "Greeting for " + name;
        result.messages.push_back(PromptMessage::text(Role::User, "Say hello to " + name + "."));
        return result;
    });
}

} // namespace

int main(int argc, char* argv[]) {
    // Parse command line arguments
    std::string config_path;
    std::string host;
    std::string instance_id;
    std::string log_level;
    std::optional<int> port;
    bool disabled = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        }
        else if (arg == "--host" && i + 1 < argc) {
            host = argv[++i];
        }
        else if (arg == "--port" && i + 1 < argc) {
            try {
                port = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: invalid port '" << argv[i] << "'" << std::endl;
                return 1;
            }
        }
        else if (arg == "--instance" && i + 1 < argc) {
            instance_id = argv[++i];
        }
        else if (arg == "--log-level" && i + 1 < argc) {
            log_level = argv[++i];
        }
        else if (arg == "--disabled") {
            disabled = true;
        }
        else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    BridgeConfig config;
    try {
        if (!config_path.empty()) {
            config = load_config(config_path);
        }

        // Command line flags override the config file
        json overrides = json::object();
        if (!host.empty()) {
            overrides["host"] = host;
        }
        if (port) {
            overrides["port"] = *port;
        }
        if (!instance_id.empty()) {
            overrides["instance_id"] = instance_id;
        }
        if (!log_level.empty()) {
            overrides["log_level"] = log_level;
        }
        if (disabled) {
            overrides["enabled"] = false;
        }
        config = parse_config(overrides, config);
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    Logger::instance().set_level(config.log_level);
    Logger::instance().set_log_file(config.log_file);

    try {
        boost::asio::io_context io;
        McpBridge bridge(io, config);

        auto started = std::chrono::steady_clock::now();
        register_demo_capabilities(bridge, started);

        bridge.on_status_change([](ConnectionStatus status) {
            MCPBRIDGE_LOG_INFO("main", "Bridge status: " << to_string(status));
        });

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            MCPBRIDGE_LOG_INFO("main", "Received signal " << signal_number << ", shutting down");
            bridge.shutdown();
            io.stop();
        });

        bridge.init();
        io.run();
    } catch (const std::exception& e) {
        MCPBRIDGE_LOG_ERROR("main", "Bridge error: " << e.what());
        return 1;
    }

    return 0;
}
