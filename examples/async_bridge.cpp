/**
 * Asynchronous Handlers Example
 *
 * Registers a tool and a resource whose work runs on a thread pool and
 * completes later, and resolves the instance identifier from the
 * environment.
 */

#include <mcpbridge/bridge.hpp>
#include <mcpbridge/log.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>

using namespace mcpbridge;

int main(int argc, char* argv[]) {
    std::string host = (argc > 1) ? argv[1] : "localhost";
    int port = (argc > 2) ? std::stoi(argv[2]) : 3003;

    Logger::instance().set_level(LogLevel::DEBUG);

    boost::asio::io_context io;
    boost::asio::thread_pool workers(2);

    BridgeConfig config;
    config.host = host;
    config.port = port;
    config.server_info.name = "async-example";

    McpBridge bridge(io, config);

    // Identifier comes from MCP_BRIDGE_INSTANCE, or "default" when unset
    bridge.set_instance_id_resolver([&workers](InstanceIdCallback done) {
        boost::asio::post(workers, [done]() {
            const char* instance = std::getenv("MCP_BRIDGE_INSTANCE");
            done(nullptr, instance ? instance : "");
        });
    });

    // Slow tool: sleeps on a worker, then reports back
    bridge.register_async_tool(
        {"sleep", "Wait for the given number of milliseconds",
         {
             {"type", "object"},
             {"properties", {
                 {"ms", {{"type", "integer"}, {"description", "Milliseconds to wait"}}}
             }},
             {"required", {"ms"}}
         }},
        [&workers](const json& args, ToolCompletion done) {
            auto it = args.find("ms");
            if (it == args.end() || !it->is_number_integer() || it->get<int>() < 0) {
                done(std::make_exception_ptr(std::invalid_argument("'ms' must be a non-negative integer")),
                     CallToolResult());
                return;
            }
            int ms = it->get<int>();
            boost::asio::post(workers, [done, ms]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(ms));
                done(nullptr, text_result("Slept " + std::to_string(ms) + "ms"));
            });
        }
    );

    // File resource read off the event loop
    ResourceDescriptor hosts;
    hosts.uri = "file:///etc/hosts";
    hosts.name = "hosts";
    hosts.mime_type = "text/plain";
    bridge.register_async_resource(hosts, [&workers](ResourceCompletion done) {
        boost::asio::post(workers, [done]() {
            std::ifstream file("/etc/hosts");
            if (!file.is_open()) {
                done(std::make_exception_ptr(std::runtime_error("Failed to open /etc/hosts")), {});
                return;
            }
            std::stringstream buffer;
            buffer << file.rdbuf();

            ResourceContent content;
            content.uri = "file:///etc/hosts";
            content.mime_type = "text/plain";
            content.text = buffer.str();
            done(nullptr, {content});
        });
    });

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int) {
        if (!ec) {
            bridge.shutdown();
            io.stop();
        }
    });

    std::cout << "Connecting to ws://" << host << ":" << port << "/...\n";
    bridge.init();
    io.run();

    workers.join();
    return 0;
}
