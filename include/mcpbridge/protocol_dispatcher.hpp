#pragma once

#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include <mcpbridge/capability_registry.hpp>
#include <mcpbridge/jsonrpc.hpp>
#include <mcpbridge/types.hpp>

using json = nlohmann::json;

namespace mcpbridge {

/**
 * Routes inbound JSON-RPC messages to the capability registry.
 *
 * Responses are correlated only through the echoed request id. Handler
 * completions are posted back to the io_context before anything is sent,
 * so overlapping calls never touch bridge state off the event loop.
 */
class ProtocolDispatcher {
public:
    // Returns false when the message was dropped (transport not open)
    using Sender = std::function<bool(const json& message)>;

    ProtocolDispatcher(boost::asio::io_context& io, const CapabilityRegistry& registry,
                       ServerInfo server_info, Sender sender);

    // Parses and dispatches one text frame. Malformed frames are logged and dropped.
    void handle_frame(const std::string& frame);

    void dispatch(const Message& message);

    const ServerInfo& server_info() const { return server_info_; }

private:
    void handle(const InitializeRequest& request);
    void handle(const InitializedNotification& notification);
    void handle(const ListToolsRequest& request);
    void handle(const CallToolRequest& request);
    void handle(const ListResourcesRequest& request);
    void handle(const ReadResourceRequest& request);
    void handle(const ListPromptsRequest& request);
    void handle(const GetPromptRequest& request);
    void handle(const UnrecognizedMessage& message);

    json initialize_result() const;

    void respond(const json& id, const json& result);
    void respond_error(const json& id, int code, const std::string& message);

    // Completion handed to a capability handler. Callable once, from any
    // thread; the response is built and sent from the event loop.
    template <typename Result, typename Transform>
    std::function<void(std::exception_ptr, Result)> completion(const json& id, const std::string& target,
                                                               Transform transform);

    boost::asio::io_context& io_;
    const CapabilityRegistry& registry_;
    ServerInfo server_info_;
    Sender sender_;
    std::shared_ptr<bool> alive_;
};

// Message carried by a handler failure, "Unknown error" when there is none
std::string describe_exception(std::exception_ptr error);

} // namespace mcpbridge
