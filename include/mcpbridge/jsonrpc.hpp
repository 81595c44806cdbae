#pragma once

#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

#include <mcpbridge/types.hpp>

namespace mcpbridge {

constexpr const char* kJsonRpcVersion = "2.0";
constexpr const char* kProtocolVersion = "2024-11-05";

// Error codes emitted by the bridge
constexpr int kErrorNotFound = -32601;
constexpr int kErrorHandlerFailed = -32000;

// Decoded inbound messages. A request carries an id; the same method
// without an id is a notification and is never answered.
struct InitializeRequest {
    std::optional<json> id;
    json params;
};

struct InitializedNotification {
};

struct ListToolsRequest {
    std::optional<json> id;
};

struct CallToolRequest {
    std::optional<json> id;
    std::string name;
    json arguments;
};

struct ListResourcesRequest {
    std::optional<json> id;
};

struct ReadResourceRequest {
    std::optional<json> id;
    std::string uri;
};

struct ListPromptsRequest {
    std::optional<json> id;
};

struct GetPromptRequest {
    std::optional<json> id;
    std::string name;
    std::optional<PromptArguments> arguments;
};

// Unknown method, or a message without a method (a response from the peer)
struct UnrecognizedMessage {
    std::optional<json> id;
    std::string method;
};

using Message = std::variant<
    InitializeRequest,
    InitializedNotification,
    ListToolsRequest,
    CallToolRequest,
    ListResourcesRequest,
    ReadResourceRequest,
    ListPromptsRequest,
    GetPromptRequest,
    UnrecognizedMessage>;

// Classifies one parsed frame. Throws std::invalid_argument when the frame
// is not a well-formed JSON-RPC 2.0 message.
Message decode_message(const json& frame);

json make_result_response(const json& id, const json& result);
json make_error_response(const json& id, int code, const std::string& message);
json make_notification(const std::string& method);

} // namespace mcpbridge
