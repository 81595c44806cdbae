#pragma once

#include <exception>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace mcpbridge {

// Connection status of the bridge
enum class ConnectionStatus {
    Disconnected,
    Connecting,
    Connected,
    Error
};

const char* to_string(ConnectionStatus status);

// Server identity reported by initialize
struct ServerInfo {
    std::string name = "mcp-bridge";
    std::string version = "0.1.0";
};

// Tool definition
struct ToolDescriptor {
    std::string name;
    std::string description;
    json input_schema = json{{"type", "object"}};
};

// Resource definition
struct ResourceDescriptor {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;
};

struct PromptArgument {
    std::string name;
    std::optional<std::string> description;
    bool required = false;
};

// Prompt definition
struct PromptDescriptor {
    std::string name;
    std::optional<std::string> description;
    std::vector<PromptArgument> arguments;
};

// One item produced by reading a resource. At most one of text/blob is set;
// blob holds base64 encoded bytes.
struct ResourceContent {
    std::string uri;
    std::optional<std::string> mime_type;
    std::optional<std::string> text;
    std::optional<std::string> blob;
};

enum class Role {
    User,
    Assistant
};

struct PromptMessage {
    Role role = Role::User;
    json content;

    static PromptMessage text(Role role, const std::string& text);
};

struct PromptResult {
    std::optional<std::string> description;
    std::vector<PromptMessage> messages;
};

// Tool results are free-form MCP CallToolResult objects ({"content": [...]})
using CallToolResult = json;

using PromptArguments = std::map<std::string, std::string>;

// Synchronous handler signatures. Failures are reported by throwing.
using ToolFunction = std::function<CallToolResult(const json& arguments)>;
using ResourceFunction = std::function<std::vector<ResourceContent>()>;
using PromptFunction = std::function<PromptResult(const std::optional<PromptArguments>& arguments)>;

// Asynchronous handler signatures. The completion may be invoked later, from
// any thread; a non-null exception_ptr reports failure.
using ToolCompletion = std::function<void(std::exception_ptr, CallToolResult)>;
using ResourceCompletion = std::function<void(std::exception_ptr, std::vector<ResourceContent>)>;
using PromptCompletion = std::function<void(std::exception_ptr, PromptResult)>;

using AsyncToolFunction = std::function<void(const json& arguments, ToolCompletion done)>;
using AsyncResourceFunction = std::function<void(ResourceCompletion done)>;
using AsyncPromptFunction =
    std::function<void(const std::optional<PromptArguments>& arguments, PromptCompletion done)>;

// Builds {"content": [{"type": "text", "text": text}]}
CallToolResult text_result(const std::string& text);

void to_json(json& j, const ToolDescriptor& tool);
void to_json(json& j, const ResourceDescriptor& resource);
void to_json(json& j, const PromptArgument& argument);
void to_json(json& j, const PromptDescriptor& prompt);
void to_json(json& j, const ResourceContent& content);
void to_json(json& j, const PromptMessage& message);
void to_json(json& j, const PromptResult& result);

} // namespace mcpbridge
