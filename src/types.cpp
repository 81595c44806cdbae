#include <mcpbridge/types.hpp>

namespace mcpbridge {

const char* to_string(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::Disconnected: return "disconnected";
        case ConnectionStatus::Connecting:   return "connecting";
        case ConnectionStatus::Connected:    return "connected";
        case ConnectionStatus::Error:        return "error";
    }
    return "unknown";
}

PromptMessage PromptMessage::text(Role role, const std::string& text) {
    PromptMessage message;
    message.role = role;
    message.content = {
        {"type", "text"},
        {"text", text}
    };
    return message;
}

CallToolResult text_result(const std::string& text) {
    return {
        {"content", json::array({
            {
                {"type", "text"},
                {"text", text}
            }
        })}
    };
}

void to_json(json& j, const ToolDescriptor& tool) {
    j = {
        {"name", tool.name},
        {"description", tool.description},
        {"inputSchema", tool.input_schema}
    };
}

void to_json(json& j, const ResourceDescriptor& resource) {
    j = {
        {"uri", resource.uri},
        {"name", resource.name.empty() ? resource.uri : resource.name}
    };
    if (resource.description) {
        j["description"] = *resource.description;
    }
    if (resource.mime_type) {
        j["mimeType"] = *resource.mime_type;
    }
}

void to_json(json& j, const PromptArgument& argument) {
    j = {
        {"name", argument.name},
        {"required", argument.required}
    };
    if (argument.description) {
        j["description"] = *argument.description;
    }
}

void to_json(json& j, const PromptDescriptor& prompt) {
    j = {{"name", prompt.name}};
    if (prompt.description) {
        j["description"] = *prompt.description;
    }
    if (!prompt.arguments.empty()) {
        j["arguments"] = prompt.arguments;
    }
}

void to_json(json& j, const ResourceContent& content) {
    j = {{"uri", content.uri}};
    if (content.mime_type) {
        j["mimeType"] = *content.mime_type;
    }
    if (content.text) {
        j["text"] = *content.text;
    }
    if (content.blob) {
        j["blob"] = *content.blob;
    }
}

void to_json(json& j, const PromptMessage& message) {
    j = {
        {"role", message.role == Role::Assistant ? "assistant" : "user"},
        {"content", message.content}
    };
}

void to_json(json& j, const PromptResult& result) {
    j = {{"messages", result.messages}};
    if (result.description) {
        j["description"] = *result.description;
    }
}

} // namespace mcpbridge
