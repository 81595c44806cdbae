#include <mcpbridge/jsonrpc.hpp>

#include <stdexcept>

namespace mcpbridge {

namespace {

void validate_id(const json& id) {
    if (id.is_string() || id.is_number()) {
        return;
    }
    throw std::invalid_argument("JSON-RPC id must be a string or a number");
}

std::string string_field(const json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end() || !it->is_string()) {
        return std::string();
    }
    return it->get<std::string>();
}

json object_field(const json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end() || !it->is_object()) {
        return json::object();
    }
    return *it;
}

std::optional<PromptArguments> prompt_arguments(const json& params) {
    auto it = params.find("arguments");
    if (it == params.end() || !it->is_object()) {
        return std::nullopt;
    }

    PromptArguments arguments;
    for (const auto& [key, value] : it->items()) {
        arguments[key] = value.is_string() ? value.get<std::string>() : value.dump();
    }
    return arguments;
}

} // namespace

Message decode_message(const json& frame) {
    if (!frame.is_object()) {
        throw std::invalid_argument("message must be a JSON object");
    }

    auto version_it = frame.find("jsonrpc");
    if (version_it == frame.end() || !version_it->is_string() || *version_it != kJsonRpcVersion) {
        throw std::invalid_argument("jsonrpc must be \"2.0\"");
    }

    std::optional<json> id;
    auto id_it = frame.find("id");
    if (id_it != frame.end()) {
        validate_id(*id_it);
        id = *id_it;
    }

    auto method_it = frame.find("method");
    if (method_it == frame.end()) {
        return UnrecognizedMessage{id, std::string()};
    }
    if (!method_it->is_string()) {
        throw std::invalid_argument("method must be a string");
    }
    const std::string method = method_it->get<std::string>();

    json params = json::object();
    auto params_it = frame.find("params");
    if (params_it != frame.end() && !params_it->is_null()) {
        if (!params_it->is_object()) {
            throw std::invalid_argument("params must be an object");
        }
        params = *params_it;
    }

    if (method == "initialize") {
        return InitializeRequest{id, params};
    }
    if (method == "notifications/initialized") {
        return InitializedNotification{};
    }
    if (method == "tools/list") {
        return ListToolsRequest{id};
    }
    if (method == "tools/call") {
        return CallToolRequest{id, string_field(params, "name"), object_field(params, "arguments")};
    }
    if (method == "resources/list") {
        return ListResourcesRequest{id};
    }
    if (method == "resources/read") {
        return ReadResourceRequest{id, string_field(params, "uri")};
    }
    if (method == "prompts/list") {
        return ListPromptsRequest{id};
    }
    if (method == "prompts/get") {
        return GetPromptRequest{id, string_field(params, "name"), prompt_arguments(params)};
    }

    return UnrecognizedMessage{id, method};
}

json make_result_response(const json& id, const json& result) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"result", result}
    };
}

json make_error_response(const json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

json make_notification(const std::string& method) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"method", method}
    };
}

} // namespace mcpbridge
