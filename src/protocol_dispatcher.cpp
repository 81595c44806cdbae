#include <mcpbridge/protocol_dispatcher.hpp>
#include <mcpbridge/log.hpp>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <variant>
#include <boost/asio/post.hpp>

namespace mcpbridge {

namespace {

const char* kComponent = "dispatch";

// Wraps anything that is not already a CallToolResult as one text content item
json normalize_tool_result(const json& result) {
    if (result.is_object()) {
        auto it = result.find("content");
        if (it != result.end() && it->is_array()) {
            return result;
        }
    }
    return text_result(result.is_string() ? result.get<std::string>() : result.dump());
}

} // namespace

std::string describe_exception(std::exception_ptr error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        std::string message = e.what();
        return message.empty() ? "Unknown error" : message;
    } catch (...) {
        return "Unknown error";
    }
}

ProtocolDispatcher::ProtocolDispatcher(boost::asio::io_context& io, const CapabilityRegistry& registry,
                                       ServerInfo server_info, Sender sender)
    : io_(io)
    , registry_(registry)
    , server_info_(std::move(server_info))
    , sender_(std::move(sender))
    , alive_(std::make_shared<bool>(true)) {
}

void ProtocolDispatcher::handle_frame(const std::string& frame) {
    json parsed;
    try {
        parsed = json::parse(frame);
    } catch (const json::parse_error& e) {
        MCPBRIDGE_LOG_ERROR(kComponent, "Failed to parse message: " << e.what());
        return;
    }

    std::optional<Message> message;
    try {
        message = decode_message(parsed);
    } catch (const std::invalid_argument& e) {
        MCPBRIDGE_LOG_WARN(kComponent, "Dropping malformed message: " << e.what());
        return;
    }

    dispatch(*message);
}

void ProtocolDispatcher::dispatch(const Message& message) {
    std::visit([this](const auto& decoded) { handle(decoded); }, message);
}

template <typename Result, typename Transform>
std::function<void(std::exception_ptr, Result)> ProtocolDispatcher::completion(
        const json& id, const std::string& target, Transform transform) {
    auto finished = std::make_shared<std::atomic<bool>>(false);
    std::weak_ptr<bool> token = alive_;
    boost::asio::io_context& io = io_;

    return [this, &io, token, finished, id, target, transform](std::exception_ptr error, Result result) {
        if (finished->exchange(true)) {
            MCPBRIDGE_LOG_WARN(kComponent, "Ignoring repeated completion for " << target);
            return;
        }

        // Back onto the event loop before the response is built and sent
        boost::asio::post(io, [this, token, id, target, transform, error, result = std::move(result)]() mutable {
            if (token.expired()) {
                return;
            }
            if (error) {
                std::string message = describe_exception(error);
                MCPBRIDGE_LOG_WARN(kComponent, "Handler for " << target << " failed: " << message);
                respond_error(id, kErrorHandlerFailed, message);
                return;
            }
            try {
                respond(id, transform(std::move(result)));
            } catch (const std::exception& e) {
                MCPBRIDGE_LOG_WARN(kComponent, "Result of " << target << " could not be encoded: " << e.what());
                respond_error(id, kErrorHandlerFailed, e.what());
            }
        });
    };
}

json ProtocolDispatcher::initialize_result() const {
    return {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", {
            {"tools", {{"listChanged", true}}},
            {"resources", {{"listChanged", true}, {"subscribe", false}}},
            {"prompts", {{"listChanged", true}}}
        }},
        {"serverInfo", {
            {"name", server_info_.name},
            {"version", server_info_.version}
        }}
    };
}

void ProtocolDispatcher::handle(const InitializeRequest& request) {
    if (!request.id) {
        return;
    }

    auto client_it = request.params.find("clientInfo");
    if (client_it != request.params.end() && client_it->is_object()) {
        MCPBRIDGE_LOG_INFO(kComponent, "Initialize from client " << client_it->value("name", "unknown")
                           << " " << client_it->value("version", ""));
    }
    respond(*request.id, initialize_result());
}

void ProtocolDispatcher::handle(const InitializedNotification&) {
    MCPBRIDGE_LOG_DEBUG(kComponent, "Client acknowledged initialization");
}

void ProtocolDispatcher::handle(const ListToolsRequest& request) {
    if (request.id) {
        respond(*request.id, {{"tools", registry_.tools()}});
    }
}

void ProtocolDispatcher::handle(const CallToolRequest& request) {
    if (!request.id) {
        MCPBRIDGE_LOG_DEBUG(kComponent, "Ignoring tools/call without id");
        return;
    }

    const ToolEntry* entry = registry_.find_tool(request.name);
    if (!entry) {
        respond_error(*request.id, kErrorNotFound, "Tool " + request.name + " not found");
        return;
    }

    AsyncToolFunction handler = entry->handler;
    auto done = completion<CallToolResult>(*request.id, "tool " + request.name,
        [](CallToolResult result) {
            return normalize_tool_result(result);
        });

    try {
        handler(request.arguments, done);
    } catch (...) {
        done(std::current_exception(), CallToolResult());
    }
}

void ProtocolDispatcher::handle(const ListResourcesRequest& request) {
    if (request.id) {
        respond(*request.id, {{"resources", registry_.resources()}});
    }
}

void ProtocolDispatcher::handle(const ReadResourceRequest& request) {
    if (!request.id) {
        MCPBRIDGE_LOG_DEBUG(kComponent, "Ignoring resources/read without id");
        return;
    }

    const ResourceEntry* entry = registry_.find_resource(request.uri);
    if (!entry) {
        respond_error(*request.id, kErrorNotFound, "Resource " + request.uri + " not found");
        return;
    }

    AsyncResourceFunction handler = entry->handler;
    std::string uri = request.uri;
    std::optional<std::string> mime_type = entry->descriptor.mime_type;
    auto done = completion<std::vector<ResourceContent>>(*request.id, "resource " + uri,
        [uri, mime_type](std::vector<ResourceContent> contents) {
            json items = json::array();
            for (auto& content : contents) {
                if (content.uri.empty()) {
                    content.uri = uri;
                }
                if (!content.mime_type) {
                    content.mime_type = mime_type;
                }
                items.push_back(json(content));
            }
            return json{{"contents", items}};
        });

    try {
        handler(done);
    } catch (...) {
        done(std::current_exception(), {});
    }
}

void ProtocolDispatcher::handle(const ListPromptsRequest& request) {
    if (request.id) {
        respond(*request.id, {{"prompts", registry_.prompts()}});
    }
}

void ProtocolDispatcher::handle(const GetPromptRequest& request) {
    if (!request.id) {
        MCPBRIDGE_LOG_DEBUG(kComponent, "Ignoring prompts/get without id");
        return;
    }

    const PromptEntry* entry = registry_.find_prompt(request.name);
    if (!entry) {
        respond_error(*request.id, kErrorNotFound, "Prompt " + request.name + " not found");
        return;
    }

    AsyncPromptFunction handler = entry->handler;
    std::optional<std::string> description = entry->descriptor.description;
    auto done = completion<PromptResult>(*request.id, "prompt " + request.name,
        [description](PromptResult result) {
            if (!result.description) {
                result.description = description;
            }
            return json(result);
        });

    try {
        handler(request.arguments, done);
    } catch (...) {
        done(std::current_exception(), PromptResult());
    }
}

void ProtocolDispatcher::handle(const UnrecognizedMessage& message) {
    if (message.method.empty()) {
        MCPBRIDGE_LOG_DEBUG(kComponent, "Ignoring message without method");
        return;
    }
    MCPBRIDGE_LOG_DEBUG(kComponent, "Ignoring unsupported method " << message.method);
}

void ProtocolDispatcher::respond(const json& id, const json& result) {
    if (!sender_(make_result_response(id, result))) {
        MCPBRIDGE_LOG_DEBUG(kComponent, "Dropped response for id " << id.dump() << " (transport not open)");
    }
}

void ProtocolDispatcher::respond_error(const json& id, int code, const std::string& message) {
    if (!sender_(make_error_response(id, code, message))) {
        MCPBRIDGE_LOG_DEBUG(kComponent, "Dropped error for id " << id.dump() << " (transport not open)");
    }
}

} // namespace mcpbridge
