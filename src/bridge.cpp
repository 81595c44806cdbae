#include <mcpbridge/bridge.hpp>
#include <mcpbridge/log.hpp>
#include <mcpbridge/websocket_transport.hpp>

namespace mcpbridge {

namespace {

const char* kComponent = "bridge";

} // namespace

McpBridge::McpBridge(boost::asio::io_context& io, BridgeConfig config)
    : McpBridge(io, config, websocket_transport_factory(io, config.connect_timeout)) {
}

McpBridge::McpBridge(boost::asio::io_context& io, BridgeConfig config, TransportFactory factory)
    : config_(std::move(config))
    , emitter_(io, config_.keepalive_interval, [this](const json& message) {
          return connection_.send(message);
      })
    , dispatcher_(io, registry_, config_.server_info, [this](const json& message) {
          return connection_.send(message);
      })
    , connection_(io, config_.connection_options(), std::move(factory), emitter_)
    , initialized_(false) {
    registry_.set_change_listener([this](CapabilityKind kind) {
        on_capabilities_changed(kind);
    });
    connection_.set_message_handler([this](const std::string& frame) {
        dispatcher_.handle_frame(frame);
    });
}

McpBridge::~McpBridge() {
    registry_.set_change_listener(nullptr);
}

void McpBridge::init() {
    if (initialized_) {
        return;
    }
    initialized_ = true;

    MCPBRIDGE_LOG_INFO(kComponent, "Starting " << config_.server_info.name << " "
                       << config_.server_info.version);
    if (config_.enabled) {
        connection_.enable();
    } else {
        connection_.disable();
    }
}

void McpBridge::shutdown() {
    if (!initialized_) {
        return;
    }
    initialized_ = false;

    connection_.disable();
    MCPBRIDGE_LOG_INFO(kComponent, "Shut down");
}

void McpBridge::register_tool(const ToolDescriptor& descriptor, ToolFunction handler) {
    registry_.register_tool(descriptor, std::move(handler));
}

void McpBridge::register_async_tool(const ToolDescriptor& descriptor, AsyncToolFunction handler) {
    registry_.register_async_tool(descriptor, std::move(handler));
}

void McpBridge::register_resource(const ResourceDescriptor& descriptor, ResourceFunction handler) {
    registry_.register_resource(descriptor, std::move(handler));
}

void McpBridge::register_async_resource(const ResourceDescriptor& descriptor,
                                        AsyncResourceFunction handler) {
    registry_.register_async_resource(descriptor, std::move(handler));
}

void McpBridge::register_prompt(const PromptDescriptor& descriptor, PromptFunction handler) {
    registry_.register_prompt(descriptor, std::move(handler));
}

void McpBridge::register_async_prompt(const PromptDescriptor& descriptor, AsyncPromptFunction handler) {
    registry_.register_async_prompt(descriptor, std::move(handler));
}

void McpBridge::set_enabled(bool enabled) {
    if (enabled) {
        enable();
    } else {
        disable();
    }
}

void McpBridge::enable() {
    connection_.enable();
}

void McpBridge::disable() {
    connection_.disable();
}

void McpBridge::retry() {
    connection_.retry();
}

void McpBridge::set_instance_id(const std::string& instance_id) {
    if (instance_id == connection_.instance_id()) {
        return;
    }
    connection_.set_instance_id(instance_id);
    if (initialized_ && connection_.enabled()) {
        connection_.retry();
    }
}

void McpBridge::set_instance_id_resolver(InstanceIdResolver resolver) {
    connection_.set_instance_id_resolver(std::move(resolver));
}

SubscriptionId McpBridge::on_status_change(StatusCallback callback) {
    return connection_.status_observable().subscribe(std::move(callback));
}

SubscriptionId McpBridge::on_error_change(ErrorCallback callback) {
    return connection_.error_observable().subscribe(std::move(callback));
}

bool McpBridge::unsubscribe_status(SubscriptionId id) {
    return connection_.status_observable().unsubscribe(id);
}

bool McpBridge::unsubscribe_error(SubscriptionId id) {
    return connection_.error_observable().unsubscribe(id);
}

void McpBridge::on_capabilities_changed(CapabilityKind kind) {
    // Without a connection the open announcement covers the change
    if (connection_.status() == ConnectionStatus::Connected) {
        emitter_.list_changed(kind);
    }
}

} // namespace mcpbridge
