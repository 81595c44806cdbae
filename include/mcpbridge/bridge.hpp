#ifndef MCPBRIDGE_BRIDGE_HPP
#define MCPBRIDGE_BRIDGE_HPP

#include <functional>
#include <optional>
#include <string>
#include <boost/asio/io_context.hpp>

#include <mcpbridge/capability_registry.hpp>
#include <mcpbridge/config.hpp>
#include <mcpbridge/connection_manager.hpp>
#include <mcpbridge/notification_emitter.hpp>
#include <mcpbridge/observable.hpp>
#include <mcpbridge/protocol_dispatcher.hpp>
#include <mcpbridge/transport.hpp>
#include <mcpbridge/types.hpp>

namespace mcpbridge {

/**
 * Exposes locally registered tools, resources and prompts to one remote
 * JSON-RPC client over a persistent WebSocket.
 *
 * Build one at startup, hand it to the capability producers, call init()
 * and run the io_context. Every method must be called from the thread
 * running the io_context.
 */
class McpBridge {
public:
    using StatusCallback = std::function<void(ConnectionStatus)>;
    using ErrorCallback = std::function<void(const std::optional<std::string>&)>;

    // Connects through WebSocketTransport
    McpBridge(boost::asio::io_context& io, BridgeConfig config = BridgeConfig());
    McpBridge(boost::asio::io_context& io, BridgeConfig config, TransportFactory factory);
    ~McpBridge();

    McpBridge(const McpBridge&) = delete;
    McpBridge& operator=(const McpBridge&) = delete;

    // Starts connecting when the configuration enables the bridge
    void init();
    // Disconnects and suppresses reconnection
    void shutdown();
    bool initialized() const { return initialized_; }

    // Register tools, resources, and prompts
    void register_tool(const ToolDescriptor& descriptor, ToolFunction handler);
    void register_async_tool(const ToolDescriptor& descriptor, AsyncToolFunction handler);
    void register_resource(const ResourceDescriptor& descriptor, ResourceFunction handler);
    void register_async_resource(const ResourceDescriptor& descriptor, AsyncResourceFunction handler);
    void register_prompt(const PromptDescriptor& descriptor, PromptFunction handler);
    void register_async_prompt(const PromptDescriptor& descriptor, AsyncPromptFunction handler);

    void set_enabled(bool enabled);
    void enable();
    void disable();
    void retry();

    // A new identifier reconnects immediately when enabled
    void set_instance_id(const std::string& instance_id);
    void set_instance_id_resolver(InstanceIdResolver resolver);

    ConnectionStatus status() const { return connection_.status(); }
    std::optional<std::string> error() const { return connection_.error(); }
    bool enabled() const { return connection_.enabled(); }
    unsigned reconnect_attempt() const { return connection_.reconnect_attempt(); }

    // Subscribers are called once immediately, then on every change
    SubscriptionId on_status_change(StatusCallback callback);
    SubscriptionId on_error_change(ErrorCallback callback);
    bool unsubscribe_status(SubscriptionId id);
    bool unsubscribe_error(SubscriptionId id);

    const CapabilityRegistry& registry() const { return registry_; }
    const BridgeConfig& config() const { return config_; }

private:
    void on_capabilities_changed(CapabilityKind kind);

    BridgeConfig config_;
    CapabilityRegistry registry_;
    NotificationEmitter emitter_;
    ProtocolDispatcher dispatcher_;
    ConnectionManager connection_;
    bool initialized_;
};

} // namespace mcpbridge

#endif // MCPBRIDGE_BRIDGE_HPP
