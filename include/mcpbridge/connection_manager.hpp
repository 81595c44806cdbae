#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <nlohmann/json.hpp>

#include <mcpbridge/backoff.hpp>
#include <mcpbridge/notification_emitter.hpp>
#include <mcpbridge/observable.hpp>
#include <mcpbridge/transport.hpp>
#include <mcpbridge/types.hpp>

using json = nlohmann::json;

namespace mcpbridge {

constexpr const char* kDefaultInstanceId = "default";

// Host-supplied asynchronous lookup of the instance identifier. The callback
// may be invoked from any thread; an exception or an empty identifier makes
// the bridge fall back to kDefaultInstanceId.
using InstanceIdCallback = std::function<void(std::exception_ptr, std::string)>;
using InstanceIdResolver = std::function<void(InstanceIdCallback)>;

struct ConnectionOptions {
    std::string host = "localhost";
    int port = 3003;
    std::string instance_id;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{30000};
};

// ws://host:port/<instance-id>, with the identifier percent-encoded
std::string endpoint_url(const std::string& host, int port, const std::string& instance_id);

/**
 * Owns the transport and the connection status state machine.
 *
 *   disconnected -> connecting -> connected -> disconnected
 *   connecting -> error -> disconnected (transport could not be created)
 *
 * Every attempt gets a new generation number; events from an older
 * attempt (late close of a replaced transport, a resolver finishing after
 * disable) are ignored. Reconnects are scheduled with exponential backoff
 * while enabled, and at most one reconnect timer is pending.
 */
class ConnectionManager {
public:
    using MessageHandler = std::function<void(const std::string& frame)>;

    ConnectionManager(boost::asio::io_context& io, ConnectionOptions options,
                      TransportFactory factory, NotificationEmitter& emitter);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    void set_message_handler(MessageHandler handler);
    void set_instance_id_resolver(InstanceIdResolver resolver);

    // Used by the next connection attempt
    void set_instance_id(const std::string& instance_id);
    const std::string& instance_id() const { return options_.instance_id; }

    // No-op unless enabled and disconnected/error
    void connect();
    void enable();
    void disable();

    // Drops the current connection and reconnects without waiting for backoff
    void retry();

    // Writes one message if the transport is open; returns false when dropped
    bool send(const json& message);

    bool enabled() const { return enabled_; }
    ConnectionStatus status() const { return status_.get(); }
    const std::optional<std::string>& error() const { return error_.get(); }
    unsigned reconnect_attempt() const { return backoff_.attempt(); }
    bool reconnect_pending() const { return reconnect_pending_; }
    const std::string& last_url() const { return last_url_; }

    Observable<ConnectionStatus>& status_observable() { return status_; }
    Observable<std::optional<std::string>>& error_observable() { return error_; }

private:
    void resolve_instance_id(uint64_t generation);
    void open_transport(uint64_t generation, const std::string& instance_id);

    void on_transport_open(uint64_t generation);
    void on_transport_close(uint64_t generation);
    void on_transport_error(uint64_t generation, const std::string& error);
    void on_transport_message(uint64_t generation, const std::string& frame);

    void drop_connection();
    void schedule_reconnect();
    void cancel_reconnect();
    void retire_transport();

    void set_status(ConnectionStatus status);
    void set_error(std::optional<std::string> error);

    boost::asio::io_context& io_;
    ConnectionOptions options_;
    TransportFactory factory_;
    NotificationEmitter& emitter_;
    MessageHandler message_handler_;
    InstanceIdResolver resolver_;

    std::unique_ptr<Transport> transport_;
    boost::asio::steady_timer reconnect_timer_;
    bool reconnect_pending_;
    ReconnectBackoff backoff_;
    bool enabled_;
    uint64_t generation_;
    std::string last_url_;

    Observable<ConnectionStatus> status_;
    Observable<std::optional<std::string>> error_;

    std::shared_ptr<bool> alive_;
};

} // namespace mcpbridge
