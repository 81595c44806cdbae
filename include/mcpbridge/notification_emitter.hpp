#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <nlohmann/json.hpp>

#include <mcpbridge/capability_registry.hpp>

using json = nlohmann::json;

namespace mcpbridge {

// Sends unsolicited notifications: list_changed announcements and the
// periodic keepalive ping.
class NotificationEmitter {
public:
    // Returns false when the message was dropped (transport not open)
    using Sender = std::function<bool(const json& message)>;

    NotificationEmitter(boost::asio::io_context& io, std::chrono::milliseconds keepalive_interval,
                        Sender sender);

    void list_changed(CapabilityKind kind);

    // tools, resources and prompts list_changed, in that order
    void announce_all();

    // Restarts the keepalive timer; any previous timer is cancelled
    void start_keepalive();
    void stop_keepalive();
    bool keepalive_active() const { return keepalive_active_; }

    std::chrono::milliseconds keepalive_interval() const { return keepalive_interval_; }

private:
    void arm_keepalive(uint64_t generation);

    boost::asio::steady_timer keepalive_timer_;
    std::chrono::milliseconds keepalive_interval_;
    Sender sender_;
    bool keepalive_active_;
    uint64_t keepalive_generation_;
};

} // namespace mcpbridge
