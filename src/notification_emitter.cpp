#include <mcpbridge/notification_emitter.hpp>
#include <mcpbridge/jsonrpc.hpp>
#include <mcpbridge/log.hpp>

#include <string>

namespace mcpbridge {

namespace {

const char* kComponent = "notify";

} // namespace

NotificationEmitter::NotificationEmitter(boost::asio::io_context& io,
                                         std::chrono::milliseconds keepalive_interval,
                                         Sender sender)
    : keepalive_timer_(io)
    , keepalive_interval_(keepalive_interval)
    , sender_(std::move(sender))
    , keepalive_active_(false)
    , keepalive_generation_(0) {
}

void NotificationEmitter::list_changed(CapabilityKind kind) {
    std::string method = std::string("notifications/") + to_string(kind) + "/list_changed";
    if (!sender_(make_notification(method))) {
        MCPBRIDGE_LOG_DEBUG(kComponent, "Dropped " << method << " (transport not open)");
    }
}

void NotificationEmitter::announce_all() {
    list_changed(CapabilityKind::Tools);
    list_changed(CapabilityKind::Resources);
    list_changed(CapabilityKind::Prompts);
}

void NotificationEmitter::start_keepalive() {
    stop_keepalive();
    keepalive_active_ = true;
    keepalive_timer_.expires_after(keepalive_interval_);
    arm_keepalive(keepalive_generation_);
}

void NotificationEmitter::stop_keepalive() {
    // A handler already queued with success still sees the generation change
    ++keepalive_generation_;
    keepalive_active_ = false;
    keepalive_timer_.cancel();
}

void NotificationEmitter::arm_keepalive(uint64_t generation) {
    keepalive_timer_.async_wait([this, generation](const boost::system::error_code& ec) {
        if (ec || generation != keepalive_generation_ || !keepalive_active_) {
            return;
        }

        if (sender_(make_notification("ping"))) {
            MCPBRIDGE_LOG_TRACE(kComponent, "Keepalive ping sent");
        }

        // Fixed rate: the next deadline follows the previous one, not now
        keepalive_timer_.expires_at(keepalive_timer_.expiry() + keepalive_interval_);
        arm_keepalive(generation);
    });
}

} // namespace mcpbridge
