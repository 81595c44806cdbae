#include <mcpbridge/connection_manager.hpp>
#include <mcpbridge/log.hpp>

#include <atomic>
#include <cctype>
#include <cstdio>
#include <boost/asio/post.hpp>

namespace mcpbridge {

namespace {

const char* kComponent = "connection";

std::string encode_path_segment(const std::string& segment) {
    std::string encoded;
    for (unsigned char c : segment) {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~' || c == '@') {
            encoded += static_cast<char>(c);
        } else {
            char escaped[4];
            std::snprintf(escaped, sizeof(escaped), "%%%02X", c);
            encoded += escaped;
        }
    }
    return encoded;
}

} // namespace

std::string endpoint_url(const std::string& host, int port, const std::string& instance_id) {
    return "ws://" + host + ":" + std::to_string(port) + "/" + encode_path_segment(instance_id);
}

ConnectionManager::ConnectionManager(boost::asio::io_context& io, ConnectionOptions options,
                                     TransportFactory factory, NotificationEmitter& emitter)
    : io_(io)
    , options_(std::move(options))
    , factory_(std::move(factory))
    , emitter_(emitter)
    , reconnect_timer_(io)
    , reconnect_pending_(false)
    , backoff_(options_.base_delay, options_.max_delay)
    , enabled_(true)
    , generation_(0)
    , status_(ConnectionStatus::Disconnected)
    , error_(std::nullopt)
    , alive_(std::make_shared<bool>(true)) {
}

ConnectionManager::~ConnectionManager() {
    ++generation_;
    reconnect_timer_.cancel();
    if (transport_) {
        transport_->close();
    }
}

void ConnectionManager::set_message_handler(MessageHandler handler) {
    message_handler_ = std::move(handler);
}

void ConnectionManager::set_instance_id_resolver(InstanceIdResolver resolver) {
    resolver_ = std::move(resolver);
}

void ConnectionManager::set_instance_id(const std::string& instance_id) {
    options_.instance_id = instance_id;
}

void ConnectionManager::connect() {
    ConnectionStatus current = status();
    if (!enabled_ || current == ConnectionStatus::Connecting || current == ConnectionStatus::Connected) {
        return;
    }

    cancel_reconnect();
    uint64_t generation = ++generation_;
    set_status(ConnectionStatus::Connecting);
    set_error(std::nullopt);
    resolve_instance_id(generation);
}

void ConnectionManager::enable() {
    enabled_ = true;
    connect();
}

void ConnectionManager::disable() {
    enabled_ = false;
    drop_connection();
    MCPBRIDGE_LOG_INFO(kComponent, "Bridge disabled");
}

void ConnectionManager::retry() {
    if (!enabled_) {
        return;
    }
    MCPBRIDGE_LOG_INFO(kComponent, "Manual retry requested");
    drop_connection();
    connect();
}

void ConnectionManager::drop_connection() {
    ++generation_;
    cancel_reconnect();
    emitter_.stop_keepalive();
    if (transport_) {
        transport_->close();
        retire_transport();
    }
    set_status(ConnectionStatus::Disconnected);
}

bool ConnectionManager::send(const json& message) {
    if (!transport_ || !transport_->is_open()) {
        return false;
    }
    // Invalid UTF-8 from handlers is replaced with U+FFFD rather than thrown
    std::string frame = message.dump(-1, ' ', false, json::error_handler_t::replace);
    MCPBRIDGE_LOG_TRACE(kComponent, "-> " << frame);
    transport_->send(frame);
    return true;
}

void ConnectionManager::resolve_instance_id(uint64_t generation) {
    std::weak_ptr<bool> token = alive_;

    if (!options_.instance_id.empty() || !resolver_) {
        std::string instance_id = options_.instance_id.empty() ? kDefaultInstanceId : options_.instance_id;
        boost::asio::post(io_, [this, token, generation, instance_id]() {
            if (!token.expired()) {
                open_transport(generation, instance_id);
            }
        });
        return;
    }

    boost::asio::io_context& io = io_;
    auto finished = std::make_shared<std::atomic<bool>>(false);
    InstanceIdCallback on_resolved = [this, &io, token, generation, finished](std::exception_ptr error,
                                                                              std::string resolved) {
        if (finished->exchange(true)) {
            MCPBRIDGE_LOG_WARN(kComponent, "Ignoring repeated instance id resolution");
            return;
        }
        std::string instance_id = std::move(resolved);
        if (error) {
            try {
                std::rethrow_exception(error);
            } catch (const std::exception& e) {
                MCPBRIDGE_LOG_WARN(kComponent, "Failed to resolve instance id: " << e.what());
            } catch (...) {
                MCPBRIDGE_LOG_WARN(kComponent, "Failed to resolve instance id");
            }
            instance_id.clear();
        }
        if (instance_id.empty()) {
            instance_id = kDefaultInstanceId;
        }

        boost::asio::post(io, [this, token, generation, instance_id]() {
            if (!token.expired()) {
                open_transport(generation, instance_id);
            }
        });
    };

    try {
        resolver_(on_resolved);
    } catch (...) {
        on_resolved(std::current_exception(), std::string());
    }
}

void ConnectionManager::open_transport(uint64_t generation, const std::string& instance_id) {
    if (generation != generation_ || !enabled_ || status() != ConnectionStatus::Connecting) {
        return;
    }

    retire_transport();
    last_url_ = endpoint_url(options_.host, options_.port, instance_id);
    MCPBRIDGE_LOG_INFO(kComponent, "Connecting to " << last_url_);

    std::weak_ptr<bool> token = alive_;
    Transport::Callbacks callbacks;
    callbacks.on_open = [this, token, generation]() {
        if (!token.expired()) {
            on_transport_open(generation);
        }
    };
    callbacks.on_close = [this, token, generation]() {
        if (!token.expired()) {
            on_transport_close(generation);
        }
    };
    callbacks.on_error = [this, token, generation](const std::string& error) {
        if (!token.expired()) {
            on_transport_error(generation, error);
        }
    };
    callbacks.on_message = [this, token, generation](const std::string& frame) {
        if (!token.expired()) {
            on_transport_message(generation, frame);
        }
    };

    try {
        transport_ = factory_();
        if (!transport_) {
            throw TransportError("transport factory returned no transport");
        }
        transport_->open(last_url_, std::move(callbacks));
    } catch (const std::exception& e) {
        MCPBRIDGE_LOG_ERROR(kComponent, "Failed to create WebSocket: " << e.what());
        retire_transport();
        set_error(std::string(e.what()));
        set_status(ConnectionStatus::Error);
        if (generation != generation_) {
            return;
        }
        emitter_.stop_keepalive();
        schedule_reconnect();
    }
}

void ConnectionManager::on_transport_open(uint64_t generation) {
    if (generation != generation_) {
        return;
    }

    MCPBRIDGE_LOG_INFO(kComponent, "Connected");
    set_status(ConnectionStatus::Connected);
    if (generation != generation_) {
        // A status subscriber disabled or restarted the connection
        return;
    }
    backoff_.reset();
    set_error(std::nullopt);

    // Announce availability even when the registries are empty
    emitter_.announce_all();
    emitter_.start_keepalive();
}

void ConnectionManager::on_transport_close(uint64_t generation) {
    if (generation != generation_) {
        return;
    }

    MCPBRIDGE_LOG_INFO(kComponent, "Disconnected");
    uint64_t closed = ++generation_;
    retire_transport();
    emitter_.stop_keepalive();
    set_status(ConnectionStatus::Disconnected);
    if (closed != generation_) {
        return;
    }
    schedule_reconnect();
}

void ConnectionManager::on_transport_error(uint64_t generation, const std::string& error) {
    if (generation != generation_) {
        return;
    }

    // Status is left alone: the transport reports on_close next
    MCPBRIDGE_LOG_ERROR(kComponent, "Connection error: " << error);
    set_error(error);
}

void ConnectionManager::on_transport_message(uint64_t generation, const std::string& frame) {
    if (generation != generation_) {
        return;
    }

    MCPBRIDGE_LOG_TRACE(kComponent, "<- " << frame);
    if (message_handler_) {
        message_handler_(frame);
    }
}

void ConnectionManager::schedule_reconnect() {
    if (!enabled_) {
        return;
    }

    emitter_.stop_keepalive();
    cancel_reconnect();

    std::chrono::milliseconds delay = backoff_.next_delay();
    MCPBRIDGE_LOG_INFO(kComponent, "Reconnecting in " << delay.count() << "ms (attempt "
                       << backoff_.attempt() + 1 << ")");

    reconnect_pending_ = true;
    uint64_t generation = generation_;
    std::weak_ptr<bool> token = alive_;
    reconnect_timer_.expires_after(delay);
    reconnect_timer_.async_wait([this, token, generation](const boost::system::error_code& ec) {
        if (ec || token.expired() || generation != generation_) {
            return;
        }
        reconnect_pending_ = false;
        backoff_.increment();
        connect();
    });
}

void ConnectionManager::cancel_reconnect() {
    if (reconnect_pending_) {
        reconnect_timer_.cancel();
        reconnect_pending_ = false;
    }
}

void ConnectionManager::retire_transport() {
    if (!transport_) {
        return;
    }
    // Destroyed on a later turn: this may run inside one of the transport's own callbacks
    std::shared_ptr<Transport> retired(std::move(transport_));
    boost::asio::post(io_, [retired]() {});
}

void ConnectionManager::set_status(ConnectionStatus status) {
    if (status_.set(status)) {
        MCPBRIDGE_LOG_DEBUG(kComponent, "Status " << to_string(status));
    }
}

void ConnectionManager::set_error(std::optional<std::string> error) {
    error_.set(std::move(error));
}

} // namespace mcpbridge
