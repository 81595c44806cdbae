#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

namespace mcpbridge {

// Raised by Transport::open() when the transport cannot even be created
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * One message-oriented connection to the remote endpoint.
 *
 * Events are delivered on the event loop that owns the transport. After
 * open() the transport reports exactly one of on_open or on_close first;
 * on_error may precede on_close. close() initiated locally does not fire
 * on_close.
 */
class Transport {
public:
    struct Callbacks {
        std::function<void()> on_open;
        std::function<void()> on_close;
        std::function<void(const std::string& error)> on_error;
        std::function<void(const std::string& frame)> on_message;
    };

    virtual ~Transport() = default;

    // Starts connecting. Throws TransportError on synchronous failure.
    virtual void open(const std::string& url, Callbacks callbacks) = 0;

    virtual bool is_open() const = 0;

    // Sends one text frame. Only called while is_open() is true.
    virtual void send(const std::string& frame) = 0;

    virtual void close() = 0;
};

// A fresh transport is created for every connection attempt
using TransportFactory = std::function<std::unique_ptr<Transport>()>;

} // namespace mcpbridge
