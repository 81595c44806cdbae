#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <curl/curl.h>

#include <mcpbridge/frame_buffer.hpp>
#include <mcpbridge/transport.hpp>

namespace mcpbridge {

/**
 * WebSocket client built on libcurl's WebSocket API.
 *
 * libcurl performs the upgrade handshake (CURLOPT_CONNECT_ONLY = 2); the
 * connected socket is then watched through a posix::stream_descriptor so
 * every read, send and callback happens on the io_context thread. Frames the
 * socket cannot take yet are queued and written once it becomes writable.
 */
class WebSocketTransport : public Transport {
public:
    WebSocketTransport(boost::asio::io_context& io, std::chrono::milliseconds connect_timeout);
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    void open(const std::string& url, Callbacks callbacks) override;
    bool is_open() const override;
    void send(const std::string& frame) override;
    void close() override;

private:
    enum class State {
        Idle,
        Connecting,
        Open,
        Closed
    };

    void handshake();
    void wait_readable();
    void wait_writable();
    void read_frames();
    void flush();
    void fail(const std::string& error);
    void release();

    boost::asio::io_context& io_;
    std::chrono::milliseconds connect_timeout_;
    CURL* curl_;
    std::unique_ptr<boost::asio::posix::stream_descriptor> socket_;
    Callbacks callbacks_;
    std::string url_;
    MessageAssembler incoming_;
    OutgoingFrames outgoing_;
    bool write_waiting_;
    State state_;

    // Expires with the transport; posted handlers check it before touching this
    std::shared_ptr<bool> alive_;
};

// True when the linked libcurl was built with ws:// support
bool websocket_supported();

// Factory producing WebSocketTransport instances bound to io
TransportFactory websocket_transport_factory(boost::asio::io_context& io,
                                             std::chrono::milliseconds connect_timeout);

} // namespace mcpbridge
