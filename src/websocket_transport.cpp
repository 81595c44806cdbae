#include <mcpbridge/websocket_transport.hpp>
#include <mcpbridge/log.hpp>

#include <cerrno>
#include <cstring>
#include <mutex>
#include <unistd.h>
#include <boost/asio/post.hpp>

namespace mcpbridge {

namespace {

const char* kComponent = "websocket";

void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

bool has_websocket_scheme(const std::string& url) {
    return url.rfind("ws://", 0) == 0 || url.rfind("wss://", 0) == 0;
}

// curl_ws_recv's frame out-parameter became const-qualified in later libcurl
// releases; deducing Frame accepts both declarations.
template <typename Frame>
CURLcode receive_frame(CURLcode (*recv)(CURL*, void*, size_t, size_t*, Frame**),
                       CURL* curl, char* buffer, size_t size, size_t* received,
                       const curl_ws_frame** meta) {
    Frame* frame = nullptr;
    CURLcode rc = recv(curl, buffer, size, received, &frame);
    *meta = frame;
    return rc;
}

} // namespace

bool websocket_supported() {
    ensure_curl_initialized();
    const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
    if (info == nullptr || info->protocols == nullptr) {
        return false;
    }
    for (const char* const* protocol = info->protocols; *protocol != nullptr; ++protocol) {
        if (std::strcmp(*protocol, "ws") == 0) {
            return true;
        }
    }
    return false;
}

WebSocketTransport::WebSocketTransport(boost::asio::io_context& io,
                                       std::chrono::milliseconds connect_timeout)
    : io_(io)
    , connect_timeout_(connect_timeout)
    , curl_(nullptr)
    , write_waiting_(false)
    , state_(State::Idle)
    , alive_(std::make_shared<bool>(true)) {
}

WebSocketTransport::~WebSocketTransport() {
    release();
}

void WebSocketTransport::open(const std::string& url, Callbacks callbacks) {
    if (state_ != State::Idle) {
        throw TransportError("WebSocket transport can only be opened once");
    }
    if (!has_websocket_scheme(url)) {
        throw TransportError("Not a WebSocket URL: " + url);
    }

    if (!websocket_supported()) {
        throw TransportError("libcurl was built without WebSocket support");
    }

    curl_ = curl_easy_init();
    if (!curl_) {
        throw TransportError("Failed to create CURL handle");
    }

    if (curl_easy_setopt(curl_, CURLOPT_URL, url.c_str()) != CURLE_OK) {
        release();
        throw TransportError("Invalid WebSocket URL: " + url);
    }
    curl_easy_setopt(curl_, CURLOPT_CONNECT_ONLY, 2L);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout_.count()));

    url_ = url;
    callbacks_ = std::move(callbacks);
    state_ = State::Connecting;

    std::weak_ptr<bool> token = alive_;
    boost::asio::post(io_, [this, token]() {
        if (token.expired()) {
            return;
        }
        handshake();
    });
}

void WebSocketTransport::handshake() {
    if (state_ != State::Connecting) {
        return;
    }

    MCPBRIDGE_LOG_DEBUG(kComponent, "Connecting to " << url_);
    CURLcode rc = curl_easy_perform(curl_);
    if (rc != CURLE_OK) {
        fail(std::string("Connection failed: ") + curl_easy_strerror(rc));
        return;
    }

    curl_socket_t fd = CURL_SOCKET_BAD;
    if (curl_easy_getinfo(curl_, CURLINFO_ACTIVESOCKET, &fd) != CURLE_OK || fd == CURL_SOCKET_BAD) {
        fail("Connection failed: no active socket");
        return;
    }

    // The descriptor owns a duplicate so libcurl keeps ownership of fd
    int watched = ::dup(fd);
    if (watched < 0) {
        fail(std::string("Connection failed: ") + std::strerror(errno));
        return;
    }
    socket_ = std::make_unique<boost::asio::posix::stream_descriptor>(io_, watched);
    state_ = State::Open;

    std::weak_ptr<bool> token = alive_;
    auto on_open = callbacks_.on_open;
    if (on_open) {
        on_open();
    }
    if (token.expired() || state_ != State::Open) {
        return;
    }

    // The handshake response may already carry buffered frames
    read_frames();
}

void WebSocketTransport::wait_readable() {
    if (!socket_) {
        return;
    }

    std::weak_ptr<bool> token = alive_;
    socket_->async_wait(boost::asio::posix::stream_descriptor::wait_read,
        [this, token](const boost::system::error_code& ec) {
            if (token.expired() || ec == boost::asio::error::operation_aborted) {
                return;
            }
            if (ec) {
                fail(ec.message());
                return;
            }
            read_frames();
        });
}

void WebSocketTransport::wait_writable() {
    if (!socket_ || write_waiting_) {
        return;
    }
    write_waiting_ = true;

    std::weak_ptr<bool> token = alive_;
    socket_->async_wait(boost::asio::posix::stream_descriptor::wait_write,
        [this, token](const boost::system::error_code& ec) {
            if (token.expired() || ec == boost::asio::error::operation_aborted) {
                return;
            }
            write_waiting_ = false;
            if (ec) {
                fail(ec.message());
                return;
            }
            flush();
        });
}

void WebSocketTransport::read_frames() {
    std::weak_ptr<bool> token = alive_;
    char buffer[16384];

    while (state_ == State::Open) {
        size_t received = 0;
        const curl_ws_frame* meta = nullptr;
        CURLcode rc = receive_frame(&curl_ws_recv, curl_, buffer, sizeof(buffer), &received, &meta);

        if (rc == CURLE_AGAIN) {
            wait_readable();
            return;
        }
        if (rc == CURLE_GOT_NOTHING) {
            fail(std::string());
            return;
        }
        if (rc != CURLE_OK || meta == nullptr) {
            fail(curl_easy_strerror(rc));
            return;
        }

        if (meta->flags & CURLWS_CLOSE) {
            MCPBRIDGE_LOG_DEBUG(kComponent, "Peer closed the connection");
            fail(std::string());
            return;
        }
        if (!(meta->flags & (CURLWS_TEXT | CURLWS_BINARY | CURLWS_CONT))) {
            // PING/PONG are answered by libcurl
            continue;
        }

        bool final = meta->bytesleft == 0 && !(meta->flags & CURLWS_CONT);
        if (!incoming_.append(buffer, received, final)) {
            continue;
        }

        std::string frame = incoming_.take();
        auto on_message = callbacks_.on_message;
        if (on_message) {
            on_message(frame);
        }
        if (token.expired()) {
            return;
        }
    }
}

bool WebSocketTransport::is_open() const {
    return state_ == State::Open;
}

void WebSocketTransport::send(const std::string& frame) {
    if (state_ != State::Open) {
        return;
    }

    outgoing_.push(frame);
    if (!write_waiting_) {
        flush();
    }
}

void WebSocketTransport::flush() {
    while (state_ == State::Open && !outgoing_.empty()) {
        size_t sent = 0;
        CURLcode rc = curl_ws_send(curl_, outgoing_.pending_data(), outgoing_.pending_size(), &sent, 0,
                                   CURLWS_TEXT);
        if (rc == CURLE_AGAIN) {
            outgoing_.consume(sent);
            wait_writable();
            return;
        }
        if (rc != CURLE_OK) {
            fail(std::string("Send failed: ") + curl_easy_strerror(rc));
            return;
        }

        bool stalled = sent == 0 && outgoing_.pending_size() > 0;
        outgoing_.consume(sent);
        if (stalled) {
            wait_writable();
            return;
        }
    }
}

void WebSocketTransport::close() {
    // A close frame cannot be interleaved with a partly written text frame
    if (state_ == State::Open && !outgoing_.front_started()) {
        size_t sent = 0;
        CURLcode rc = curl_ws_send(curl_, "", 0, &sent, 0, CURLWS_CLOSE);
        if (rc != CURLE_OK) {
            MCPBRIDGE_LOG_DEBUG(kComponent, "Close frame not sent: " << curl_easy_strerror(rc));
        }
    }
    state_ = State::Closed;
    release();
}

void WebSocketTransport::fail(const std::string& error) {
    if (state_ == State::Closed) {
        return;
    }
    state_ = State::Closed;
    release();

    // Reported from a fresh handler so a failing send() never re-enters its caller
    std::weak_ptr<bool> token = alive_;
    auto callbacks = callbacks_;
    boost::asio::post(io_, [token, callbacks, error]() {
        if (token.expired()) {
            return;
        }
        if (!error.empty() && callbacks.on_error) {
            callbacks.on_error(error);
        }
        if (callbacks.on_close) {
            callbacks.on_close();
        }
    });
}

void WebSocketTransport::release() {
    if (socket_) {
        boost::system::error_code ignored;
        socket_->cancel(ignored);
        socket_->close(ignored);
        socket_.reset();
    }
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
    outgoing_.clear();
    incoming_.reset();
    write_waiting_ = false;
}

TransportFactory websocket_transport_factory(boost::asio::io_context& io,
                                             std::chrono::milliseconds connect_timeout) {
    return [&io, connect_timeout]() -> std::unique_ptr<Transport> {
        return std::make_unique<WebSocketTransport>(io, connect_timeout);
    };
}

} // namespace mcpbridge
