// WebSocket transport tests: send queue, fragment reassembly and a loopback peer
#include <mcpbridge/frame_buffer.hpp>
#include <mcpbridge/log.hpp>
#include <mcpbridge/websocket_transport.hpp>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/websocket.hpp>

using namespace mcpbridge;
using std::chrono::milliseconds;

namespace {

namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

int fail(const char* name, const std::string& msg) {
    std::cerr << "[FAIL] " << name << ": " << msg << '\n';
    return 1;
}

int test_outgoing_frames_resume_partial_writes() {
    OutgoingFrames frames;
    frames.push("hello");
    frames.push("world");

    if (frames.size() != 2 || frames.pending_size() != 5 || frames.front_started()) {
        return fail("test_outgoing_frames_resume_partial_writes", "fresh queue mismatch");
    }
    frames.consume(2);
    if (std::string(frames.pending_data(), frames.pending_size()) != "llo" || !frames.front_started()) {
        return fail("test_outgoing_frames_resume_partial_writes", "short write must keep the remainder first");
    }
    frames.consume(0);
    if (frames.pending_size() != 3 || frames.size() != 2) {
        return fail("test_outgoing_frames_resume_partial_writes", "empty write must not advance");
    }
    frames.consume(3);
    if (frames.size() != 1 || std::string(frames.pending_data(), frames.pending_size()) != "world"
        || frames.front_started()) {
        return fail("test_outgoing_frames_resume_partial_writes", "completed frame must be popped");
    }
    frames.consume(50);
    if (!frames.empty() || frames.pending_size() != 0 || frames.pending_data() != nullptr) {
        return fail("test_outgoing_frames_resume_partial_writes", "queue should be empty");
    }

    frames.push("");
    frames.consume(0);
    if (!frames.empty()) {
        return fail("test_outgoing_frames_resume_partial_writes", "empty frame is written by a zero-length send");
    }

    frames.push("abc");
    frames.consume(1);
    frames.clear();
    frames.push("next");
    if (frames.front_started() || frames.pending_size() != 4) {
        return fail("test_outgoing_frames_resume_partial_writes", "clear must drop the partial offset");
    }
    std::cout << "✓ send queue\n";
    return 0;
}

int test_message_assembler_joins_fragments() {
    MessageAssembler assembler;
    if (assembler.append("{\"a\":", 5, false) || !assembler.in_progress()) {
        return fail("test_message_assembler_joins_fragments", "first fragment must not complete");
    }
    if (assembler.append("", 0, false)) {
        return fail("test_message_assembler_joins_fragments", "empty fragment must not complete");
    }
    if (!assembler.append("1}", 2, true)) {
        return fail("test_message_assembler_joins_fragments", "last fragment must complete");
    }
    if (assembler.take() != "{\"a\":1}" || assembler.in_progress()) {
        return fail("test_message_assembler_joins_fragments", "joined message mismatch");
    }

    if (!assembler.append("single", 6, true) || assembler.take() != "single") {
        return fail("test_message_assembler_joins_fragments", "unfragmented message mismatch");
    }

    assembler.append("stale", 5, false);
    assembler.reset();
    assembler.append("fresh", 5, true);
    if (assembler.take() != "fresh") {
        return fail("test_message_assembler_joins_fragments", "reset must drop earlier fragments");
    }
    std::cout << "✓ fragment reassembly\n";
    return 0;
}

int test_open_rejects_bad_urls() {
    boost::asio::io_context io;
    WebSocketTransport transport(io, milliseconds(100));
    try {
        transport.open("http://localhost:3003/default", Transport::Callbacks());
        return fail("test_open_rejects_bad_urls", "http URL accepted");
    } catch (const TransportError&) {
    }
    if (transport.is_open()) {
        return fail("test_open_rejects_bad_urls", "rejected transport must stay closed");
    }

    // Sends before the connection opens are dropped
    transport.send("{}");
    io.poll();
    std::cout << "✓ url validation\n";
    return 0;
}

int test_loopback_large_messages() {
    if (!websocket_supported()) {
        std::cout << "- loopback skipped: libcurl built without WebSocket support\n";
        return 0;
    }

    const std::size_t kUpload = 1024 * 1024;
    const std::size_t kDownload = 300 * 1024;

    boost::asio::io_context peer_io;
    tcp::acceptor acceptor(peer_io, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
    unsigned short port = acceptor.local_endpoint().port();
    std::size_t peer_received = 0;

    std::thread peer([&]() {
        boost::system::error_code ec;
        tcp::socket socket(peer_io);
        acceptor.accept(socket, ec);
        if (ec) {
            return;
        }
        websocket::stream<tcp::socket> ws(std::move(socket));
        ws.read_message_max(kUpload * 2);
        ws.accept(ec);
        if (ec) {
            return;
        }
        ws.text(true);
        std::string download(kDownload, 'd');
        ws.write(boost::asio::buffer(download), ec);
        if (ec) {
            return;
        }

        // Hold off reading so the client's upload backs up in its queue
        std::this_thread::sleep_for(milliseconds(200));
        boost::beast::flat_buffer buffer;
        ws.read(buffer, ec);
        if (ec) {
            return;
        }
        peer_received = buffer.size();
        std::string reply = std::to_string(peer_received);
        ws.write(boost::asio::buffer(reply), ec);
        if (ec) {
            return;
        }
        buffer.consume(buffer.size());
        ws.read(buffer, ec);
    });

    boost::asio::io_context io;
    bool opened = false;
    std::string error;
    std::vector<std::string> messages;
    {
        WebSocketTransport transport(io, milliseconds(2000));
        Transport::Callbacks callbacks;
        callbacks.on_open = [&]() {
            opened = true;
            transport.send(std::string(kUpload, 'u'));
        };
        callbacks.on_message = [&](const std::string& message) {
            messages.push_back(message);
            if (messages.size() == 2) {
                transport.close();
            }
        };
        callbacks.on_error = [&error](const std::string& e) { error = e; };

        transport.open("ws://127.0.0.1:" + std::to_string(port) + "/loopback", callbacks);
        io.run_for(milliseconds(5000));
    }

    if (!opened) {
        // Unblock the peer's accept
        boost::system::error_code ignored;
        tcp::socket poke(io);
        poke.connect(acceptor.local_endpoint(), ignored);
        poke.close(ignored);
    }
    peer.join();

    if (!opened || !error.empty()) {
        return fail("test_loopback_large_messages", "connection failed: " + error);
    }
    if (messages.size() != 2) {
        return fail("test_loopback_large_messages", "expected two messages, got " + std::to_string(messages.size()));
    }
    if (messages[0].size() != kDownload
        || std::count(messages[0].begin(), messages[0].end(), 'd') != static_cast<long>(kDownload)) {
        return fail("test_loopback_large_messages", "large message was not reassembled");
    }
    if (peer_received != kUpload || messages[1] != std::to_string(kUpload)) {
        return fail("test_loopback_large_messages", "peer received " + std::to_string(peer_received) + " bytes");
    }
    std::cout << "✓ loopback large messages\n";
    return 0;
}

} // namespace

int main() {
    std::cout << "Running websocket tests...\n";
    Logger::instance().set_level(LogLevel::OFF);

    if (int rc = test_outgoing_frames_resume_partial_writes(); rc != 0) return rc;
    if (int rc = test_message_assembler_joins_fragments(); rc != 0) return rc;
    if (int rc = test_open_rejects_bad_urls(); rc != 0) return rc;
    if (int rc = test_loopback_large_messages(); rc != 0) return rc;

    std::cout << "[PASS] websocket tests\n";
    return 0;
}
