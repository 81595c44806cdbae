// Connection lifecycle tests, driven through an in-memory transport
#include <mcpbridge/bridge.hpp>
#include <mcpbridge/log.hpp>

#include "fake_transport.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/asio/io_context.hpp>

using namespace mcpbridge;
using namespace mcpbridge::testing;
using std::chrono::milliseconds;

namespace {

int fail(const char* name, const std::string& msg) {
    std::cerr << "[FAIL] " << name << ": " << msg << '\n';
    return 1;
}

BridgeConfig fast_config() {
    BridgeConfig config;
    config.base_delay = milliseconds(10);
    config.max_delay = milliseconds(40);
    config.keepalive_interval = milliseconds(20);
    return config;
}

void run_for(boost::asio::io_context& io, int ms) {
    io.restart();
    io.run_for(milliseconds(ms));
}

std::string describe(const std::vector<ConnectionStatus>& statuses) {
    std::string text;
    for (ConnectionStatus status : statuses) {
        text += std::string(text.empty() ? "" : ",") + to_string(status);
    }
    return text;
}

int test_connect_and_reconnect_cycle() {
    boost::asio::io_context io;
    FakeTransportFactory transports;
    McpBridge bridge(io, fast_config(), transports.factory());

    std::vector<ConnectionStatus> statuses;
    bridge.on_status_change([&statuses](ConnectionStatus status) { statuses.push_back(status); });

    bridge.init();
    drain(io);
    if (transports.created() != 1 || transports.last().url != "ws://localhost:3003/default") {
        return fail("test_connect_and_reconnect_cycle", "first attempt should target the default instance");
    }

    transports.last().fire_open();
    if (bridge.status() != ConnectionStatus::Connected || bridge.error()) {
        return fail("test_connect_and_reconnect_cycle", "open should connect and clear the error");
    }

    // Availability is announced on every open
    FakeTransportState& first = transports.at(0);
    if (first.count_method("notifications/tools/list_changed") != 1
        || first.count_method("notifications/resources/list_changed") != 1
        || first.count_method("notifications/prompts/list_changed") != 1) {
        return fail("test_connect_and_reconnect_cycle", "open must announce all three lists");
    }

    first.fire_close();
    if (bridge.status() != ConnectionStatus::Disconnected) {
        return fail("test_connect_and_reconnect_cycle", "close should disconnect");
    }

    run_for(io, 50);
    if (transports.created() != 2 || bridge.status() != ConnectionStatus::Connecting) {
        return fail("test_connect_and_reconnect_cycle", "close should schedule a reconnect");
    }
    if (bridge.reconnect_attempt() != 1) {
        return fail("test_connect_and_reconnect_cycle", "attempt counter should be 1 while reconnecting");
    }

    transports.last().fire_open();
    if (bridge.reconnect_attempt() != 0) {
        return fail("test_connect_and_reconnect_cycle", "successful open must reset the attempt counter");
    }

    std::string expected = "disconnected,connecting,connected,disconnected,connecting,connected";
    if (describe(statuses) != expected) {
        return fail("test_connect_and_reconnect_cycle", "status sequence was " + describe(statuses));
    }
    std::cout << "✓ connect, close, reconnect\n";
    return 0;
}

int test_backoff_grows_across_failures() {
    boost::asio::io_context io;
    FakeTransportFactory transports;
    McpBridge bridge(io, fast_config(), transports.factory());

    bridge.init();
    drain(io);

    // 10ms, 20ms, 40ms between attempts
    transports.last().fire_close();
    run_for(io, 15);
    transports.last().fire_close();
    run_for(io, 30);
    transports.last().fire_close();
    if (transports.created() != 3 || bridge.reconnect_attempt() != 2) {
        return fail("test_backoff_grows_across_failures", "expected three attempts so far");
    }

    run_for(io, 20);
    if (transports.created() != 3) {
        return fail("test_backoff_grows_across_failures", "third delay should be 40ms");
    }
    run_for(io, 40);
    if (transports.created() != 4 || bridge.reconnect_attempt() != 3) {
        return fail("test_backoff_grows_across_failures", "fourth attempt missing");
    }
    std::cout << "✓ exponential backoff\n";
    return 0;
}

int test_disable_stops_everything() {
    boost::asio::io_context io;
    FakeTransportFactory transports;
    McpBridge bridge(io, fast_config(), transports.factory());

    // Disabled while the attempt is still resolving
    bridge.init();
    bridge.disable();
    run_for(io, 50);
    if (transports.created() != 0 || bridge.status() != ConnectionStatus::Disconnected) {
        return fail("test_disable_stops_everything", "disable while connecting must prevent the attempt");
    }

    // Disabled while the transport is opening
    bridge.enable();
    drain(io);
    FakeTransportState& pending = transports.last();
    bridge.disable();
    if (!pending.closed_locally) {
        return fail("test_disable_stops_everything", "disable must close the transport");
    }
    pending.fire_open();
    pending.fire_close();
    run_for(io, 50);
    if (transports.created() != 1 || bridge.status() != ConnectionStatus::Disconnected) {
        return fail("test_disable_stops_everything", "late events from a closed transport must be ignored");
    }
    if (!pending.destroyed) {
        return fail("test_disable_stops_everything", "closed transport should be released");
    }

    // Connected, then disabled: no reconnect and no keepalive
    bridge.enable();
    drain(io);
    FakeTransportState& live = transports.last();
    live.fire_open();
    bridge.disable();
    std::size_t sent = live.sent.size();
    run_for(io, 60);
    if (transports.created() != 2 || live.sent.size() != sent) {
        return fail("test_disable_stops_everything", "disabled bridge kept working");
    }
    if (bridge.enabled()) {
        return fail("test_disable_stops_everything", "enabled flag mismatch");
    }
    std::cout << "✓ disable\n";
    return 0;
}

int test_init_respects_enabled_flag() {
    boost::asio::io_context io;
    FakeTransportFactory transports;
    BridgeConfig config = fast_config();
    config.enabled = false;
    McpBridge bridge(io, config, transports.factory());

    bridge.init();
    run_for(io, 30);
    if (transports.created() != 0 || bridge.enabled()) {
        return fail("test_init_respects_enabled_flag", "disabled config must not connect");
    }

    bridge.set_enabled(true);
    drain(io);
    if (transports.created() != 1 || bridge.status() != ConnectionStatus::Connecting) {
        return fail("test_init_respects_enabled_flag", "set_enabled(true) should connect");
    }
    std::cout << "✓ enabled flag\n";
    return 0;
}

int test_keepalive_only_while_connected() {
    boost::asio::io_context io;
    FakeTransportFactory transports;
    McpBridge bridge(io, fast_config(), transports.factory());

    bridge.init();
    drain(io);
    run_for(io, 50);
    FakeTransportState& first = transports.last();
    if (first.count_method("ping") != 0) {
        return fail("test_keepalive_only_while_connected", "no ping before open");
    }

    first.fire_open();
    run_for(io, 70);
    int pings = first.count_method("ping");
    if (pings < 2 || pings > 4) {
        return fail("test_keepalive_only_while_connected", "expected about three pings, saw " + std::to_string(pings));
    }
    for (const json& message : first.sent_json()) {
        if (message.value("method", "") == "ping" && message != json{{"jsonrpc", "2.0"}, {"method", "ping"}}) {
            return fail("test_keepalive_only_while_connected", "ping shape mismatch: " + message.dump());
        }
    }

    first.fire_close();
    run_for(io, 70);
    if (first.count_method("ping") != pings) {
        return fail("test_keepalive_only_while_connected", "ping sent after disconnect");
    }
    if (transports.created() < 2 || !transports.last().sent.empty()) {
        return fail("test_keepalive_only_while_connected", "unopened transport must not receive pings");
    }
    std::cout << "✓ keepalive\n";
    return 0;
}

int test_list_changed_only_while_connected() {
    boost::asio::io_context io;
    FakeTransportFactory transports;
    McpBridge bridge(io, fast_config(), transports.factory());

    bridge.register_tool({"early", "", {{"type", "object"}}}, [](const json&) { return text_result(""); });
    bridge.init();
    drain(io);
    bridge.register_tool({"connecting", "", {{"type", "object"}}}, [](const json&) { return text_result(""); });

    FakeTransportState& transport = transports.last();
    if (!transport.sent.empty()) {
        return fail("test_list_changed_only_while_connected", "nothing may be sent before open");
    }

    transport.fire_open();
    bridge.register_tool({"late", "", {{"type", "object"}}}, [](const json&) { return text_result(""); });

    if (transport.count_method("notifications/tools/list_changed") != 2
        || transport.count_method("notifications/resources/list_changed") != 1) {
        return fail("test_list_changed_only_while_connected", "expected announcement plus one tool change");
    }

    PromptDescriptor prompt;
    prompt.name = "p";
    bridge.register_prompt(prompt, [](const std::optional<PromptArguments>&) { return PromptResult(); });
    if (transport.count_method("notifications/prompts/list_changed") != 2) {
        return fail("test_list_changed_only_while_connected", "prompt registration not announced");
    }
    if (bridge.registry().tool_count() != 3) {
        return fail("test_list_changed_only_while_connected", "registrations while disconnected were lost");
    }
    std::cout << "✓ list_changed\n";
    return 0;
}

int test_retry_replaces_connection() {
    boost::asio::io_context io;
    FakeTransportFactory transports;
    McpBridge bridge(io, fast_config(), transports.factory());

    bridge.init();
    drain(io);
    FakeTransportState& first = transports.last();
    first.fire_open();

    bridge.retry();
    if (!first.closed_locally || bridge.status() != ConnectionStatus::Connecting) {
        return fail("test_retry_replaces_connection", "retry should close and reconnect immediately");
    }
    drain(io);
    if (transports.created() != 2) {
        return fail("test_retry_replaces_connection", "retry should open a new transport");
    }

    // The old transport's close arrives late and is ignored
    first.fire_close();
    if (bridge.status() != ConnectionStatus::Connecting) {
        return fail("test_retry_replaces_connection", "stale close changed the status");
    }
    run_for(io, 30);
    if (transports.created() != 2) {
        return fail("test_retry_replaces_connection", "stale close scheduled a reconnect");
    }

    // A new instance id reconnects to the new endpoint
    transports.last().fire_open();
    bridge.set_instance_id("editor two");
    drain(io);
    if (transports.created() != 3 || transports.last().url != "ws://localhost:3003/editor%20two") {
        return fail("test_retry_replaces_connection", "instance change should reconnect: " + transports.last().url);
    }

    // Disabled bridges ignore retry
    bridge.disable();
    bridge.retry();
    drain(io);
    if (transports.created() != 3 || bridge.status() != ConnectionStatus::Disconnected) {
        return fail("test_retry_replaces_connection", "retry while disabled must do nothing");
    }
    std::cout << "✓ retry\n";
    return 0;
}

int test_open_failure_reports_error() {
    boost::asio::io_context io;
    FakeTransportFactory transports;
    McpBridge bridge(io, fast_config(), transports.factory());

    std::vector<ConnectionStatus> statuses;
    std::vector<std::optional<std::string>> errors;
    bridge.on_status_change([&statuses](ConnectionStatus status) { statuses.push_back(status); });
    bridge.on_error_change([&errors](const std::optional<std::string>& error) { errors.push_back(error); });

    transports.fail_next();
    bridge.init();
    drain(io);
    if (bridge.status() != ConnectionStatus::Error || bridge.error() != std::string("connection refused")) {
        return fail("test_open_failure_reports_error", "synchronous failure should end in error");
    }

    run_for(io, 30);
    if (transports.created() != 2 || bridge.status() != ConnectionStatus::Connecting || bridge.error()) {
        return fail("test_open_failure_reports_error", "error state should retry with backoff");
    }
    if (describe(statuses) != "disconnected,connecting,error,connecting") {
        return fail("test_open_failure_reports_error", "status sequence was " + describe(statuses));
    }
    if (errors.size() != 3 || errors[1] != std::string("connection refused") || errors[2]) {
        return fail("test_open_failure_reports_error", "error observable sequence mismatch");
    }

    // Transport errors are reported without changing status
    transports.last().fire_open();
    transports.last().fire_error("socket hang up");
    if (bridge.error() != std::string("socket hang up") || bridge.status() != ConnectionStatus::Connected) {
        return fail("test_open_failure_reports_error", "transport error should only set the error");
    }
    std::cout << "✓ open failure\n";
    return 0;
}

int test_instance_id_resolution() {
    boost::asio::io_context io;
    FakeTransportFactory transports;
    McpBridge bridge(io, fast_config(), transports.factory());

    bridge.set_instance_id_resolver([](InstanceIdCallback done) {
        done(std::make_exception_ptr(std::runtime_error("no instance")), std::string());
    });
    bridge.init();
    drain(io);
    if (transports.created() != 1 || transports.last().url != "ws://localhost:3003/default") {
        return fail("test_instance_id_resolution", "failed resolver must fall back to default");
    }

    InstanceIdCallback pending;
    bridge.set_instance_id_resolver([&pending](InstanceIdCallback done) { pending = done; });
    bridge.retry();
    drain(io);
    if (transports.created() != 1 || !pending) {
        return fail("test_instance_id_resolution", "attempt should wait for the resolver");
    }
    pending(nullptr, "workspace-7");
    drain(io);
    if (transports.created() != 2 || transports.last().url != "ws://localhost:3003/workspace-7") {
        return fail("test_instance_id_resolution", "resolved identifier not used");
    }

    // A resolver that answers and then throws still opens one transport
    bridge.set_instance_id_resolver([](InstanceIdCallback done) {
        done(nullptr, "answered");
        throw std::runtime_error("late failure");
    });
    bridge.retry();
    drain(io);
    if (transports.created() != 3 || transports.last().url != "ws://localhost:3003/answered") {
        return fail("test_instance_id_resolution", "resolver result must be used exactly once");
    }

    // An explicit identifier wins over the resolver
    bridge.set_instance_id("fixed");
    drain(io);
    if (transports.created() != 4 || transports.last().url != "ws://localhost:3003/fixed") {
        return fail("test_instance_id_resolution", "configured identifier should skip the resolver");
    }
    std::cout << "✓ instance id resolution\n";
    return 0;
}

int test_requests_flow_end_to_end() {
    boost::asio::io_context io;
    FakeTransportFactory transports;
    BridgeConfig config = fast_config();
    config.server_info.name = "e2e";
    McpBridge bridge(io, config, transports.factory());
    bridge.register_tool({"add", "Add", {{"type", "object"}}},
        [](const json& args) -> json { return args.value("a", 0) + args.value("b", 0); });

    bridge.init();
    drain(io);
    FakeTransportState& transport = transports.last();
    transport.fire_open();
    transport.sent.clear();

    transport.fire_message(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})");
    transport.fire_message(R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"add","arguments":{"a":2,"b":3}}})");
    drain(io);

    std::vector<json> sent;
    for (const json& message : transport.sent_json()) {
        if (message.contains("id")) {
            sent.push_back(message);
        }
    }
    if (sent.size() != 2) {
        return fail("test_requests_flow_end_to_end", "expected two responses");
    }
    if (sent[0]["id"] != 1 || sent[0]["result"]["serverInfo"]["name"] != "e2e") {
        return fail("test_requests_flow_end_to_end", "initialize response mismatch: " + sent[0].dump());
    }
    if (sent[1]["id"] != 2 || sent[1]["result"] != text_result("5")) {
        return fail("test_requests_flow_end_to_end", "tools/call response mismatch: " + sent[1].dump());
    }

    bridge.shutdown();
    transport.fire_close();
    run_for(io, 30);
    if (transports.created() != 1 || bridge.status() != ConnectionStatus::Disconnected) {
        return fail("test_requests_flow_end_to_end", "shutdown must not reconnect");
    }
    std::cout << "✓ end to end\n";
    return 0;
}

} // namespace

int main() {
    std::cout << "Running connection tests...\n";
    Logger::instance().set_level(LogLevel::OFF);

    if (int rc = test_connect_and_reconnect_cycle(); rc != 0) return rc;
    if (int rc = test_backoff_grows_across_failures(); rc != 0) return rc;
    if (int rc = test_disable_stops_everything(); rc != 0) return rc;
    if (int rc = test_init_respects_enabled_flag(); rc != 0) return rc;
    if (int rc = test_keepalive_only_while_connected(); rc != 0) return rc;
    if (int rc = test_list_changed_only_while_connected(); rc != 0) return rc;
    if (int rc = test_retry_replaces_connection(); rc != 0) return rc;
    if (int rc = test_open_failure_reports_error(); rc != 0) return rc;
    if (int rc = test_instance_id_resolution(); rc != 0) return rc;
    if (int rc = test_requests_flow_end_to_end(); rc != 0) return rc;

    std::cout << "[PASS] connection tests\n";
    return 0;
}
