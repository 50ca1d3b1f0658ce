/*
===============================================================================
 protocol::Session - Unit Tests
===============================================================================

Covered Requirements:
---------------------
S1. connection_ack binds the session id; later frames carry it (Scenario A)
S2. Known inbound types are published under their type with their payload
S3. Unknown types are published under unknown_message with the envelope
S4. Malformed frames are dropped without touching the connection
S5. Outbound while disconnected -> false, nothing written
S6. disconnect() publishes disconnected{1000} and forgets the session id
S7. A drop publishes disconnected + reconnect_scheduled and clears the id
S8. Giving up publishes max_reconnect_attempts_reached exactly once
S9. send() validates and minifies caller JSON
===============================================================================
*/

#include <chrono>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "poslink/core/protocol/session.hpp"
#include "poslink/core/protocol/codec.hpp"
#include "poslink/dispatch/bus.hpp"
#include "poslink/dispatch/category.hpp"
#include "common/manual_clock.hpp"
#include "common/mock_websocket.hpp"
#include "common/test_check.hpp"

using namespace poslink;
using namespace poslink::core;
using namespace poslink::core::protocol;
using transport::test::MockWebSocket;
using poslink::test::ManualClock;

using SessionUnderTest = Session<MockWebSocket, ManualClock>;

// -----------------------------------------------------------------------------
// Records every publish on the categories of interest, in order
// -----------------------------------------------------------------------------
struct Recorder {
    std::vector<std::pair<std::string, std::string>> events;
    std::vector<dispatch::Subscription> subs;

    Recorder(dispatch::Bus& bus, std::initializer_list<std::string_view> categories) {
        for (auto c : categories) {
            std::string category(c);
            subs.emplace_back(bus, c, bus.subscribe(c, [this, category](std::string_view payload) {
                events.emplace_back(category, std::string(payload));
            }));
        }
    }

    [[nodiscard]]
    std::size_t count(std::string_view category) const {
        std::size_t n = 0;
        for (const auto& e : events) {
            n += (e.first == category) ? 1 : 0;
        }
        return n;
    }

    [[nodiscard]]
    const std::string& last(std::string_view category) const {
        for (auto it = events.rbegin(); it != events.rend(); ++it) {
            if (it->first == category) {
                return it->second;
            }
        }
        TEST_CHECK(false && "category not published");
        return events.back().second;
    }
};

static void reset_doubles() {
    MockWebSocket::reset();
    ManualClock::reset();
}

static void connect(SessionUnderTest& session) {
    TEST_CHECK(session.connect("ws://localhost:3000/ws") == transport::Error::None);
    session.poll();
    TEST_CHECK(session.is_connected());
}

// -----------------------------------------------------------------------------
// S1. Scenario A
// -----------------------------------------------------------------------------
void test_ack_binds_terminal_id() {
    std::cout << "[TEST] Group S1: connection_ack binds the session id\n";
    reset_doubles();
    dispatch::Bus bus;
    Recorder rec(bus, {dispatch::category::Connected, dispatch::category::TerminalAssigned});
    SessionUnderTest session(bus);

    connect(session);
    TEST_CHECK(rec.count(dispatch::category::Connected) == 1);
    TEST_CHECK(!session.terminal_id());

    // Before the ack: no terminalId in the envelope
    TEST_CHECK(session.request_price("p0", "000"));
    TEST_CHECK(MockWebSocket::sent().back().find("terminalId") == std::string::npos);

    session.connection().ws().emit_message(R"({"type":"connection_ack","payload":{"terminalId":"T1","message":"hi"}})");
    session.poll();
    TEST_CHECK(session.terminal_id() && *session.terminal_id() == "T1");
    TEST_CHECK(rec.count(dispatch::category::TerminalAssigned) == 1);
    TEST_CHECK(rec.last(dispatch::category::TerminalAssigned) == R"({"terminalId":"T1","message":"hi"})");

    TEST_CHECK(session.request_price("p1", "7791234"));
    Codec codec;
    Message out;
    TEST_CHECK(codec.decode(MockWebSocket::sent().back(), out) == parser::Result::Parsed);
    TEST_CHECK(out.type == "price_request");
    TEST_CHECK(out.terminal_id && *out.terminal_id == "T1");
    TEST_CHECK(out.payload == R"({"productId":"p1","barcode":"7791234"})");
    Timestamp ts;
    TEST_CHECK(parse_iso8601(out.timestamp, ts));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// S2. Known inbound types
// -----------------------------------------------------------------------------
void test_known_types_published() {
    std::cout << "[TEST] Group S2: inbound payloads by type\n";
    reset_doubles();
    dispatch::Bus bus;
    Recorder rec(bus, {"price_response", "inventory_changed", "terminal_status",
                       "transaction_sync", "employee_action"});
    SessionUnderTest session(bus);
    connect(session);

    auto& ws = session.connection().ws();
    ws.emit_message(R"({"type":"price_response","payload":{"productId":"p1","barcode":"1","price":3.5,"available":false}})");
    ws.emit_message(R"({"type":"inventory_changed","payload":{"productId":"p1","oldQuantity":2,"newQuantity":1,"reason":"sale"}})");
    ws.emit_message(R"({"type":"transaction_sync","payload":{"id":"tx-1","total":10}})");
    ws.emit_message(R"({"type":"employee_action","payload":"clock_in"})");
    session.poll();

    TEST_CHECK(rec.events.size() == 4);
    TEST_CHECK(rec.events[0].first == "price_response");
    TEST_CHECK(rec.events[0].second == R"({"productId":"p1","barcode":"1","price":3.5,"available":false})");
    TEST_CHECK(rec.events[1].first == "inventory_changed");
    TEST_CHECK(rec.events[2].first == "transaction_sync");
    TEST_CHECK(rec.events[2].second == R"({"id":"tx-1","total":10})");
    TEST_CHECK(rec.events[3].second == R"("clock_in")");
    TEST_CHECK(session.rx_messages() == 4);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// S3. Unknown types
// -----------------------------------------------------------------------------
void test_unknown_type() {
    std::cout << "[TEST] Group S3: unknown_message carries the envelope\n";
    reset_doubles();
    dispatch::Bus bus;
    Recorder rec(bus, {dispatch::category::UnknownMessage, "loyalty_points"});
    SessionUnderTest session(bus);
    connect(session);

    session.connection().ws().emit_message(R"({"type":"loyalty_points","payload":{"points":5},"timestamp":"2024-01-01T00:00:00.000Z"})");
    session.poll();

    TEST_CHECK(rec.count("loyalty_points") == 0);
    TEST_CHECK(rec.count(dispatch::category::UnknownMessage) == 1);
    TEST_CHECK(rec.last(dispatch::category::UnknownMessage) ==
        R"({"type":"loyalty_points","payload":{"points":5},"timestamp":"2024-01-01T00:00:00.000Z"})");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// S4. Malformed frames
// -----------------------------------------------------------------------------
void test_malformed_dropped() {
    std::cout << "[TEST] Group S4: malformed frames are dropped\n";
    reset_doubles();
    dispatch::Bus bus;
    Recorder rec(bus, {dispatch::category::UnknownMessage, dispatch::category::Error,
                       dispatch::category::Disconnected, dispatch::category::TerminalAssigned, "price_response"});
    SessionUnderTest session(bus);
    connect(session);

    auto& ws = session.connection().ws();
    ws.emit_message("{oops");
    ws.emit_message(R"({"payload":{}})");
    ws.emit_message(R"({"type":"connection_ack","payload":{"terminalId":""}})");
    ws.emit_message(R"({"type":"price_response","payload":{"productId":"p1","barcode":"1","price":1,"available":true}})");
    session.poll();

    TEST_CHECK(session.is_connected());
    TEST_CHECK(!session.terminal_id());
    TEST_CHECK(rec.events.size() == 1);
    TEST_CHECK(rec.events[0].first == "price_response");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// S5. Outbound while disconnected
// -----------------------------------------------------------------------------
void test_outbound_while_disconnected() {
    std::cout << "[TEST] Group S5: outbound while disconnected\n";
    reset_doubles();
    dispatch::Bus bus;
    SessionUnderTest session(bus);

    TEST_CHECK(!session.request_price("p1", "1"));
    TEST_CHECK(!session.report_inventory_change("p1", 1, 0, "sale"));
    TEST_CHECK(!session.sync_transaction(R"({"id":1})"));
    TEST_CHECK(!session.update_terminal_status(schema::ActivityStatus::Active));
    TEST_CHECK(!session.send("custom", "{}"));
    TEST_CHECK(MockWebSocket::sent().empty());

    // Connecting is not connected either
    MockWebSocket::set_auto_open(false);
    TEST_CHECK(session.connect("ws://localhost:3000/ws") == transport::Error::None);
    session.poll();
    TEST_CHECK(!session.request_price("p1", "1"));
    TEST_CHECK(MockWebSocket::sent().empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// S6. Clean disconnect
// -----------------------------------------------------------------------------
void test_disconnect() {
    std::cout << "[TEST] Group S6: disconnect() is clean\n";
    reset_doubles();
    dispatch::Bus bus;
    Recorder rec(bus, {dispatch::category::Disconnected, dispatch::category::ReconnectScheduled});
    SessionUnderTest session(bus);
    connect(session);

    session.connection().ws().emit_message(R"({"type":"connection_ack","payload":{"terminalId":"T1"}})");
    session.poll();
    TEST_CHECK(session.terminal_id());

    session.disconnect();
    TEST_CHECK(!session.terminal_id());
    TEST_CHECK(session.state() == transport::State::Disconnected);
    TEST_CHECK(rec.count(dispatch::category::Disconnected) == 1);
    TEST_CHECK(rec.last(dispatch::category::Disconnected) == R"({"code":1000,"reason":"Client disconnect"})");
    TEST_CHECK(MockWebSocket::last_close_code() == 1000);

    ManualClock::advance(std::chrono::minutes(10));
    session.poll();
    TEST_CHECK(rec.count(dispatch::category::ReconnectScheduled) == 0);
    TEST_CHECK(MockWebSocket::connect_calls() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// S7. Drop and reconnect
// -----------------------------------------------------------------------------
void test_drop_and_reconnect() {
    std::cout << "[TEST] Group S7: drop -> disconnected, reconnect_scheduled\n";
    reset_doubles();
    dispatch::Bus bus;
    Recorder rec(bus, {dispatch::category::Connected, dispatch::category::Disconnected,
                       dispatch::category::ReconnectScheduled});
    SessionUnderTest session(bus);
    connect(session);

    session.connection().ws().emit_message(R"({"type":"connection_ack","payload":{"terminalId":"T1"}})");
    session.connection().ws().emit_close(transport::CloseCode::Abnormal, "lost");
    session.poll();

    TEST_CHECK(!session.terminal_id());
    TEST_CHECK(rec.last(dispatch::category::Disconnected) == R"({"code":1006,"reason":"lost"})");
    TEST_CHECK(rec.last(dispatch::category::ReconnectScheduled) == R"({"attempt":1,"delayMs":1000})");

    ManualClock::advance(std::chrono::milliseconds(1000));
    session.poll();
    session.poll();
    TEST_CHECK(session.is_connected());
    TEST_CHECK(rec.count(dispatch::category::Connected) == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// S8. Give up
// -----------------------------------------------------------------------------
void test_give_up_published_once() {
    std::cout << "[TEST] Group S8: max_reconnect_attempts_reached once\n";
    reset_doubles();
    dispatch::Bus bus;
    Recorder rec(bus, {dispatch::category::MaxReconnectAttemptsReached, dispatch::category::Error,
                       dispatch::category::ReconnectScheduled});
    SessionUnderTest session(bus);
    MockWebSocket::set_next_connect_result(transport::Error::ConnectionFailed);

    TEST_CHECK(session.connect("ws://localhost:3000/ws") == transport::Error::ConnectionFailed);
    for (int i = 0; i < 10; ++i) {
        ManualClock::advance(std::chrono::seconds(60));
        session.poll();
    }

    TEST_CHECK(rec.count(dispatch::category::ReconnectScheduled) == 5);
    TEST_CHECK(rec.count(dispatch::category::MaxReconnectAttemptsReached) == 1);
    TEST_CHECK(rec.last(dispatch::category::MaxReconnectAttemptsReached) == R"({"attempts":5})");
    TEST_CHECK(rec.last(dispatch::category::Error) == R"({"error":"ConnectionFailed"})");
    TEST_CHECK(MockWebSocket::connect_calls() == 6);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// S9. Caller JSON
// -----------------------------------------------------------------------------
void test_send_validates_json() {
    std::cout << "[TEST] Group S9: send() validates caller JSON\n";
    reset_doubles();
    dispatch::Bus bus;
    SessionUnderTest session(bus);
    connect(session);

    TEST_CHECK(!session.send("transaction_sync", "{broken"));
    TEST_CHECK(MockWebSocket::sent().empty());

    TEST_CHECK(session.sync_transaction(R"({ "id": "tx-9", "items": [ 1, 2 ] })"));
    Codec codec;
    Message out;
    TEST_CHECK(codec.decode(MockWebSocket::sent().back(), out) == parser::Result::Parsed);
    TEST_CHECK(out.type == "transaction_sync");
    TEST_CHECK(out.payload == R"({"id":"tx-9","items":[1,2]})");

    TEST_CHECK(session.update_terminal_status(schema::ActivityStatus::Inactive));
    TEST_CHECK(codec.decode(MockWebSocket::sent().back(), out) == parser::Result::Parsed);
    TEST_CHECK(out.type == "terminal_status_update");
    TEST_CHECK(out.payload == R"({"status":"inactive"})");
    TEST_CHECK(session.tx_messages() == 2);

    std::cout << "[TEST] OK\n";
}

int main() {
    poslink::log::Logger::instance().set_level(poslink::log::Level::Debug);

    test_ack_binds_terminal_id();
    test_known_types_published();
    test_unknown_type();
    test_malformed_dropped();
    test_outbound_while_disconnected();
    test_disconnect();
    test_drop_and_reconnect();
    test_give_up_published_once();
    test_send_validates_json();

    std::cout << "\n[SESSION TESTS PASSED]\n";
    return 0;
}
