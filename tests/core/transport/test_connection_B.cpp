/*
===============================================================================
 transport::Connection - Group B Unit Tests
===============================================================================

Scope:
------
Reconnection policy: exponential backoff, attempt cap, give-up signal.

Covered Requirements:
---------------------
B1. Drop with 1006 -> one retry at base delay; failed retry -> 2x base
B2. Unreachable server: delays 1, 2, 4, 8, 16 x base, then RetryExhausted
    exactly once and no further attempt
B3. A successful reconnect resets the counter and the backoff
B4. With jitter enabled, successive delays never decrease
B5. A failure while opening does not double count
B6. open() after giving up starts a fresh outage budget
===============================================================================
*/

#include <chrono>
#include <iostream>

#include "common/harness/connection.hpp"

using namespace poslink::core::transport::test::harness;
using connection::SignalKind;
using std::chrono::milliseconds;


// -----------------------------------------------------------------------------
// B1. Drop after connected (1006)
// -----------------------------------------------------------------------------
void test_drop_schedules_backoff() {
    std::cout << "[TEST] Group B1: abnormal drop -> base, then 2x base\n";
    ConnectionHarness h;

    TEST_CHECK(h.connection.open("ws://localhost:3000/ws") == Error::None);
    h.poll();
    TEST_CHECK(h.connection.is_connected());

    h.connection.ws().emit_close(CloseCode::Abnormal);
    h.poll();
    TEST_CHECK(h.connection.state() == State::Disconnected);
    TEST_CHECK(h.last(SignalKind::Disconnected).code == 1006);
    TEST_CHECK(h.count(SignalKind::RetryScheduled) == 1);
    TEST_CHECK(h.last(SignalKind::RetryScheduled).attempt == 1);
    TEST_CHECK(h.last(SignalKind::RetryScheduled).delay == milliseconds(1000));

    // Not yet due
    h.advance(milliseconds(999));
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 1);

    // The retry also fails (this time without ever opening)
    WebSocketUnderTest::set_next_connect_result(Error::ConnectionFailed);
    h.advance(milliseconds(1));
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 2);
    TEST_CHECK(h.count(SignalKind::RetryScheduled) == 2);
    TEST_CHECK(h.last(SignalKind::RetryScheduled).attempt == 2);
    TEST_CHECK(h.last(SignalKind::RetryScheduled).delay == milliseconds(2000));
    TEST_CHECK(h.count(SignalKind::Error) == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B2. Attempt cap
// -----------------------------------------------------------------------------
void test_attempt_cap() {
    std::cout << "[TEST] Group B2: five failed retries -> give up once\n";
    ConnectionHarness h;
    WebSocketUnderTest::set_next_connect_result(Error::ConnectionFailed);

    TEST_CHECK(h.connection.open("ws://localhost:3000/ws") == Error::ConnectionFailed);
    h.drain();

    for (int i = 0; i < 10; ++i) {
        h.advance(std::chrono::seconds(60));
    }

    const auto delays = h.retry_delays();
    TEST_CHECK(delays.size() == 5);
    TEST_CHECK(delays[0] == milliseconds(1000));
    TEST_CHECK(delays[1] == milliseconds(2000));
    TEST_CHECK(delays[2] == milliseconds(4000));
    TEST_CHECK(delays[3] == milliseconds(8000));
    TEST_CHECK(delays[4] == milliseconds(16000));

    // Initial attempt plus five retries, never a sixth
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 6);
    TEST_CHECK(h.count(SignalKind::RetryExhausted) == 1);
    TEST_CHECK(h.last(SignalKind::RetryExhausted).attempt == 5);
    TEST_CHECK(h.count(SignalKind::Disconnected) == 6);
    TEST_CHECK(h.connection.state() == State::Disconnected);
    TEST_CHECK(!h.connection.is_retry_pending());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B3. Reset after success
// -----------------------------------------------------------------------------
void test_reset_after_success() {
    std::cout << "[TEST] Group B3: successful reconnect resets the backoff\n";
    ConnectionHarness h;

    TEST_CHECK(h.connection.open("ws://localhost:3000/ws") == Error::None);
    h.poll();

    // Two failing rounds
    h.connection.ws().emit_close(CloseCode::GoingAway);
    h.poll();
    WebSocketUnderTest::set_next_connect_result(Error::ConnectionFailed);
    h.advance(milliseconds(1000));
    TEST_CHECK(h.connection.retry_attempts() == 2);

    // Third attempt succeeds
    WebSocketUnderTest::set_next_connect_result(Error::None);
    h.advance(milliseconds(2000));
    TEST_CHECK(h.connection.state() == State::Connecting);
    h.poll();
    TEST_CHECK(h.connection.is_connected());
    TEST_CHECK(h.connection.retry_attempts() == 0);
    TEST_CHECK(h.count(SignalKind::Connected) == 2);

    // Next outage starts again at base delay
    h.connection.ws().emit_close(CloseCode::Abnormal);
    h.poll();
    TEST_CHECK(h.last(SignalKind::RetryScheduled).attempt == 1);
    TEST_CHECK(h.last(SignalKind::RetryScheduled).delay == milliseconds(1000));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B4. Jitter keeps the sequence monotonic
// -----------------------------------------------------------------------------
void test_jitter_monotonic() {
    std::cout << "[TEST] Group B4: jittered delays never decrease\n";
    ReconnectPolicy policy;
    policy.base_delay = milliseconds(100);
    policy.max_attempts = 8;
    policy.jitter = milliseconds(500);
    ConnectionHarness h{policy};
    WebSocketUnderTest::set_next_connect_result(Error::ConnectionFailed);

    TEST_CHECK(h.connection.open("ws://localhost:3000/ws") == Error::ConnectionFailed);
    h.drain();
    for (int i = 0; i < 12; ++i) {
        h.advance(std::chrono::seconds(60));
    }

    const auto delays = h.retry_delays();
    TEST_CHECK(delays.size() == 8);
    for (std::size_t i = 0; i < delays.size(); ++i) {
        const auto floor = milliseconds(100 * (std::int64_t{1} << i));
        TEST_CHECK(delays[i] >= floor);
        if (i > 0) {
            TEST_CHECK(delays[i] >= delays[i - 1]);
        }
    }
    TEST_CHECK(h.count(SignalKind::RetryExhausted) == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B5. Opening failure counts once
// -----------------------------------------------------------------------------
void test_opening_failure_counts_once() {
    std::cout << "[TEST] Group B5: failure while opening counts once\n";
    ConnectionHarness h;
    WebSocketUnderTest::set_auto_open(false);

    TEST_CHECK(h.connection.open("ws://localhost:3000/ws") == Error::None);
    h.poll();
    TEST_CHECK(h.connection.state() == State::Connecting);

    // Handshake never completes: transport reports an error, then the close
    h.connection.ws().emit_error(Error::HandshakeFailed);
    h.connection.ws().emit_close(CloseCode::Abnormal, "handshake failed");
    h.poll();

    TEST_CHECK(h.count(SignalKind::Error) == 1);
    TEST_CHECK(h.count(SignalKind::Disconnected) == 1);
    TEST_CHECK(h.count(SignalKind::RetryScheduled) == 1);
    TEST_CHECK(h.connection.retry_attempts() == 1);
    TEST_CHECK(h.last(SignalKind::RetryScheduled).delay == milliseconds(1000));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B6. Manual open after giving up
// -----------------------------------------------------------------------------
void test_open_after_give_up() {
    std::cout << "[TEST] Group B6: open() after give-up starts over\n";
    ReconnectPolicy policy;
    policy.max_attempts = 2;
    ConnectionHarness h{policy};
    WebSocketUnderTest::set_next_connect_result(Error::ConnectionFailed);

    TEST_CHECK(h.connection.open("ws://localhost:3000/ws") == Error::ConnectionFailed);
    h.drain();
    h.advance(std::chrono::seconds(10));
    h.advance(std::chrono::seconds(10));
    TEST_CHECK(h.count(SignalKind::RetryExhausted) == 1);

    WebSocketUnderTest::set_next_connect_result(Error::None);
    TEST_CHECK(h.connection.open("ws://localhost:3000/ws") == Error::None);
    h.poll();
    TEST_CHECK(h.connection.is_connected());
    TEST_CHECK(h.connection.retry_attempts() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    poslink::log::Logger::instance().set_level(poslink::log::Level::Trace);

    test_drop_schedules_backoff();
    test_attempt_cap();
    test_reset_after_success();
    test_jitter_monotonic();
    test_opening_failure_counts_once();
    test_open_after_give_up();

    std::cout << "\n[GROUP B - RECONNECTION POLICY TESTS PASSED]\n";
    return 0;
}
