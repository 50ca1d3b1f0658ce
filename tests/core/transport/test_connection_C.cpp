/*
===============================================================================
 transport::Connection - Group C Unit Tests
===============================================================================

Scope:
------
Epoch guard and the edges around explicit close().

Covered Requirements:
---------------------
C1. close() while a retry is pending: the timer never fires an attempt
C2. A timer armed before close() + open() is discarded as stale
C3. Non-retryable open failures are not retried
C4. Local close with a non-1000 code still never retries
C5. A late Open after close() is ignored
C6. Transport errors are informational while connected
C7. Destruction closes the transport with 1000
===============================================================================
*/

#include <chrono>
#include <iostream>

#include "common/harness/connection.hpp"

using namespace poslink::core::transport::test::harness;
using connection::SignalKind;
using std::chrono::milliseconds;


// -----------------------------------------------------------------------------
// C1. Pending retry cancelled by close()
// -----------------------------------------------------------------------------
void test_close_cancels_pending_retry() {
    std::cout << "[TEST] Group C1: close() cancels a pending retry\n";
    ConnectionHarness h;

    TEST_CHECK(h.connection.open("ws://localhost:3000/ws") == Error::None);
    h.poll();
    h.connection.ws().emit_close(CloseCode::Abnormal);
    h.poll();
    TEST_CHECK(h.connection.is_retry_pending());

    const auto epoch = h.connection.epoch();
    h.connection.close();
    TEST_CHECK(h.connection.epoch() == epoch + 1);
    TEST_CHECK(!h.connection.is_retry_pending());

    h.advance(std::chrono::seconds(30));
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 1);
    TEST_CHECK(h.connection.state() == State::Disconnected);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// C2. Stale timer after close() + open()
// -----------------------------------------------------------------------------
void test_stale_timer_discarded() {
    std::cout << "[TEST] Group C2: stale timer is discarded\n";
    ConnectionHarness h;

    TEST_CHECK(h.connection.open("ws://localhost:3000/ws") == Error::None);
    h.poll();
    h.connection.ws().emit_close(CloseCode::Abnormal);
    h.poll();
    TEST_CHECK(h.connection.is_retry_pending());

    h.connection.close();
    TEST_CHECK(h.connection.open("ws://localhost:3000/ws") == Error::None);
    h.poll();
    TEST_CHECK(h.connection.is_connected());
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 2);

    h.advance(milliseconds(1000));
    h.advance(milliseconds(5000));
    TEST_CHECK(h.connection.is_connected());
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 2);
    TEST_CHECK(WebSocketUnderTest::instances() == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// C3. Non-retryable failure
// -----------------------------------------------------------------------------
void test_non_retryable_failure() {
    std::cout << "[TEST] Group C3: non-retryable open failure\n";
    ConnectionHarness h;
    WebSocketUnderTest::set_next_connect_result(Error::InvalidUrl);

    TEST_CHECK(h.connection.open("ws://localhost:3000/ws") == Error::InvalidUrl);
    h.drain();
    TEST_CHECK(h.count(SignalKind::Error) == 1);
    TEST_CHECK(h.count(SignalKind::Disconnected) == 1);
    TEST_CHECK(h.count(SignalKind::RetryScheduled) == 0);
    TEST_CHECK(h.count(SignalKind::RetryExhausted) == 0);

    h.advance(std::chrono::minutes(1));
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// C4. Local close with another code
// -----------------------------------------------------------------------------
void test_local_close_custom_code() {
    std::cout << "[TEST] Group C4: local close with 1001 is final\n";
    ConnectionHarness h;

    TEST_CHECK(h.connection.open("ws://localhost:3000/ws") == Error::None);
    h.poll();
    h.connection.close(CloseCode::GoingAway, "maintenance");
    h.drain();

    TEST_CHECK(WebSocketUnderTest::last_close_code() == 1001);
    TEST_CHECK(h.last(SignalKind::Disconnected).code == 1001);
    TEST_CHECK(h.last(SignalKind::Disconnected).text == "maintenance");

    h.advance(std::chrono::minutes(1));
    TEST_CHECK(h.count(SignalKind::RetryScheduled) == 0);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// C5. Late Open after close()
// -----------------------------------------------------------------------------
void test_late_open_ignored() {
    std::cout << "[TEST] Group C5: Open after close() is ignored\n";
    ConnectionHarness h;
    WebSocketUnderTest::set_auto_open(false);

    TEST_CHECK(h.connection.open("ws://localhost:3000/ws") == Error::None);
    h.poll();
    TEST_CHECK(h.connection.state() == State::Connecting);

    h.connection.close();
    h.connection.ws().emit_open();
    h.poll();

    TEST_CHECK(h.connection.state() == State::Disconnected);
    TEST_CHECK(h.count(SignalKind::Connected) == 0);
    TEST_CHECK(h.count(SignalKind::Disconnected) == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// C6. Error while connected
// -----------------------------------------------------------------------------
void test_error_is_informational() {
    std::cout << "[TEST] Group C6: transport error alone does not disconnect\n";
    ConnectionHarness h;

    TEST_CHECK(h.connection.open("ws://localhost:3000/ws") == Error::None);
    h.poll();
    h.connection.ws().emit_error(Error::TransportFailure);
    h.poll();

    TEST_CHECK(h.connection.is_connected());
    TEST_CHECK(h.count(SignalKind::Error) == 1);
    TEST_CHECK(h.last(SignalKind::Error).error == Error::TransportFailure);
    TEST_CHECK(h.count(SignalKind::Disconnected) == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// C7. Destructor
// -----------------------------------------------------------------------------
void test_destructor_closes_transport() {
    std::cout << "[TEST] Group C7: destruction closes the transport\n";
    {
        ConnectionHarness h;
        TEST_CHECK(h.connection.open("ws://localhost:3000/ws") == Error::None);
        h.poll();
        TEST_CHECK(WebSocketUnderTest::close_calls() == 0);
    }
    TEST_CHECK(WebSocketUnderTest::close_calls() == 1);
    TEST_CHECK(WebSocketUnderTest::last_close_code() == 1000);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    poslink::log::Logger::instance().set_level(poslink::log::Level::Trace);

    test_close_cancels_pending_retry();
    test_stale_timer_discarded();
    test_non_retryable_failure();
    test_local_close_custom_code();
    test_late_open_ignored();
    test_error_is_informational();
    test_destructor_closes_transport();

    std::cout << "\n[GROUP C - EPOCH GUARD TESTS PASSED]\n";
    return 0;
}
