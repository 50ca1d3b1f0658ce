/*
===============================================================================
 host::Lifecycle - Unit Tests
===============================================================================

Covered Requirements:
---------------------
L1. Visibility notifications are edge-triggered (starts visible)
L2. Teardown is delivered at most once
L3. Detached listeners are no longer invoked; unknown ids are ignored
L4. A throwing listener (standard exception or not) does not prevent the
    others from running
L5. A listener may detach itself while being notified
===============================================================================
*/

#include <iostream>
#include <stdexcept>
#include <vector>

#include "poslink/host/lifecycle.hpp"
#include "common/test_check.hpp"

using poslink::host::Lifecycle;


void test_visibility_edges() {
    std::cout << "[TEST] Group L1: visibility edges\n";
    Lifecycle lc;
    std::vector<bool> seen;
    (void)lc.on_visibility([&](bool v) { seen.push_back(v); });

    TEST_CHECK(lc.visible());
    lc.notify_visibility(true);     // no edge
    TEST_CHECK(seen.empty());

    lc.notify_visibility(false);
    lc.notify_visibility(false);
    lc.notify_visibility(true);
    TEST_CHECK((seen == std::vector<bool>{false, true}));
    TEST_CHECK(lc.visible());

    std::cout << "[TEST] OK\n";
}

void test_teardown_once() {
    std::cout << "[TEST] Group L2: teardown once\n";
    Lifecycle lc;
    int calls = 0;
    (void)lc.on_teardown([&] { ++calls; });

    TEST_CHECK(!lc.torn_down());
    lc.notify_teardown();
    lc.notify_teardown();
    TEST_CHECK(calls == 1);
    TEST_CHECK(lc.torn_down());

    std::cout << "[TEST] OK\n";
}

void test_detach() {
    std::cout << "[TEST] Group L3: detach\n";
    Lifecycle lc;
    int a = 0, b = 0;
    const auto id_a = lc.on_visibility([&](bool) { ++a; });
    const auto id_b = lc.on_teardown([&] { ++b; });
    TEST_CHECK(id_a != Lifecycle::INVALID_LISTENER);
    TEST_CHECK(id_a != id_b);
    TEST_CHECK(lc.listener_count() == 2);

    lc.detach(id_a);
    lc.detach(Lifecycle::INVALID_LISTENER);
    lc.detach(9999);
    TEST_CHECK(lc.listener_count() == 1);

    lc.notify_visibility(false);
    TEST_CHECK(a == 0);

    lc.detach(id_b);
    lc.notify_teardown();
    TEST_CHECK(b == 0);
    TEST_CHECK(lc.listener_count() == 0);

    std::cout << "[TEST] OK\n";
}

void test_throwing_listener() {
    std::cout << "[TEST] Group L4: throwing listener isolated\n";
    Lifecycle lc;
    int after = 0;
    (void)lc.on_visibility([](bool) { throw std::runtime_error("boom"); });
    (void)lc.on_visibility([&](bool) { ++after; });
    (void)lc.on_visibility([](bool) { throw 42; });
    (void)lc.on_visibility([&](bool) { ++after; });
    (void)lc.on_teardown([] { throw std::logic_error("bang"); });
    (void)lc.on_teardown([] { throw "not an exception object"; });
    (void)lc.on_teardown([&] { ++after; });

    lc.notify_visibility(false);
    TEST_CHECK(after == 2);
    lc.notify_teardown();
    TEST_CHECK(after == 3);

    std::cout << "[TEST] OK\n";
}

void test_self_detach() {
    std::cout << "[TEST] Group L5: self detach during notification\n";
    Lifecycle lc;
    int calls = 0;
    Lifecycle::ListenerId self = Lifecycle::INVALID_LISTENER;
    self = lc.on_visibility([&](bool) {
        ++calls;
        lc.detach(self);
    });

    lc.notify_visibility(false);
    lc.notify_visibility(true);
    TEST_CHECK(calls == 1);
    TEST_CHECK(lc.listener_count() == 0);

    std::cout << "[TEST] OK\n";
}

int main() {
    poslink::log::Logger::instance().set_level(poslink::log::Level::Debug);

    test_visibility_edges();
    test_teardown_once();
    test_detach();
    test_throwing_listener();
    test_self_detach();

    std::cout << "\n[LIFECYCLE TESTS PASSED]\n";
    return 0;
}
