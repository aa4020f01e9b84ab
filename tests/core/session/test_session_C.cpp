/*
===============================================================================
 session::Client — Group C Unit Tests (closing, cancellation, accounting)
===============================================================================

Scope:
------
Graceful close, cancellation of in-flight work, forced termination, and the
exactly-one-outcome accounting rule.

Covered Requirements:
---------------------
C1. request_close() while Active: Closing → Closed, no drop recorded
C2. Close handshake never completes: released after the close timeout
C3. Close requested while Connecting: ConnectionError, counted once
C4. Close requested while waiting for the ack: SubscribeFailed, counted once
C5. Close requested during an update: the update counts as failed
C6. force_terminate() while Active: forced, outcome unchanged
C7. force_terminate() before any outcome: classified by state
C8. force_terminate() on a terminal session is a no-op
C9. request_close() from another thread is honored at the next poll
C10. Randomized event sequences: exactly one outcome per session, gauge
     back to zero, every update attempt ends acked or failed
===============================================================================
*/

#include <iostream>
#include <memory>
#include <random>
#include <thread>
#include <vector>

#include "common/session_harness.hpp"
#include "common/test_check.hpp"

using namespace wireload::core;
using namespace wireload::test;
using session::Outcome;
using session::State;


// -----------------------------------------------------------------------------
// C1. Graceful close
// -----------------------------------------------------------------------------
void test_close_while_active() {
    std::cout << "[TEST] Group C1: close while active\n";

    SessionHarness h;
    auto c = h.make(1);
    h.subscribe(*c, milliseconds{0});

    c->request_close();
    TEST_CHECK(c->state() == State::Active);        // honored on the next poll only
    TEST_CHECK(!c->poll(h.at(milliseconds{100})));

    TEST_CHECK(c->state() == State::Closed);
    TEST_CHECK(c->outcome() == Outcome::Subscribed);
    TEST_CHECK(c->ws().close_count() == 1);
    TEST_CHECK(h.metrics.connections_dropped() == 0);
    TEST_CHECK(h.metrics.active_sessions() == 0);
    TEST_CHECK(h.outcomes() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// C2. Close timeout
// -----------------------------------------------------------------------------
void test_close_timeout() {
    std::cout << "[TEST] Group C2: close handshake timeout\n";

    SessionHarness h(milliseconds{1000}, milliseconds{500}, milliseconds{200});
    auto c = h.make(1, transport::Error::None, false);
    h.subscribe(*c, milliseconds{0});

    c->request_close();
    c->poll(h.at(milliseconds{100}));
    TEST_CHECK(c->state() == State::Closing);
    TEST_CHECK(h.metrics.active_sessions() == 1);

    // Data still in flight while closing is not lost
    c->ws().emit_message(json::pusher::data_without_timestamp(h.config.channel));
    c->poll(h.at(milliseconds{299}));
    TEST_CHECK(c->state() == State::Closing);
    TEST_CHECK(c->messages_received() == 1);

    c->poll(h.at(milliseconds{300}));
    TEST_CHECK(c->state() == State::Closed);
    TEST_CHECK(h.metrics.active_sessions() == 0);
    TEST_CHECK(c->ws().close_count() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// C3. Cancel while connecting
// -----------------------------------------------------------------------------
void test_close_while_connecting() {
    std::cout << "[TEST] Group C3: close while connecting\n";

    SessionHarness h;
    auto c = h.make(1);
    c->start(h.at(milliseconds{0}));

    c->request_close();
    c->poll(h.at(milliseconds{1}));
    TEST_CHECK(c->outcome() == Outcome::ConnectionError);
    TEST_CHECK(c->is_terminal());

    // A connect completion racing the close is ignored
    c->ws().emit_connected();
    TEST_CHECK(!c->poll(h.at(milliseconds{2})));
    TEST_CHECK(h.metrics.connection_errors() == 1);
    TEST_CHECK(h.outcomes() == 1);
    TEST_CHECK(h.metrics.active_sessions() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// C4. Cancel while subscribing
// -----------------------------------------------------------------------------
void test_close_while_subscribing() {
    std::cout << "[TEST] Group C4: close while waiting for the ack\n";

    SessionHarness h;
    auto c = h.make(4);
    c->start(h.at(milliseconds{0}));
    c->ws().emit_connected();
    c->ws().emit_message(json::pusher::connection_established());
    c->poll(h.at(milliseconds{1}));
    TEST_CHECK(c->state() == State::Subscribing);

    c->request_close();
    c->poll(h.at(milliseconds{2}));
    TEST_CHECK(c->is_terminal());
    TEST_CHECK(c->outcome() == Outcome::SubscribeFailed);
    TEST_CHECK(h.metrics.subscribe_failed() == 1);
    TEST_CHECK(h.outcomes() == 1);
    TEST_CHECK(h.metrics.active_sessions() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// C5. Cancel during update
// -----------------------------------------------------------------------------
void test_close_while_updating() {
    std::cout << "[TEST] Group C5: close during a filter update\n";

    SessionHarness h;
    auto c = h.make(2);
    h.subscribe(*c, milliseconds{0}, milliseconds{0});
    c->poll(h.at(milliseconds{500}));
    TEST_CHECK(c->state() == State::Updating);

    c->request_close();
    c->poll(h.at(milliseconds{510}));
    TEST_CHECK(c->is_terminal());
    TEST_CHECK(c->outcome() == Outcome::Subscribed);
    TEST_CHECK(h.metrics.update_attempts() == 1);
    TEST_CHECK(h.metrics.update_failures() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// C6. Forced while Active
// -----------------------------------------------------------------------------
void test_force_active() {
    std::cout << "[TEST] Group C6: forced termination while active\n";

    SessionHarness h;
    auto c = h.make(1);
    h.subscribe(*c, milliseconds{0});

    c->force_terminate();
    TEST_CHECK(c->state() == State::Failed);
    TEST_CHECK(c->outcome() == Outcome::Subscribed);
    TEST_CHECK(c->ws().close_count() == 1);
    TEST_CHECK(h.metrics.forced_terminations() == 1);
    TEST_CHECK(h.metrics.active_sessions() == 0);
    TEST_CHECK(h.outcomes() == 1);
    TEST_CHECK(!c->poll(h.at(milliseconds{1})));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// C7. Forced before outcome
// -----------------------------------------------------------------------------
void test_force_pending() {
    std::cout << "[TEST] Group C7: forced termination before any outcome\n";

    SessionHarness h;

    auto connecting = h.make(1);
    connecting->start(h.at(milliseconds{0}));
    connecting->force_terminate();
    TEST_CHECK(connecting->outcome() == Outcome::ConnectionError);

    auto authenticating = h.make(1);
    authenticating->start(h.at(milliseconds{0}));
    authenticating->ws().emit_connected();
    authenticating->poll(h.at(milliseconds{1}));
    TEST_CHECK(authenticating->state() == State::Authenticating);
    authenticating->force_terminate();
    TEST_CHECK(authenticating->outcome() == Outcome::SubscribeFailed);

    TEST_CHECK(h.metrics.forced_terminations() == 2);
    TEST_CHECK(h.metrics.connection_errors() == 1);
    TEST_CHECK(h.metrics.subscribe_failed() == 1);
    TEST_CHECK(h.metrics.active_sessions() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// C8. Forced after terminal
// -----------------------------------------------------------------------------
void test_force_terminal_noop() {
    std::cout << "[TEST] Group C8: forcing a terminal session is a no-op\n";

    SessionHarness h;
    auto c = h.make(1, transport::Error::ConnectionFailed);
    c->start(h.at(milliseconds{0}));
    TEST_CHECK(c->is_terminal());

    c->force_terminate();
    TEST_CHECK(h.metrics.forced_terminations() == 0);
    TEST_CHECK(h.outcomes() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// C9. Cross-thread close request
// -----------------------------------------------------------------------------
void test_close_from_other_thread() {
    std::cout << "[TEST] Group C9: close requested from another thread\n";

    SessionHarness h;
    auto c = h.make(1);
    h.subscribe(*c, milliseconds{0});

    std::thread other([&c] { c->request_close(); });
    other.join();

    c->poll(h.at(milliseconds{100}));
    TEST_CHECK(c->state() == State::Closed);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// C10. Randomized sequences
// -----------------------------------------------------------------------------
void test_exactly_one_outcome() {
    std::cout << "[TEST] Group C10: exactly one outcome per session\n";

    constexpr int SESSIONS = 300;
    SessionHarness h(milliseconds{300}, milliseconds{100}, milliseconds{50});
    std::mt19937 rng(2024);
    std::uniform_int_distribution<int> action(0, 11);

    std::vector<std::unique_ptr<MockClient>> clients;
    for (int i = 0; i < SESSIONS; ++i) {
        const bool refuse = (i % 17) == 0;
        clients.push_back(h.make(1 + (i % 5),
                                 refuse ? transport::Error::ConnectionFailed : transport::Error::None,
                                 (i % 3) != 0));
        clients.back()->start(h.at(milliseconds{0}));
    }

    for (int step = 1; step <= 60; ++step) {
        const auto now = h.at(milliseconds{step * 10});
        for (auto& c : clients) {
            if (c->is_terminal()) continue;
            auto& ws = c->ws();
            switch (action(rng)) {
                case 0: ws.emit_connected(); break;
                case 1: ws.emit_message(json::pusher::connection_established()); break;
                case 2: ws.emit_message(json::pusher::subscription_succeeded(h.config.channel)); break;
                case 3: ws.emit_message(json::pusher::error()); break;
                case 4: ws.emit_message(json::pusher::data_with_timestamp(h.config.channel, json::pusher::now_ms())); break;
                case 5: ws.emit_failure(transport::Error::RemoteClosed); break;
                case 6: c->request_close(); break;
                case 7: ws.emit_message(json::pusher::ping()); break;
                default: break;
            }
            c->poll(now);
        }
    }
    for (auto& c : clients) {
        c->force_terminate();
        TEST_CHECK(c->is_terminal());
        TEST_CHECK(c->outcome() != Outcome::Pending);
    }

    TEST_CHECK(h.outcomes() == SESSIONS);
    TEST_CHECK(h.metrics.connection_attempts() == SESSIONS);
    TEST_CHECK(h.metrics.active_sessions() == 0);
    TEST_CHECK(h.metrics.update_attempts() ==
               h.metrics.latency(metrics::LatencyKind::Update).size() + h.metrics.update_failures());

    std::cout << "[TEST] OK\n";
}


#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Warn);

    test_close_while_active();
    test_close_timeout();
    test_close_while_connecting();
    test_close_while_subscribing();
    test_close_while_updating();
    test_force_active();
    test_force_pending();
    test_force_terminal_noop();
    test_close_from_other_thread();
    test_exactly_one_outcome();

    std::cout << "\n[GROUP C — SESSION CLOSE AND ACCOUNTING TESTS PASSED]\n";
    return 0;
}
