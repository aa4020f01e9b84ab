/*
===============================================================================
 ramp::Controller / ramp::WorkerPool — Unit Tests
===============================================================================

Scope:
------
The three-stage run schedule, driven with in-memory sessions that only
account for themselves (no transport, no protocol).

Covered Requirements:
---------------------
R1. N sessions created, closed and accounted: exactly N outcomes
R2. Creation never runs ahead of the linear ramp-up curve
R3. Closure is requested in creation order
R4. Sessions ignoring the close request are forced at the deadline
R5. Factory failures count as connection errors and do not stop the run
R6. Warm-up: its own stage before a full hold, messages until its end counted apart
R7. External stop or process-wide interrupt flag: immediate ramp-down,
    schedule marked incomplete
R8. Sessions that fail on their own leave the schedule untouched
===============================================================================
*/

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "wireload/core/config/scenario.hpp"
#include "wireload/core/metrics/aggregator.hpp"
#include "wireload/core/ramp/controller.hpp"
#include "common/test_check.hpp"

using namespace wireload::core;
using namespace std::chrono_literals;
using clock_type = std::chrono::steady_clock;


namespace {

// Order in which the controller asked sessions to close
struct CloseLog {
    std::mutex mutex;
    std::vector<std::uint64_t> order;

    void push(std::uint64_t index) {
        std::lock_guard<std::mutex> lock(mutex);
        order.push_back(index);
    }
};

// -----------------------------------------------------------------------------
// FakeSession
//
// Subscribe:    subscribes on first poll, one message per poll, closes on request
// Refuse:       connection error on first poll
// IgnoreClose:  subscribes, never honors a close request
// -----------------------------------------------------------------------------
class FakeSession {
public:
    enum class Behavior { Subscribe, Refuse, IgnoreClose };

    FakeSession(std::uint64_t index, Behavior behavior, metrics::Aggregator& metrics, CloseLog& log)
        : index_(index)
        , behavior_(behavior)
        , metrics_(metrics)
        , log_(log)
    {
        metrics_.record_connection_attempt();
    }

    bool poll(clock_type::time_point) {
        if (terminal_.load()) {
            return false;
        }
        if (!started_) {
            started_ = true;
            if (behavior_ == Behavior::Refuse) {
                metrics_.record_connection_error();
                terminal_.store(true);
                return false;
            }
            metrics_.session_opened();
            metrics_.record_subscribe_success();
        }
        metrics_.record_message_received();
        if (close_requested_.load() && behavior_ != Behavior::IgnoreClose) {
            finish_();
            return false;
        }
        return true;
    }

    bool is_terminal() const noexcept { return terminal_.load(); }

    void request_close() noexcept {
        close_requested_.store(true);
        log_.push(index_);
    }

    void force_terminate() {
        if (terminal_.load()) {
            return;
        }
        metrics_.record_forced_termination();
        if (!started_) {
            metrics_.record_connection_error();
            terminal_.store(true);
            return;
        }
        finish_();
    }

private:
    void finish_() {
        metrics_.session_closed();
        terminal_.store(true);
    }

    std::uint64_t index_;
    Behavior behavior_;
    metrics::Aggregator& metrics_;
    CloseLog& log_;

    bool started_ = false;
    std::atomic<bool> terminal_{false};
    std::atomic<bool> close_requested_{false};
};
static_assert(ramp::PollableSession<FakeSession>);

ramp::Options fast_options() {
    ramp::Options o;
    o.workers = 3;
    o.tick = 1ms;
    o.grace = 500ms;
    o.quantum = 5ms;
    o.progress_interval = 100ms;
    return o;
}

const config::Scenario& scenario() {
    return *config::find_scenario(1);
}

} // namespace


// -----------------------------------------------------------------------------
// R1 / R2 / R3. Normal run
// -----------------------------------------------------------------------------
void test_normal_run() {
    std::cout << "[TEST] R1-R3: normal run, ramp curve, closure order\n";

    constexpr std::size_t N = 40;
    metrics::Aggregator metrics;
    CloseLog log;
    std::vector<clock_type::time_point> created_at(N);

    ramp::Controller<FakeSession> controller(fast_options(), metrics,
        [&](std::uint64_t index, const config::Scenario&) {
            created_at[index] = clock_type::now();
            return std::make_shared<FakeSession>(index, FakeSession::Behavior::Subscribe, metrics, log);
        });

    const auto before = clock_type::now();
    const ramp::RunResult r = controller.start(scenario(), N, 400ms, 200ms, 200ms);

    TEST_CHECK(r.created == N);
    TEST_CHECK(r.terminated == N);
    TEST_CHECK(r.forced == 0);
    TEST_CHECK(r.schedule_completed);
    TEST_CHECK(r.elapsed >= 800ms);

    TEST_CHECK(metrics.connection_attempts() == N);
    TEST_CHECK(metrics.subscribe_success() == N);
    TEST_CHECK(metrics.subscribe_success() + metrics.subscribe_failed() + metrics.connection_errors() == N);
    TEST_CHECK(metrics.active_sessions() == 0);
    TEST_CHECK(metrics.messages_received() > 0);

    // Session i is due once floor(N * e / ramp_up) > i, i.e. e >= (i + 1) * 10ms
    for (std::size_t i = 0; i < N; ++i) {
        TEST_CHECK(created_at[i] - before >= std::chrono::milliseconds{(i + 1) * 10});
        if (i > 0) {
            TEST_CHECK(created_at[i] >= created_at[i - 1]);
        }
    }

    TEST_CHECK(log.order.size() == N);
    for (std::size_t i = 0; i < log.order.size(); ++i) {
        TEST_CHECK(log.order[i] == i);
    }

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// R4. Forced termination
// -----------------------------------------------------------------------------
void test_forced_at_deadline() {
    std::cout << "[TEST] R4: sessions ignoring close are forced\n";

    constexpr std::size_t N = 10;
    metrics::Aggregator metrics;
    CloseLog log;

    auto options = fast_options();
    options.grace = 200ms;
    ramp::Controller<FakeSession> controller(options, metrics,
        [&](std::uint64_t index, const config::Scenario&) {
            const auto b = (index % 2 == 0) ? FakeSession::Behavior::IgnoreClose : FakeSession::Behavior::Subscribe;
            return std::make_shared<FakeSession>(index, b, metrics, log);
        });

    const ramp::RunResult r = controller.start(scenario(), N, 100ms, 100ms, 100ms);

    TEST_CHECK(r.created == N);
    TEST_CHECK(r.forced == N / 2);
    TEST_CHECK(r.terminated == N / 2);
    TEST_CHECK(r.elapsed >= 500ms);
    TEST_CHECK(metrics.forced_terminations() == N / 2);
    TEST_CHECK(metrics.subscribe_success() == N);
    TEST_CHECK(metrics.active_sessions() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// R5. Factory failures
// -----------------------------------------------------------------------------
void test_factory_failures() {
    std::cout << "[TEST] R5: factory failures\n";

    constexpr std::size_t N = 20;
    metrics::Aggregator metrics;
    CloseLog log;

    ramp::Controller<FakeSession> controller(fast_options(), metrics,
        [&](std::uint64_t index, const config::Scenario&) -> std::shared_ptr<FakeSession> {
            if (index == 5) {
                throw std::runtime_error("socket limit reached");
            }
            if (index % 4 == 0) {
                return nullptr;
            }
            return std::make_shared<FakeSession>(index, FakeSession::Behavior::Subscribe, metrics, log);
        });

    const ramp::RunResult r = controller.start(scenario(), N, 100ms, 50ms, 50ms);

    // index 0, 4, 8, 12, 16 → nullptr; index 5 → throws
    TEST_CHECK(r.created == N - 6);
    TEST_CHECK(metrics.connection_errors() == 6);
    TEST_CHECK(metrics.connection_attempts() == N);
    TEST_CHECK(metrics.subscribe_success() + metrics.subscribe_failed() + metrics.connection_errors() == N);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// R6. Warm-up
// -----------------------------------------------------------------------------
void test_warmup() {
    std::cout << "[TEST] R6: warm-up gating\n";

    constexpr std::size_t N = 8;
    metrics::Aggregator metrics;
    CloseLog log;

    auto options = fast_options();
    options.warmup = 150ms;
    ramp::Controller<FakeSession> controller(options, metrics,
        [&](std::uint64_t index, const config::Scenario&) {
            return std::make_shared<FakeSession>(index, FakeSession::Behavior::Subscribe, metrics, log);
        });

    const ramp::RunResult r = controller.start(scenario(), N, 50ms, 100ms, 50ms);

    TEST_CHECK(r.schedule_completed);
    // ramp-up + warm-up + full hold + ramp-down
    TEST_CHECK(r.elapsed >= 350ms);
    TEST_CHECK(r.forced == 0);
    TEST_CHECK(metrics.recording());
    TEST_CHECK(metrics.messages_during_warmup() > 0);
    TEST_CHECK(metrics.messages_received() > 0);
    // Subscribe outcomes are never gated
    TEST_CHECK(metrics.subscribe_success() == N);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// R7. External stop
// -----------------------------------------------------------------------------
void test_external_stop() {
    std::cout << "[TEST] R7: external stop\n";

    constexpr std::size_t N = 12;
    metrics::Aggregator metrics;
    CloseLog log;
    std::atomic<bool> stop{false};

    auto options = fast_options();
    options.stop = &stop;
    ramp::Controller<FakeSession> controller(options, metrics,
        [&](std::uint64_t index, const config::Scenario&) {
            return std::make_shared<FakeSession>(index, FakeSession::Behavior::Subscribe, metrics, log);
        });

    std::thread interrupter([&stop] {
        std::this_thread::sleep_for(300ms);
        stop.store(true);
    });

    const auto before = clock_type::now();
    const ramp::RunResult r = controller.start(scenario(), N, 100ms, 60s, 60s);
    const auto took = clock_type::now() - before;
    interrupter.join();

    TEST_CHECK(!r.schedule_completed);
    TEST_CHECK(took < 10s);
    TEST_CHECK(r.created == N);
    TEST_CHECK(r.terminated == N);
    TEST_CHECK(r.forced == 0);
    TEST_CHECK(metrics.active_sessions() == 0);
    TEST_CHECK(log.order.size() == N);

    // Interrupt flag already raised: no session is created
    std::atomic<bool> interrupt{true};
    metrics::Aggregator metrics2;
    CloseLog log2;
    auto options2 = fast_options();
    options2.interrupt = &interrupt;
    ramp::Controller<FakeSession> interrupted(options2, metrics2,
        [&](std::uint64_t index, const config::Scenario&) {
            return std::make_shared<FakeSession>(index, FakeSession::Behavior::Subscribe, metrics2, log2);
        });

    const ramp::RunResult r2 = interrupted.start(scenario(), N, 100ms, 60s, 60s);
    TEST_CHECK(!r2.schedule_completed);
    TEST_CHECK(r2.created == 0);
    TEST_CHECK(r2.elapsed < 10s);
    TEST_CHECK(metrics2.active_sessions() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// R8. Self-terminating sessions
// -----------------------------------------------------------------------------
void test_all_refused() {
    std::cout << "[TEST] R8: every session fails on its own\n";

    constexpr std::size_t N = 15;
    metrics::Aggregator metrics;
    CloseLog log;

    ramp::Controller<FakeSession> controller(fast_options(), metrics,
        [&](std::uint64_t index, const config::Scenario&) {
            return std::make_shared<FakeSession>(index, FakeSession::Behavior::Refuse, metrics, log);
        });

    const ramp::RunResult r = controller.start(scenario(), N, 60ms, 60ms, 60ms);

    TEST_CHECK(r.created == N);
    TEST_CHECK(r.terminated == N);
    TEST_CHECK(r.schedule_completed);
    TEST_CHECK(r.elapsed >= 180ms);
    TEST_CHECK(metrics.connection_errors() == N);
    TEST_CHECK(metrics.subscribe_success() == 0);

    std::cout << "[TEST] OK\n";
}


#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Info);

    test_normal_run();
    test_forced_at_deadline();
    test_factory_failures();
    test_warmup();
    test_external_stop();
    test_all_refused();

    std::cout << "\n[RAMP CONTROLLER TESTS PASSED]\n";
    return 0;
}
