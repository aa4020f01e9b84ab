#pragma once

#include <atomic>
#include <utility>

#include "wireload/core/config/error.hpp"
#include "wireload/core/config/run.hpp"
#include "wireload/core/metrics/aggregator.hpp"
#include "wireload/core/metrics/summary.hpp"


namespace wireload::core {

/*
===============================================================================
 ScenarioRunner
===============================================================================

Composes one benchmark run:

  1. validate the configuration, resolve the host, load the address pool
     (any failure here is fatal and happens before the first session)
  2. start the I/O pool (Boost.Asio threads + TLS context)
  3. let a ramp::Controller create, hold and close N Pusher sessions on
     Boost.Beast WebSockets
  4. snapshot the aggregator into a Summary

run() returns config::Error::None whenever the schedule ran, whatever the
individual sessions did: an all-failure run is a valid result.

The aggregator is owned by the runner and reset at the start of every run,
so a runner can be reused for consecutive runs.
===============================================================================
*/
class ScenarioRunner {
public:
    explicit ScenarioRunner(config::Run config)
        : config_(std::move(config))
    {}

    ScenarioRunner(const ScenarioRunner&) = delete;
    ScenarioRunner& operator=(const ScenarioRunner&) = delete;

    [[nodiscard]]
    config::Error run(metrics::Summary& out);

    // Interrupt a run in progress: skip to an immediate ramp-down (thread-safe)
    void request_stop() noexcept {
        stop_.store(true, std::memory_order_relaxed);
    }

    // Also stop when an externally owned flag is raised. The flag is only read,
    // never reset, so a signal handler may own it (it must be lock-free).
    void watch_interrupt(const std::atomic<bool>* flag) noexcept {
        interrupt_ = flag;
    }

    [[nodiscard]] const config::Run& config() const noexcept { return config_; }
    [[nodiscard]] const metrics::Aggregator& metrics() const noexcept { return metrics_; }

private:
    config::Run config_;
    metrics::Aggregator metrics_;
    std::atomic<bool> stop_{false};
    const std::atomic<bool>* interrupt_ = nullptr;
};

// One-shot convenience wrapper
[[nodiscard]]
inline config::Error run(const config::Run& config, metrics::Summary& out) {
    ScenarioRunner runner(config);
    return runner.run(out);
}

} // namespace wireload::core
