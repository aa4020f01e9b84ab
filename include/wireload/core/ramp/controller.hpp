#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "wireload/core/config/scenario.hpp"
#include "wireload/core/metrics/aggregator.hpp"
#include "wireload/core/ramp/schedule.hpp"
#include "wireload/core/ramp/worker_pool.hpp"
#include "lcr/log/logger.hpp"


namespace wireload::core::ramp {

// Result of one controller run
struct RunResult {
    std::size_t created = 0;            // sessions handed to the workers
    std::uint64_t terminated = 0;       // sessions that reached a terminal state on their own
    std::uint64_t forced = 0;           // sessions terminated at the run deadline
    bool schedule_completed = false;    // false only when the run was interrupted
    std::chrono::milliseconds elapsed{0};
};

struct Options {
    std::size_t workers = 4;
    std::chrono::milliseconds tick{1};                       // worker poll period
    std::chrono::milliseconds warmup{0};                     // between ramp-up and hold, metrics gated
    std::chrono::milliseconds grace{10000};                  // after ramp-down, before forcing
    std::chrono::milliseconds quantum = SCHEDULING_QUANTUM;
    std::chrono::milliseconds progress_interval = PROGRESS_INTERVAL;
    const std::atomic<bool>* stop = nullptr;                 // external interrupt (optional)
    const std::atomic<bool>* interrupt = nullptr;            // process-wide interrupt, set from a signal handler (optional)
};


/*
===============================================================================
 ramp::Controller
===============================================================================

Brings a run from 0 to N sessions and back to 0:

  Stage 1  ramp-up     create N sessions, linearly spread over ramp_up
  Warm-up  (optional)  no creation, no teardown, metrics gated
  Stage 2  hold        no creation, no teardown, measured for the full hold
  Stage 3  ramp-down   request closure, linearly spread over ramp_down, in
                       creation order
  Drain    wait until every session is terminal, at most until
           ramp_up + warmup + hold + ramp_down + grace after the start;
           sessions still alive at that deadline are force-terminated

Metrics recording is off from the start of the run until the warm-up ends.

The factory creates and starts one session. A factory failure (nullptr or
exception) is recorded as a connection error and never aborts the run.

start() blocks the calling thread for the whole run. Sessions are polled by
a WorkerPool owned by the run; the controller itself only creates sessions,
requests closure and logs progress every `progress_interval`.
===============================================================================
*/
template<PollableSession SessionT>
class Controller {
public:
    using clock = std::chrono::steady_clock;
    using Factory = std::function<std::shared_ptr<SessionT>(std::uint64_t index, const config::Scenario& scenario)>;

    Controller(const Options& options, metrics::Aggregator& metrics, Factory factory)
        : options_(options)
        , metrics_(metrics)
        , factory_(std::move(factory))
    {}

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;

    [[nodiscard]]
    RunResult start(const config::Scenario& scenario,
                    std::size_t client_count,
                    std::chrono::milliseconds ramp_up,
                    std::chrono::milliseconds hold,
                    std::chrono::milliseconds ramp_down)
    {
        RunResult result;
        failed_creations_ = 0;
        WorkerPool<SessionT> pool(options_.workers, options_.tick);
        std::vector<std::shared_ptr<SessionT>> sessions;
        sessions.reserve(client_count);

        const bool gated = options_.warmup.count() > 0;
        if (gated) {
            metrics_.set_recording(false);
        }

        const auto t0 = clock::now();
        auto deadline = t0 + ramp_up + options_.warmup + hold + ramp_down + options_.grace;
        last_progress_ = t0;

        // ---------------------------------------------------------------------
        // Stage 1: ramp-up
        // ---------------------------------------------------------------------
        WL_INFO("[RAMP] Stage 1: ramping to " << client_count << " clients over " << seconds_(ramp_up) << "s");
        auto next = t0;
        while (sessions.size() + failed_creations_ < client_count && !stopped_()) {
            const auto now = clock::now();
            const std::size_t target = ramp_target(client_count, now - t0, ramp_up);
            while (sessions.size() + failed_creations_ < target) {
                create_(sessions.size() + failed_creations_, scenario, pool, sessions);
            }
            log_progress_("Stage 1", now, pool);
            if (sessions.size() + failed_creations_ < client_count) {
                next += options_.quantum;
                std::this_thread::sleep_until(next);
            }
        }
        wait_until_(t0 + ramp_up, "Stage 1", pool);
        result.created = sessions.size();
        WL_INFO("[RAMP] Stage 1 complete: " << sessions.size() << " clients created, "
                << metrics_.active_sessions() << " active");

        // ---------------------------------------------------------------------
        // Warm-up
        // ---------------------------------------------------------------------
        if (gated && !stopped_()) {
            WL_INFO("[RAMP] Warm-up: " << seconds_(options_.warmup) << "s (metrics discarded)");
            wait_until_(clock::now() + options_.warmup, "Warm-up", pool);
            WL_INFO("[RAMP] Warm-up complete, starting measurement phase");
        }
        if (gated) {
            metrics_.set_recording(true);
        }

        // ---------------------------------------------------------------------
        // Stage 2: hold (measurement)
        // ---------------------------------------------------------------------
        if (!stopped_()) {
            WL_INFO("[RAMP] Stage 2: measuring for " << seconds_(hold) << "s");
            wait_until_(clock::now() + hold, "Stage 2", pool);
        }
        WL_INFO("[RAMP] Stage 2 complete: " << metrics_.active_sessions() << " active");

        // ---------------------------------------------------------------------
        // Stage 3: ramp-down
        // ---------------------------------------------------------------------
        const bool interrupted = stopped_();
        const auto window = interrupted ? std::chrono::milliseconds{0} : ramp_down;
        if (interrupted) {
            WL_WARN("[RAMP] Run interrupted, closing all sessions");
            deadline = std::min(deadline, clock::now() + ramp_down + options_.grace);
        }
        WL_INFO("[RAMP] Stage 3: ramping down " << sessions.size() << " clients over " << seconds_(window) << "s");

        const auto rd_start = clock::now();
        next = rd_start;
        std::size_t closed = 0;
        while (closed < sessions.size()) {
            const auto now = clock::now();
            const std::size_t target = ramp_target(sessions.size(), now - rd_start, window);
            for (; closed < target; ++closed) {
                sessions[closed]->request_close();
            }
            log_progress_("Stage 3", now, pool);
            if (closed < sessions.size()) {
                next += options_.quantum;
                std::this_thread::sleep_until(next);
            }
        }

        // ---------------------------------------------------------------------
        // Drain
        // ---------------------------------------------------------------------
        while (pool.live() > 0 && clock::now() < deadline) {
            std::this_thread::sleep_for(options_.quantum);
            log_progress_("Draining", clock::now(), pool);
        }
        if (pool.live() > 0) {
            WL_WARN("[RAMP] Deadline reached with " << pool.live() << " session(s) still alive, forcing termination");
            pool.force_terminate_all();
            while (pool.live() > 0) {
                std::this_thread::sleep_for(options_.tick);
            }
        }
        pool.stop();

        result.forced = pool.forced();
        result.terminated = pool.terminated() - result.forced;
        result.schedule_completed = !interrupted;
        result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - t0);

        WL_INFO("[RAMP] Stage 3 complete: " << result.terminated << " closed, " << result.forced
                << " forced, " << failed_creations_ << " not created, elapsed " << seconds_(result.elapsed) << "s");
        return result;
    }

private:
    void create_(std::uint64_t index,
                 const config::Scenario& scenario,
                 WorkerPool<SessionT>& pool,
                 std::vector<std::shared_ptr<SessionT>>& sessions)
    {
        std::shared_ptr<SessionT> session;
        try {
            session = factory_(index, scenario);
        }
        catch (const std::exception& e) {
            WL_ERROR("[RAMP] Failed to create session " << index << ": " << e.what());
        }
        if (!session) {
            // Counted as an attempt that never connected
            metrics_.record_connection_attempt();
            metrics_.record_connection_error();
            ++failed_creations_;
            return;
        }
        pool.submit(session);
        sessions.push_back(std::move(session));
    }

    // Sleep quantum by quantum until `until`, logging progress on the way
    void wait_until_(clock::time_point until, std::string_view phase, const WorkerPool<SessionT>& pool) {
        auto now = clock::now();
        while (now < until && !stopped_()) {
            std::this_thread::sleep_until(std::min(until, now + options_.quantum));
            now = clock::now();
            log_progress_(phase, now, pool);
        }
    }

    void log_progress_(std::string_view phase, clock::time_point now, const WorkerPool<SessionT>& pool) {
        if (now - last_progress_ < options_.progress_interval) {
            return;
        }
        last_progress_ = now;
        WL_INFO("[RAMP] " << phase
                << ": created=" << pool.submitted()
                << ", active=" << metrics_.active_sessions()
                << ", subscribed=" << metrics_.subscribe_success()
                << ", errors=" << metrics_.connection_errors()
                << ", messages=" << (metrics_.messages_received() + metrics_.messages_during_warmup()));
    }

    [[nodiscard]]
    bool stopped_() const noexcept {
        return (options_.stop != nullptr && options_.stop->load(std::memory_order_relaxed)) ||
               (options_.interrupt != nullptr && options_.interrupt->load(std::memory_order_relaxed));
    }

    [[nodiscard]]
    static double seconds_(std::chrono::milliseconds d) noexcept {
        return static_cast<double>(d.count()) / 1000.0;
    }

private:
    Options options_;
    metrics::Aggregator& metrics_;
    Factory factory_;

    std::size_t failed_creations_ = 0;
    clock::time_point last_progress_{};
};

} // namespace wireload::core::ramp
