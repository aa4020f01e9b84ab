#pragma once

#include <atomic>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "lcr/log/logger.hpp"
#include "lcr/metrics/atomic/counter.hpp"


namespace wireload::core::ramp {

// -----------------------------------------------------------------------------
// PollableSession
//
// What a worker needs from a session: non-blocking progress and a way to
// terminate it on the spot.
// -----------------------------------------------------------------------------
template<class S>
concept PollableSession =
    requires(S s, std::chrono::steady_clock::time_point now)
{
    { s.poll(now) } -> std::same_as<bool>;
    { s.is_terminal() } -> std::same_as<bool>;
    s.request_close();
    s.force_terminate();
};


/*
===============================================================================
 ramp::WorkerPool
===============================================================================

Fixed set of threads driving every session of a run.

  • Sessions are sharded round-robin on submit(); a session is polled by a
    single thread for its whole life (SPSC rings stay single-consumer)
  • Each worker polls all of its sessions every tick and drops the ones that
    reached a terminal state
  • force_terminate_all() makes every worker terminate whatever it still owns
    at its next tick

Hand-off from the submitting thread to a worker goes through a small
mutex-protected inbox per shard; the steady-state poll loop takes no lock.
===============================================================================
*/
template<PollableSession SessionT>
class WorkerPool {
public:
    WorkerPool(std::size_t workers, std::chrono::milliseconds tick)
        : tick_(tick)
    {
        const std::size_t n = workers == 0 ? 1 : workers;
        shards_.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            shards_.push_back(std::make_unique<Shard>());
        }
        for (std::size_t i = 0; i < n; ++i) {
            shards_[i]->thread = std::thread([this, i] { run_(*shards_[i]); });
        }
        WL_DEBUG("[WORKERS] Started " << n << " worker(s), tick " << tick_.count() << " ms");
    }

    ~WorkerPool() {
        stop();
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Hand a started session to the next worker
    void submit(std::shared_ptr<SessionT> session) {
        Shard& shard = *shards_[next_++ % shards_.size()];
        submitted_.inc();
        std::lock_guard<std::mutex> lock(shard.mutex);
        shard.inbox.push_back(std::move(session));
    }

    // Terminate every remaining session at the next tick
    void force_terminate_all() noexcept {
        force_.store(true, std::memory_order_release);
    }

    // Stop and join the workers (idempotent). Sessions still owned are released.
    void stop() {
        if (stop_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        for (auto& shard : shards_) {
            if (shard->thread.joinable()) {
                shard->thread.join();
            }
        }
        WL_DEBUG("[WORKERS] Stopped");
    }

    [[nodiscard]] std::uint64_t submitted() const noexcept { return submitted_.load(); }
    [[nodiscard]] std::uint64_t terminated() const noexcept { return terminated_.load(); }
    [[nodiscard]] std::uint64_t forced() const noexcept { return forced_.load(); }

    // Sessions submitted and not yet terminal
    [[nodiscard]]
    std::uint64_t live() const noexcept {
        const std::uint64_t t = terminated_.load();
        const std::uint64_t s = submitted_.load();
        return s > t ? s - t : 0;
    }

    [[nodiscard]] std::size_t size() const noexcept { return shards_.size(); }

private:
    struct Shard {
        std::mutex mutex;
        std::vector<std::shared_ptr<SessionT>> inbox;     // guarded by mutex
        std::vector<std::shared_ptr<SessionT>> sessions;  // worker thread only
        std::thread thread;
    };

    void run_(Shard& shard) {
        std::vector<std::shared_ptr<SessionT>> incoming;
        auto next_tick = std::chrono::steady_clock::now();

        while (!stop_.load(std::memory_order_acquire)) {
            {
                std::lock_guard<std::mutex> lock(shard.mutex);
                incoming.swap(shard.inbox);
            }
            for (auto& s : incoming) {
                shard.sessions.push_back(std::move(s));
            }
            incoming.clear();

            if (force_.load(std::memory_order_acquire)) {
                force_shard_(shard);
            }

            const auto now = std::chrono::steady_clock::now();
            auto& sessions = shard.sessions;
            for (std::size_t i = 0; i < sessions.size();) {
                if (sessions[i]->poll(now)) {
                    ++i;
                    continue;
                }
                // Terminal: swap-pop
                sessions[i] = std::move(sessions.back());
                sessions.pop_back();
                terminated_.inc();
            }

            next_tick += tick_;
            const auto after = std::chrono::steady_clock::now();
            if (next_tick < after) {
                next_tick = after; // overloaded: do not accumulate debt
            }
            else {
                std::this_thread::sleep_until(next_tick);
            }
        }
        shard.sessions.clear();
    }

    void force_shard_(Shard& shard) {
        for (auto& s : shard.sessions) {
            if (!s->is_terminal()) {
                s->force_terminate();
                forced_.inc();
            }
            terminated_.inc();
        }
        shard.sessions.clear();
    }

private:
    std::chrono::milliseconds tick_;
    std::vector<std::unique_ptr<Shard>> shards_;
    std::size_t next_ = 0;

    std::atomic<bool> stop_{false};
    std::atomic<bool> force_{false};

    lcr::metrics::atomic::counter64 submitted_;
    lcr::metrics::atomic::counter64 terminated_;
    lcr::metrics::atomic::counter64 forced_;
};

} // namespace wireload::core::ramp
