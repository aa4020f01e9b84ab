#pragma once

#include <atomic>
#include <cstdint>
#include <vector>

#include "wireload/core/metrics/latency_samples.hpp"
#include "wireload/core/metrics/summary.hpp"
#include "lcr/metrics/atomic/counter.hpp"


namespace wireload::core::metrics {

enum class LatencyKind : std::uint8_t {
    Subscribe,
    Update,
    EndToEnd
};

/*
===============================================================================
 metrics::Aggregator
===============================================================================

Run-scoped accounting shared by every session of one run.

  • Counters are relaxed atomics: aggregation is commutative, nothing is
    synchronized through them
  • Latency samples are an unordered multiset per kind (mutex-protected append)
  • One object per run, never a global; reset() before reuse

Warm-up gating:
  While recording is off, channel messages are counted separately and
  update / end-to-end latency samples are discarded. Subscribe outcomes,
  subscribe latencies and connection accounting are always recorded.

snapshot() is meant to be taken once every session is terminal; taken
earlier it is a consistent-enough progress view, never a torn counter.
===============================================================================
*/
class Aggregator {
public:
    Aggregator() = default;

    Aggregator(const Aggregator&) = delete;
    Aggregator& operator=(const Aggregator&) = delete;

    void reset() {
        connection_attempts_.reset();
        connection_errors_.reset();
        subscribe_success_.reset();
        subscribe_failed_.reset();
        update_attempts_.reset();
        update_failures_.reset();
        messages_received_.reset();
        messages_during_warmup_.reset();
        connections_dropped_.reset();
        forced_terminations_.reset();
        active_sessions_.reset();
        subscribe_latency_.reset();
        update_latency_.reset();
        e2e_latency_.reset();
        recording_.store(true, std::memory_order_relaxed);
    }

    // ---------------------------------------------------------------------
    // Warm-up gate
    // ---------------------------------------------------------------------

    void set_recording(bool on) noexcept { recording_.store(on, std::memory_order_relaxed); }

    [[nodiscard]]
    bool recording() const noexcept { return recording_.load(std::memory_order_relaxed); }

    // ---------------------------------------------------------------------
    // Session outcomes
    // ---------------------------------------------------------------------

    void record_connection_attempt() noexcept { connection_attempts_.inc(); }
    void record_connection_error() noexcept { connection_errors_.inc(); }
    void record_subscribe_success() noexcept { subscribe_success_.inc(); }
    void record_subscribe_failure() noexcept { subscribe_failed_.inc(); }

    void record_update_attempt() noexcept { update_attempts_.inc(); }
    void record_update_failure() noexcept { update_failures_.inc(); }

    void record_connection_dropped() noexcept { connections_dropped_.inc(); }
    void record_forced_termination() noexcept { forced_terminations_.inc(); }

    void session_opened() noexcept { active_sessions_.inc(); }
    void session_closed() noexcept { active_sessions_.dec(); }

    void record_message_received(std::uint64_t n = 1) noexcept {
        if (n == 0) return;
        if (recording()) {
            messages_received_.inc(n);
        }
        else {
            messages_during_warmup_.inc(n);
        }
    }

    // ---------------------------------------------------------------------
    // Latency samples (microseconds)
    // ---------------------------------------------------------------------

    void record_latency(LatencyKind kind, std::uint64_t us) {
        if (kind != LatencyKind::Subscribe && !recording()) {
            return;
        }
        samples_(kind).record(us);
    }

    void record_latencies(LatencyKind kind, const std::vector<std::uint64_t>& batch) {
        if (kind != LatencyKind::Subscribe && !recording()) {
            return;
        }
        samples_(kind).record(batch);
    }

    // ---------------------------------------------------------------------
    // Live view (progress logs)
    // ---------------------------------------------------------------------

    [[nodiscard]] std::uint64_t connection_attempts() const noexcept { return connection_attempts_.load(); }
    [[nodiscard]] std::uint64_t connection_errors() const noexcept { return connection_errors_.load(); }
    [[nodiscard]] std::uint64_t subscribe_success() const noexcept { return subscribe_success_.load(); }
    [[nodiscard]] std::uint64_t subscribe_failed() const noexcept { return subscribe_failed_.load(); }
    [[nodiscard]] std::uint64_t update_attempts() const noexcept { return update_attempts_.load(); }
    [[nodiscard]] std::uint64_t update_failures() const noexcept { return update_failures_.load(); }
    [[nodiscard]] std::uint64_t messages_received() const noexcept { return messages_received_.load(); }
    [[nodiscard]] std::uint64_t messages_during_warmup() const noexcept { return messages_during_warmup_.load(); }
    [[nodiscard]] std::uint64_t connections_dropped() const noexcept { return connections_dropped_.load(); }
    [[nodiscard]] std::uint64_t forced_terminations() const noexcept { return forced_terminations_.load(); }
    [[nodiscard]] std::int64_t active_sessions() const noexcept { return active_sessions_.load(); }

    [[nodiscard]]
    const LatencySamples& latency(LatencyKind kind) const noexcept {
        switch (kind) {
            case LatencyKind::Update:   return update_latency_;
            case LatencyKind::EndToEnd: return e2e_latency_;
            default:                    return subscribe_latency_;
        }
    }

    // ---------------------------------------------------------------------
    // Final snapshot
    // ---------------------------------------------------------------------

    [[nodiscard]]
    Summary snapshot() const {
        Summary s;
        s.connection_attempts    = connection_attempts_.load();
        s.connection_errors      = connection_errors_.load();
        s.subscribe_success      = subscribe_success_.load();
        s.subscribe_failed       = subscribe_failed_.load();
        s.filter_updates         = update_attempts_.load();
        s.update_failures        = update_failures_.load();
        s.messages_received      = messages_received_.load();
        s.messages_during_warmup = messages_during_warmup_.load();
        s.connections_dropped    = connections_dropped_.load();
        s.forced_terminations    = forced_terminations_.load();
        s.subscribe  = subscribe_latency_.summarize();
        s.update     = update_latency_.summarize();
        s.end_to_end = e2e_latency_.summarize();
        return s;
    }

private:
    [[nodiscard]]
    LatencySamples& samples_(LatencyKind kind) noexcept {
        switch (kind) {
            case LatencyKind::Update:   return update_latency_;
            case LatencyKind::EndToEnd: return e2e_latency_;
            default:                    return subscribe_latency_;
        }
    }

private:
    lcr::metrics::atomic::counter64 connection_attempts_;
    lcr::metrics::atomic::counter64 connection_errors_;
    lcr::metrics::atomic::counter64 subscribe_success_;
    lcr::metrics::atomic::counter64 subscribe_failed_;
    lcr::metrics::atomic::counter64 update_attempts_;
    lcr::metrics::atomic::counter64 update_failures_;
    lcr::metrics::atomic::counter64 messages_received_;
    lcr::metrics::atomic::counter64 messages_during_warmup_;
    lcr::metrics::atomic::counter64 connections_dropped_;
    lcr::metrics::atomic::counter64 forced_terminations_;
    lcr::metrics::atomic::gauge64   active_sessions_;

    LatencySamples subscribe_latency_;
    LatencySamples update_latency_;
    LatencySamples e2e_latency_;

    std::atomic<bool> recording_{true};
};

} // namespace wireload::core::metrics
