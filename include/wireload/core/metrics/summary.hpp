#pragma once

#include <cstdint>
#include <iomanip>
#include <ostream>

#include "wireload/core/metrics/latency_samples.hpp"


namespace wireload::core::metrics {

// Process-wide transport counters, copied out of the I/O pool at run end
struct TransportTotals {
    std::uint64_t bytes_rx = 0;
    std::uint64_t bytes_tx = 0;
    std::uint64_t messages_rx = 0;
    std::uint64_t messages_tx = 0;
    std::uint64_t handshakes = 0;
    std::uint64_t connect_errors = 0;
    std::uint64_t receive_errors = 0;
    std::uint64_t close_events = 0;
    std::uint64_t backpressure = 0;
};

// ===============================================================================
// Summary
//
// Final, immutable result of one run. dump() writes one "Label: value" per
// line; labels are stable so the output can be scraped line by line.
// ===============================================================================
struct Summary {
    // Outcomes (each session has exactly one of these three)
    std::uint64_t subscribe_success = 0;
    std::uint64_t subscribe_failed = 0;
    std::uint64_t connection_errors = 0;

    // Activity
    std::uint64_t clients = 0;
    std::uint64_t connection_attempts = 0;
    std::uint64_t filter_updates = 0;
    std::uint64_t update_failures = 0;
    std::uint64_t messages_received = 0;
    std::uint64_t messages_during_warmup = 0;
    std::uint64_t connections_dropped = 0;
    std::uint64_t forced_terminations = 0;

    LatencyStats subscribe;
    LatencyStats update;
    LatencyStats end_to_end;

    TransportTotals transport;

    bool schedule_completed = false;
    double elapsed_s = 0.0;

    [[nodiscard]]
    std::uint64_t outcomes() const noexcept {
        return subscribe_success + subscribe_failed + connection_errors;
    }

    void dump(std::ostream& os) const {
        const auto flags = os.flags();
        const auto precision = os.precision();
        os << std::fixed << std::setprecision(2);

        os << "\n============================================================\n";
        os << "                    BENCHMARK SUMMARY\n";
        os << "============================================================\n";
        os << "\nConnection Metrics:\n";
        os << "  Clients:             " << clients << '\n';
        os << "  Subscribe Success:   " << subscribe_success << '\n';
        os << "  Subscribe Failed:    " << subscribe_failed << '\n';
        os << "  Connection Errors:   " << connection_errors << '\n';
        os << "  Filter Updates:      " << filter_updates << '\n';
        os << "  Update Failures:     " << update_failures << '\n';
        os << "  Messages Received:   " << messages_received << '\n';
        if (messages_during_warmup > 0) {
            os << "  Warm-up Messages:    " << messages_during_warmup << '\n';
        }
        os << "  Dropped Connections: " << connections_dropped << '\n';
        os << "  Forced Terminations: " << forced_terminations << '\n';

        os << "\nSubscribe Latency (ms):\n";
        dump_latency_(os, subscribe, false);

        if (!update.empty()) {
            os << "\nFilter Update Latency (ms):\n";
            dump_latency_(os, update, false);
        }

        os << "\nEnd-to-End Latency (ms):\n";
        dump_latency_(os, end_to_end, true);

        os << "\nTransport Telemetry:\n";
        os << "  RX bytes:            " << transport.bytes_rx << '\n';
        os << "  TX bytes:            " << transport.bytes_tx << '\n';
        os << "  RX messages:         " << transport.messages_rx << '\n';
        os << "  TX messages:         " << transport.messages_tx << '\n';
        os << "  Handshakes:          " << transport.handshakes << '\n';
        os << "  Connect errors:      " << transport.connect_errors << '\n';
        os << "  Receive errors:      " << transport.receive_errors << '\n';
        os << "  Close events:        " << transport.close_events << '\n';
        os << "  Backpressure drops:  " << transport.backpressure << '\n';

        os << "\nRun:\n";
        os << "  Schedule Completed:  " << (schedule_completed ? "yes" : "no") << '\n';
        os << "  Elapsed:             " << elapsed_s << "s\n";
        os << "============================================================\n";

        os.flags(flags);
        os.precision(precision);
    }

private:
    static void dump_latency_(std::ostream& os, const LatencyStats& s, bool with_samples) {
        if (s.empty()) {
            os << "  No data\n";
            return;
        }
        os << "  Min:    " << s.min_ms << '\n';
        os << "  Mean:   " << s.mean_ms << '\n';
        os << "  p50:    " << s.p50_ms << '\n';
        os << "  p95:    " << s.p95_ms << '\n';
        os << "  p99:    " << s.p99_ms << '\n';
        os << "  Max:    " << s.max_ms << '\n';
        if (with_samples) {
            os << "  Samples: " << s.count << '\n';
        }
    }
};

} // namespace wireload::core::metrics
