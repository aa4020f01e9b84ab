#pragma once

#include <type_traits>

#include "lcr/metrics/atomic/counter.hpp"

namespace wireload::core::transport::telemetry {

// ============================================================================
// WebSocket Telemetry
//
// Transport-level observability shared by every WebSocket of a run.
// Captures ONLY mechanical socket behavior.
//
// Design principles:
//   • no clocks
//   • no rates
//   • no policy
//   • no allocation
//
// One instance per I/O pool; all sockets on the pool feed it.
// ============================================================================

struct alignas(64) WebSocket final {
    // ---------------------------------------------------------------------
    // Throughput (cumulative, monotonic)
    // ---------------------------------------------------------------------

    lcr::metrics::atomic::counter64 bytes_rx_total;
    lcr::metrics::atomic::counter64 bytes_tx_total;

    lcr::metrics::atomic::counter64 messages_rx_total;
    lcr::metrics::atomic::counter64 messages_tx_total;

    // ---------------------------------------------------------------------
    // Errors & lifecycle
    // ---------------------------------------------------------------------

    lcr::metrics::atomic::counter64 handshakes_total;
    lcr::metrics::atomic::counter64 connect_errors_total;
    lcr::metrics::atomic::counter64 receive_errors_total;
    lcr::metrics::atomic::counter64 close_events_total;
    lcr::metrics::atomic::counter64 backpressure_total;
};

static_assert(std::is_standard_layout_v<WebSocket>, "telemetry::WebSocket must be standard layout");
static_assert(!std::is_polymorphic_v<WebSocket>, "telemetry::WebSocket must not be polymorphic");
static_assert(alignof(WebSocket) == 64, "telemetry::WebSocket must be cache-line aligned");

} // namespace wireload::core::transport::telemetry
