#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

#include "wireload/core/config/error.hpp"
#include "wireload/core/config/scenario.hpp"
#include "wireload/core/protocol/pusher/schema.hpp"
#include "wireload/core/transport/endpoint.hpp"
#include "lcr/log/logger.hpp"


namespace wireload::core::config {

/*
===============================================================================
 config::Run
===============================================================================

Everything one benchmark run needs, with the defaults used by the CLI.
Durations are kept in milliseconds so tests can run whole schedules in a
fraction of a second; the CLI takes seconds.

validate() performs the static checks (ranges, empty fields). Host
resolution and address pool loading happen in the runner, before any
session is created.
===============================================================================
*/
struct Run {
    // --- Target -------------------------------------------------------------
    std::string host = "localhost";
    std::uint32_t port = 443;
    std::string app_key;
    std::string channel = "trident_filter_tokens_v1";
    transport::TlsMode tls = transport::TlsMode::Auto;
    bool verify_peer = true;
    protocol::pusher::Schema schema{};

    // --- Workload -----------------------------------------------------------
    std::uint32_t scenario = 1;
    std::size_t client_count = 1000;
    std::size_t client_id_offset = 0;
    std::string token_file = "token-addresses.json";

    // --- Schedule -----------------------------------------------------------
    std::chrono::milliseconds ramp_up{30000};
    std::chrono::milliseconds hold{60000};
    std::chrono::milliseconds ramp_down{10000};
    std::chrono::milliseconds warmup{0};
    std::chrono::milliseconds grace{10000};

    // --- Session timing -----------------------------------------------------
    std::chrono::milliseconds update_interval{5000};
    std::chrono::milliseconds subscribe_timeout{10000};
    std::chrono::milliseconds close_timeout{2000};
    std::chrono::milliseconds connect_timeout{10000};

    // --- Execution ----------------------------------------------------------
    std::size_t workers = 4;
    std::size_t io_threads = 2;
    std::uint64_t seed = 0;              // 0 = seed from the clock

    [[nodiscard]]
    Error validate() const {
        if (find_scenario(scenario) == nullptr) {
            WL_ERROR("[CONFIG] Invalid scenario id " << scenario << " (expected 1-" << SCENARIOS.size() << ")");
            return Error::InvalidScenario;
        }
        if (client_count == 0) {
            WL_ERROR("[CONFIG] Client count must be positive");
            return Error::InvalidClientCount;
        }
        using ms = std::chrono::milliseconds;
        if (ramp_up <= ms::zero() || hold <= ms::zero() || ramp_down <= ms::zero()) {
            WL_ERROR("[CONFIG] Ramp-up, hold and ramp-down durations must be positive");
            return Error::InvalidDuration;
        }
        if (grace < ms::zero() || update_interval <= ms::zero() || subscribe_timeout <= ms::zero() ||
            close_timeout <= ms::zero() || connect_timeout <= ms::zero()) {
            WL_ERROR("[CONFIG] Timeouts and the update interval must be positive");
            return Error::InvalidDuration;
        }
        if (warmup < ms::zero()) {
            WL_ERROR("[CONFIG] Warm-up (" << warmup.count() << " ms) must not be negative");
            return Error::InvalidWarmup;
        }
        if (workers == 0 || io_threads == 0) {
            WL_ERROR("[CONFIG] Worker and I/O thread counts must be positive");
            return Error::InvalidThreads;
        }
        if (port == 0 || port > 65535) {
            WL_ERROR("[CONFIG] Port " << port << " out of range");
            return Error::InvalidEndpoint;
        }
        if (transport::validate(endpoint()) != transport::Error::None) {
            WL_ERROR("[CONFIG] Invalid endpoint " << endpoint().url());
            return Error::InvalidEndpoint;
        }
        if (app_key.empty()) {
            WL_ERROR("[CONFIG] Application key must not be empty");
            return Error::EmptyAppKey;
        }
        if (channel.empty()) {
            WL_ERROR("[CONFIG] Channel must not be empty");
            return Error::EmptyChannel;
        }
        return Error::None;
    }

    [[nodiscard]]
    transport::Endpoint endpoint() const {
        transport::Endpoint ep;
        ep.secure = transport::use_tls(tls, static_cast<std::uint16_t>(port));
        ep.host = host;
        ep.port = std::to_string(port);
        ep.path = schema.path(app_key);
        return ep;
    }

    [[nodiscard]]
    const Scenario& scenario_def() const noexcept {
        const Scenario* s = find_scenario(scenario);
        return s ? *s : SCENARIOS.front();
    }

    void dump(std::ostream& os) const {
        const Scenario& s = scenario_def();
        os << "Configuration:\n";
        os << "  Host:            " << host << ':' << port << '\n';
        os << "  URL:             " << endpoint().url() << '\n';
        os << "  App Key:         " << app_key << '\n';
        os << "  Channel:         " << channel << '\n';
        os << "  Scenario:        " << scenario << " (" << s.label << ")\n";
        os << "  Num Clients:     " << client_count << '\n';
        os << "  Client Offset:   " << client_id_offset << '\n';
        os << "  Ramp Duration:   " << ramp_up.count() / 1000.0 << "s\n";
        os << "  Warmup Duration: " << warmup.count() / 1000.0 << "s\n";
        os << "  Hold Duration:   " << hold.count() / 1000.0 << "s\n";
        os << "  Ramp Down:       " << ramp_down.count() / 1000.0 << "s\n";
        if (s.periodic_update) {
            os << "  Update Interval: " << update_interval.count() << "ms\n";
        }
    }
};

} // namespace wireload::core::config
