#pragma once

#include <chrono>
#include <string>

#include "wireload/core/transport/endpoint.hpp"


namespace wireload::core::session {

// Per-run session parameters, shared read-only by every session of the run
struct Config {
    transport::Endpoint endpoint;
    std::string app_key;
    std::string channel;

    std::chrono::milliseconds subscribe_timeout{10000};  // Authenticating + Subscribing
    std::chrono::milliseconds update_interval{5000};
    std::chrono::milliseconds close_timeout{2000};

    // End-to-end samples at or above this are treated as clock skew and dropped
    std::chrono::milliseconds e2e_limit{60000};

    // Filter updates may not wait longer than one interval for their ack
    [[nodiscard]]
    std::chrono::milliseconds update_timeout() const noexcept {
        return subscribe_timeout < update_interval ? subscribe_timeout : update_interval;
    }
};

} // namespace wireload::core::session
