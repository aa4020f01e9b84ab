#pragma once

#include <string_view>

namespace wireload::core {
namespace config {

/*
===============================================================================
 config::Error
===============================================================================

Fatal configuration errors. Any of these aborts a run before the first
session is created; none of them is ever produced once sessions exist.
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Workload -----------------------------------------------------------
    InvalidScenario,        // Scenario id outside the known table
    InvalidClientCount,     // Zero clients
    InvalidDuration,        // Non-positive ramp / hold / timeout / interval
    InvalidWarmup,          // Negative warm-up
    InvalidThreads,         // Zero workers or I/O threads

    // --- Target -------------------------------------------------------------
    InvalidEndpoint,        // Empty host, port out of range, malformed path
    EmptyAppKey,
    EmptyChannel,
    UnresolvableHost,       // DNS lookup failed

    // --- Address pool -------------------------------------------------------
    PoolUnreadable,         // Token file present but cannot be read
    PoolMalformed,          // Token file is not a JSON array of strings
    PoolTooSmall,           // Fewer distinct values than the largest filter needs
};


[[nodiscard]]
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:               return "None";
    case Error::InvalidScenario:    return "InvalidScenario";
    case Error::InvalidClientCount: return "InvalidClientCount";
    case Error::InvalidDuration:    return "InvalidDuration";
    case Error::InvalidWarmup:      return "InvalidWarmup";
    case Error::InvalidThreads:     return "InvalidThreads";
    case Error::InvalidEndpoint:    return "InvalidEndpoint";
    case Error::EmptyAppKey:        return "EmptyAppKey";
    case Error::EmptyChannel:       return "EmptyChannel";
    case Error::UnresolvableHost:   return "UnresolvableHost";
    case Error::PoolUnreadable:     return "PoolUnreadable";
    case Error::PoolMalformed:      return "PoolMalformed";
    case Error::PoolTooSmall:       return "PoolTooSmall";
    default:                        return "Unknown";
    }
}

} // namespace config
} // namespace wireload::core
