#pragma once

#include <string_view>

namespace wireload::core {
namespace transport {

/*
===============================================================================
 transport::Error
===============================================================================

Transport-level error classification.

This enum represents *semantic transport failures*, abstracted away from
library-specific error codes (Boost.Asio, Boost.Beast, OpenSSL).

It is intentionally:
- small
- stable
- policy-free

Sessions use this classification only for logging and to decide which
outcome a failure maps to. No layer retries on any of these errors.
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Control / contract errors (caller responsibility) ------------------
    InvalidEndpoint,  // Empty host, bad port or malformed path
    InvalidState,     // Operation not allowed in current transport state
    Cancelled,        // Operation aborted by a local lifecycle decision

    // --- Expected / benign termination --------------------------------------
    LocalShutdown,    // Connection was closed intentionally by the local endpoint
    RemoteClosed,     // Remote endpoint closed the connection (CLOSE frame or EOF)

    // --- Connection establishment failures ----------------------------------
    ResolveFailed,    // Host name could not be resolved
    Timeout,          // Connect, handshake or close timed out
    ConnectionFailed, // TCP connection attempt failed (refused, unreachable)
    HandshakeFailed,  // TLS or WebSocket handshake failure

    // --- Protocol / framing issues ------------------------------------------
    ProtocolError,    // Invalid frame or protocol violation

    // --- Fatal / unspecified transport failure ------------------------------
    TransportFailure, // Unclassified transport failure

    // --- Fatal / backpressure failure ---------------------------------------
    Backpressure,     // Session is not draining inbound messages fast enough
};


/// Helper for logging / diagnostics
[[nodiscard]]
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:              return "None";
    case Error::InvalidEndpoint:   return "InvalidEndpoint";
    case Error::InvalidState:      return "InvalidState";
    case Error::Cancelled:         return "Cancelled";
    case Error::LocalShutdown:     return "LocalShutdown";
    case Error::RemoteClosed:      return "RemoteClosed";
    case Error::ResolveFailed:     return "ResolveFailed";
    case Error::Timeout:           return "Timeout";
    case Error::ConnectionFailed:  return "ConnectionFailed";
    case Error::HandshakeFailed:   return "HandshakeFailed";
    case Error::ProtocolError:     return "ProtocolError";
    case Error::TransportFailure:  return "TransportFailure";
    case Error::Backpressure:      return "Backpressure";
    default:                       return "Unknown";
    }
}

} // namespace transport
} // namespace wireload::core
