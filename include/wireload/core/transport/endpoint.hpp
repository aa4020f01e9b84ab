#pragma once

#include <string>
#include <string_view>
#include <cstdint>

#include "wireload/core/transport/error.hpp"


namespace wireload::core::transport {

// Where a session connects to.
// Built once per run and shared (by value) by every session.
struct Endpoint {
    bool secure = false;   // true = wss, false = ws
    std::string host;
    std::string port;
    std::string path = "/";

    [[nodiscard]]
    std::string url() const {
        std::string out = secure ? "wss://" : "ws://";
        out += host;
        out += ':';
        out += port;
        out += path;
        return out;
    }
};

// TLS selection. Auto follows the usual convention: 443 → wss, anything else → ws.
enum class TlsMode : std::uint8_t {
    Auto,
    Enabled,
    Disabled
};

[[nodiscard]]
inline constexpr bool use_tls(TlsMode mode, std::uint16_t port) noexcept {
    switch (mode) {
        case TlsMode::Enabled:  return true;
        case TlsMode::Disabled: return false;
        default:                return port == 443;
    }
}

// ---------------------------------------------------------------------
// Minimal endpoint validation.
// Rejects what can never connect; does not attempt full RFC compliance.
// ---------------------------------------------------------------------
[[nodiscard]]
inline Error validate(const Endpoint& ep) noexcept {
    if (ep.host.empty() || ep.port.empty()) {
        return Error::InvalidEndpoint;
    }
    for (char c : ep.host) {
        if (c == '/' || c == ' ' || c == '?' || c == '#') {
            return Error::InvalidEndpoint;
        }
    }
    unsigned long p = 0;
    for (char c : ep.port) {
        if (c < '0' || c > '9') {
            return Error::InvalidEndpoint;
        }
        p = p * 10 + static_cast<unsigned long>(c - '0');
        if (p > 65535) {
            return Error::InvalidEndpoint;
        }
    }
    if (p == 0) {
        return Error::InvalidEndpoint;
    }
    if (ep.path.empty() || ep.path[0] != '/') {
        return Error::InvalidEndpoint;
    }
    return Error::None;
}

} // namespace wireload::core::transport
