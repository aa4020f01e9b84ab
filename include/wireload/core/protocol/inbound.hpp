#pragma once

#include <cstdint>
#include <string_view>

#include "lcr/optional.hpp"


namespace wireload::core::protocol {

// -----------------------------------------------------------------------------
// Inbound
//
// Classification of one inbound text frame, as seen by a session.
// The session only needs to tell control traffic (handshake, acks, pings)
// apart from channel data; payloads are never retained.
// -----------------------------------------------------------------------------
struct Inbound {
    enum class Kind : std::uint8_t {
        Ignored,            // valid JSON, not relevant to this session
        InvalidJson,        // not parseable
        Handshake,          // server accepted the connection (app key authenticated)
        SubscribeAck,       // subscription (or replacement) acknowledged
        SubscribeRejected,  // subscription (or replacement) refused
        Ping,               // protocol-level ping
        RawPing,            // bare text ping
        ChannelData         // data published on the subscribed channel
    };

    Kind kind = Kind::Ignored;

    // Publish timestamp carried by channel data (milliseconds since epoch)
    lcr::optional<std::uint64_t> timestamp_ms;
};

[[nodiscard]]
inline constexpr std::string_view to_string(Inbound::Kind kind) noexcept {
    switch (kind) {
        case Inbound::Kind::Ignored:           return "Ignored";
        case Inbound::Kind::InvalidJson:       return "InvalidJson";
        case Inbound::Kind::Handshake:         return "Handshake";
        case Inbound::Kind::SubscribeAck:      return "SubscribeAck";
        case Inbound::Kind::SubscribeRejected: return "SubscribeRejected";
        case Inbound::Kind::Ping:              return "Ping";
        case Inbound::Kind::RawPing:           return "RawPing";
        case Inbound::Kind::ChannelData:       return "ChannelData";
    }
    return "Unknown";
}

} // namespace wireload::core::protocol
