#pragma once

/*
===============================================================================
 wireload::core::transport::websocket::Event
===============================================================================

Control-plane event type emitted by a WebSocket transport implementation
and delivered to the owning session via a lock-free SPSC ring buffer.

Cross-thread callbacks are replaced with a deterministic, poll-driven,
lock-free event channel: the transport's I/O strand produces, the worker
polling the session consumes.

-------------------------------------------------------------------------------
 Delivery contract
-------------------------------------------------------------------------------

• Connected  → exactly once, when the WebSocket handshake completed
• Error      → at most once, before Close, carrying the classification
• Close      → exactly once per connect() attempt, always last

A connect attempt that fails produces Error followed by Close and never
Connected. Control-plane events must not be dropped.

===============================================================================
*/

#include <cstdint>
#include <type_traits>

#include "wireload/core/transport/error.hpp"

namespace wireload::core::transport::websocket {

enum class EventType : std::uint8_t {
    None      = 0,
    Connected = 1,
    Close     = 2,
    Error     = 3,
};

struct Event {

    EventType type{EventType::None};
    transport::Error error{transport::Error::None}; // valid only if type == EventType::Error

    static constexpr Event make_connected() noexcept {
        return Event{EventType::Connected, transport::Error::None};
    }

    static constexpr Event make_close() noexcept {
        return Event{EventType::Close, transport::Error::None};
    }

    static constexpr Event make_error(transport::Error e) noexcept {
        return Event{EventType::Error, e};
    }
};

// Ensure SPSC-safety properties
static_assert(std::is_trivially_copyable_v<Event>, "websocket::Event must be trivially copyable");
static_assert(sizeof(Event) <= 16, "websocket::Event should remain small and cache-friendly");

} // namespace wireload::core::transport::websocket
