#pragma once

#include <string>
#include <concepts>

#include "wireload/core/transport/endpoint.hpp"
#include "wireload/core/transport/error.hpp"
#include "wireload/core/transport/websocket/events.hpp"

namespace wireload::core::transport {

// -----------------------------------------------------------------------------
// WebSocketConcept
// -----------------------------------------------------------------------------
//
// Defines the minimal contract required by a session::Client.
//
// The WebSocket implementation:
//
//   • Performs I/O asynchronously (its own strand / thread)
//   • connect() only validates and starts the attempt; completion is
//     reported through poll_event() (Connected, or Error + Close)
//   • send() enqueues a complete text message; returns false when the
//     transport is not in a state that can accept it
//   • close() starts a graceful close; idempotent
//   • Pushes control-plane events into an internal SPSC ring
//   • Pushes complete inbound text messages into a second SPSC ring
//
// Every member is called from the single thread currently polling the
// owning session. No callbacks cross threads.
//
// -----------------------------------------------------------------------------

template<class WS>
concept WebSocketConcept =
    requires(
        WS ws,
        const Endpoint& endpoint,
        std::string msg,
        std::string& out,
        websocket::Event& ev
    )
{
    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    { ws.connect(endpoint) } noexcept -> std::same_as<Error>;
    { ws.close() } noexcept -> std::same_as<void>;

    // ---------------------------------------------------------------------
    // Sending
    // ---------------------------------------------------------------------

    { ws.send(std::move(msg)) } noexcept -> std::same_as<bool>;

    // ---------------------------------------------------------------------
    // Pull-based delivery
    // ---------------------------------------------------------------------

    { ws.poll_event(ev) } noexcept -> std::same_as<bool>;
    { ws.poll_message(out) } noexcept -> std::same_as<bool>;
};

} // namespace wireload::core::transport
