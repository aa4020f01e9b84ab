#pragma once

#include <memory>
#include <string>
#include <variant>

#include "wireload/core/transport/concepts.hpp"
#include "wireload/core/transport/endpoint.hpp"
#include "wireload/core/transport/error.hpp"
#include "wireload/core/transport/websocket/events.hpp"
#include "wireload/core/transport/beast/io_pool.hpp"
#include "lcr/lockfree/spsc_ring.hpp"

/*
================================================================================
WebSocket Transport (Boost.Beast)
================================================================================

Client WebSocket on Boost.Beast / Boost.Asio, plain (ws) or TLS (wss).

Design highlights:
  • Single-connection transport primitive, no retries, no reconnection
  • Fully asynchronous: resolve → connect → [TLS handshake] → WS handshake →
    read loop, all serialized on a per-socket strand of the shared IoPool
  • Pull-based delivery: control events and complete text messages are pushed
    into SPSC rings and drained by the session's worker thread
  • Failure-first signaling: Error then Close, exactly once per attempt
  • Deterministic lifecycle: idempotent close(); pending handlers keep the
    socket state alive until they complete, the owning object may go first

Messages that do not fit in the inbound ring are a fatal Backpressure error
for that socket: dropping data silently would corrupt the message counts.
================================================================================
*/


namespace wireload::core::transport::beast {

namespace detail {

inline constexpr std::size_t EVENT_RING_CAPACITY   = 16;
inline constexpr std::size_t MESSAGE_RING_CAPACITY = 256;

// Hand-off between the socket strand (producer) and the session worker (consumer)
struct Inbox {
    lcr::lockfree::spsc_ring<websocket::Event, EVENT_RING_CAPACITY> events;
    lcr::lockfree::spsc_ring<std::string, MESSAGE_RING_CAPACITY> messages;
};

template<bool Secure>
class Stream;

} // namespace detail


class WebSocket {
public:
    explicit WebSocket(IoPool& pool) noexcept;
    ~WebSocket();

    WebSocket(const WebSocket&) = delete;
    WebSocket& operator=(const WebSocket&) = delete;

    // Start a connection attempt. Completion is reported via poll_event().
    [[nodiscard]]
    Error connect(const Endpoint& endpoint) noexcept;

    // Queue a text message. Messages sent before the handshake completes are
    // flushed right after it.
    [[nodiscard]]
    bool send(std::string msg) noexcept;

    // Graceful close (idempotent)
    void close() noexcept;

    [[nodiscard]]
    bool poll_event(websocket::Event& ev) noexcept {
        return inbox_ && inbox_->events.pop(ev);
    }

    [[nodiscard]]
    bool poll_message(std::string& out) noexcept {
        return inbox_ && inbox_->messages.pop(out);
    }

private:
    IoPool& pool_;
    std::shared_ptr<detail::Inbox> inbox_;
    std::variant<
        std::monostate,
        std::shared_ptr<detail::Stream<false>>,
        std::shared_ptr<detail::Stream<true>>
    > stream_;
    bool close_requested_ = false;
};
static_assert(WebSocketConcept<WebSocket>);

} // namespace wireload::core::transport::beast
