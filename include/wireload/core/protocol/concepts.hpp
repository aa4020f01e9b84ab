#pragma once

#include <concepts>
#include <string>
#include <string_view>

#include "wireload/core/protocol/filter.hpp"
#include "wireload/core/protocol/inbound.hpp"


namespace wireload::core::protocol {

// -----------------------------------------------------------------------------
// CodecConcept
// -----------------------------------------------------------------------------
//
// Wire schema of the service under test, as needed by a session::Client.
//
//   • encode_subscribe() serializes an initial subscription or a filter
//     replacement (both use the same request)
//   • encode_pong() / encode_raw_pong() answer protocol and bare-text pings
//   • decode() classifies one inbound text frame
//
// A codec instance is owned by exactly one session and may keep scratch
// state (parser buffers) between calls. It is never shared across threads.
//
// -----------------------------------------------------------------------------

template<class C>
concept CodecConcept =
    requires(C codec, const SubscribeRequest& req, std::string_view msg)
{
    { codec.encode_subscribe(req) } -> std::same_as<std::string>;
    { codec.encode_pong() } -> std::same_as<std::string>;
    { codec.encode_raw_pong() } -> std::same_as<std::string>;
    { codec.decode(msg) } -> std::same_as<Inbound>;
};

} // namespace wireload::core::protocol
