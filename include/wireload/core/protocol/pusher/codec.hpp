#pragma once

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>

#include "simdjson.h"

#include "wireload/core/protocol/concepts.hpp"
#include "wireload/core/protocol/filter.hpp"
#include "wireload/core/protocol/inbound.hpp"
#include "wireload/core/protocol/pusher/schema.hpp"
#include "lcr/json.hpp"
#include "lcr/log/logger.hpp"


namespace wireload::core::protocol::pusher {

namespace detail {

// Millisecond timestamp as a JSON number or a numeric string
[[nodiscard]]
inline bool parse_timestamp(simdjson::dom::element el, std::uint64_t& out) noexcept {
    if (!el.get_uint64().get(out)) {
        return true;
    }
    std::string_view sv;
    if (el.get(sv)) {
        return false;
    }
    const char* end = sv.data() + sv.size();
    auto [ptr, ec] = std::from_chars(sv.data(), end, out);
    return ec == std::errc{} && ptr == end && !sv.empty();
}

// Lookup order: root tags.timestamp, data.tags.timestamp, data.timestamp
[[nodiscard]]
inline lcr::optional<std::uint64_t> extract_timestamp(const simdjson::dom::object& root) noexcept {
    std::uint64_t ts = 0;

    simdjson::dom::object tags;
    simdjson::dom::element el;
    if (!root["tags"].get(tags) && !tags["timestamp"].get(el) && parse_timestamp(el, ts)) {
        return ts;
    }

    simdjson::dom::object data;
    if (root["data"].get(data)) {
        return {};
    }
    if (!data["tags"].get(tags) && !tags["timestamp"].get(el) && parse_timestamp(el, ts)) {
        return ts;
    }
    if (!data["timestamp"].get(el) && parse_timestamp(el, ts)) {
        return ts;
    }
    return {};
}

} // namespace detail


// -----------------------------------------------------------------------------
// pusher::Codec
//
// One instance per session: owns a simdjson DOM parser whose buffers are
// reused for every inbound frame of that session.
// -----------------------------------------------------------------------------
class Codec {
public:
    Codec(const Schema& schema, std::string channel)
        : schema_(&schema)
        , channel_(std::move(channel))
    {}

    // {"event":"pusher:subscribe","data":{"channel":C,"filter":{...}}}
    [[nodiscard]]
    std::string encode_subscribe(const SubscribeRequest& req) const {
        std::string out;
        out.reserve(96 + req.filter.values.size() * 48);

        out += '{';
        lcr::json::append_key(out, "event");
        lcr::json::append_string(out, schema_->subscribe);
        out += ',';
        lcr::json::append_key(out, "data");
        out += '{';
        lcr::json::append_key(out, "channel");
        lcr::json::append_string(out, req.channel);
        if (!schema_->app_key_field.empty()) {
            out += ',';
            lcr::json::append_key(out, schema_->app_key_field);
            lcr::json::append_string(out, req.app_key);
        }
        out += ',';
        lcr::json::append_key(out, "filter");
        out += '{';
        lcr::json::append_key(out, "key");
        lcr::json::append_string(out, schema_->filter_key);
        out += ',';
        lcr::json::append_key(out, "cmp");

        if (req.filter.mode == ComparisonMode::Equals) {
            lcr::json::append_string(out, schema_->equals_token);
            out += ',';
            lcr::json::append_key(out, "val");
            lcr::json::append_string(out, req.filter.values.empty() ? std::string_view{} : std::string_view{req.filter.values.front()});
        }
        else {
            lcr::json::append_string(out, schema_->in_token);
            out += ',';
            lcr::json::append_key(out, "vals");
            out += '[';
            bool first = true;
            for (const auto& v : req.filter.values) {
                if (!first) out += ',';
                first = false;
                lcr::json::append_string(out, v);
            }
            out += ']';
        }
        out += "}}}";
        return out;
    }

    // {"event":"pusher:pong","data":{}}
    [[nodiscard]]
    std::string encode_pong() const {
        std::string out;
        out += '{';
        lcr::json::append_key(out, "event");
        lcr::json::append_string(out, schema_->pong);
        out += ",\"data\":{}}";
        return out;
    }

    [[nodiscard]]
    std::string encode_raw_pong() const {
        return "pong";
    }

    [[nodiscard]]
    Inbound decode(std::string_view msg) {
        Inbound in;
        if (msg == "ping") {
            in.kind = Inbound::Kind::RawPing;
            return in;
        }

        simdjson::dom::element doc;
        if (parser_.parse(msg.data(), msg.size()).get(doc)) {
            WL_TRACE("[PUSHER] Unparseable frame (" << msg.size() << " bytes)");
            in.kind = Inbound::Kind::InvalidJson;
            return in;
        }

        simdjson::dom::object root;
        std::string_view event;
        if (doc.get(root) || root["event"].get(event)) {
            return in; // Ignored: not an event envelope
        }

        std::string_view channel;
        const bool has_channel = !root["channel"].get(channel);

        if (event == schema_->subscription_succeeded) {
            if (!has_channel || channel == channel_) {
                in.kind = Inbound::Kind::SubscribeAck;
            }
            return in;
        }
        if (schema_->is_rejection(event)) {
            in.kind = Inbound::Kind::SubscribeRejected;
            return in;
        }
        if (event == schema_->ping) {
            in.kind = Inbound::Kind::Ping;
            return in;
        }
        if (event == schema_->connection_established) {
            in.kind = Inbound::Kind::Handshake;
            return in;
        }
        if (has_channel && channel == channel_) {
            in.kind = Inbound::Kind::ChannelData;
            in.timestamp_ms = detail::extract_timestamp(root);
        }
        return in;
    }

    [[nodiscard]]
    const std::string& channel() const noexcept { return channel_; }

private:
    const Schema* schema_;
    std::string channel_;
    simdjson::dom::parser parser_;
};
static_assert(CodecConcept<Codec>);

} // namespace wireload::core::protocol::pusher
