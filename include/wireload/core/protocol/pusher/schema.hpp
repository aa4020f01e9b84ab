#pragma once

#include <string>
#include <string_view>
#include <vector>


namespace wireload::core::protocol::pusher {

/*
===============================================================================
 pusher::Schema
===============================================================================

Runtime description of a Pusher-style wire protocol. Everything the codec
emits or matches on is taken from here, so a server speaking a dialect of the
protocol (different event names, filter key or comparison tokens) can be
targeted without touching the session.

Defaults:
  URL path      /app/{app_key}
  handshake     pusher:connection_established
  subscribe     pusher:subscribe
  ack           pusher_internal:subscription_succeeded
  rejections    pusher:error, pusher:subscription_error
  ping / pong   pusher:ping / pusher:pong
  filter        {"key":"token_address","cmp":"eq","val":V}
                {"key":"token_address","cmp":"in","vals":[V...]}
===============================================================================
*/
struct Schema {
    std::string path_template = "/app/{app_key}";

    std::string connection_established = "pusher:connection_established";
    std::string subscribe              = "pusher:subscribe";
    std::string subscription_succeeded = "pusher_internal:subscription_succeeded";
    std::vector<std::string> rejections{"pusher:error", "pusher:subscription_error"};
    std::string ping = "pusher:ping";
    std::string pong = "pusher:pong";

    std::string filter_key   = "token_address";
    std::string equals_token = "eq";
    std::string in_token     = "in";

    // When set, the app key is also sent inside the subscribe payload under this field
    std::string app_key_field;

    // Expand the URL path template for one application key
    [[nodiscard]]
    std::string path(std::string_view app_key) const {
        static constexpr std::string_view placeholder = "{app_key}";
        std::string out = path_template;
        const auto pos = out.find(placeholder);
        if (pos != std::string::npos) {
            out.replace(pos, placeholder.size(), app_key);
        }
        if (out.empty() || out.front() != '/') {
            out.insert(out.begin(), '/');
        }
        return out;
    }

    [[nodiscard]]
    bool is_rejection(std::string_view event) const noexcept {
        for (const auto& r : rejections) {
            if (r == event) return true;
        }
        return false;
    }
};

} // namespace wireload::core::protocol::pusher
