#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>


namespace wireload::core::protocol {

enum class ComparisonMode : std::uint8_t {
    Equals,
    InSet
};

[[nodiscard]]
inline constexpr std::string_view to_string(ComparisonMode mode) noexcept {
    switch (mode) {
        case ComparisonMode::Equals: return "equals";
        case ComparisonMode::InSet:  return "in-set";
    }
    return "unknown";
}

// Subscription predicate: one value for Equals, one or more for InSet.
// Values are opaque strings taken from the address pool.
struct SubscriptionFilter {
    ComparisonMode mode = ComparisonMode::Equals;
    std::vector<std::string> values;
};

// What a session asks the server for, on initial subscribe and on every update
struct SubscribeRequest {
    std::string_view app_key;
    std::string_view channel;
    const SubscriptionFilter& filter;
};

} // namespace wireload::core::protocol
