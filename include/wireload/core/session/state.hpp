#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>
#include <variant>


namespace wireload::core::session {

using clock = std::chrono::steady_clock;

// ===============================================================
// SESSION STATE ENUM
// ===============================================================
enum class State : uint8_t {
    Connecting,
    Authenticating,
    Subscribing,
    Active,
    Updating,
    Closing,
    Closed,
    Failed
};

// ------------------------------------------------------------
// State → string
// ------------------------------------------------------------
[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Connecting:     return "Connecting";
        case State::Authenticating: return "Authenticating";
        case State::Subscribing:    return "Subscribing";
        case State::Active:         return "Active";
        case State::Updating:       return "Updating";
        case State::Closing:        return "Closing";
        case State::Closed:         return "Closed";
        case State::Failed:         return "Failed";
        default:                    return "Unknown";
    }
}


// ===============================================================
// SESSION OUTCOME
//
// Exactly one per session, fixed the first time it is known.
// ===============================================================
enum class Outcome : uint8_t {
    Pending,
    ConnectionError,
    SubscribeFailed,
    Subscribed
};

[[nodiscard]]
inline constexpr std::string_view to_string(Outcome o) noexcept {
    switch (o) {
        case Outcome::Pending:         return "Pending";
        case Outcome::ConnectionError: return "ConnectionError";
        case Outcome::SubscribeFailed: return "SubscribeFailed";
        case Outcome::Subscribed:      return "Subscribed";
        default:                       return "Unknown";
    }
}


// ===============================================================
// STATE DATA
//
// Each alternative carries only what its own transitions need.
// ===============================================================
namespace state {

struct Connecting {
    clock::time_point started;
};

// Transport open, waiting for the server to accept the application key
struct Authenticating {
    clock::time_point opened;       // subscribe timeout starts here
};

struct Subscribing {
    clock::time_point opened;
    clock::time_point sent;         // latency timer
};

struct Active {
};

struct Updating {
    clock::time_point sent;
    clock::time_point deadline;
};

struct Closing {
    clock::time_point started;
};

struct Closed {
};

struct Failed {
};

} // namespace state

using StateData = std::variant<
    state::Connecting,
    state::Authenticating,
    state::Subscribing,
    state::Active,
    state::Updating,
    state::Closing,
    state::Closed,
    state::Failed
>;

// Variant alternatives are declared in State order
static_assert(std::variant_size_v<StateData> == static_cast<std::size_t>(State::Failed) + 1);

[[nodiscard]]
inline constexpr State state_of(const StateData& data) noexcept {
    return static_cast<State>(data.index());
}

} // namespace wireload::core::session
