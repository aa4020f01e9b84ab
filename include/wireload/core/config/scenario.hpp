#pragma once

#include <array>
#include <cstdint>
#include <string_view>

#include "wireload/core/protocol/filter.hpp"


namespace wireload::core::config {

// ===============================================================================
// Scenario
//
// Immutable workload definition: how many filter values each session
// subscribes with, how they are compared, and whether the filter is replaced
// periodically while the session is active.
// ===============================================================================

enum class ScenarioId : std::uint8_t {
    SingleEquals   = 1,
    PeriodicUpdate = 2,
    InSet10        = 3,
    InSet100       = 4,
    InSet500       = 5
};

struct Scenario {
    ScenarioId id;
    protocol::ComparisonMode mode;
    std::uint32_t cardinality;
    bool periodic_update;
    std::string_view label;

    [[nodiscard]]
    constexpr std::uint32_t number() const noexcept {
        return static_cast<std::uint32_t>(id);
    }
};

inline constexpr std::array<Scenario, 5> SCENARIOS{{
    {ScenarioId::SingleEquals,   protocol::ComparisonMode::Equals, 1,   false, "single equals filter"},
    {ScenarioId::PeriodicUpdate, protocol::ComparisonMode::Equals, 1,   true,  "periodic filter update"},
    {ScenarioId::InSet10,        protocol::ComparisonMode::InSet,  10,  false, "in-set of 10"},
    {ScenarioId::InSet100,       protocol::ComparisonMode::InSet,  100, false, "in-set of 100"},
    {ScenarioId::InSet500,       protocol::ComparisonMode::InSet,  500, false, "in-set of 500"},
}};

// Lookup by numeric id, nullptr when out of range
[[nodiscard]]
inline constexpr const Scenario* find_scenario(std::uint32_t id) noexcept {
    for (const auto& s : SCENARIOS) {
        if (s.number() == id) {
            return &s;
        }
    }
    return nullptr;
}

// Largest cardinality of any scenario: the address pool must hold at least this many values
[[nodiscard]]
inline constexpr std::uint32_t max_cardinality() noexcept {
    std::uint32_t k = 0;
    for (const auto& s : SCENARIOS) {
        if (s.cardinality > k) k = s.cardinality;
    }
    return k;
}

} // namespace wireload::core::config
