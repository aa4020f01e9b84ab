#pragma once

#include <chrono>
#include <cstddef>


namespace wireload::core::ramp {

// Pacing tick of the controller
inline constexpr std::chrono::milliseconds SCHEDULING_QUANTUM{50};

// Interval between progress log lines, in every phase
inline constexpr std::chrono::milliseconds PROGRESS_INTERVAL{5000};

// -----------------------------------------------------------------------------
// Linear spread of `total` operations over `window`.
//
// Cumulative number of operations due after `elapsed`:
//     min(total, floor(total * elapsed / window))
//
// Monotonically non-decreasing in `elapsed`; reaches `total` at the end of
// the window. A non-positive window means everything is due immediately.
// -----------------------------------------------------------------------------
[[nodiscard]]
inline constexpr std::size_t ramp_target(std::size_t total,
                                         std::chrono::nanoseconds elapsed,
                                         std::chrono::nanoseconds window) noexcept {
    if (window.count() <= 0 || elapsed >= window) {
        return total;
    }
    if (elapsed.count() <= 0) {
        return 0;
    }
    // long double keeps total * elapsed exact enough for hours-long windows
    const long double due = static_cast<long double>(total) * static_cast<long double>(elapsed.count())
                          / static_cast<long double>(window.count());
    const auto n = static_cast<std::size_t>(due);
    return n < total ? n : total;
}

} // namespace wireload::core::ramp
