#pragma once

#include <cassert>
#include <ostream>
#include <type_traits>
#include <utility>


namespace lcr {

// -----------------------------------------------------------------------------
// optional<T>
//
// Minimal value-or-nothing holder for small trivially-resettable fields
// decoded from the wire (timestamps, sequence numbers, counters).
// Always holds a default-constructed T when empty, so it stays trivially
// copyable whenever T is.
// -----------------------------------------------------------------------------
template <typename T>
class optional {
    static_assert(std::is_default_constructible_v<T>, "lcr::optional<T> requires a default-constructible T");

public:
    constexpr optional() noexcept : has_(false), value_{} {}
    constexpr optional(const T& v) : has_(true), value_(v) {}
    constexpr optional(T&& v) : has_(true), value_(std::move(v)) {}

    [[nodiscard]] constexpr bool has() const noexcept { return has_; }
    constexpr explicit operator bool() const noexcept { return has_; }

    [[nodiscard]] constexpr const T& value() const noexcept {
        assert(has_ && "lcr::optional::value() called when empty");
        return value_;
    }

    [[nodiscard]] constexpr T value_or(T fallback) const {
        return has_ ? value_ : fallback;
    }

    constexpr void reset() {
        has_ = false;
        value_ = T{};
    }

    constexpr optional& operator=(const T& v) {
        value_ = v;
        has_ = true;
        return *this;
    }

private:
    bool has_;
    T value_;
};

template <typename T>
inline std::ostream& operator<<(std::ostream& os, const optional<T>& opt) {
    if (!opt.has()) {
        return os << "null";
    }
    return os << opt.value();
}

} // namespace lcr
