#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "wireload/core/config/error.hpp"


namespace wireload::core::filter {

// -----------------------------------------------------------------------------
// AddressPool
//
// Immutable set of distinct filter values (token addresses) that sessions
// draw their filters from. Built once per run, then shared read-only by every
// session and worker thread.
// -----------------------------------------------------------------------------
class AddressPool {
public:
    AddressPool() = default;

    // Takes ownership of the values; duplicates are dropped, first occurrence wins
    explicit AddressPool(std::vector<std::string> values);

    // Load a JSON array of strings. Leaves `out` untouched on error.
    [[nodiscard]]
    static config::Error load_file(const std::string& path, AddressPool& out);

    // `count` synthetic values: token_00000000, token_00000001, ...
    [[nodiscard]]
    static AddressPool make_synthetic(std::size_t count);

    [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }
    [[nodiscard]] bool empty() const noexcept { return values_.empty(); }
    [[nodiscard]] const std::string& operator[](std::size_t i) const noexcept { return values_[i]; }
    [[nodiscard]] const std::vector<std::string>& values() const noexcept { return values_; }

private:
    std::vector<std::string> values_;
};

inline constexpr std::size_t SYNTHETIC_POOL_SIZE = 10000;

} // namespace wireload::core::filter
