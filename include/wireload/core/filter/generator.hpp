#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <random>
#include <unordered_set>
#include <vector>

#include "wireload/core/config/scenario.hpp"
#include "wireload/core/filter/address_pool.hpp"
#include "wireload/core/protocol/filter.hpp"


namespace wireload::core::filter {

/*
===============================================================================
 filter::Generator
===============================================================================

Builds the subscription filter of one session for one scenario.

  • Equals scenarios: one value
  • InSet scenarios:  exactly k distinct values, drawn without replacement

Stateless apart from a reference to the immutable pool: the random source is
passed in by the caller (one engine per session), so a single Generator is
shared by all sessions and all worker threads without synchronization.

Sampling uses Floyd's algorithm: k draws, no shuffle of the whole pool.
===============================================================================
*/
class Generator {
public:
    explicit Generator(const AddressPool& pool) noexcept
        : pool_(&pool)
    {}

    [[nodiscard]]
    protocol::SubscriptionFilter generate(const config::Scenario& scenario, std::mt19937_64& rng) const {
        protocol::SubscriptionFilter filter;
        filter.mode = scenario.mode;

        const std::size_t n = pool_->size();
        const std::size_t k = std::min<std::size_t>(scenario.cardinality, n);
        if (k == 0) {
            return filter;
        }

        filter.values.reserve(k);
        if (k == 1) {
            std::uniform_int_distribution<std::size_t> dist(0, n - 1);
            filter.values.push_back((*pool_)[dist(rng)]);
            return filter;
        }

        std::unordered_set<std::size_t> chosen;
        chosen.reserve(k * 2);
        for (std::size_t j = n - k; j < n; ++j) {
            std::uniform_int_distribution<std::size_t> dist(0, j);
            const std::size_t t = dist(rng);
            const std::size_t pick = chosen.insert(t).second ? t : j;
            if (pick == j) {
                chosen.insert(j);
            }
            filter.values.push_back((*pool_)[pick]);
        }
        return filter;
    }

    [[nodiscard]]
    const AddressPool& pool() const noexcept { return *pool_; }

private:
    const AddressPool* pool_;
};

} // namespace wireload::core::filter
