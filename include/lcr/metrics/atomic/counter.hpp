#pragma once

#include <atomic>
#include <type_traits>
#include <cstdint>


namespace lcr {
namespace metrics {
namespace atomic {

// ---------------------------------------------------------------------------
// counter - A monotonically increasing counter (Cumulative metric)
//
// Relaxed ordering everywhere: counters are aggregated commutatively and
// only read for reporting, never used to synchronize other memory.
// ---------------------------------------------------------------------------
template<typename T = uint64_t>
struct alignas(64) counter {
    // Constructor
    counter() = default;
    explicit counter(T initial) noexcept : value_(initial) {}
    // Disable copy/move semantics
    counter(const counter&) = delete;
    counter& operator=(const counter&) = delete;
    counter(counter&&) noexcept = delete;
    counter& operator=(counter&&) noexcept = delete;

    // Accessor
    inline T load() const noexcept { return value_.load(std::memory_order_relaxed); }
    // Mutators
    inline void inc(T n = 1) noexcept { value_.fetch_add(n, std::memory_order_relaxed); }
    // Return-after-update mutator
    inline T add(T n) noexcept { return value_.fetch_add(n, std::memory_order_relaxed) + n; }

    // Reset counter to zero (only between runs)
    inline void reset() noexcept { value_.store(0, std::memory_order_relaxed); }

private:
    std::atomic<T> value_{0};
};
using counter32 = counter<uint32_t>;
static_assert(std::is_standard_layout_v<counter32>, "counter32 must be standard layout");
using counter64 = counter<uint64_t>;
static_assert(std::is_standard_layout_v<counter64>, "counter64 must be standard layout");


// ---------------------------------------------------------------------------
// gauge - A metric that can go up and down (Instantaneous state)
// ---------------------------------------------------------------------------
template<typename T = int64_t>
struct alignas(64) gauge {
    gauge() = default;

    gauge(const gauge&) = delete;
    gauge& operator=(const gauge&) = delete;

    inline T load() const noexcept { return value_.load(std::memory_order_relaxed); }
    inline void inc(T n = 1) noexcept { value_.fetch_add(n, std::memory_order_relaxed); }
    inline void dec(T n = 1) noexcept { value_.fetch_sub(n, std::memory_order_relaxed); }
    inline void reset() noexcept { value_.store(0, std::memory_order_relaxed); }

private:
    std::atomic<T> value_{0};
};
using gauge64 = gauge<int64_t>;

} // namespace atomic
} // namespace metrics
} // namespace lcr
