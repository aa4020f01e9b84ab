#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <utility>
#include <vector>


namespace wireload::core::metrics {

// ---------------------------------------------------------------------------
// LatencyStats
//
// Summary of one latency sample set, in milliseconds.
// All fields are zero when count == 0.
// ---------------------------------------------------------------------------
struct LatencyStats {
    std::size_t count = 0;
    double min_ms  = 0.0;
    double mean_ms = 0.0;
    double p50_ms  = 0.0;
    double p95_ms  = 0.0;
    double p99_ms  = 0.0;
    double max_ms  = 0.0;

    [[nodiscard]] bool empty() const noexcept { return count == 0; }
};

// Nearest-rank percentile over an ascending sample set: rank = ceil(q * n), clamped to [1, n]
[[nodiscard]]
inline std::uint64_t nearest_rank(const std::vector<std::uint64_t>& sorted, double q) noexcept {
    const std::size_t n = sorted.size();
    if (n == 0) return 0;
    auto rank = static_cast<std::size_t>(std::ceil(q * static_cast<double>(n)));
    rank = std::clamp<std::size_t>(rank, 1, n);
    return sorted[rank - 1];
}

// Summarize an arbitrary-order sample set (microseconds). The input is copied
// and sorted, so the result does not depend on insertion order.
[[nodiscard]]
inline LatencyStats summarize(std::vector<std::uint64_t> samples_us) {
    LatencyStats s;
    if (samples_us.empty()) {
        return s;
    }
    std::sort(samples_us.begin(), samples_us.end());

    long double total = 0;
    for (auto v : samples_us) total += v;

    constexpr double US_PER_MS = 1000.0;
    s.count   = samples_us.size();
    s.min_ms  = samples_us.front() / US_PER_MS;
    s.max_ms  = samples_us.back() / US_PER_MS;
    s.mean_ms = static_cast<double>(total / samples_us.size()) / US_PER_MS;
    s.p50_ms  = nearest_rank(samples_us, 0.50) / US_PER_MS;
    s.p95_ms  = nearest_rank(samples_us, 0.95) / US_PER_MS;
    s.p99_ms  = nearest_rank(samples_us, 0.99) / US_PER_MS;
    return s;
}

// ---------------------------------------------------------------------------
// LatencySamples
//
// Append-only multiset of latency samples (microseconds) shared by every
// session of a run. Appends take a short mutex; sessions batch their
// high-rate samples and append them once per poll.
// ---------------------------------------------------------------------------
class LatencySamples {
public:
    LatencySamples() = default;

    LatencySamples(const LatencySamples&) = delete;
    LatencySamples& operator=(const LatencySamples&) = delete;

    void record(std::uint64_t us) {
        std::lock_guard<std::mutex> lock(mutex_);
        samples_.push_back(us);
    }

    void record(const std::vector<std::uint64_t>& batch) {
        if (batch.empty()) return;
        std::lock_guard<std::mutex> lock(mutex_);
        samples_.insert(samples_.end(), batch.begin(), batch.end());
    }

    [[nodiscard]]
    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return samples_.size();
    }

    [[nodiscard]]
    LatencyStats summarize() const {
        std::vector<std::uint64_t> copy;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            copy = samples_;
        }
        return metrics::summarize(std::move(copy));
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        samples_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::uint64_t> samples_;
};

} // namespace wireload::core::metrics
