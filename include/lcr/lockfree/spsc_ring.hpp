// -----------------------------------------------------------------------------
// SPSC ring buffer with compile-time capacity
// Lock-free, wait-free, cacheline-separated producer/consumer indices.
//
// Used as the hand-off between a transport I/O strand (producer) and the
// worker thread polling the owning session (consumer).
//
// Example:
//     spsc_ring<std::string, 256> inbox;
//     inbox.push(std::move(msg));
//     std::string msg;
//     while (inbox.pop(msg)) { ... }
//
// Notes:
//   - Capacity must be a power of two (compile-time check)
//   - Usable capacity is Capacity - 1
//   - Single Producer, Single Consumer only. A strand counts as a single
//     producer: its handlers never run concurrently.
//   - T must be nothrow move-assignable
// -----------------------------------------------------------------------------
#pragma once


#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <type_traits>


namespace lcr::lockfree {

template <typename T, size_t Capacity>
class alignas(64) spsc_ring {
    static_assert((Capacity >= 2) && ((Capacity & (Capacity - 1)) == 0),
                  "Capacity must be power of two and >= 2");
    static_assert(std::is_nothrow_move_assignable_v<T>,
                  "spsc_ring<T> requires nothrow move assignment");

public:
    spsc_ring() noexcept = default;
    ~spsc_ring() noexcept = default;

    // Non-copyable / non-movable
    spsc_ring(const spsc_ring&) = delete;
    spsc_ring& operator=(const spsc_ring&) = delete;

    // Push (move). Returns false when full; the item is left untouched.
    [[nodiscard]] inline bool push(T&& item) noexcept {
        const size_t head = head_.index.load(std::memory_order_relaxed);
        const size_t next = (head + 1) & MASK;
        if (next == tail_.index.load(std::memory_order_acquire))
            return false; // full
        buffer_[head] = std::move(item);
        head_.index.store(next, std::memory_order_release);
        return true;
    }

    // Push (copy)
    [[nodiscard]] inline bool push(const T& item) noexcept(std::is_nothrow_copy_assignable_v<T>) {
        const size_t head = head_.index.load(std::memory_order_relaxed);
        const size_t next = (head + 1) & MASK;
        if (next == tail_.index.load(std::memory_order_acquire))
            return false; // full
        buffer_[head] = item;
        head_.index.store(next, std::memory_order_release);
        return true;
    }

    // Pop (move)
    [[nodiscard]] inline bool pop(T& out) noexcept {
        const size_t tail = tail_.index.load(std::memory_order_relaxed);
        if (tail == head_.index.load(std::memory_order_acquire))
            return false; // empty
        out = std::move(buffer_[tail]);
        buffer_[tail] = T{};  // release whatever the moved-from slot still owns
        tail_.index.store((tail + 1) & MASK, std::memory_order_release);
        return true;
    }

    [[nodiscard]] inline bool empty() const noexcept {
        return tail_.index.load(std::memory_order_acquire) ==
               head_.index.load(std::memory_order_acquire);
    }

    [[nodiscard]] inline constexpr size_t capacity() const noexcept { return Capacity - 1; }

    [[nodiscard]] inline size_t used() const noexcept {
        const size_t h = head_.index.load(std::memory_order_acquire);
        const size_t t = tail_.index.load(std::memory_order_acquire);
        return (h - t) & MASK;
    }

private:
    struct alignas(64) PaddedAtomic {
        std::atomic<size_t> index{0};
        char pad[64 - sizeof(std::atomic<size_t>)]{};
    };

    static constexpr size_t MASK = Capacity - 1;
    alignas(64) std::array<T, Capacity> buffer_{};
    alignas(64) PaddedAtomic head_;
    alignas(64) PaddedAtomic tail_;
};

} // namespace lcr::lockfree
