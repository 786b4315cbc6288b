/**
 * @file SpscQueue.hpp
 * @brief Bounded lock-free single-producer single-consumer queue.
 */

#ifndef VOICEGRAPH_SPSC_QUEUE_HPP
#define VOICEGRAPH_SPSC_QUEUE_HPP

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace voicegraph {

/**
 * @brief Wait-free SPSC ring buffer with a capacity chosen at construction.
 *
 * Head and tail are monotonically increasing counters, so every slot is
 * usable and "full" is simply head - tail == capacity. The producer
 * publishes a slot with a release store of head; the consumer observes it
 * with an acquire load (and vice versa for tail).
 *
 * Storage is allocated once in the constructor; push/pop never allocate.
 */
template<typename T>
class SpscQueue {
public:
    static_assert(std::is_trivially_copyable_v<T>, "SpscQueue elements must be trivially copyable");

    /**
     * @param min_capacity Requested capacity, rounded up to a power of two.
     * @throws std::invalid_argument if min_capacity is zero.
     */
    explicit SpscQueue(size_t min_capacity)
        : capacity_(round_up_pow2(min_capacity))
        , mask_(capacity_ - 1)
        , buffer_(std::make_unique<T[]>(capacity_))
    {
    }

    SpscQueue(const SpscQueue&) = delete;
    SpscQueue& operator=(const SpscQueue&) = delete;

    /**
     * @brief Producer side. Never blocks.
     * @return false if the queue is full (the item is not enqueued).
     */
    bool try_push(const T& item) {
        const size_t h = head_.load(std::memory_order_relaxed);
        const size_t t = tail_.load(std::memory_order_acquire);
        if (h - t >= capacity_) {
            return false;
        }
        buffer_[h & mask_] = item;
        head_.store(h + 1, std::memory_order_release);
        return true;
    }

    /**
     * @brief Consumer side. Never blocks.
     */
    std::optional<T> try_pop() {
        const size_t t = tail_.load(std::memory_order_relaxed);
        const size_t h = head_.load(std::memory_order_acquire);
        if (t == h) {
            return std::nullopt;
        }
        T item = buffer_[t & mask_];
        tail_.store(t + 1, std::memory_order_release);
        return item;
    }

    bool empty() const {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }

    /**
     * @brief Approximate when called concurrently with push/pop.
     */
    size_t size() const {
        return head_.load(std::memory_order_acquire) - tail_.load(std::memory_order_acquire);
    }

    size_t capacity() const { return capacity_; }

private:
    static size_t round_up_pow2(size_t n) {
        if (n == 0) {
            throw std::invalid_argument("SpscQueue capacity must be greater than zero");
        }
        size_t p = 1;
        while (p < n) {
            p <<= 1;
        }
        return p;
    }

    const size_t capacity_;
    const size_t mask_;
    std::unique_ptr<T[]> buffer_;

    // Separate cache lines for producer and consumer indices.
    alignas(64) std::atomic<size_t> head_{0};
    alignas(64) std::atomic<size_t> tail_{0};
};

} // namespace voicegraph

#endif // VOICEGRAPH_SPSC_QUEUE_HPP
