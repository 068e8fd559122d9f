#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>
#include <vector>

// Lock-free single-producer single-consumer ring of samples.
// Producer (capture thread) calls push(). Consumer (provider worker) calls pop()/clear().
template <typename T>
class RingBuffer {
    static_assert(std::is_trivially_copyable_v<T>);

public:
    explicit RingBuffer(size_t capacity)
        : buf_(capacity), capacity_(capacity) {}

    // Producer: append samples. Whatever does not fit is dropped and counted.
    size_t push(std::span<const T> samples) {
        size_t w = write_pos_.load(std::memory_order_relaxed);
        size_t r = read_pos_.load(std::memory_order_acquire);

        size_t free_slots = capacity_ - (w - r);
        size_t n = std::min(samples.size(), free_slots);
        if (n < samples.size()) {
            dropped_.fetch_add(samples.size() - n, std::memory_order_relaxed);
        }
        if (n == 0) return 0;

        size_t offset = w % capacity_;
        size_t first = std::min(n, capacity_ - offset);
        std::copy_n(samples.begin(), first, buf_.begin() + offset);
        std::copy_n(samples.begin() + first, n - first, buf_.begin());

        write_pos_.store(w + n, std::memory_order_release);
        return n;
    }

    // Consumer: move up to out.size() samples into out.
    size_t pop(std::span<T> out) {
        size_t r = read_pos_.load(std::memory_order_relaxed);
        size_t w = write_pos_.load(std::memory_order_acquire);

        size_t n = std::min(out.size(), w - r);
        if (n == 0) return 0;

        size_t offset = r % capacity_;
        size_t first = std::min(n, capacity_ - offset);
        std::copy_n(buf_.begin() + offset, first, out.begin());
        std::copy_n(buf_.begin(), n - first, out.begin() + first);

        read_pos_.store(r + n, std::memory_order_release);
        return n;
    }

    // Consumer: take everything currently queued.
    std::vector<T> pop_all() {
        std::vector<T> out(size());
        out.resize(pop(out));
        return out;
    }

    // Consumer: discard queued samples. Safe against a concurrent producer.
    void clear() {
        read_pos_.store(write_pos_.load(std::memory_order_acquire), std::memory_order_release);
    }

    size_t size() const {
        size_t w = write_pos_.load(std::memory_order_acquire);
        size_t r = read_pos_.load(std::memory_order_acquire);
        return w - r;
    }

    size_t capacity() const { return capacity_; }
    uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    std::vector<T> buf_;
    size_t capacity_;
    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) std::atomic<size_t> read_pos_{0};
    std::atomic<uint64_t> dropped_{0};
};
