#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

// Lock-free single-producer single-consumer ring of S16 samples.
// Producer (PipeWire realtime thread) calls write(). Consumer (chunk pump) calls drain().
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity_samples)
        : buf_(capacity_samples), capacity_(capacity_samples) {}

    // Producer: copy samples in. Returns samples actually written; the rest is dropped.
    size_t write(const int16_t* data, size_t count) {
        size_t w = write_pos_.load(std::memory_order_relaxed);
        size_t r = read_pos_.load(std::memory_order_acquire);

        size_t free_space = capacity_ - (w - r);
        size_t to_write = std::min(count, free_space);
        if (to_write == 0) {
            dropped_.fetch_add(count, std::memory_order_relaxed);
            return 0;
        }

        size_t offset = w % capacity_;
        size_t first = std::min(to_write, capacity_ - offset);
        std::memcpy(buf_.data() + offset, data, first * sizeof(int16_t));
        if (first < to_write) {
            std::memcpy(buf_.data(), data + first, (to_write - first) * sizeof(int16_t));
        }

        write_pos_.store(w + to_write, std::memory_order_release);
        if (to_write < count) {
            dropped_.fetch_add(count - to_write, std::memory_order_relaxed);
        }
        return to_write;
    }

    // Consumer: append up to max_count samples to out. Returns samples moved.
    size_t drain(std::vector<int16_t>& out, size_t max_count = SIZE_MAX) {
        size_t r = read_pos_.load(std::memory_order_relaxed);
        size_t w = write_pos_.load(std::memory_order_acquire);

        size_t to_read = std::min(max_count, w - r);
        if (to_read == 0) return 0;

        size_t base = out.size();
        out.resize(base + to_read);

        size_t offset = r % capacity_;
        size_t first = std::min(to_read, capacity_ - offset);
        std::memcpy(out.data() + base, buf_.data() + offset, first * sizeof(int16_t));
        if (first < to_read) {
            std::memcpy(out.data() + base + first, buf_.data(), (to_read - first) * sizeof(int16_t));
        }

        read_pos_.store(r + to_read, std::memory_order_release);
        return to_read;
    }

    size_t available() const {
        size_t w = write_pos_.load(std::memory_order_acquire);
        size_t r = read_pos_.load(std::memory_order_acquire);
        return w - r;
    }

    // Samples lost to overflow over the buffer's lifetime.
    size_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    std::vector<int16_t> buf_;
    size_t capacity_;
    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) std::atomic<size_t> read_pos_{0};
    std::atomic<size_t> dropped_{0};
};
