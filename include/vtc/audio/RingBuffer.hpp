#pragma once

/**
 * RingBuffer.hpp - Lock-free single producer / single consumer ring buffer
 *
 * The producer is whoever queues playback, the consumer the audio callback.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace vtc::audio {

template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity)
        : buffer_(capacity + 1) {}

    /// @return number of samples actually written (less than count when full)
    size_t push(const T* data, size_t count) {
        size_t write = write_.load(std::memory_order_relaxed);
        size_t read = read_.load(std::memory_order_acquire);
        size_t free_space = (read + buffer_.size() - write - 1) % buffer_.size();

        size_t n = count < free_space ? count : free_space;
        for (size_t i = 0; i < n; ++i) {
            buffer_[(write + i) % buffer_.size()] = data[i];
        }
        write_.store((write + n) % buffer_.size(), std::memory_order_release);
        return n;
    }

    /// @return number of samples read
    size_t pop(T* out, size_t count) {
        size_t read = read_.load(std::memory_order_relaxed);
        size_t write = write_.load(std::memory_order_acquire);
        size_t avail = (write + buffer_.size() - read) % buffer_.size();

        size_t n = count < avail ? count : avail;
        for (size_t i = 0; i < n; ++i) {
            out[i] = buffer_[(read + i) % buffer_.size()];
        }
        read_.store((read + n) % buffer_.size(), std::memory_order_release);
        return n;
    }

    size_t available() const {
        size_t read = read_.load(std::memory_order_acquire);
        size_t write = write_.load(std::memory_order_acquire);
        return (write + buffer_.size() - read) % buffer_.size();
    }

    size_t capacity() const { return buffer_.size() - 1; }

    /// Drop everything queued. A pop() racing with this may still return a few old samples.
    void clear() {
        read_.store(write_.load(std::memory_order_acquire), std::memory_order_release);
    }

private:
    std::vector<T> buffer_;
    std::atomic<size_t> read_{0};
    std::atomic<size_t> write_{0};
};

} // namespace vtc::audio
