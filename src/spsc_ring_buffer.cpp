#include "spsc_ring_buffer.hpp"
#include <stdexcept>
#include <utility>

namespace LobReplay {

SPSCRingBuffer::SPSCRingBuffer(size_t capacity)
    : head_(0), tail_(0), mask_(capacity - 1) {
    if (capacity < 2 || (capacity & (capacity - 1)) != 0) {
        throw std::invalid_argument("SPSCRingBuffer capacity must be a power of two >= 2");
    }
    buffer_.resize(capacity);
}

bool SPSCRingBuffer::enqueue(OrderBookEvent&& event) noexcept {
    const uint64_t current_head = head_.load(std::memory_order_relaxed);
    const uint64_t next_head = (current_head + 1) & mask_;

    // Check if buffer is full
    if (next_head == tail_.load(std::memory_order_acquire)) {
        return false;
    }

    buffer_[current_head] = std::move(event);
    head_.store(next_head, std::memory_order_release);
    return true;
}

bool SPSCRingBuffer::enqueue(const OrderBookEvent& event) {
    OrderBookEvent copy = event;
    return enqueue(std::move(copy));
}

bool SPSCRingBuffer::dequeue(OrderBookEvent& event) noexcept {
    const uint64_t current_tail = tail_.load(std::memory_order_relaxed);

    // Check if buffer is empty
    if (current_tail == head_.load(std::memory_order_acquire)) {
        return false;
    }

    event = std::move(buffer_[current_tail]);
    tail_.store((current_tail + 1) & mask_, std::memory_order_release);
    return true;
}

bool SPSCRingBuffer::empty() const noexcept {
    return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
}

size_t SPSCRingBuffer::size() const noexcept {
    const uint64_t head = head_.load(std::memory_order_acquire);
    const uint64_t tail = tail_.load(std::memory_order_acquire);
    return static_cast<size_t>((head - tail) & mask_);
}

} // namespace LobReplay
