#pragma once

#include "types.hpp"
#include "events.hpp"
#include <atomic>
#include <vector>

namespace LobReplay {

/**
 * Single-Producer Single-Consumer Lock-Free Ring Buffer carrying feed events
 * from the feed thread to the replay thread.
 *
 * Critical design choices for low latency:
 * 1. Power-of-2 size allows bitwise masking instead of modulo operation
 * 2. Separate cache lines for head/tail to avoid false sharing
 * 3. Acquire-Release memory ordering provides necessary synchronization without seq_cst overhead
 * 4. Producer and consumer each own their respective indices to minimize contention
 *
 * One slot is kept free to tell full from empty, so a ring of capacity N
 * holds at most N - 1 events.
 */
class SPSCRingBuffer {
private:
    alignas(64) std::atomic<uint64_t> head_;  // Producer writes here, separate cache line
    alignas(64) std::atomic<uint64_t> tail_;  // Consumer reads from here, separate cache line
    uint64_t mask_;
    std::vector<OrderBookEvent> buffer_;

public:
    /**
     * capacity must be a power of two and at least 2; throws
     * std::invalid_argument otherwise
     */
    explicit SPSCRingBuffer(size_t capacity = RING_BUFFER_SIZE);

    SPSCRingBuffer(const SPSCRingBuffer&) = delete;
    SPSCRingBuffer& operator=(const SPSCRingBuffer&) = delete;

    /**
     * Producer enqueue operation
     * Uses release memory ordering to ensure all writes to the event
     * are visible to the consumer before the head index is updated
     */
    bool enqueue(OrderBookEvent&& event) noexcept;
    bool enqueue(const OrderBookEvent& event);

    /**
     * Consumer dequeue operation
     * Uses acquire memory ordering to ensure all writes from producer
     * are visible before reading the event data
     */
    bool dequeue(OrderBookEvent& event) noexcept;

    bool empty() const noexcept;
    size_t size() const noexcept;
    size_t capacity() const noexcept { return buffer_.size(); }
};

} // namespace LobReplay
