#pragma once

#include "types.hpp"
#include "events.hpp"
#include "spsc_ring_buffer.hpp"
#include <atomic>
#include <string>

namespace LobReplay {

/**
 * Shape of a simulated feed
 */
struct FeedProfile {
    std::string symbol = "SIM";
    uint64_t total_events = 1'000'000;
    uint64_t seed = 42;
    Price mid_price = 10'000;
    Price price_range = 50;          // Passive orders rest within mid +/- range
    double trade_rate = 0.05;
    double cancel_rate = 0.25;
    double modify_rate = 0.10;
    double iceberg_rate = 0.02;
    double reorder_rate = 0.0;       // Swap an event with its successor
    double duplicate_rate = 0.0;     // Deliver an event twice
    double drop_rate = 0.0;          // Never deliver an event
    uint64_t snapshot_every = 10'000; // 0 disables periodic snapshots
    Timestamp feed_latency_ns = 500;
};

/**
 * Counters describing what the feed delivered
 */
struct FeedStats {
    std::atomic<uint64_t> events_generated{0};
    std::atomic<uint64_t> events_enqueued{0};
    std::atomic<uint64_t> snapshots{0};
    std::atomic<uint64_t> reordered{0};
    std::atomic<uint64_t> duplicated{0};
    std::atomic<uint64_t> dropped{0};
};

/**
 * Feed handler simulates an exchange incremental feed for one symbol:
 * an opening snapshot, then sequenced order adds, modifies, deletes and
 * trades around a random-walk mid, with periodic snapshots of the feed's
 * own book. Delivery can be disturbed by reordering, duplication and drops
 * to exercise recovery. Snapshots are always delivered in order.
 */
class FeedHandler {
private:
    FeedProfile profile_;
    FeedStats stats_;
    std::atomic<bool> finished_;

public:
    explicit FeedHandler(const FeedProfile& profile);

    /**
     * Producer loop; blocks (yielding) while the ring is full
     */
    void run(SPSCRingBuffer* ring_buffer);

    bool finished() const noexcept { return finished_.load(std::memory_order_acquire); }
    const FeedStats& stats() const noexcept { return stats_; }
    const FeedProfile& profile() const noexcept { return profile_; }
};

} // namespace LobReplay
