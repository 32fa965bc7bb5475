#pragma once

#include "types.hpp"
#include <atomic>
#include <string>

namespace LobReplay {

/**
 * Point-in-time copy of PerformanceMetrics
 */
struct MetricsSnapshot {
    std::string symbol;
    uint64_t orders_added = 0;
    uint64_t orders_modified = 0;
    uint64_t orders_cancelled = 0;
    uint64_t trades_executed = 0;
    uint64_t snapshots_processed = 0;
    uint64_t volume_added = 0;
    uint64_t volume_cancelled = 0;
    uint64_t volume_traded = 0;
    uint64_t max_bid_levels = 0;
    uint64_t max_ask_levels = 0;
    uint64_t avg_bid_depth = 0;       // Moving average of resting bid volume
    uint64_t avg_ask_depth = 0;
    Price min_spread = 0;             // Spread fields stay zero until sampled
    Price max_spread = 0;
    Price avg_spread = 0;
    uint64_t spread_samples = 0;
    uint64_t updates_per_second = 0;  // Last complete one-second window of event time
    uint64_t checksum_matches = 0;
    uint64_t checksum_mismatches = 0;

    std::string format_report() const;
};

/**
 * Book activity metrics for one symbol: operation counts and volumes, depth
 * and spread extremes, update rate and snapshot checksum outcomes.
 *
 * Writers are serialized by the owning ReplayEngine. Readers take a
 * MetricsSnapshot at any time without blocking the writer. The update rate is
 * measured in event time, so a replayed stream reports the rate it was
 * recorded at rather than the replay speed.
 */
class PerformanceMetrics {
private:
    std::string symbol_;

    // Operation counters
    std::atomic<uint64_t> orders_added_{0};
    std::atomic<uint64_t> orders_modified_{0};
    std::atomic<uint64_t> orders_cancelled_{0};
    std::atomic<uint64_t> trades_executed_{0};
    std::atomic<uint64_t> snapshots_processed_{0};

    // Volume
    std::atomic<uint64_t> volume_added_{0};
    std::atomic<uint64_t> volume_cancelled_{0};
    std::atomic<uint64_t> volume_traded_{0};

    // Depth
    std::atomic<uint64_t> max_bid_levels_{0};
    std::atomic<uint64_t> max_ask_levels_{0};
    std::atomic<uint64_t> avg_bid_depth_{0};
    std::atomic<uint64_t> avg_ask_depth_{0};

    // Spread
    std::atomic<Price> min_spread_{0};
    std::atomic<Price> max_spread_{0};
    std::atomic<Price> avg_spread_{0};
    std::atomic<uint64_t> spread_samples_{0};

    // Update rate
    std::atomic<uint64_t> updates_per_second_{0};
    Timestamp window_start_;
    uint64_t window_updates_;

    std::atomic<uint64_t> checksum_matches_{0};
    std::atomic<uint64_t> checksum_mismatches_{0};

    void count_update(Timestamp event_time) noexcept;

public:
    explicit PerformanceMetrics(const std::string& symbol);

    PerformanceMetrics(const PerformanceMetrics&) = delete;
    PerformanceMetrics& operator=(const PerformanceMetrics&) = delete;

    void record_order_add(Quantity quantity, Timestamp event_time) noexcept;
    void record_order_modify(Timestamp event_time) noexcept;
    void record_order_cancel(Quantity quantity, Timestamp event_time) noexcept;
    void record_trade(Quantity quantity, Timestamp event_time) noexcept;
    void record_snapshot() noexcept;
    void record_spread(Price spread) noexcept;

    /**
     * Track level-count peaks and a moving average (weight 1/10 for the new
     * sample) of resting volume per side
     */
    void record_depth(uint64_t bid_levels, uint64_t ask_levels,
                      uint64_t bid_volume, uint64_t ask_volume) noexcept;

    void record_checksum(bool matched) noexcept;

    MetricsSnapshot get_snapshot() const;

    /**
     * Zero every metric. Writer thread only.
     */
    void reset() noexcept;

    const std::string& symbol() const noexcept { return symbol_; }
};

} // namespace LobReplay
