#include "performance_metrics.hpp"
#include <sstream>

namespace LobReplay {

namespace {

constexpr Timestamp RATE_WINDOW_NS = 1'000'000'000;
constexpr uint64_t DEPTH_AVERAGE_WEIGHT = 100;  // Per mille given to the new sample

} // namespace

std::string MetricsSnapshot::format_report() const {
    std::ostringstream report;
    report << "=== BOOK METRICS: " << symbol << " ===\n";
    report << "Orders: " << orders_added << " added, " << orders_modified << " modified, "
           << orders_cancelled << " cancelled\n";
    report << "Trades: " << trades_executed << " executed\n";
    report << "Snapshots: " << snapshots_processed << "\n";
    report << "Volume: " << volume_added << " added, " << volume_cancelled << " cancelled, "
           << volume_traded << " traded\n";
    report << "Depth: max " << max_bid_levels << " bid / " << max_ask_levels << " ask levels, avg volume "
           << avg_bid_depth << " bid / " << avg_ask_depth << " ask\n";
    if (spread_samples > 0) {
        report << "Spread: min " << min_spread << ", max " << max_spread << ", avg " << avg_spread << "\n";
    } else {
        report << "Spread: n/a\n";
    }
    report << "Updates: " << updates_per_second << " per second\n";
    report << "Checksums: " << checksum_matches << " matches, " << checksum_mismatches << " mismatches\n";
    return report.str();
}

PerformanceMetrics::PerformanceMetrics(const std::string& symbol)
    : symbol_(symbol), window_start_(0), window_updates_(0) {}

void PerformanceMetrics::record_order_add(Quantity quantity, Timestamp event_time) noexcept {
    orders_added_.fetch_add(1, std::memory_order_relaxed);
    volume_added_.fetch_add(quantity, std::memory_order_relaxed);
    count_update(event_time);
}

void PerformanceMetrics::record_order_modify(Timestamp event_time) noexcept {
    orders_modified_.fetch_add(1, std::memory_order_relaxed);
    count_update(event_time);
}

void PerformanceMetrics::record_order_cancel(Quantity quantity, Timestamp event_time) noexcept {
    orders_cancelled_.fetch_add(1, std::memory_order_relaxed);
    volume_cancelled_.fetch_add(quantity, std::memory_order_relaxed);
    count_update(event_time);
}

void PerformanceMetrics::record_trade(Quantity quantity, Timestamp event_time) noexcept {
    trades_executed_.fetch_add(1, std::memory_order_relaxed);
    volume_traded_.fetch_add(quantity, std::memory_order_relaxed);
    count_update(event_time);
}

void PerformanceMetrics::record_snapshot() noexcept {
    snapshots_processed_.fetch_add(1, std::memory_order_relaxed);
}

void PerformanceMetrics::record_spread(Price spread) noexcept {
    const uint64_t samples = spread_samples_.load(std::memory_order_relaxed) + 1;

    if (samples == 1 || spread < min_spread_.load(std::memory_order_relaxed)) {
        min_spread_.store(spread, std::memory_order_relaxed);
    }
    if (samples == 1 || spread > max_spread_.load(std::memory_order_relaxed)) {
        max_spread_.store(spread, std::memory_order_relaxed);
    }

    // Running mean
    const Price average = avg_spread_.load(std::memory_order_relaxed);
    avg_spread_.store(average + (spread - average) / static_cast<Price>(samples), std::memory_order_relaxed);
    spread_samples_.store(samples, std::memory_order_release);
}

void PerformanceMetrics::record_depth(uint64_t bid_levels, uint64_t ask_levels,
                                      uint64_t bid_volume, uint64_t ask_volume) noexcept {
    if (bid_levels > max_bid_levels_.load(std::memory_order_relaxed)) {
        max_bid_levels_.store(bid_levels, std::memory_order_relaxed);
    }
    if (ask_levels > max_ask_levels_.load(std::memory_order_relaxed)) {
        max_ask_levels_.store(ask_levels, std::memory_order_relaxed);
    }

    const uint64_t bid_average = avg_bid_depth_.load(std::memory_order_relaxed);
    avg_bid_depth_.store((bid_average * (1000 - DEPTH_AVERAGE_WEIGHT) + bid_volume * DEPTH_AVERAGE_WEIGHT) / 1000,
                         std::memory_order_relaxed);
    const uint64_t ask_average = avg_ask_depth_.load(std::memory_order_relaxed);
    avg_ask_depth_.store((ask_average * (1000 - DEPTH_AVERAGE_WEIGHT) + ask_volume * DEPTH_AVERAGE_WEIGHT) / 1000,
                         std::memory_order_relaxed);
}

void PerformanceMetrics::record_checksum(bool matched) noexcept {
    if (matched) {
        checksum_matches_.fetch_add(1, std::memory_order_relaxed);
    } else {
        checksum_mismatches_.fetch_add(1, std::memory_order_relaxed);
    }
}

void PerformanceMetrics::count_update(Timestamp event_time) noexcept {
    if (window_updates_ == 0) {
        window_start_ = event_time;
        window_updates_ = 1;
        return;
    }

    // Timestamps behind the window start count toward the current window
    if (event_time >= window_start_ && event_time - window_start_ >= RATE_WINDOW_NS) {
        updates_per_second_.store(window_updates_, std::memory_order_relaxed);
        window_start_ = event_time;
        window_updates_ = 1;
    } else {
        ++window_updates_;
    }
}

MetricsSnapshot PerformanceMetrics::get_snapshot() const {
    MetricsSnapshot snapshot;
    snapshot.symbol = symbol_;
    snapshot.orders_added = orders_added_.load(std::memory_order_relaxed);
    snapshot.orders_modified = orders_modified_.load(std::memory_order_relaxed);
    snapshot.orders_cancelled = orders_cancelled_.load(std::memory_order_relaxed);
    snapshot.trades_executed = trades_executed_.load(std::memory_order_relaxed);
    snapshot.snapshots_processed = snapshots_processed_.load(std::memory_order_relaxed);
    snapshot.volume_added = volume_added_.load(std::memory_order_relaxed);
    snapshot.volume_cancelled = volume_cancelled_.load(std::memory_order_relaxed);
    snapshot.volume_traded = volume_traded_.load(std::memory_order_relaxed);
    snapshot.max_bid_levels = max_bid_levels_.load(std::memory_order_relaxed);
    snapshot.max_ask_levels = max_ask_levels_.load(std::memory_order_relaxed);
    snapshot.avg_bid_depth = avg_bid_depth_.load(std::memory_order_relaxed);
    snapshot.avg_ask_depth = avg_ask_depth_.load(std::memory_order_relaxed);
    snapshot.spread_samples = spread_samples_.load(std::memory_order_acquire);
    snapshot.min_spread = min_spread_.load(std::memory_order_relaxed);
    snapshot.max_spread = max_spread_.load(std::memory_order_relaxed);
    snapshot.avg_spread = avg_spread_.load(std::memory_order_relaxed);
    snapshot.updates_per_second = updates_per_second_.load(std::memory_order_relaxed);
    snapshot.checksum_matches = checksum_matches_.load(std::memory_order_relaxed);
    snapshot.checksum_mismatches = checksum_mismatches_.load(std::memory_order_relaxed);
    return snapshot;
}

void PerformanceMetrics::reset() noexcept {
    orders_added_.store(0, std::memory_order_relaxed);
    orders_modified_.store(0, std::memory_order_relaxed);
    orders_cancelled_.store(0, std::memory_order_relaxed);
    trades_executed_.store(0, std::memory_order_relaxed);
    snapshots_processed_.store(0, std::memory_order_relaxed);
    volume_added_.store(0, std::memory_order_relaxed);
    volume_cancelled_.store(0, std::memory_order_relaxed);
    volume_traded_.store(0, std::memory_order_relaxed);
    max_bid_levels_.store(0, std::memory_order_relaxed);
    max_ask_levels_.store(0, std::memory_order_relaxed);
    avg_bid_depth_.store(0, std::memory_order_relaxed);
    avg_ask_depth_.store(0, std::memory_order_relaxed);
    min_spread_.store(0, std::memory_order_relaxed);
    max_spread_.store(0, std::memory_order_relaxed);
    avg_spread_.store(0, std::memory_order_relaxed);
    spread_samples_.store(0, std::memory_order_release);
    updates_per_second_.store(0, std::memory_order_relaxed);
    window_start_ = 0;
    window_updates_ = 0;
    checksum_matches_.store(0, std::memory_order_relaxed);
    checksum_mismatches_.store(0, std::memory_order_relaxed);
}

} // namespace LobReplay
