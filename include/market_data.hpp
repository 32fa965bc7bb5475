#pragma once

#include "types.hpp"
#include "events.hpp"
#include "replay_engine.hpp"
#include "performance_metrics.hpp"
#include <vector>
#include <memory>
#include <string>

namespace LobReplay {

/**
 * Level 2 view of a reconstructed book
 */
struct Level2Snapshot {
    std::string symbol;
    Sequence sequence;
    Timestamp timestamp;
    std::vector<LevelUpdate> bids;  // Sorted highest to lowest
    std::vector<LevelUpdate> asks;  // Sorted lowest to highest

    Level2Snapshot(const std::string& sym, Sequence seq)
        : symbol(sym), sequence(seq), timestamp(now_ns()) {}

    /**
     * Top `levels` per side of the book held by a replay engine
     */
    static Level2Snapshot from_engine(const ReplayEngine& engine, size_t levels);
};

/**
 * Market data publisher interface
 */
class MarketDataPublisher {
public:
    virtual ~MarketDataPublisher() = default;

    virtual void publish_trade(const std::string& symbol, const TradeEvent& trade) = 0;
    virtual void publish_depth(const Level2Snapshot& snapshot) = 0;
    virtual void publish_replay_stats(const std::string& symbol, const ReplayStats& stats) = 0;
    virtual void publish_metrics(const MetricsSnapshot& metrics) = 0;
};

/**
 * Console-based market data publisher for testing
 */
class ConsoleMarketDataPublisher : public MarketDataPublisher {
private:
    bool verbose_;

public:
    explicit ConsoleMarketDataPublisher(bool verbose = false) : verbose_(verbose) {}

    void publish_trade(const std::string& symbol, const TradeEvent& trade) override;
    void publish_depth(const Level2Snapshot& snapshot) override;
    void publish_replay_stats(const std::string& symbol, const ReplayStats& stats) override;
    void publish_metrics(const MetricsSnapshot& metrics) override;
};

/**
 * File-based market data publisher for recording. Appends CSV rows to
 * <base>_trades.csv, <base>_l2_<symbol>.csv, <base>_stats.csv and
 * <base>_metrics.csv.
 */
class FileMarketDataPublisher : public MarketDataPublisher {
private:
    std::string base_filename_;
    uint64_t write_failures_;

public:
    explicit FileMarketDataPublisher(const std::string& filename)
        : base_filename_(filename), write_failures_(0) {}

    void publish_trade(const std::string& symbol, const TradeEvent& trade) override;
    void publish_depth(const Level2Snapshot& snapshot) override;
    void publish_replay_stats(const std::string& symbol, const ReplayStats& stats) override;
    void publish_metrics(const MetricsSnapshot& metrics) override;

    uint64_t write_failures() const noexcept { return write_failures_; }
};

/**
 * Market data manager that handles multiple publishers
 */
class MarketDataManager {
private:
    std::vector<std::unique_ptr<MarketDataPublisher>> publishers_;
    bool enabled_;

public:
    MarketDataManager() : enabled_(true) {}

    void add_publisher(std::unique_ptr<MarketDataPublisher> publisher);
    void remove_all_publishers();
    size_t publisher_count() const noexcept { return publishers_.size(); }

    void enable() { enabled_ = true; }
    void disable() { enabled_ = false; }
    bool is_enabled() const { return enabled_; }

    // Publishing methods
    void publish_trade(const std::string& symbol, const TradeEvent& trade);
    void publish_depth(const Level2Snapshot& snapshot);
    void publish_replay_stats(const std::string& symbol, const ReplayStats& stats);
    void publish_metrics(const MetricsSnapshot& metrics);
};

} // namespace LobReplay
