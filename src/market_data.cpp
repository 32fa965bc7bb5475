#include "market_data.hpp"
#include <iostream>
#include <fstream>
#include <iomanip>

namespace LobReplay {

Level2Snapshot Level2Snapshot::from_engine(const ReplayEngine& engine, size_t levels) {
    Level2Snapshot snapshot(engine.symbol(), engine.last_applied_sequence());
    auto [bids, asks] = engine.order_book().get_depth(levels);
    snapshot.bids = std::move(bids);
    snapshot.asks = std::move(asks);
    return snapshot;
}

// Console Market Data Publisher Implementation
void ConsoleMarketDataPublisher::publish_trade(const std::string& symbol, const TradeEvent& trade) {
    std::cout << "TRADE: " << symbol
              << " seq=" << trade.sequence
              << " id=" << trade.trade_id
              << " price=" << trade.price
              << " qty=" << trade.quantity
              << " aggressor=" << side_to_string(trade.aggressor_side)
              << std::endl;
}

void ConsoleMarketDataPublisher::publish_depth(const Level2Snapshot& snapshot) {
    if (!verbose_) return;

    std::cout << "L2_DEPTH: " << snapshot.symbol << " seq=" << snapshot.sequence << std::endl;

    // Print asks (highest to lowest)
    std::cout << "  ASKS:" << std::endl;
    for (auto it = snapshot.asks.rbegin(); it != snapshot.asks.rend(); ++it) {
        std::cout << "    " << std::setw(8) << it->price
                  << " | " << std::setw(8) << it->quantity
                  << " | " << std::setw(4) << it->order_count << std::endl;
    }

    std::cout << "  --------" << std::endl;

    // Print bids (highest to lowest)
    std::cout << "  BIDS:" << std::endl;
    for (const auto& level : snapshot.bids) {
        std::cout << "    " << std::setw(8) << level.price
                  << " | " << std::setw(8) << level.quantity
                  << " | " << std::setw(4) << level.order_count << std::endl;
    }
    std::cout << std::endl;
}

void ConsoleMarketDataPublisher::publish_replay_stats(const std::string& symbol, const ReplayStats& stats) {
    std::cout << "REPLAY_STATS: " << symbol
              << " orders=" << stats.orders_processed
              << " trades=" << stats.trades_processed
              << " snapshots=" << stats.snapshots_processed
              << " deltas=" << stats.deltas_processed
              << " market=" << stats.market_events
              << " gaps=" << stats.sequence_gaps
              << " checksum_errors=" << stats.checksum_errors
              << " buffered=" << stats.events_buffered
              << " duplicates=" << stats.duplicates_ignored
              << std::endl;
}

void ConsoleMarketDataPublisher::publish_metrics(const MetricsSnapshot& metrics) {
    std::cout << "\n" << metrics.format_report();
}

// File Market Data Publisher Implementation
void FileMarketDataPublisher::publish_trade(const std::string& symbol, const TradeEvent& trade) {
    std::string filename = base_filename_ + "_trades.csv";
    std::ofstream file(filename, std::ios::app);

    if (!file.is_open()) {
        ++write_failures_;
        std::cerr << "WARNING: Cannot open " << filename << "\n";
        return;
    }

    // CSV format: exchange_time,symbol,sequence,trade_id,price,quantity,aggressor_side
    file << trade.exchange_time << ","
         << symbol << ","
         << trade.sequence << ","
         << trade.trade_id << ","
         << trade.price << ","
         << trade.quantity << ","
         << side_to_string(trade.aggressor_side) << std::endl;
}

void FileMarketDataPublisher::publish_depth(const Level2Snapshot& snapshot) {
    std::string filename = base_filename_ + "_l2_" + snapshot.symbol + ".csv";
    std::ofstream file(filename, std::ios::app);

    if (!file.is_open()) {
        ++write_failures_;
        std::cerr << "WARNING: Cannot open " << filename << "\n";
        return;
    }

    file << "SNAPSHOT," << snapshot.timestamp << "," << snapshot.symbol
         << "," << snapshot.sequence << std::endl;

    for (const auto& level : snapshot.bids) {
        file << "BID," << level.price << "," << level.quantity
             << "," << level.order_count << std::endl;
    }

    for (const auto& level : snapshot.asks) {
        file << "ASK," << level.price << "," << level.quantity
             << "," << level.order_count << std::endl;
    }

    file << "END_SNAPSHOT" << std::endl;
}

void FileMarketDataPublisher::publish_replay_stats(const std::string& symbol, const ReplayStats& stats) {
    std::string filename = base_filename_ + "_stats.csv";
    std::ofstream file(filename, std::ios::app);

    if (!file.is_open()) {
        ++write_failures_;
        std::cerr << "WARNING: Cannot open " << filename << "\n";
        return;
    }

    file << now_ns() << ","
         << symbol << ","
         << stats.orders_processed << ","
         << stats.trades_processed << ","
         << stats.snapshots_processed << ","
         << stats.deltas_processed << ","
         << stats.market_events << ","
         << stats.sequence_gaps << ","
         << stats.checksum_errors << ","
         << stats.events_buffered << ","
         << stats.duplicates_ignored << std::endl;
}

void FileMarketDataPublisher::publish_metrics(const MetricsSnapshot& metrics) {
    std::string filename = base_filename_ + "_metrics.csv";
    std::ofstream file(filename, std::ios::app);

    if (!file.is_open()) {
        ++write_failures_;
        std::cerr << "WARNING: Cannot open " << filename << "\n";
        return;
    }

    file << now_ns() << ","
         << metrics.symbol << ","
         << metrics.orders_added << ","
         << metrics.orders_modified << ","
         << metrics.orders_cancelled << ","
         << metrics.trades_executed << ","
         << metrics.volume_added << ","
         << metrics.volume_cancelled << ","
         << metrics.volume_traded << ","
         << metrics.max_bid_levels << ","
         << metrics.max_ask_levels << ","
         << metrics.min_spread << ","
         << metrics.max_spread << ","
         << metrics.avg_spread << ","
         << metrics.updates_per_second << ","
         << metrics.checksum_matches << ","
         << metrics.checksum_mismatches << std::endl;
}

// Market Data Manager Implementation
void MarketDataManager::add_publisher(std::unique_ptr<MarketDataPublisher> publisher) {
    publishers_.push_back(std::move(publisher));
}

void MarketDataManager::remove_all_publishers() {
    publishers_.clear();
}

void MarketDataManager::publish_trade(const std::string& symbol, const TradeEvent& trade) {
    if (!enabled_) return;

    for (auto& publisher : publishers_) {
        publisher->publish_trade(symbol, trade);
    }
}

void MarketDataManager::publish_depth(const Level2Snapshot& snapshot) {
    if (!enabled_) return;

    for (auto& publisher : publishers_) {
        publisher->publish_depth(snapshot);
    }
}

void MarketDataManager::publish_replay_stats(const std::string& symbol, const ReplayStats& stats) {
    if (!enabled_) return;

    for (auto& publisher : publishers_) {
        publisher->publish_replay_stats(symbol, stats);
    }
}

void MarketDataManager::publish_metrics(const MetricsSnapshot& metrics) {
    if (!enabled_) return;

    for (auto& publisher : publishers_) {
        publisher->publish_metrics(metrics);
    }
}

} // namespace LobReplay
