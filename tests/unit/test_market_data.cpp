#include <gtest/gtest.h>
#include "market_data.hpp"
#include <cstdio>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

using namespace LobReplay;

namespace {

/**
 * Records everything it is handed
 */
class RecordingPublisher : public MarketDataPublisher {
public:
    std::vector<TradeEvent> trades;
    std::vector<Level2Snapshot> depths;
    std::vector<ReplayStats> stats;
    std::vector<MetricsSnapshot> metrics;

    void publish_trade(const std::string&, const TradeEvent& trade) override {
        trades.push_back(trade);
    }
    void publish_depth(const Level2Snapshot& snapshot) override {
        depths.push_back(snapshot);
    }
    void publish_replay_stats(const std::string&, const ReplayStats& replay_stats) override {
        stats.push_back(replay_stats);
    }
    void publish_metrics(const MetricsSnapshot& snapshot) override {
        metrics.push_back(snapshot);
    }
};

} // namespace

class MarketDataManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto publisher = std::make_unique<RecordingPublisher>();
        recorder = publisher.get();
        manager.add_publisher(std::move(publisher));
    }

    MarketDataManager manager;
    RecordingPublisher* recorder = nullptr;
};

TEST_F(MarketDataManagerTest, FansOutToPublishers) {
    auto second = std::make_unique<RecordingPublisher>();
    RecordingPublisher* second_recorder = second.get();
    manager.add_publisher(std::move(second));

    TradeEvent trade;
    trade.trade_id = 1;
    manager.publish_trade("BTCUSDT", trade);

    EXPECT_EQ(manager.publisher_count(), 2u);
    EXPECT_EQ(recorder->trades.size(), 1u);
    EXPECT_EQ(second_recorder->trades.size(), 1u);
}

TEST_F(MarketDataManagerTest, DisabledManagerPublishesNothing) {
    manager.disable();
    EXPECT_FALSE(manager.is_enabled());

    manager.publish_trade("BTCUSDT", TradeEvent{});
    manager.publish_depth(Level2Snapshot("BTCUSDT", 1));
    manager.publish_replay_stats("BTCUSDT", ReplayStats{});
    manager.publish_metrics(MetricsSnapshot{});

    EXPECT_TRUE(recorder->trades.empty());
    EXPECT_TRUE(recorder->metrics.empty());
    EXPECT_TRUE(recorder->depths.empty());
    EXPECT_TRUE(recorder->stats.empty());

    manager.enable();
    manager.publish_replay_stats("BTCUSDT", ReplayStats{});
    EXPECT_EQ(recorder->stats.size(), 1u);
}

TEST_F(MarketDataManagerTest, RemoveAllPublishers) {
    manager.remove_all_publishers();
    EXPECT_EQ(manager.publisher_count(), 0u);
    manager.publish_trade("BTCUSDT", TradeEvent{});
}

TEST(Level2SnapshotTest, BuiltFromEngineDepth) {
    ReplayEngine engine("BTCUSDT");
    OrderBookSnapshot snapshot;
    snapshot.symbol = "BTCUSDT";
    snapshot.sequence = 42;
    snapshot.bids = {{100, 10, 1}, {99, 20, 2}, {98, 30, 3}};
    snapshot.asks = {{101, 15, 1}};
    snapshot.checksum = OrderBook::snapshot_checksum(snapshot.bids, snapshot.asks);
    engine.process_event(snapshot);

    const Level2Snapshot depth = Level2Snapshot::from_engine(engine, 2);

    EXPECT_EQ(depth.symbol, "BTCUSDT");
    EXPECT_EQ(depth.sequence, 42u);
    ASSERT_EQ(depth.bids.size(), 2u);
    EXPECT_EQ(depth.bids[0].price, 100);
    EXPECT_EQ(depth.bids[1].price, 99);
    ASSERT_EQ(depth.asks.size(), 1u);
    EXPECT_EQ(depth.asks[0].quantity, 15u);
}

TEST(FileMarketDataPublisherTest, AppendsCsvRows) {
    const std::string base = ::testing::TempDir() + "lob_replay_md_test";
    const std::string trades_file = base + "_trades.csv";
    std::remove(trades_file.c_str());

    FileMarketDataPublisher publisher(base);
    TradeEvent trade;
    trade.trade_id = 9;
    trade.price = 100;
    trade.quantity = 3;
    trade.sequence = 5;
    publisher.publish_trade("BTCUSDT", trade);
    publisher.publish_trade("BTCUSDT", trade);

    std::ifstream in(trades_file);
    ASSERT_TRUE(in.is_open());
    std::string line;
    int rows = 0;
    while (std::getline(in, line)) {
        EXPECT_NE(line.find(",BTCUSDT,5,9,100,3,BUY"), std::string::npos);
        ++rows;
    }
    EXPECT_EQ(rows, 2);
    EXPECT_EQ(publisher.write_failures(), 0u);

    std::remove(trades_file.c_str());
}

TEST(FileMarketDataPublisherTest, AppendsMetricsRow) {
    const std::string base = ::testing::TempDir() + "lob_replay_metrics_test";
    const std::string metrics_file = base + "_metrics.csv";
    std::remove(metrics_file.c_str());

    MetricsSnapshot metrics;
    metrics.symbol = "ETHUSDT";
    metrics.orders_added = 7;
    metrics.checksum_mismatches = 2;

    FileMarketDataPublisher publisher(base);
    publisher.publish_metrics(metrics);

    std::ifstream in(metrics_file);
    ASSERT_TRUE(in.is_open());
    std::string line;
    ASSERT_TRUE(std::getline(in, line));
    EXPECT_NE(line.find(",ETHUSDT,7,"), std::string::npos);
    EXPECT_EQ(line.substr(line.size() - 2), ",2");
    EXPECT_EQ(publisher.write_failures(), 0u);

    std::remove(metrics_file.c_str());
}

TEST(FileMarketDataPublisherTest, UnwritablePathIsCounted) {
    FileMarketDataPublisher publisher("/nonexistent-dir/lob_replay");
    publisher.publish_replay_stats("BTCUSDT", ReplayStats{});
    EXPECT_EQ(publisher.write_failures(), 1u);
}
