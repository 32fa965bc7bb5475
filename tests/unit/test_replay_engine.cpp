#include <gtest/gtest.h>
#include "replay_engine.hpp"
#include <memory>
#include <thread>
#include <vector>

using namespace LobReplay;

class ReplayEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine = std::make_unique<ReplayEngine>("BTCUSDT");
    }

    void reset_engine(const ReplayConfig& config) {
        engine = std::make_unique<ReplayEngine>("BTCUSDT", config);
    }

    static OrderUpdate order_at(Sequence sequence, OrderId id = 0, Price price = 100, Side side = Side::BUY) {
        OrderUpdate update;
        update.symbol = "BTCUSDT";
        update.order_id = id ? id : sequence;
        update.price = price;
        update.quantity = 10;
        update.side = side;
        update.update_type = UpdateType::ADD;
        update.exchange_time = 1000;
        update.local_time = 1500;
        update.sequence = sequence;
        return update;
    }

    static TradeEvent trade_at(Sequence sequence) {
        TradeEvent trade;
        trade.symbol = "BTCUSDT";
        trade.trade_id = sequence;
        trade.price = 100;
        trade.quantity = 1;
        trade.sequence = sequence;
        return trade;
    }

    static OrderBookSnapshot snapshot_at(Sequence sequence) {
        OrderBookSnapshot snapshot;
        snapshot.symbol = "BTCUSDT";
        snapshot.sequence = sequence;
        snapshot.bids = {{100, 50, 2}, {99, 30, 1}};
        snapshot.asks = {{101, 40, 3}};
        snapshot.checksum = OrderBook::snapshot_checksum(snapshot.bids, snapshot.asks);
        return snapshot;
    }

    static OrderBookDelta delta_at(Sequence prev, Sequence sequence) {
        OrderBookDelta delta;
        delta.symbol = "BTCUSDT";
        delta.prev_sequence = prev;
        delta.sequence = sequence;
        delta.bid_updates = {{98, 25, 1}};
        delta.ask_deletions = {101};
        return delta;
    }

    std::unique_ptr<ReplayEngine> engine;
};

TEST_F(ReplayEngineTest, InitialState) {
    EXPECT_EQ(engine->state(), SyncState::UNINITIALIZED);
    EXPECT_EQ(engine->last_applied_sequence(), 0u);
    EXPECT_FALSE(engine->needs_resync());
    EXPECT_FALSE(engine->is_halted());
    EXPECT_EQ(engine->symbol(), "BTCUSDT");
}

TEST_F(ReplayEngineTest, InOrderEventsAppliedOnce) {
    for (Sequence seq = 1; seq <= 10; ++seq) {
        EXPECT_EQ(engine->process_event(order_at(seq)), ReplayError::NONE);
    }

    const ReplayStats stats = engine->get_stats();
    EXPECT_EQ(stats.orders_processed, 10u);
    EXPECT_EQ(engine->last_applied_sequence(), 10u);
    EXPECT_EQ(engine->state(), SyncState::SYNCED);
    EXPECT_EQ(engine->order_book().order_count(), 10u);
    EXPECT_EQ(engine->order_book().get_bid_size_at(100), std::optional<Quantity>(100));
}

TEST_F(ReplayEngineTest, RedeliveryIsNoOp) {
    for (Sequence seq = 1; seq <= 5; ++seq) {
        engine->process_event(order_at(seq));
    }
    const uint64_t checksum = engine->order_book().get_checksum();

    for (Sequence seq = 1; seq <= 5; ++seq) {
        EXPECT_EQ(engine->process_event(order_at(seq)), ReplayError::NONE);
    }

    const ReplayStats stats = engine->get_stats();
    EXPECT_EQ(stats.orders_processed, 5u);
    EXPECT_EQ(stats.duplicates_ignored, 5u);
    EXPECT_EQ(engine->order_book().get_checksum(), checksum);
}

TEST_F(ReplayEngineTest, OutOfOrderReachesSameCounters) {
    ReplayEngine in_order("BTCUSDT");
    in_order.process_event(order_at(1));
    in_order.process_event(order_at(2));
    in_order.process_event(order_at(3));

    engine->process_event(order_at(1));
    engine->process_event(order_at(3));
    EXPECT_EQ(engine->get_stats().orders_processed, 1u);
    EXPECT_EQ(engine->buffered_count(), 1u);

    engine->process_event(order_at(2));

    EXPECT_EQ(engine->get_stats().orders_processed, in_order.get_stats().orders_processed);
    EXPECT_EQ(engine->last_applied_sequence(), 3u);
    EXPECT_EQ(engine->buffered_count(), 0u);
    EXPECT_EQ(engine->get_stats().events_buffered, 1u);

    const auto depth = engine->order_book().get_depth(10);
    const auto expected = in_order.order_book().get_depth(10);
    EXPECT_EQ(depth.first, expected.first);
    EXPECT_EQ(depth.second, expected.second);
}

TEST_F(ReplayEngineTest, BufferedDuplicateIsIgnored) {
    engine->process_event(order_at(1));
    engine->process_event(order_at(3));
    engine->process_event(order_at(3));

    EXPECT_EQ(engine->buffered_count(), 1u);
    EXPECT_EQ(engine->get_stats().duplicates_ignored, 1u);
}

TEST_F(ReplayEngineTest, TradesAreSequencedButDoNotTouchBook) {
    engine->process_event(order_at(1));
    const uint64_t checksum = engine->order_book().get_checksum();

    engine->process_event(trade_at(2));

    EXPECT_EQ(engine->get_stats().trades_processed, 1u);
    EXPECT_EQ(engine->last_applied_sequence(), 2u);
    EXPECT_EQ(engine->order_book().get_checksum(), checksum);
}

TEST_F(ReplayEngineTest, FirstEventEstablishesBaseline) {
    EXPECT_EQ(engine->process_event(order_at(500)), ReplayError::NONE);

    EXPECT_EQ(engine->last_applied_sequence(), 500u);
    EXPECT_EQ(engine->get_stats().orders_processed, 1u);
    EXPECT_EQ(engine->state(), SyncState::SYNCED);
}

TEST_F(ReplayEngineTest, ModifyAndDeleteMutateBook) {
    engine->process_event(order_at(1, 7, 100));

    OrderUpdate modify = order_at(2, 7, 102);
    modify.update_type = UpdateType::MODIFY;
    modify.quantity = 25;
    engine->process_event(modify);

    EXPECT_FALSE(engine->order_book().get_bid_size_at(100).has_value());
    EXPECT_EQ(engine->order_book().get_bid_size_at(102), std::optional<Quantity>(25));

    OrderUpdate del = order_at(3, 7, 102);
    del.update_type = UpdateType::DELETE;
    del.quantity = 0;
    engine->process_event(del);

    EXPECT_FALSE(engine->order_book().best_bid().has_value());
    EXPECT_EQ(engine->get_stats().orders_processed, 3u);
}

TEST_F(ReplayEngineTest, IcebergUpdateKeepsHiddenQuantity) {
    OrderUpdate iceberg = order_at(1, 1, 100);
    iceberg.quantity = 1000;
    iceberg.is_iceberg = true;
    iceberg.visible_quantity = 100;
    engine->process_event(iceberg);

    EXPECT_EQ(engine->order_book().get_bid_size_at(100), std::optional<Quantity>(1000));
}

TEST_F(ReplayEngineTest, SnapshotLoadsBook) {
    EXPECT_EQ(engine->process_event(snapshot_at(100)), ReplayError::NONE);

    EXPECT_EQ(engine->last_applied_sequence(), 100u);
    EXPECT_EQ(engine->state(), SyncState::SYNCED);
    EXPECT_EQ(engine->order_book().best_bid(), std::optional<Price>(100));
    EXPECT_EQ(engine->order_book().best_ask(), std::optional<Price>(101));

    const ReplayStats stats = engine->get_stats();
    EXPECT_EQ(stats.snapshots_processed, 1u);
    EXPECT_EQ(stats.checksum_errors, 0u);
    EXPECT_EQ(engine->snapshot_manager().size(), 1u);
}

TEST_F(ReplayEngineTest, SnapshotBehindLastAppliedStillApplies) {
    for (Sequence seq = 1; seq <= 20; ++seq) {
        engine->process_event(order_at(seq));
    }

    EXPECT_EQ(engine->process_event(snapshot_at(10)), ReplayError::NONE);
    EXPECT_EQ(engine->last_applied_sequence(), 10u);
    EXPECT_EQ(engine->order_book().order_count(), 0u);
}

TEST_F(ReplayEngineTest, DeltaAppliesWhenChained) {
    engine->process_event(snapshot_at(10));

    EXPECT_EQ(engine->process_event(delta_at(10, 11)), ReplayError::NONE);

    EXPECT_EQ(engine->last_applied_sequence(), 11u);
    EXPECT_EQ(engine->get_stats().deltas_processed, 1u);
    EXPECT_EQ(engine->order_book().get_bid_size_at(98), std::optional<Quantity>(25));
    EXPECT_FALSE(engine->order_book().best_ask().has_value());
}

TEST_F(ReplayEngineTest, MismatchedDeltaIsRejected) {
    engine->process_event(snapshot_at(10));
    const ReplayStats before = engine->get_stats();
    const uint64_t checksum = engine->order_book().get_checksum();

    EXPECT_EQ(engine->process_event(delta_at(11, 12)), ReplayError::SEQUENCE_GAP);

    const ReplayStats after = engine->get_stats();
    EXPECT_EQ(after.deltas_processed, before.deltas_processed);
    EXPECT_EQ(after.orders_processed, before.orders_processed);
    EXPECT_EQ(after.snapshots_processed, before.snapshots_processed);
    EXPECT_EQ(after.delta_rejections, 1u);
    EXPECT_EQ(engine->last_applied_sequence(), 10u);
    EXPECT_EQ(engine->order_book().get_checksum(), checksum);
}

TEST_F(ReplayEngineTest, DeltaWithoutBaselineIsRejected) {
    EXPECT_EQ(engine->process_event(delta_at(0, 1)), ReplayError::SEQUENCE_GAP);
    EXPECT_EQ(engine->state(), SyncState::UNINITIALIZED);
}

TEST_F(ReplayEngineTest, StaleDeltaIsDuplicate) {
    engine->process_event(snapshot_at(10));
    engine->process_event(delta_at(10, 11));

    EXPECT_EQ(engine->process_event(delta_at(10, 11)), ReplayError::NONE);
    EXPECT_EQ(engine->get_stats().deltas_processed, 1u);
    EXPECT_EQ(engine->get_stats().duplicates_ignored, 1u);
}

TEST_F(ReplayEngineTest, DeltaDrainsBufferedSuccessor) {
    engine->process_event(snapshot_at(10));
    engine->process_event(order_at(12));
    EXPECT_EQ(engine->buffered_count(), 1u);

    engine->process_event(delta_at(10, 11));

    EXPECT_EQ(engine->last_applied_sequence(), 12u);
    EXPECT_EQ(engine->get_stats().orders_processed, 1u);
}

TEST_F(ReplayEngineTest, GapThenSnapshotSupersedesBufferedEvent) {
    ReplayConfig config;
    config.max_sequence_gap = 5;
    reset_engine(config);

    engine->process_event(order_at(1));
    engine->process_event(order_at(10));

    EXPECT_EQ(engine->get_stats().orders_processed, 1u);
    EXPECT_EQ(engine->state(), SyncState::GAP_DETECTED);
    EXPECT_TRUE(engine->needs_resync());
    EXPECT_EQ(engine->get_stats().sequence_gaps, 1u);

    EXPECT_EQ(engine->process_event(snapshot_at(10)), ReplayError::NONE);

    EXPECT_EQ(engine->last_applied_sequence(), 10u);
    EXPECT_EQ(engine->get_stats().orders_processed, 1u);
    EXPECT_EQ(engine->buffered_count(), 0u);
    EXPECT_EQ(engine->state(), SyncState::SYNCED);
    EXPECT_FALSE(engine->needs_resync());
}

TEST_F(ReplayEngineTest, SnapshotDrainsLaterBufferedEvents) {
    engine->process_event(order_at(1));
    engine->process_event(order_at(11));
    engine->process_event(order_at(12));

    engine->process_event(snapshot_at(10));

    EXPECT_EQ(engine->last_applied_sequence(), 12u);
    EXPECT_EQ(engine->get_stats().orders_processed, 3u);
    EXPECT_EQ(engine->order_book().order_count(), 2u);
}

TEST_F(ReplayEngineTest, GapClosesWhenMissingEventsArrive) {
    ReplayConfig config;
    config.max_sequence_gap = 2;
    reset_engine(config);

    engine->process_event(order_at(1));
    engine->process_event(order_at(5));
    EXPECT_TRUE(engine->needs_resync());

    engine->process_event(order_at(2));
    engine->process_event(order_at(3));
    engine->process_event(order_at(4));

    EXPECT_EQ(engine->last_applied_sequence(), 5u);
    EXPECT_EQ(engine->state(), SyncState::SYNCED);
}

TEST_F(ReplayEngineTest, FullBufferEvictsOldest) {
    ReplayConfig config;
    config.buffer_size = 2;
    reset_engine(config);

    engine->process_event(order_at(1));
    engine->process_event(order_at(3));
    engine->process_event(order_at(4));
    engine->process_event(order_at(5));  // Evicts 3

    EXPECT_EQ(engine->buffered_count(), 2u);
    EXPECT_EQ(engine->get_stats().buffer_overflows, 1u);

    // 3 is lost: delivering 2 cannot bridge to 4
    engine->process_event(order_at(2));
    EXPECT_EQ(engine->last_applied_sequence(), 2u);
    EXPECT_EQ(engine->buffered_count(), 2u);
    EXPECT_TRUE(engine->needs_resync());
}

TEST_F(ReplayEngineTest, EvictionKeepsResyncFlaggedUntilSnapshot) {
    ReplayConfig config;
    config.buffer_size = 2;
    reset_engine(config);

    engine->process_event(order_at(1));
    engine->process_event(order_at(3));
    engine->process_event(order_at(4));
    EXPECT_FALSE(engine->needs_resync());

    engine->process_event(order_at(5));  // Evicts 3
    EXPECT_EQ(engine->state(), SyncState::GAP_DETECTED);

    engine->process_event(order_at(2));
    for (Sequence seq = 6; seq < 50; ++seq) {
        engine->process_event(order_at(seq));
    }

    EXPECT_EQ(engine->last_applied_sequence(), 2u);
    EXPECT_EQ(engine->state(), SyncState::GAP_DETECTED);
    EXPECT_TRUE(engine->needs_resync());
    EXPECT_EQ(engine->get_stats().sequence_gaps, 1u);
    EXPECT_EQ(engine->get_stats().buffer_overflows, 45u);

    engine->process_event(snapshot_at(49));
    EXPECT_EQ(engine->state(), SyncState::SYNCED);
    EXPECT_FALSE(engine->needs_resync());
    EXPECT_EQ(engine->buffered_count(), 0u);
}

TEST_F(ReplayEngineTest, ResentEvictedEventClosesGap) {
    ReplayConfig config;
    config.buffer_size = 2;
    reset_engine(config);

    engine->process_event(order_at(1));
    engine->process_event(order_at(3));
    engine->process_event(order_at(4));
    engine->process_event(order_at(5));  // Evicts 3
    engine->process_event(order_at(2));
    EXPECT_TRUE(engine->needs_resync());

    engine->process_event(order_at(3));

    EXPECT_EQ(engine->last_applied_sequence(), 5u);
    EXPECT_EQ(engine->buffered_count(), 0u);
    EXPECT_EQ(engine->state(), SyncState::SYNCED);
}

TEST_F(ReplayEngineTest, DroppedEventKeepsGapOpen) {
    ReplayConfig config;
    config.buffer_size = 0;
    config.max_sequence_gap = 5;
    reset_engine(config);

    engine->process_event(order_at(1));
    engine->process_event(order_at(10));  // Flagged and dropped
    EXPECT_TRUE(engine->needs_resync());

    engine->process_event(order_at(2));
    EXPECT_EQ(engine->last_applied_sequence(), 2u);
    EXPECT_EQ(engine->state(), SyncState::GAP_DETECTED);
    EXPECT_TRUE(engine->needs_resync());
    EXPECT_EQ(engine->get_stats().buffer_overflows, 1u);
}

TEST_F(ReplayEngineTest, DropWithinGapLimitStillFlagsResync) {
    ReplayConfig config;
    config.buffer_size = 0;
    reset_engine(config);

    engine->process_event(order_at(1));
    engine->process_event(order_at(3));
    engine->process_event(order_at(2));

    EXPECT_EQ(engine->last_applied_sequence(), 2u);
    EXPECT_TRUE(engine->needs_resync());
    EXPECT_EQ(engine->get_stats().sequence_gaps, 1u);
}

TEST_F(ReplayEngineTest, ChecksumMismatchWarnsByDefault) {
    OrderBookSnapshot snapshot = snapshot_at(10);
    snapshot.checksum ^= 0xdeadbeef;

    EXPECT_EQ(engine->process_event(snapshot), ReplayError::NONE);

    EXPECT_EQ(engine->get_stats().checksum_errors, 1u);
    EXPECT_EQ(engine->get_stats().snapshots_processed, 1u);
    EXPECT_EQ(engine->last_applied_sequence(), 10u);
    EXPECT_EQ(engine->metrics().get_snapshot().checksum_mismatches, 1u);
    EXPECT_EQ(engine->metrics().get_snapshot().checksum_matches, 0u);
}

TEST_F(ReplayEngineTest, ChecksumMismatchCanBeFatal) {
    ReplayConfig config;
    config.fatal_checksum_mismatch = true;
    reset_engine(config);

    OrderBookSnapshot snapshot = snapshot_at(10);
    snapshot.checksum ^= 0xdeadbeef;

    EXPECT_EQ(engine->process_event(snapshot), ReplayError::CHECKSUM_MISMATCH);
    EXPECT_EQ(engine->get_stats().checksum_errors, 1u);
    EXPECT_EQ(engine->get_stats().snapshots_processed, 0u);
    EXPECT_FALSE(engine->order_book().best_bid().has_value());
    EXPECT_EQ(engine->state(), SyncState::UNINITIALIZED);

    EXPECT_EQ(engine->process_event(snapshot_at(10)), ReplayError::NONE);
}

TEST_F(ReplayEngineTest, ChecksumValidationCanBeDisabled) {
    ReplayConfig config;
    config.validate_checksums = false;
    reset_engine(config);

    OrderBookSnapshot snapshot = snapshot_at(10);
    snapshot.checksum = 1;
    engine->process_event(snapshot);

    EXPECT_EQ(engine->get_stats().checksum_errors, 0u);
}

TEST_F(ReplayEngineTest, MarketEventsBypassSequencing) {
    engine->process_event(order_at(1));

    MarketEvent halt;
    halt.event_type = MarketEventType::TRADING_HALT;
    halt.symbol = "BTCUSDT";
    EXPECT_EQ(engine->process_event(halt), ReplayError::NONE);
    EXPECT_TRUE(engine->is_halted());
    EXPECT_EQ(engine->last_applied_sequence(), 1u);

    MarketEvent other;
    other.event_type = MarketEventType::TRADING_RESUME;
    other.symbol = "ETHUSDT";
    engine->process_event(other);
    EXPECT_TRUE(engine->is_halted());

    MarketEvent resume;
    resume.event_type = MarketEventType::TRADING_RESUME;
    engine->process_event(resume);
    EXPECT_FALSE(engine->is_halted());

    MarketEvent breaker;
    breaker.event_type = MarketEventType::CIRCUIT_BREAKER;
    engine->process_event(breaker);
    EXPECT_TRUE(engine->is_halted());

    EXPECT_EQ(engine->get_stats().market_events, 4u);
}

TEST_F(ReplayEngineTest, LatencyTracking) {
    engine->process_event(order_at(1));
    engine->process_event(order_at(2));

    OrderUpdate skewed = order_at(3);
    skewed.local_time = skewed.exchange_time - 1;  // Clock skew: not sampled
    engine->process_event(skewed);

    const LatencyPercentiles p = engine->latency_tracker().get_percentiles();
    EXPECT_EQ(p.count, 2u);
    EXPECT_EQ(p.p50, 500u);
}

TEST_F(ReplayEngineTest, LatencyTrackingCanBeDisabled) {
    ReplayConfig config;
    config.track_latency = false;
    reset_engine(config);

    engine->process_event(order_at(1));
    EXPECT_EQ(engine->latency_tracker().sample_count(), 0u);
}

TEST_F(ReplayEngineTest, ConcurrentCallersRecordEveryLatencySample) {
    ReplayConfig config;
    config.latency_samples = 32768;
    reset_engine(config);

    const Sequence per_thread = 5000;
    std::vector<std::thread> workers;
    for (Sequence t = 0; t < 4; ++t) {
        workers.emplace_back([this, t, per_thread]() {
            for (Sequence i = 1; i <= per_thread; ++i) {
                engine->process_event(order_at(t * per_thread + i));
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(engine->latency_tracker().total_recorded(), 4 * per_thread);
}

TEST_F(ReplayEngineTest, MetricsFollowAppliedEvents) {
    engine->process_event(snapshot_at(1));
    engine->process_event(order_at(2, 7, 98));

    OrderUpdate modify = order_at(3, 7, 97);
    modify.update_type = UpdateType::MODIFY;
    modify.quantity = 4;
    engine->process_event(modify);

    OrderUpdate remove = order_at(4, 7, 97);
    remove.update_type = UpdateType::DELETE;
    engine->process_event(remove);

    engine->process_event(trade_at(5));
    engine->process_event(order_at(5));  // Duplicate: not counted

    const MetricsSnapshot metrics = engine->metrics().get_snapshot();
    EXPECT_EQ(metrics.symbol, "BTCUSDT");
    EXPECT_EQ(metrics.snapshots_processed, 1u);
    EXPECT_EQ(metrics.checksum_matches, 1u);
    EXPECT_EQ(metrics.orders_added, 1u);
    EXPECT_EQ(metrics.orders_modified, 1u);
    EXPECT_EQ(metrics.orders_cancelled, 1u);
    EXPECT_EQ(metrics.volume_added, 10u);
    EXPECT_EQ(metrics.volume_cancelled, 4u);
    EXPECT_EQ(metrics.trades_executed, 1u);
    EXPECT_EQ(metrics.volume_traded, 1u);
    EXPECT_EQ(metrics.max_bid_levels, 3u);
    EXPECT_EQ(metrics.max_ask_levels, 1u);
    EXPECT_EQ(metrics.spread_samples, 5u);
    EXPECT_EQ(metrics.min_spread, 1);
    EXPECT_EQ(metrics.max_spread, 1);
}

TEST_F(ReplayEngineTest, MetricsCanBeDisabled) {
    ReplayConfig config;
    config.track_metrics = false;
    reset_engine(config);

    engine->process_event(order_at(1));
    engine->process_event(trade_at(2));

    const MetricsSnapshot metrics = engine->metrics().get_snapshot();
    EXPECT_EQ(metrics.orders_added, 0u);
    EXPECT_EQ(metrics.trades_executed, 0u);
    EXPECT_EQ(metrics.spread_samples, 0u);
    EXPECT_EQ(engine->get_stats().orders_processed, 1u);
}

TEST_F(ReplayEngineTest, SnapshotDue) {
    ReplayConfig config;
    config.snapshot_interval = 5;
    reset_engine(config);

    engine->process_event(snapshot_at(1));
    for (Sequence seq = 2; seq <= 5; ++seq) {
        engine->process_event(order_at(seq));
    }
    EXPECT_FALSE(engine->snapshot_due());

    engine->process_event(order_at(6));
    EXPECT_TRUE(engine->snapshot_due());
}

TEST(ReplayErrorTest, Names) {
    EXPECT_STREQ(replay_error_to_string(ReplayError::NONE), "NONE");
    EXPECT_STREQ(replay_error_to_string(ReplayError::SEQUENCE_GAP), "SEQUENCE_GAP");
    EXPECT_STREQ(replay_error_to_string(ReplayError::CHECKSUM_MISMATCH), "CHECKSUM_MISMATCH");
    EXPECT_STREQ(sync_state_to_string(SyncState::GAP_DETECTED), "GAP_DETECTED");
}

TEST(ReplayConfigTest, Defaults) {
    const ReplayConfig config;
    EXPECT_EQ(config.max_sequence_gap, 100u);
    EXPECT_TRUE(config.validate_checksums);
    EXPECT_EQ(config.buffer_size, 100000u);
    EXPECT_EQ(config.snapshot_interval, 10000u);
    EXPECT_TRUE(config.track_latency);
    EXPECT_FALSE(config.fatal_checksum_mismatch);
    EXPECT_TRUE(config.track_metrics);
}
