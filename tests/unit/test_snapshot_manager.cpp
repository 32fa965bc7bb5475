#include <gtest/gtest.h>
#include "snapshot_manager.hpp"

using namespace LobReplay;

namespace {

OrderBookSnapshot make_snapshot(Sequence sequence, Price best_bid = 100) {
    OrderBookSnapshot snapshot;
    snapshot.symbol = "BTCUSDT";
    snapshot.sequence = sequence;
    snapshot.bids = {{best_bid, 10, 1}};
    snapshot.asks = {{best_bid + 1, 10, 1}};
    return snapshot;
}

} // namespace

TEST(SnapshotManagerTest, LookupBeforeSequence) {
    SnapshotManager manager(100);
    manager.store_snapshot(make_snapshot(100));
    manager.store_snapshot(make_snapshot(200));

    auto before_150 = manager.get_snapshot_before(150);
    ASSERT_TRUE(before_150.has_value());
    EXPECT_EQ(before_150->sequence, 100u);

    auto before_250 = manager.get_snapshot_before(250);
    ASSERT_TRUE(before_250.has_value());
    EXPECT_EQ(before_250->sequence, 200u);

    EXPECT_FALSE(manager.get_snapshot_before(99).has_value());
}

TEST(SnapshotManagerTest, LookupIsInclusive) {
    SnapshotManager manager;
    manager.store_snapshot(make_snapshot(100));

    auto exact = manager.get_snapshot_before(100);
    ASSERT_TRUE(exact.has_value());
    EXPECT_EQ(exact->sequence, 100u);
}

TEST(SnapshotManagerTest, NeedsSnapshot) {
    SnapshotManager manager(100);

    EXPECT_TRUE(manager.needs_snapshot(300, 200));
    EXPECT_FALSE(manager.needs_snapshot(250, 200));
    EXPECT_TRUE(manager.needs_snapshot(301, 200));
    EXPECT_TRUE(manager.needs_snapshot(100, 0));
    EXPECT_FALSE(manager.needs_snapshot(100, 200));  // Sequence went backwards
}

TEST(SnapshotManagerTest, EvictsOldestBeyondLimit) {
    SnapshotManager manager(10, 3);
    for (Sequence seq = 10; seq <= 50; seq += 10) {
        manager.store_snapshot(make_snapshot(seq));
    }

    EXPECT_EQ(manager.size(), 3u);
    EXPECT_FALSE(manager.get_snapshot_before(25).has_value());
    EXPECT_EQ(manager.get_snapshot_before(35)->sequence, 30u);
    EXPECT_EQ(manager.latest()->sequence, 50u);
}

TEST(SnapshotManagerTest, SameSequenceReplaces) {
    SnapshotManager manager;
    manager.store_snapshot(make_snapshot(100, 100));
    manager.store_snapshot(make_snapshot(100, 500));

    EXPECT_EQ(manager.size(), 1u);
    EXPECT_EQ(manager.latest()->bids[0].price, 500);
}

TEST(SnapshotManagerTest, ClearAndEmpty) {
    SnapshotManager manager;
    EXPECT_FALSE(manager.latest().has_value());

    manager.store_snapshot(make_snapshot(1));
    manager.clear();

    EXPECT_EQ(manager.size(), 0u);
    EXPECT_FALSE(manager.get_snapshot_before(1).has_value());
    EXPECT_EQ(manager.snapshot_interval(), DEFAULT_SNAPSHOT_INTERVAL);
    EXPECT_EQ(manager.max_snapshots(), DEFAULT_MAX_SNAPSHOTS);
}
