#pragma once

#include "types.hpp"
#include "events.hpp"
#include <map>
#include <optional>
#include <shared_mutex>

namespace LobReplay {

/**
 * Keeps recent full snapshots indexed by sequence for recovery and
 * checkpointing. Retention is count-bounded: the oldest sequence is evicted
 * once max_snapshots are held.
 */
class SnapshotManager {
private:
    uint64_t snapshot_interval_;
    size_t max_snapshots_;
    mutable std::shared_mutex mutex_;
    std::map<Sequence, OrderBookSnapshot> snapshots_;

public:
    explicit SnapshotManager(uint64_t snapshot_interval = DEFAULT_SNAPSHOT_INTERVAL,
                             size_t max_snapshots = DEFAULT_MAX_SNAPSHOTS);

    /**
     * Store a snapshot under its sequence. A snapshot already stored at the
     * same sequence is replaced.
     */
    void store_snapshot(const OrderBookSnapshot& snapshot);

    /**
     * Latest stored snapshot whose sequence is <= sequence
     */
    std::optional<OrderBookSnapshot> get_snapshot_before(Sequence sequence) const;

    std::optional<OrderBookSnapshot> latest() const;

    /**
     * True once current_sequence is at least snapshot_interval past
     * last_snapshot_sequence
     */
    bool needs_snapshot(Sequence current_sequence, Sequence last_snapshot_sequence) const noexcept;

    size_t size() const;
    void clear();

    uint64_t snapshot_interval() const noexcept { return snapshot_interval_; }
    size_t max_snapshots() const noexcept { return max_snapshots_; }
};

} // namespace LobReplay
