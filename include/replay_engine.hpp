#pragma once

#include "types.hpp"
#include "events.hpp"
#include "instrument.hpp"
#include "order_book.hpp"
#include "snapshot_manager.hpp"
#include "latency_tracker.hpp"
#include "performance_metrics.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <string>

namespace LobReplay {

/**
 * Replay configuration
 */
struct ReplayConfig {
    uint32_t max_sequence_gap = DEFAULT_MAX_SEQUENCE_GAP;    // Gap beyond which a resync is flagged
    bool validate_checksums = true;
    uint32_t buffer_size = DEFAULT_BUFFER_SIZE;              // Max out-of-order events held
    uint32_t snapshot_interval = DEFAULT_SNAPSHOT_INTERVAL;  // Sequences between checkpoints
    bool track_latency = true;
    bool fatal_checksum_mismatch = false;                    // Reject mismatching snapshots instead of warning
    size_t max_snapshots = DEFAULT_MAX_SNAPSHOTS;
    size_t latency_samples = DEFAULT_LATENCY_SAMPLES;
    bool verbose = false;                                    // Informational logging to stdout
    bool track_metrics = true;                               // Book activity metrics after every applied event
};

/**
 * Replay statistics. Every counter is monotonic.
 */
struct ReplayStats {
    uint64_t orders_processed = 0;
    uint64_t trades_processed = 0;
    uint64_t snapshots_processed = 0;
    uint64_t deltas_processed = 0;
    uint64_t market_events = 0;
    uint64_t sequence_gaps = 0;        // Transitions into GAP_DETECTED
    uint64_t checksum_errors = 0;
    uint64_t events_buffered = 0;      // Out-of-order events admitted to the buffer
    uint64_t duplicates_ignored = 0;
    uint64_t buffer_overflows = 0;     // Events evicted from or dropped by a full buffer
    uint64_t delta_rejections = 0;
};

enum class SyncState : uint8_t {
    UNINITIALIZED,
    SYNCED,
    GAP_DETECTED
};

/**
 * Result of processing one event. Only a delta whose predecessor does not
 * match, or a snapshot failing a fatal checksum check, is reported; every
 * other anomaly is absorbed into statistics and state.
 */
enum class ReplayError : uint8_t {
    NONE,
    SEQUENCE_GAP,
    CHECKSUM_MISMATCH
};

const char* replay_error_to_string(ReplayError error) noexcept;
const char* sync_state_to_string(SyncState state) noexcept;

/**
 * Per-symbol sequencing state machine that rebuilds and validates an
 * OrderBook from a feed of snapshots, deltas, order updates and trades.
 *
 * Events are applied strictly in sequence. Near-term out-of-order events are
 * buffered and drained once their predecessor arrives, duplicates are
 * suppressed, and a snapshot is always authoritative: it replaces the book and
 * resets the sequence whatever its position in the stream. Deltas are never
 * buffered because they are meaningless without their exact predecessor state.
 *
 * process_event calls are serialized internally; statistics, sequence and
 * state accessors are lock-free reads that never wait on processing.
 */
class ReplayEngine {
private:
    struct Counters {
        std::atomic<uint64_t> orders_processed{0};
        std::atomic<uint64_t> trades_processed{0};
        std::atomic<uint64_t> snapshots_processed{0};
        std::atomic<uint64_t> deltas_processed{0};
        std::atomic<uint64_t> market_events{0};
        std::atomic<uint64_t> sequence_gaps{0};
        std::atomic<uint64_t> checksum_errors{0};
        std::atomic<uint64_t> events_buffered{0};
        std::atomic<uint64_t> duplicates_ignored{0};
        std::atomic<uint64_t> buffer_overflows{0};
        std::atomic<uint64_t> delta_rejections{0};
    };

    ReplayConfig config_;
    OrderBook book_;
    SnapshotManager snapshot_manager_;
    LatencyTracker latency_tracker_;
    PerformanceMetrics metrics_;

    // Processing state, guarded by process_mutex_
    std::mutex process_mutex_;
    std::map<Sequence, OrderBookEvent> pending_;
    bool overflow_reported_;
    Sequence lost_through_;  // Highest sequence discarded by a full buffer since the last snapshot

    // Published state
    std::atomic<Sequence> last_applied_sequence_;
    std::atomic<Sequence> last_snapshot_sequence_;
    std::atomic<SyncState> state_;
    std::atomic<bool> halted_;
    std::atomic<size_t> buffered_count_;
    Counters counters_;

    void record_latency(const OrderBookEvent& event) noexcept;
    void apply_market_event(const MarketEvent& event) noexcept;
    ReplayError apply_snapshot(const OrderBookSnapshot& snapshot);
    ReplayError apply_delta(const OrderBookDelta& delta);
    void apply_sequenced(const OrderBookEvent& event, Sequence sequence);
    void apply_order_update(const OrderUpdate& update);
    void buffer_event(const OrderBookEvent& event, Sequence sequence, Sequence last_applied);
    void flag_gap(Sequence last_applied, const char* reason);
    void sample_book();
    void drain_buffer();
    void discard_buffered_through(Sequence sequence);

public:
    explicit ReplayEngine(const std::string& symbol, const ReplayConfig& config = ReplayConfig());
    explicit ReplayEngine(const Instrument& instrument, const ReplayConfig& config = ReplayConfig());

    ReplayEngine(const ReplayEngine&) = delete;
    ReplayEngine& operator=(const ReplayEngine&) = delete;

    /**
     * Validate, sequence and apply one event.
     * Returns ReplayError::NONE unless the event could not be applied.
     */
    ReplayError process_event(const OrderBookEvent& event);

    /**
     * Statistics snapshot; does not block event processing
     */
    ReplayStats get_stats() const noexcept;

    Sequence last_applied_sequence() const noexcept;
    SyncState state() const noexcept;

    /**
     * True while a gap awaits a snapshot: either it exceeds max_sequence_gap,
     * or events were evicted or dropped so it can never close on its own
     */
    bool needs_resync() const noexcept;

    /**
     * True once snapshot_interval sequences have been applied since the last snapshot
     */
    bool snapshot_due() const noexcept;

    bool is_halted() const noexcept;
    size_t buffered_count() const noexcept;

    const ReplayConfig& config() const noexcept { return config_; }
    const std::string& symbol() const noexcept { return book_.symbol(); }
    const OrderBook& order_book() const noexcept { return book_; }
    OrderBook& order_book() noexcept { return book_; }
    const SnapshotManager& snapshot_manager() const noexcept { return snapshot_manager_; }
    const LatencyTracker& latency_tracker() const noexcept { return latency_tracker_; }
    const PerformanceMetrics& metrics() const noexcept { return metrics_; }
};

} // namespace LobReplay
