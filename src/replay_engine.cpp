#include "replay_engine.hpp"
#include <algorithm>
#include <iostream>
#include <utility>

namespace LobReplay {

const char* replay_error_to_string(ReplayError error) noexcept {
    switch (error) {
        case ReplayError::NONE: return "NONE";
        case ReplayError::SEQUENCE_GAP: return "SEQUENCE_GAP";
        case ReplayError::CHECKSUM_MISMATCH: return "CHECKSUM_MISMATCH";
    }
    return "UNKNOWN";
}

const char* sync_state_to_string(SyncState state) noexcept {
    switch (state) {
        case SyncState::UNINITIALIZED: return "UNINITIALIZED";
        case SyncState::SYNCED: return "SYNCED";
        case SyncState::GAP_DETECTED: return "GAP_DETECTED";
    }
    return "UNKNOWN";
}

ReplayEngine::ReplayEngine(const std::string& symbol, const ReplayConfig& config)
    : ReplayEngine(Instrument(symbol), config) {}

ReplayEngine::ReplayEngine(const Instrument& instrument, const ReplayConfig& config)
    : config_(config),
      book_(instrument),
      snapshot_manager_(config.snapshot_interval, config.max_snapshots),
      latency_tracker_(config.latency_samples),
      metrics_(instrument.symbol),
      overflow_reported_(false),
      lost_through_(0),
      last_applied_sequence_(0),
      last_snapshot_sequence_(0),
      state_(SyncState::UNINITIALIZED),
      halted_(false),
      buffered_count_(0) {}

ReplayError ReplayEngine::process_event(const OrderBookEvent& event) {
    std::lock_guard<std::mutex> lock(process_mutex_);

    // The latency tracker has a single writer: record under the lock
    if (config_.track_latency) {
        record_latency(event);
    }

    if (const auto* market = std::get_if<MarketEvent>(&event)) {
        apply_market_event(*market);
        return ReplayError::NONE;
    }

    if (const auto* snapshot = std::get_if<OrderBookSnapshot>(&event)) {
        return apply_snapshot(*snapshot);
    }

    const bool initialized = state_.load(std::memory_order_relaxed) != SyncState::UNINITIALIZED;
    const Sequence last = last_applied_sequence_.load(std::memory_order_relaxed);

    if (const auto* delta = std::get_if<OrderBookDelta>(&event)) {
        if (initialized && delta->sequence <= last) {
            counters_.duplicates_ignored.fetch_add(1, std::memory_order_relaxed);
            return ReplayError::NONE;
        }
        if (!initialized || delta->prev_sequence != last) {
            counters_.delta_rejections.fetch_add(1, std::memory_order_relaxed);
            std::cerr << "WARNING: [" << book_.symbol() << "] delta rejected, sequence="
                      << delta->sequence << " prev_sequence=" << delta->prev_sequence
                      << " last_applied=" << last << "\n";
            return ReplayError::SEQUENCE_GAP;
        }
        return apply_delta(*delta);
    }

    // Order updates and trades
    const Sequence sequence = *event_sequence(event);
    if (initialized && sequence <= last) {
        counters_.duplicates_ignored.fetch_add(1, std::memory_order_relaxed);
        return ReplayError::NONE;
    }

    if (!initialized || sequence == last + 1) {
        apply_sequenced(event, sequence);
        drain_buffer();
        return ReplayError::NONE;
    }

    buffer_event(event, sequence, last);
    return ReplayError::NONE;
}

void ReplayEngine::record_latency(const OrderBookEvent& event) noexcept {
    const std::optional<Timestamp> local_time = event_local_time(event);
    if (!local_time) {
        return;
    }
    const Timestamp exchange_time = event_exchange_time(event);
    if (*local_time >= exchange_time) {
        latency_tracker_.record(*local_time - exchange_time);
    }
}

void ReplayEngine::apply_market_event(const MarketEvent& event) noexcept {
    counters_.market_events.fetch_add(1, std::memory_order_relaxed);

    if (event.symbol && *event.symbol != book_.symbol()) {
        return;
    }

    switch (event.event_type) {
        case MarketEventType::TRADING_HALT:
        case MarketEventType::CIRCUIT_BREAKER:
            halted_.store(true, std::memory_order_release);
            break;
        case MarketEventType::TRADING_RESUME:
        case MarketEventType::MARKET_OPEN:
            halted_.store(false, std::memory_order_release);
            break;
        default:
            break;
    }
}

ReplayError ReplayEngine::apply_snapshot(const OrderBookSnapshot& snapshot) {
    if (config_.validate_checksums && config_.fatal_checksum_mismatch) {
        const uint32_t expected = book_.expected_checksum(snapshot.bids, snapshot.asks);
        metrics_.record_checksum(expected == snapshot.checksum);
        if (expected != snapshot.checksum) {
            counters_.checksum_errors.fetch_add(1, std::memory_order_relaxed);
            std::cerr << "ERROR: [" << book_.symbol() << "] snapshot rejected, checksum mismatch at sequence="
                      << snapshot.sequence << " expected=" << expected
                      << " received=" << snapshot.checksum << "\n";
            return ReplayError::CHECKSUM_MISMATCH;
        }
    }

    book_.load_snapshot(snapshot.bids, snapshot.asks);

    if (config_.validate_checksums && !config_.fatal_checksum_mismatch) {
        const uint32_t actual = static_cast<uint32_t>(book_.get_checksum());
        metrics_.record_checksum(actual == snapshot.checksum);
        if (actual != snapshot.checksum) {
            counters_.checksum_errors.fetch_add(1, std::memory_order_relaxed);
            std::cerr << "WARNING: [" << book_.symbol() << "] checksum mismatch at sequence="
                      << snapshot.sequence << " book=" << actual
                      << " snapshot=" << snapshot.checksum << "\n";
        }
    }

    const SyncState previous = state_.exchange(SyncState::SYNCED, std::memory_order_acq_rel);
    last_applied_sequence_.store(snapshot.sequence, std::memory_order_release);
    last_snapshot_sequence_.store(snapshot.sequence, std::memory_order_release);
    counters_.snapshots_processed.fetch_add(1, std::memory_order_relaxed);
    snapshot_manager_.store_snapshot(snapshot);
    overflow_reported_ = false;
    lost_through_ = 0;
    metrics_.record_snapshot();
    sample_book();

    if (config_.verbose) {
        std::cout << "[" << book_.symbol() << "] snapshot applied, sequence=" << snapshot.sequence
                  << " bids=" << snapshot.bids.size() << " asks=" << snapshot.asks.size()
                  << (previous == SyncState::GAP_DETECTED ? " (resynced)" : "") << "\n";
    }

    discard_buffered_through(snapshot.sequence);
    drain_buffer();
    return ReplayError::NONE;
}

ReplayError ReplayEngine::apply_delta(const OrderBookDelta& delta) {
    for (const LevelUpdate& level : delta.bid_updates) {
        book_.apply_level_update(Side::BUY, level.price, level.quantity, level.order_count);
    }
    for (const LevelUpdate& level : delta.ask_updates) {
        book_.apply_level_update(Side::SELL, level.price, level.quantity, level.order_count);
    }
    for (Price price : delta.bid_deletions) {
        book_.remove_level(Side::BUY, price);
    }
    for (Price price : delta.ask_deletions) {
        book_.remove_level(Side::SELL, price);
    }

    last_applied_sequence_.store(delta.sequence, std::memory_order_release);
    counters_.deltas_processed.fetch_add(1, std::memory_order_relaxed);
    sample_book();

    // A delta may jump past buffered events; those can no longer apply
    discard_buffered_through(delta.sequence);
    drain_buffer();
    return ReplayError::NONE;
}

void ReplayEngine::apply_sequenced(const OrderBookEvent& event, Sequence sequence) {
    if (const auto* update = std::get_if<OrderUpdate>(&event)) {
        apply_order_update(*update);
        counters_.orders_processed.fetch_add(1, std::memory_order_relaxed);
    } else if (const auto* trade = std::get_if<TradeEvent>(&event)) {
        counters_.trades_processed.fetch_add(1, std::memory_order_relaxed);
        if (config_.track_metrics) {
            metrics_.record_trade(trade->quantity, trade->exchange_time);
        }
    }
    sample_book();

    last_applied_sequence_.store(sequence, std::memory_order_release);

    SyncState expected = SyncState::UNINITIALIZED;
    state_.compare_exchange_strong(expected, SyncState::SYNCED, std::memory_order_acq_rel);
}

void ReplayEngine::apply_order_update(const OrderUpdate& update) {
    switch (update.update_type) {
        case UpdateType::ADD:
        case UpdateType::MODIFY: {
            Order order(update.order_id, update.side, update.price, update.quantity);
            order.is_iceberg = update.is_iceberg;
            order.visible_quantity = update.is_iceberg ? update.visible_quantity : update.quantity;
            order.timestamp = update.exchange_time;
            // add_order replaces a resting order with the same id
            book_.add_order(order);
            if (config_.track_metrics) {
                if (update.update_type == UpdateType::ADD) {
                    metrics_.record_order_add(update.quantity, update.exchange_time);
                } else {
                    metrics_.record_order_modify(update.exchange_time);
                }
            }
            break;
        }
        case UpdateType::DELETE: {
            const std::optional<Order> removed = book_.cancel_order(update.order_id);
            if (removed && config_.track_metrics) {
                metrics_.record_order_cancel(removed->quantity, update.exchange_time);
            }
            break;
        }
    }
}

void ReplayEngine::sample_book() {
    if (!config_.track_metrics) {
        return;
    }

    if (const std::optional<Price> spread = book_.get_spread()) {
        metrics_.record_spread(*spread);
    }

    const auto [bids, asks] = book_.top_volume(METRICS_DEPTH_LEVELS);
    metrics_.record_depth(book_.level_count(Side::BUY), book_.level_count(Side::SELL), bids, asks);
}

void ReplayEngine::buffer_event(const OrderBookEvent& event, Sequence sequence, Sequence last_applied) {
    const Sequence gap = sequence - last_applied - 1;
    if (gap > config_.max_sequence_gap) {
        flag_gap(last_applied, "sequence gap exceeds limit");
    }

    if (pending_.count(sequence) > 0) {
        counters_.duplicates_ignored.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    if (pending_.size() >= config_.buffer_size) {
        counters_.buffer_overflows.fetch_add(1, std::memory_order_relaxed);
        if (!overflow_reported_) {
            overflow_reported_ = true;
            std::cerr << "WARNING: [" << book_.symbol() << "] reorder buffer full ("
                      << config_.buffer_size << " events), evicting oldest\n";
        }

        // The gap cannot close until the discarded sequence is applied again
        // or superseded by a snapshot or delta
        flag_gap(last_applied, "events discarded by full reorder buffer");
        if (pending_.empty()) {
            lost_through_ = std::max(lost_through_, sequence);
            return;
        }
        lost_through_ = std::max(lost_through_, pending_.begin()->first);
        pending_.erase(pending_.begin());
    }

    pending_.emplace(sequence, event);
    counters_.events_buffered.fetch_add(1, std::memory_order_relaxed);
    buffered_count_.store(pending_.size(), std::memory_order_release);
}

void ReplayEngine::flag_gap(Sequence last_applied, const char* reason) {
    if (state_.load(std::memory_order_relaxed) == SyncState::GAP_DETECTED) {
        return;
    }
    state_.store(SyncState::GAP_DETECTED, std::memory_order_release);
    counters_.sequence_gaps.fetch_add(1, std::memory_order_relaxed);
    std::cerr << "WARNING: [" << book_.symbol() << "] " << reason
              << " after sequence=" << last_applied << ", resync required\n";
}

void ReplayEngine::drain_buffer() {
    while (!pending_.empty()) {
        auto it = pending_.begin();
        const Sequence last = last_applied_sequence_.load(std::memory_order_relaxed);
        if (it->first != last + 1) {
            break;
        }

        const Sequence sequence = it->first;
        OrderBookEvent next = std::move(it->second);
        pending_.erase(it);
        apply_sequenced(next, sequence);
    }

    buffered_count_.store(pending_.size(), std::memory_order_release);

    // Every outstanding event arrived, including any discarded ones; the gap
    // closed without a snapshot
    const Sequence applied = last_applied_sequence_.load(std::memory_order_relaxed);
    if (pending_.empty() && applied >= lost_through_ &&
        state_.load(std::memory_order_relaxed) == SyncState::GAP_DETECTED) {
        state_.store(SyncState::SYNCED, std::memory_order_release);
    }
}

void ReplayEngine::discard_buffered_through(Sequence sequence) {
    pending_.erase(pending_.begin(), pending_.upper_bound(sequence));
    buffered_count_.store(pending_.size(), std::memory_order_release);
}

ReplayStats ReplayEngine::get_stats() const noexcept {
    ReplayStats stats;
    stats.orders_processed = counters_.orders_processed.load(std::memory_order_relaxed);
    stats.trades_processed = counters_.trades_processed.load(std::memory_order_relaxed);
    stats.snapshots_processed = counters_.snapshots_processed.load(std::memory_order_relaxed);
    stats.deltas_processed = counters_.deltas_processed.load(std::memory_order_relaxed);
    stats.market_events = counters_.market_events.load(std::memory_order_relaxed);
    stats.sequence_gaps = counters_.sequence_gaps.load(std::memory_order_relaxed);
    stats.checksum_errors = counters_.checksum_errors.load(std::memory_order_relaxed);
    stats.events_buffered = counters_.events_buffered.load(std::memory_order_relaxed);
    stats.duplicates_ignored = counters_.duplicates_ignored.load(std::memory_order_relaxed);
    stats.buffer_overflows = counters_.buffer_overflows.load(std::memory_order_relaxed);
    stats.delta_rejections = counters_.delta_rejections.load(std::memory_order_relaxed);
    return stats;
}

Sequence ReplayEngine::last_applied_sequence() const noexcept {
    return last_applied_sequence_.load(std::memory_order_acquire);
}

SyncState ReplayEngine::state() const noexcept {
    return state_.load(std::memory_order_acquire);
}

bool ReplayEngine::needs_resync() const noexcept {
    return state() == SyncState::GAP_DETECTED;
}

bool ReplayEngine::snapshot_due() const noexcept {
    return snapshot_manager_.needs_snapshot(last_applied_sequence_.load(std::memory_order_acquire),
                                            last_snapshot_sequence_.load(std::memory_order_acquire));
}

bool ReplayEngine::is_halted() const noexcept {
    return halted_.load(std::memory_order_acquire);
}

size_t ReplayEngine::buffered_count() const noexcept {
    return buffered_count_.load(std::memory_order_acquire);
}

} // namespace LobReplay
