#include "snapshot_manager.hpp"
#include <algorithm>
#include <iterator>
#include <mutex>

namespace LobReplay {

SnapshotManager::SnapshotManager(uint64_t snapshot_interval, size_t max_snapshots)
    : snapshot_interval_(snapshot_interval), max_snapshots_(std::max<size_t>(max_snapshots, 1)) {}

void SnapshotManager::store_snapshot(const OrderBookSnapshot& snapshot) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    snapshots_.insert_or_assign(snapshot.sequence, snapshot);

    while (snapshots_.size() > max_snapshots_) {
        snapshots_.erase(snapshots_.begin());
    }
}

std::optional<OrderBookSnapshot> SnapshotManager::get_snapshot_before(Sequence sequence) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = snapshots_.upper_bound(sequence);
    if (it == snapshots_.begin()) {
        return std::nullopt;
    }
    return std::prev(it)->second;
}

std::optional<OrderBookSnapshot> SnapshotManager::latest() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (snapshots_.empty()) {
        return std::nullopt;
    }
    return snapshots_.rbegin()->second;
}

bool SnapshotManager::needs_snapshot(Sequence current_sequence, Sequence last_snapshot_sequence) const noexcept {
    if (current_sequence < last_snapshot_sequence) {
        return false;
    }
    return current_sequence - last_snapshot_sequence >= snapshot_interval_;
}

size_t SnapshotManager::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return snapshots_.size();
}

void SnapshotManager::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    snapshots_.clear();
}

} // namespace LobReplay
