#include "latency_tracker.hpp"
#include <algorithm>
#include <numeric>

namespace LobReplay {

namespace {

// Nearest-rank percentile over sorted data
uint64_t calculate_percentile(const std::vector<uint64_t>& sorted_data, uint64_t per_mille) noexcept {
    if (sorted_data.empty()) return 0;

    const size_t index = static_cast<size_t>((per_mille * (sorted_data.size() - 1)) / 1000);
    return sorted_data[index];
}

} // namespace

LatencyTracker::LatencyTracker(size_t max_samples)
    : samples_(std::max<size_t>(max_samples, 1)), recorded_(0) {}

void LatencyTracker::record(uint64_t latency_ns) noexcept {
    const uint64_t cursor = recorded_.load(std::memory_order_relaxed);
    samples_[cursor % samples_.size()].store(latency_ns, std::memory_order_relaxed);
    recorded_.store(cursor + 1, std::memory_order_release);
}

LatencyPercentiles LatencyTracker::get_percentiles() const {
    const uint64_t recorded = recorded_.load(std::memory_order_acquire);
    const size_t count = static_cast<size_t>(std::min<uint64_t>(recorded, samples_.size()));

    LatencyPercentiles result;
    if (count == 0) {
        return result;
    }

    std::vector<uint64_t> sorted;
    sorted.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        sorted.push_back(samples_[i].load(std::memory_order_relaxed));
    }
    std::sort(sorted.begin(), sorted.end());

    const uint64_t sum = std::accumulate(sorted.begin(), sorted.end(), uint64_t{0});

    result.count = count;
    result.min = sorted.front();
    result.max = sorted.back();
    result.mean = static_cast<uint64_t>(sum / count);
    result.p50 = calculate_percentile(sorted, 500);
    result.p90 = calculate_percentile(sorted, 900);
    result.p95 = calculate_percentile(sorted, 950);
    result.p99 = calculate_percentile(sorted, 990);
    result.p999 = calculate_percentile(sorted, 999);
    return result;
}

size_t LatencyTracker::sample_count() const noexcept {
    return static_cast<size_t>(std::min<uint64_t>(recorded_.load(std::memory_order_acquire), samples_.size()));
}

uint64_t LatencyTracker::total_recorded() const noexcept {
    return recorded_.load(std::memory_order_acquire);
}

void LatencyTracker::reset() noexcept {
    recorded_.store(0, std::memory_order_release);
}

} // namespace LobReplay
