#pragma once

#include "types.hpp"
#include <atomic>
#include <vector>

namespace LobReplay {

/**
 * Latency percentiles in nanoseconds
 */
struct LatencyPercentiles {
    uint64_t count = 0;
    uint64_t min = 0;
    uint64_t max = 0;
    uint64_t mean = 0;
    uint64_t p50 = 0;
    uint64_t p90 = 0;
    uint64_t p95 = 0;
    uint64_t p99 = 0;
    uint64_t p999 = 0;
};

/**
 * Bounded ring of exchange-to-local latency samples.
 *
 * One writer records; any number of readers compute percentiles without
 * locking. Slots are atomics and the write cursor is published with release
 * ordering, so a reader sees every sample recorded before the cursor it loads.
 * Once full, the oldest sample is overwritten.
 */
class LatencyTracker {
private:
    std::vector<std::atomic<uint64_t>> samples_;
    alignas(64) std::atomic<uint64_t> recorded_;

public:
    explicit LatencyTracker(size_t max_samples = DEFAULT_LATENCY_SAMPLES);

    LatencyTracker(const LatencyTracker&) = delete;
    LatencyTracker& operator=(const LatencyTracker&) = delete;

    void record(uint64_t latency_ns) noexcept;

    LatencyPercentiles get_percentiles() const;

    /**
     * Samples currently retained (at most capacity())
     */
    size_t sample_count() const noexcept;

    uint64_t total_recorded() const noexcept;
    size_t capacity() const noexcept { return samples_.size(); }

    /**
     * Forget all samples. Writer thread only.
     */
    void reset() noexcept;
};

} // namespace LobReplay
