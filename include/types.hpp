#pragma once

#include <cstdint>
#include <chrono>
#include <cstddef>

namespace LobReplay {

// Fixed-point representations: prices in ticks, quantities in lots
using Price = int64_t;
using Quantity = uint64_t;
using OrderId = uint64_t;
using Sequence = uint64_t;
using Timestamp = uint64_t;  // nanoseconds

// Configuration constants
constexpr uint32_t DEFAULT_MAX_SEQUENCE_GAP = 100;
constexpr uint32_t DEFAULT_BUFFER_SIZE = 100000;
constexpr uint32_t DEFAULT_SNAPSHOT_INTERVAL = 10000;
constexpr size_t DEFAULT_MAX_SNAPSHOTS = 100;
constexpr size_t DEFAULT_LATENCY_SAMPLES = 10000;
constexpr size_t CHECKSUM_DEPTH = 25;  // Levels per side folded into the state checksum
constexpr size_t METRICS_DEPTH_LEVELS = 10;  // Levels per side summed into depth metrics
constexpr uint64_t RING_BUFFER_SIZE = 1 << 16;  // 64K events, power of 2

// Enumerations
enum class Side : uint8_t {
    BUY,   // bid side
    SELL   // ask side
};

constexpr Side opposite(Side side) noexcept {
    return side == Side::BUY ? Side::SELL : Side::BUY;
}

constexpr const char* side_to_string(Side side) noexcept {
    return side == Side::BUY ? "BUY" : "SELL";
}

inline Timestamp now_ns() noexcept {
    return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

// Book-level view of a resting order
struct Order {
    OrderId order_id;
    Side side;
    Price price;
    Quantity quantity;           // Full quantity, including any hidden iceberg part
    Quantity original_quantity;
    bool is_iceberg;
    Quantity visible_quantity;   // Only meaningful when is_iceberg
    Timestamp timestamp;

    Order() noexcept;
    Order(OrderId id, Side s, Price p, Quantity q) noexcept;

    /**
     * Displayed part of the order. Non-iceberg orders are fully visible;
     * an iceberg never displays more than it holds.
     */
    Quantity displayed_quantity() const noexcept;

    Quantity hidden_quantity() const noexcept {
        return quantity - displayed_quantity();
    }
};

// Aggregated view of one price level, as carried by snapshots, deltas and depth queries
struct LevelUpdate {
    Price price;
    Quantity quantity;
    uint64_t order_count;

    LevelUpdate() noexcept : price(0), quantity(0), order_count(0) {}
    LevelUpdate(Price p, Quantity q, uint64_t count) noexcept
        : price(p), quantity(q), order_count(count) {}

    bool operator==(const LevelUpdate& other) const noexcept = default;
};

} // namespace LobReplay
