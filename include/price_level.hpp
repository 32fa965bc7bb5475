#pragma once

#include "types.hpp"
#include "seqlock.hpp"
#include <atomic>
#include <optional>
#include <vector>

namespace LobReplay {

/**
 * Quantity and order count of a level, read as one consistent pair.
 */
struct LevelTotals {
    Quantity quantity;
    uint64_t order_count;
    Quantity hidden_quantity;
};

/**
 * Aggregation point for every resting order at one exact price.
 *
 * A level holds an optional L2 baseline (aggregate quantity/count loaded from a
 * snapshot or delta, with no individual order ids) plus individually tracked L3
 * orders. Published totals are baseline + sum of tracked orders.
 *
 * Counters are published through a SeqLock so readers on other threads see
 * quantity, order count and hidden quantity from the same mutation. Mutating
 * calls must be serialized by the owner (OrderBook holds its side lock).
 */
class alignas(64) PriceLevel {
private:
    Price price_;

    SeqLock counters_lock_;
    std::atomic<uint64_t> total_quantity_;
    std::atomic<uint64_t> order_count_;
    std::atomic<uint64_t> hidden_quantity_;

    // Writer-side state
    Quantity base_quantity_;
    uint64_t base_count_;
    std::vector<Order> orders_;

    void publish_totals(Quantity quantity, uint64_t count, Quantity hidden) noexcept;

public:
    explicit PriceLevel(Price price) noexcept;

    PriceLevel(const PriceLevel&) = delete;
    PriceLevel& operator=(const PriceLevel&) = delete;

    /**
     * Add an order's full quantity (including any hidden iceberg part)
     * to the level and count it.
     */
    void add_order(const Order& order);

    /**
     * Remove a tracked order. Returns std::nullopt if the id is not resting here.
     */
    std::optional<Order> remove_order(OrderId order_id) noexcept;

    /**
     * Replace the aggregate L2 state of this level. Tracked L3 orders are
     * dropped; their ids are returned so the caller can unindex them.
     * A positive quantity with a zero count is treated as one order.
     */
    std::vector<OrderId> set_aggregate(Quantity quantity, uint64_t order_count);

    // Non-blocking reads
    Quantity get_quantity() const noexcept;
    uint64_t get_order_count() const noexcept;
    Quantity get_hidden_quantity() const noexcept;
    LevelTotals get_totals() const noexcept;

    bool empty() const noexcept;
    Price price() const noexcept { return price_; }

    // Writer-side view; callers must hold the owner's write lock
    const std::vector<Order>& orders() const noexcept { return orders_; }
    bool contains(OrderId order_id) const noexcept;
};

} // namespace LobReplay
