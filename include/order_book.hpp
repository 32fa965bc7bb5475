#pragma once

#include "types.hpp"
#include "instrument.hpp"
#include "price_level.hpp"
#include "seqlock.hpp"
#include <atomic>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace LobReplay {

/**
 * Per-symbol aggregated limit order book.
 *
 * Bids iterate in strictly decreasing price, asks in strictly increasing price.
 * Each side is a sorted map of price levels guarded by a shared mutex that
 * writers hold only for the map walk/insert/erase. Top of book is cached and
 * published through a SeqLock, the checksum is a single atomic word, and the
 * order id index backing cancel_order has its own exclusive mutex.
 *
 * The book never matches; crossed-book prevention is an upstream concern.
 * No operation throws on bad input: unknown ids and empty-side queries yield
 * std::nullopt or empty results.
 */
class OrderBook {
public:
    using DepthLevels = std::vector<LevelUpdate>;

    explicit OrderBook(const std::string& symbol);

    /**
     * ROI-bounded book. Updates priced outside the instrument's range of
     * interest are dropped at this boundary.
     */
    explicit OrderBook(const Instrument& instrument);

    OrderBook(const OrderBook&) = delete;
    OrderBook& operator=(const OrderBook&) = delete;

    /**
     * Add an order, creating its level if absent. An id already resting in
     * the book is replaced; a replacement priced outside the ROI removes the
     * resting order and is dropped. Updates top of book and checksum.
     */
    void add_order(const Order& order);

    /**
     * Remove an order through the id index. Empty levels are evicted and the
     * top of book recomputed when the best level goes away.
     */
    std::optional<Order> cancel_order(OrderId order_id);

    /**
     * Change price and/or quantity of a resting order (cancel + re-add),
     * keeping side and iceberg attributes. The displayed part is capped at
     * the new quantity. Returns std::nullopt if the id is unknown, or if the
     * new price is outside the ROI, in which case the order has left the book.
     */
    std::optional<Order> modify_order(OrderId order_id, Price new_price, Quantity new_quantity);

    /**
     * Replace all levels on both sides. Zero-quantity levels are skipped and
     * duplicate prices aggregate. Any tracked orders are forgotten.
     */
    void load_snapshot(const DepthLevels& bid_levels, const DepthLevels& ask_levels);

    /**
     * Set the aggregate state of one level (L2 update). Zero quantity removes it.
     */
    void apply_level_update(Side side, Price price, Quantity quantity, uint64_t order_count);

    /**
     * Remove a level and every order resting on it. Returns false if absent.
     */
    bool remove_level(Side side, Price price);

    void clear();

    // Read accessors; never wait on a writer for longer than a map walk
    std::pair<std::optional<Price>, std::optional<Price>> get_bbo() const noexcept;
    std::optional<Price> best_bid() const noexcept;
    std::optional<Price> best_ask() const noexcept;
    std::pair<DepthLevels, DepthLevels> get_depth(size_t levels) const;

    /**
     * Total quantity resting on the best `levels` of each side (bids, asks)
     */
    std::pair<Quantity, Quantity> top_volume(size_t levels) const;
    std::optional<Price> get_spread() const noexcept;
    std::optional<Price> get_mid() const noexcept;
    std::optional<Quantity> get_bid_size_at(Price price) const;
    std::optional<Quantity> get_ask_size_at(Price price) const;

    /**
     * Running fold over every structural mutation; zero after clear().
     * load_snapshot sets the low 32 bits to the state checksum of the loaded
     * levels (what snapshots carry) and the high 32 bits to a load epoch.
     */
    uint64_t get_checksum() const noexcept;

    size_t order_count() const;
    size_t level_count(Side side) const;
    bool contains_order(OrderId order_id) const;
    uint64_t dropped_updates() const noexcept;

    const std::string& symbol() const noexcept { return instrument_.symbol; }
    const Instrument& instrument() const noexcept { return instrument_; }

    /**
     * Checksum the book would carry after loading these levels: the same
     * normalization as load_snapshot, including this book's ROI filter.
     */
    uint32_t expected_checksum(const DepthLevels& bid_levels, const DepthLevels& ask_levels) const;

    /**
     * State checksum of an unbounded book holding these levels. Feeds and
     * simulators stamp snapshots with this value.
     */
    static uint32_t snapshot_checksum(const DepthLevels& bid_levels, const DepthLevels& ask_levels);

    /**
     * FNV-1a fold over price and quantity of the first CHECKSUM_DEPTH levels
     * per side, bids first. Inputs must already be best-first.
     */
    static uint32_t compute_levels_checksum(const DepthLevels& bids, const DepthLevels& asks) noexcept;

private:
    struct PriceOrder {
        bool descending;
        bool operator()(Price lhs, Price rhs) const noexcept {
            return descending ? lhs > rhs : lhs < rhs;
        }
    };

    using LevelMap = std::map<Price, std::unique_ptr<PriceLevel>, PriceOrder>;

    struct OrderLocation {
        Side side;
        Price price;
    };

    static constexpr Price NO_BID = std::numeric_limits<Price>::min();
    static constexpr Price NO_ASK = std::numeric_limits<Price>::max();

    enum class Mutation : uint8_t {
        ADD,
        CANCEL,
        LEVEL_UPDATE,
        LEVEL_REMOVE
    };

    Instrument instrument_;

    mutable std::shared_mutex bid_mutex_;
    mutable std::shared_mutex ask_mutex_;
    LevelMap bid_levels_;
    LevelMap ask_levels_;

    // Cached top of book
    SeqLock bbo_lock_;
    std::mutex bbo_write_mutex_;
    std::atomic<Price> best_bid_price_;
    std::atomic<Price> best_ask_price_;

    // Id index for O(1) cancel; the only exclusive region in the book
    mutable std::mutex index_mutex_;
    std::unordered_map<OrderId, OrderLocation> order_index_;

    std::atomic<uint64_t> checksum_;
    std::atomic<uint64_t> mutation_count_;
    std::atomic<uint64_t> dropped_updates_;

    LevelMap& levels_for(Side side) noexcept;
    const LevelMap& levels_for(Side side) const noexcept;
    std::shared_mutex& mutex_for(Side side) const noexcept;

    // Callers hold the side's unique lock
    void refresh_best_locked(Side side) noexcept;
    void publish_best(Side side, Price price) noexcept;
    void unindex(const std::vector<OrderId>& order_ids);

    void fold_checksum(Mutation mutation, uint64_t key, Price price, Quantity quantity) noexcept;
    std::optional<Quantity> size_at(Side side, Price price) const;
};

} // namespace LobReplay
