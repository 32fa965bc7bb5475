#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace LobReplay {

enum class UpdateType : uint8_t {
    ADD,
    MODIFY,
    DELETE
};

enum class MarketEventType : uint8_t {
    TRADING_HALT,
    TRADING_RESUME,
    MARKET_OPEN,
    MARKET_CLOSE,
    CIRCUIT_BREAKER,
    AUCTION_START,
    AUCTION_END
};

/**
 * Individual order update (L3 data)
 */
struct OrderUpdate {
    std::string symbol;
    OrderId order_id = 0;
    Price price = 0;
    Quantity quantity = 0;          // 0 for deletions
    Side side = Side::BUY;
    UpdateType update_type = UpdateType::ADD;
    bool is_iceberg = false;
    Quantity visible_quantity = 0;
    Timestamp exchange_time = 0;
    Timestamp local_time = 0;
    Sequence sequence = 0;
};

/**
 * Trade print. Informational for the book: resting liquidity is adjusted by
 * the order updates that accompany it.
 */
struct TradeEvent {
    std::string symbol;
    uint64_t trade_id = 0;
    Price price = 0;
    Quantity quantity = 0;
    Side aggressor_side = Side::BUY;
    std::optional<OrderId> maker_order_id;
    std::optional<OrderId> taker_order_id;
    Timestamp exchange_time = 0;
    Timestamp local_time = 0;
    Sequence sequence = 0;
};

/**
 * Complete book state at one sequence; replaces whatever the book held.
 */
struct OrderBookSnapshot {
    std::string symbol;
    std::vector<LevelUpdate> bids;
    std::vector<LevelUpdate> asks;
    Sequence sequence = 0;
    Timestamp exchange_time = 0;
    Timestamp local_time = 0;
    uint32_t checksum = 0;
};

/**
 * Incremental level changes relative to prev_sequence. Level updates carry
 * the new aggregate state of the level; deletions name prices to remove.
 */
struct OrderBookDelta {
    std::string symbol;
    std::vector<LevelUpdate> bid_updates;
    std::vector<LevelUpdate> ask_updates;
    std::vector<Price> bid_deletions;
    std::vector<Price> ask_deletions;
    Sequence prev_sequence = 0;
    Sequence sequence = 0;
    Timestamp exchange_time = 0;
    Timestamp local_time = 0;
};

/**
 * Session-level event. A missing symbol means book-wide.
 */
struct MarketEvent {
    MarketEventType event_type = MarketEventType::MARKET_OPEN;
    std::optional<std::string> symbol;
    Timestamp timestamp = 0;
    std::string message;
};

using OrderBookEvent = std::variant<OrderUpdate, TradeEvent, OrderBookSnapshot, OrderBookDelta, MarketEvent>;

/**
 * Sequence number of a book-affecting event; std::nullopt for market events.
 */
std::optional<Sequence> event_sequence(const OrderBookEvent& event) noexcept;
Timestamp event_exchange_time(const OrderBookEvent& event) noexcept;
std::optional<Timestamp> event_local_time(const OrderBookEvent& event) noexcept;

/**
 * Symbol the event applies to; std::nullopt for book-wide market events.
 */
std::optional<std::string> event_symbol(const OrderBookEvent& event);

const char* event_type_name(const OrderBookEvent& event) noexcept;
const char* update_type_to_string(UpdateType type) noexcept;
const char* market_event_type_to_string(MarketEventType type) noexcept;

/**
 * Builds well-formed, sequenced events in the same shape a feed adapter
 * produces. Every event except market events consumes the next sequence.
 */
class EventBuilder {
private:
    std::string symbol_;
    Sequence sequence_counter_;
    Timestamp feed_latency_ns_;

    void stamp(Timestamp& exchange_time, Timestamp& local_time) const noexcept;

public:
    /**
     * feed_latency_ns is added to the exchange time to form the local receive
     * time, so latency tracking sees a stable value.
     */
    explicit EventBuilder(const std::string& symbol, Timestamp feed_latency_ns = 0);

    OrderUpdate order_add(OrderId order_id, Price price, Quantity quantity, Side side);
    OrderUpdate iceberg_add(OrderId order_id, Price price, Quantity quantity,
                            Quantity visible_quantity, Side side);
    OrderUpdate order_modify(OrderId order_id, Price price, Quantity new_quantity, Side side);
    OrderUpdate order_delete(OrderId order_id, Price price, Side side);
    TradeEvent trade(uint64_t trade_id, Price price, Quantity quantity, Side aggressor_side);

    /**
     * Snapshot stamped with the checksum a book holding these levels reports.
     */
    OrderBookSnapshot snapshot(std::vector<LevelUpdate> bids, std::vector<LevelUpdate> asks);

    /**
     * Delta chained onto the current sequence.
     */
    OrderBookDelta delta(std::vector<LevelUpdate> bid_updates, std::vector<LevelUpdate> ask_updates,
                         std::vector<Price> bid_deletions = {}, std::vector<Price> ask_deletions = {});

    /**
     * Market event for this symbol, or book-wide when book_wide is set.
     */
    MarketEvent market(MarketEventType type, const std::string& message = {}, bool book_wide = false) const;

    Sequence current_sequence() const noexcept { return sequence_counter_; }
    void reset_sequence() noexcept { sequence_counter_ = 0; }
    void set_sequence(Sequence sequence) noexcept { sequence_counter_ = sequence; }
    const std::string& symbol() const noexcept { return symbol_; }
};

} // namespace LobReplay
