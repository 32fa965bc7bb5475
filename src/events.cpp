#include "events.hpp"
#include "order_book.hpp"
#include <type_traits>

namespace LobReplay {

std::optional<Sequence> event_sequence(const OrderBookEvent& event) noexcept {
    return std::visit([](const auto& e) -> std::optional<Sequence> {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, MarketEvent>) {
            return std::nullopt;
        } else {
            return e.sequence;
        }
    }, event);
}

Timestamp event_exchange_time(const OrderBookEvent& event) noexcept {
    return std::visit([](const auto& e) -> Timestamp {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, MarketEvent>) {
            return e.timestamp;
        } else {
            return e.exchange_time;
        }
    }, event);
}

std::optional<Timestamp> event_local_time(const OrderBookEvent& event) noexcept {
    return std::visit([](const auto& e) -> std::optional<Timestamp> {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, MarketEvent>) {
            return std::nullopt;
        } else {
            return e.local_time;
        }
    }, event);
}

std::optional<std::string> event_symbol(const OrderBookEvent& event) {
    return std::visit([](const auto& e) -> std::optional<std::string> {
        return e.symbol;
    }, event);
}

const char* event_type_name(const OrderBookEvent& event) noexcept {
    switch (event.index()) {
        case 0: return "ORDER";
        case 1: return "TRADE";
        case 2: return "SNAPSHOT";
        case 3: return "DELTA";
        case 4: return "MARKET";
        default: return "UNKNOWN";
    }
}

const char* update_type_to_string(UpdateType type) noexcept {
    switch (type) {
        case UpdateType::ADD: return "ADD";
        case UpdateType::MODIFY: return "MODIFY";
        case UpdateType::DELETE: return "DELETE";
    }
    return "UNKNOWN";
}

const char* market_event_type_to_string(MarketEventType type) noexcept {
    switch (type) {
        case MarketEventType::TRADING_HALT: return "TRADING_HALT";
        case MarketEventType::TRADING_RESUME: return "TRADING_RESUME";
        case MarketEventType::MARKET_OPEN: return "MARKET_OPEN";
        case MarketEventType::MARKET_CLOSE: return "MARKET_CLOSE";
        case MarketEventType::CIRCUIT_BREAKER: return "CIRCUIT_BREAKER";
        case MarketEventType::AUCTION_START: return "AUCTION_START";
        case MarketEventType::AUCTION_END: return "AUCTION_END";
    }
    return "UNKNOWN";
}

EventBuilder::EventBuilder(const std::string& symbol, Timestamp feed_latency_ns)
    : symbol_(symbol), sequence_counter_(0), feed_latency_ns_(feed_latency_ns) {}

void EventBuilder::stamp(Timestamp& exchange_time, Timestamp& local_time) const noexcept {
    exchange_time = now_ns();
    local_time = exchange_time + feed_latency_ns_;
}

OrderUpdate EventBuilder::order_add(OrderId order_id, Price price, Quantity quantity, Side side) {
    OrderUpdate update;
    update.symbol = symbol_;
    update.order_id = order_id;
    update.price = price;
    update.quantity = quantity;
    update.side = side;
    update.update_type = UpdateType::ADD;
    update.visible_quantity = quantity;
    stamp(update.exchange_time, update.local_time);
    update.sequence = ++sequence_counter_;
    return update;
}

OrderUpdate EventBuilder::iceberg_add(OrderId order_id, Price price, Quantity quantity,
                                      Quantity visible_quantity, Side side) {
    OrderUpdate update = order_add(order_id, price, quantity, side);
    update.is_iceberg = true;
    update.visible_quantity = visible_quantity;
    return update;
}

OrderUpdate EventBuilder::order_modify(OrderId order_id, Price price, Quantity new_quantity, Side side) {
    OrderUpdate update = order_add(order_id, price, new_quantity, side);
    update.update_type = UpdateType::MODIFY;
    return update;
}

OrderUpdate EventBuilder::order_delete(OrderId order_id, Price price, Side side) {
    OrderUpdate update = order_add(order_id, price, 0, side);
    update.update_type = UpdateType::DELETE;
    return update;
}

TradeEvent EventBuilder::trade(uint64_t trade_id, Price price, Quantity quantity, Side aggressor_side) {
    TradeEvent trade;
    trade.symbol = symbol_;
    trade.trade_id = trade_id;
    trade.price = price;
    trade.quantity = quantity;
    trade.aggressor_side = aggressor_side;
    stamp(trade.exchange_time, trade.local_time);
    trade.sequence = ++sequence_counter_;
    return trade;
}

OrderBookSnapshot EventBuilder::snapshot(std::vector<LevelUpdate> bids, std::vector<LevelUpdate> asks) {
    OrderBookSnapshot snapshot;
    snapshot.symbol = symbol_;
    snapshot.checksum = OrderBook::snapshot_checksum(bids, asks);
    snapshot.bids = std::move(bids);
    snapshot.asks = std::move(asks);
    stamp(snapshot.exchange_time, snapshot.local_time);
    snapshot.sequence = ++sequence_counter_;
    return snapshot;
}

OrderBookDelta EventBuilder::delta(std::vector<LevelUpdate> bid_updates, std::vector<LevelUpdate> ask_updates,
                                   std::vector<Price> bid_deletions, std::vector<Price> ask_deletions) {
    OrderBookDelta delta;
    delta.symbol = symbol_;
    delta.bid_updates = std::move(bid_updates);
    delta.ask_updates = std::move(ask_updates);
    delta.bid_deletions = std::move(bid_deletions);
    delta.ask_deletions = std::move(ask_deletions);
    stamp(delta.exchange_time, delta.local_time);
    delta.prev_sequence = sequence_counter_;
    delta.sequence = ++sequence_counter_;
    return delta;
}

MarketEvent EventBuilder::market(MarketEventType type, const std::string& message, bool book_wide) const {
    MarketEvent event;
    event.event_type = type;
    if (!book_wide) {
        event.symbol = symbol_;
    }
    event.timestamp = now_ns();
    event.message = message;
    return event;
}

} // namespace LobReplay
