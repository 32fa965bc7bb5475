#include "order_book.hpp"
#include <algorithm>

namespace LobReplay {

namespace {

constexpr uint64_t FNV_OFFSET_BASIS = 0xcbf29ce484222325ULL;
constexpr uint64_t FNV_PRIME = 0x100000001b3ULL;

inline uint64_t fnv1a(uint64_t hash, uint64_t value) noexcept {
    for (int byte = 0; byte < 8; ++byte) {
        hash ^= (value >> (byte * 8)) & 0xff;
        hash *= FNV_PRIME;
    }
    return hash;
}

inline uint64_t mix(uint64_t seed, uint64_t value) noexcept {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    return seed;
}

/**
 * Drop empty (and, with an instrument, out-of-ROI) levels, aggregate duplicate
 * prices and sort best-first for the given side.
 */
std::vector<LevelUpdate> normalize_levels(const std::vector<LevelUpdate>& levels, Side side,
                                          const Instrument* instrument, uint64_t* dropped) {
    std::map<Price, LevelUpdate> merged;
    for (const LevelUpdate& level : levels) {
        if (level.quantity == 0) {
            continue;
        }
        if (instrument && !instrument->in_roi(level.price)) {
            if (dropped) ++*dropped;
            continue;
        }
        auto [it, inserted] = merged.try_emplace(level.price, level.price, 0, 0);
        it->second.quantity += level.quantity;
        it->second.order_count += std::max<uint64_t>(level.order_count, 1);
    }

    std::vector<LevelUpdate> result;
    result.reserve(merged.size());
    if (side == Side::BUY) {
        for (auto it = merged.rbegin(); it != merged.rend(); ++it) {
            result.push_back(it->second);
        }
    } else {
        for (const auto& [price, level] : merged) {
            result.push_back(level);
        }
    }
    return result;
}

} // namespace

OrderBook::OrderBook(const std::string& symbol)
    : OrderBook(Instrument(symbol)) {}

OrderBook::OrderBook(const Instrument& instrument)
    : instrument_(instrument),
      bid_levels_(PriceOrder{true}), ask_levels_(PriceOrder{false}),
      best_bid_price_(NO_BID), best_ask_price_(NO_ASK),
      checksum_(0), mutation_count_(0), dropped_updates_(0) {}

OrderBook::LevelMap& OrderBook::levels_for(Side side) noexcept {
    return side == Side::BUY ? bid_levels_ : ask_levels_;
}

const OrderBook::LevelMap& OrderBook::levels_for(Side side) const noexcept {
    return side == Side::BUY ? bid_levels_ : ask_levels_;
}

std::shared_mutex& OrderBook::mutex_for(Side side) const noexcept {
    return side == Side::BUY ? bid_mutex_ : ask_mutex_;
}

void OrderBook::add_order(const Order& order) {
    bool already_resting;
    {
        std::lock_guard<std::mutex> index_lock(index_mutex_);
        already_resting = order_index_.count(order.order_id) > 0;
    }
    if (already_resting) {
        cancel_order(order.order_id);
    }

    // A replacement priced outside the ROI leaves the book
    if (!instrument_.in_roi(order.price)) {
        dropped_updates_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_for(order.side));
        {
            std::lock_guard<std::mutex> index_lock(index_mutex_);
            order_index_[order.order_id] = OrderLocation{order.side, order.price};
        }

        LevelMap& levels = levels_for(order.side);
        auto it = levels.find(order.price);
        if (it == levels.end()) {
            it = levels.emplace(order.price, std::make_unique<PriceLevel>(order.price)).first;
        }
        it->second->add_order(order);

        // The first map entry is the best price for either side
        if (it == levels.begin()) {
            publish_best(order.side, order.price);
        }
    }

    fold_checksum(Mutation::ADD, order.order_id, order.price, order.quantity);
}

std::optional<Order> OrderBook::cancel_order(OrderId order_id) {
    OrderLocation location;
    {
        std::lock_guard<std::mutex> index_lock(index_mutex_);
        auto found = order_index_.find(order_id);
        if (found == order_index_.end()) {
            return std::nullopt;
        }
        location = found->second;
        order_index_.erase(found);
    }

    std::optional<Order> removed;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_for(location.side));
        LevelMap& levels = levels_for(location.side);
        auto it = levels.find(location.price);
        if (it == levels.end()) {
            return std::nullopt;
        }

        removed = it->second->remove_order(order_id);
        if (!removed) {
            return std::nullopt;
        }

        if (it->second->empty()) {
            const bool was_best = (it == levels.begin());
            levels.erase(it);
            if (was_best) {
                refresh_best_locked(location.side);
            }
        }
    }

    fold_checksum(Mutation::CANCEL, order_id, removed->price, removed->quantity);
    return removed;
}

std::optional<Order> OrderBook::modify_order(OrderId order_id, Price new_price, Quantity new_quantity) {
    std::optional<Order> previous = cancel_order(order_id);
    if (!previous) {
        return std::nullopt;
    }

    Order updated = *previous;
    updated.price = new_price;
    updated.quantity = new_quantity;
    if (updated.is_iceberg) {
        updated.visible_quantity = std::min(updated.visible_quantity, new_quantity);
    }
    add_order(updated);
    if (!instrument_.in_roi(new_price)) {
        return std::nullopt;
    }
    return updated;
}

void OrderBook::load_snapshot(const DepthLevels& bid_levels, const DepthLevels& ask_levels) {
    uint64_t dropped = 0;
    const DepthLevels bids = normalize_levels(bid_levels, Side::BUY, &instrument_, &dropped);
    const DepthLevels asks = normalize_levels(ask_levels, Side::SELL, &instrument_, &dropped);

    LevelMap new_bids(PriceOrder{true});
    LevelMap new_asks(PriceOrder{false});
    for (const LevelUpdate& level : bids) {
        auto price_level = std::make_unique<PriceLevel>(level.price);
        price_level->set_aggregate(level.quantity, level.order_count);
        new_bids.emplace(level.price, std::move(price_level));
    }
    for (const LevelUpdate& level : asks) {
        auto price_level = std::make_unique<PriceLevel>(level.price);
        price_level->set_aggregate(level.quantity, level.order_count);
        new_asks.emplace(level.price, std::move(price_level));
    }

    {
        std::scoped_lock lock(bid_mutex_, ask_mutex_);
        bid_levels_.swap(new_bids);
        ask_levels_.swap(new_asks);
        {
            std::lock_guard<std::mutex> index_lock(index_mutex_);
            order_index_.clear();
        }

        std::lock_guard<std::mutex> bbo_lock(bbo_write_mutex_);
        SeqLock::WriteGuard guard(bbo_lock_);
        best_bid_price_.store(bids.empty() ? NO_BID : bids.front().price, std::memory_order_relaxed);
        best_ask_price_.store(asks.empty() ? NO_ASK : asks.front().price, std::memory_order_relaxed);
    }

    if (dropped > 0) {
        dropped_updates_.fetch_add(dropped, std::memory_order_relaxed);
    }
    // Low word: state checksum of the loaded levels. High word: load epoch, so
    // reloading identical or depth-equivalent levels still moves the checksum
    const uint64_t epoch = mutation_count_.fetch_add(1, std::memory_order_relaxed) + 1;
    checksum_.store((epoch << 32) | compute_levels_checksum(bids, asks), std::memory_order_release);
}

void OrderBook::apply_level_update(Side side, Price price, Quantity quantity, uint64_t order_count) {
    if (!instrument_.in_roi(price)) {
        dropped_updates_.fetch_add(1, std::memory_order_relaxed);
        return;
    }
    if (quantity == 0) {
        remove_level(side, price);
        return;
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_for(side));
        LevelMap& levels = levels_for(side);
        auto it = levels.find(price);
        if (it == levels.end()) {
            it = levels.emplace(price, std::make_unique<PriceLevel>(price)).first;
        }
        unindex(it->second->set_aggregate(quantity, order_count));

        if (it == levels.begin()) {
            publish_best(side, price);
        }
    }

    fold_checksum(Mutation::LEVEL_UPDATE, order_count, price, quantity);
}

bool OrderBook::remove_level(Side side, Price price) {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_for(side));
        LevelMap& levels = levels_for(side);
        auto it = levels.find(price);
        if (it == levels.end()) {
            return false;
        }

        std::vector<OrderId> resting;
        resting.reserve(it->second->orders().size());
        for (const Order& order : it->second->orders()) {
            resting.push_back(order.order_id);
        }

        const bool was_best = (it == levels.begin());
        levels.erase(it);
        unindex(resting);
        if (was_best) {
            refresh_best_locked(side);
        }
    }

    fold_checksum(Mutation::LEVEL_REMOVE, 0, price, 0);
    return true;
}

void OrderBook::clear() {
    LevelMap old_bids(PriceOrder{true});
    LevelMap old_asks(PriceOrder{false});
    {
        std::scoped_lock lock(bid_mutex_, ask_mutex_);
        bid_levels_.swap(old_bids);
        ask_levels_.swap(old_asks);
        {
            std::lock_guard<std::mutex> index_lock(index_mutex_);
            order_index_.clear();
        }

        std::lock_guard<std::mutex> bbo_lock(bbo_write_mutex_);
        SeqLock::WriteGuard guard(bbo_lock_);
        best_bid_price_.store(NO_BID, std::memory_order_relaxed);
        best_ask_price_.store(NO_ASK, std::memory_order_relaxed);
    }

    mutation_count_.fetch_add(1, std::memory_order_relaxed);
    checksum_.store(0, std::memory_order_release);
}

std::pair<std::optional<Price>, std::optional<Price>> OrderBook::get_bbo() const noexcept {
    const auto [bid, ask] = bbo_lock_.read([this]() noexcept {
        return std::make_pair(best_bid_price_.load(std::memory_order_relaxed),
                              best_ask_price_.load(std::memory_order_relaxed));
    });

    return {
        bid == NO_BID ? std::nullopt : std::optional<Price>(bid),
        ask == NO_ASK ? std::nullopt : std::optional<Price>(ask)
    };
}

std::optional<Price> OrderBook::best_bid() const noexcept {
    return get_bbo().first;
}

std::optional<Price> OrderBook::best_ask() const noexcept {
    return get_bbo().second;
}

std::pair<OrderBook::DepthLevels, OrderBook::DepthLevels> OrderBook::get_depth(size_t levels) const {
    DepthLevels bids;
    DepthLevels asks;
    bids.reserve(levels);
    asks.reserve(levels);

    {
        std::shared_lock<std::shared_mutex> lock(bid_mutex_);
        for (auto it = bid_levels_.begin(); it != bid_levels_.end() && bids.size() < levels; ++it) {
            const LevelTotals totals = it->second->get_totals();
            bids.emplace_back(it->first, totals.quantity, totals.order_count);
        }
    }
    {
        std::shared_lock<std::shared_mutex> lock(ask_mutex_);
        for (auto it = ask_levels_.begin(); it != ask_levels_.end() && asks.size() < levels; ++it) {
            const LevelTotals totals = it->second->get_totals();
            asks.emplace_back(it->first, totals.quantity, totals.order_count);
        }
    }

    return {std::move(bids), std::move(asks)};
}

std::pair<Quantity, Quantity> OrderBook::top_volume(size_t levels) const {
    Quantity bid_volume = 0;
    Quantity ask_volume = 0;
    {
        std::shared_lock<std::shared_mutex> lock(bid_mutex_);
        size_t counted = 0;
        for (auto it = bid_levels_.begin(); it != bid_levels_.end() && counted < levels; ++it, ++counted) {
            bid_volume += it->second->get_quantity();
        }
    }
    {
        std::shared_lock<std::shared_mutex> lock(ask_mutex_);
        size_t counted = 0;
        for (auto it = ask_levels_.begin(); it != ask_levels_.end() && counted < levels; ++it, ++counted) {
            ask_volume += it->second->get_quantity();
        }
    }
    return {bid_volume, ask_volume};
}

std::optional<Price> OrderBook::get_spread() const noexcept {
    const auto [bid, ask] = get_bbo();
    if (!bid || !ask) {
        return std::nullopt;
    }
    return *ask - *bid;
}

std::optional<Price> OrderBook::get_mid() const noexcept {
    const auto [bid, ask] = get_bbo();
    if (!bid || !ask) {
        return std::nullopt;
    }
    return (*bid + *ask) / 2;
}

std::optional<Quantity> OrderBook::get_bid_size_at(Price price) const {
    return size_at(Side::BUY, price);
}

std::optional<Quantity> OrderBook::get_ask_size_at(Price price) const {
    return size_at(Side::SELL, price);
}

std::optional<Quantity> OrderBook::size_at(Side side, Price price) const {
    std::shared_lock<std::shared_mutex> lock(mutex_for(side));
    const LevelMap& levels = levels_for(side);
    auto it = levels.find(price);
    if (it == levels.end()) {
        return std::nullopt;
    }
    return it->second->get_quantity();
}

uint64_t OrderBook::get_checksum() const noexcept {
    return checksum_.load(std::memory_order_acquire);
}

size_t OrderBook::order_count() const {
    std::lock_guard<std::mutex> index_lock(index_mutex_);
    return order_index_.size();
}

size_t OrderBook::level_count(Side side) const {
    std::shared_lock<std::shared_mutex> lock(mutex_for(side));
    return levels_for(side).size();
}

bool OrderBook::contains_order(OrderId order_id) const {
    std::lock_guard<std::mutex> index_lock(index_mutex_);
    return order_index_.count(order_id) > 0;
}

uint64_t OrderBook::dropped_updates() const noexcept {
    return dropped_updates_.load(std::memory_order_relaxed);
}

uint32_t OrderBook::expected_checksum(const DepthLevels& bid_levels, const DepthLevels& ask_levels) const {
    return compute_levels_checksum(normalize_levels(bid_levels, Side::BUY, &instrument_, nullptr),
                                   normalize_levels(ask_levels, Side::SELL, &instrument_, nullptr));
}

uint32_t OrderBook::snapshot_checksum(const DepthLevels& bid_levels, const DepthLevels& ask_levels) {
    return compute_levels_checksum(normalize_levels(bid_levels, Side::BUY, nullptr, nullptr),
                                   normalize_levels(ask_levels, Side::SELL, nullptr, nullptr));
}

uint32_t OrderBook::compute_levels_checksum(const DepthLevels& bids, const DepthLevels& asks) noexcept {
    uint64_t hash = FNV_OFFSET_BASIS;
    const size_t bid_depth = std::min(bids.size(), CHECKSUM_DEPTH);
    for (size_t i = 0; i < bid_depth; ++i) {
        hash = fnv1a(hash, static_cast<uint64_t>(bids[i].price));
        hash = fnv1a(hash, bids[i].quantity);
    }
    const size_t ask_depth = std::min(asks.size(), CHECKSUM_DEPTH);
    for (size_t i = 0; i < ask_depth; ++i) {
        hash = fnv1a(hash, static_cast<uint64_t>(asks[i].price));
        hash = fnv1a(hash, asks[i].quantity);
    }
    return static_cast<uint32_t>(hash ^ (hash >> 32));
}

void OrderBook::refresh_best_locked(Side side) noexcept {
    const LevelMap& levels = levels_for(side);
    if (levels.empty()) {
        publish_best(side, side == Side::BUY ? NO_BID : NO_ASK);
    } else {
        publish_best(side, levels.begin()->first);
    }
}

void OrderBook::publish_best(Side side, Price price) noexcept {
    std::lock_guard<std::mutex> bbo_lock(bbo_write_mutex_);
    SeqLock::WriteGuard guard(bbo_lock_);
    if (side == Side::BUY) {
        best_bid_price_.store(price, std::memory_order_relaxed);
    } else {
        best_ask_price_.store(price, std::memory_order_relaxed);
    }
}

void OrderBook::unindex(const std::vector<OrderId>& order_ids) {
    if (order_ids.empty()) {
        return;
    }
    std::lock_guard<std::mutex> index_lock(index_mutex_);
    for (OrderId id : order_ids) {
        order_index_.erase(id);
    }
}

void OrderBook::fold_checksum(Mutation mutation, uint64_t key, Price price, Quantity quantity) noexcept {
    const uint64_t mutation_seq = mutation_count_.fetch_add(1, std::memory_order_relaxed) + 1;

    uint64_t current = checksum_.load(std::memory_order_relaxed);
    uint64_t next;
    do {
        next = mix(current, static_cast<uint64_t>(mutation));
        next = mix(next, key);
        next = mix(next, static_cast<uint64_t>(price));
        next = mix(next, quantity);
        next = mix(next, mutation_seq);
        if (next == current) {
            ++next;
        }
    } while (!checksum_.compare_exchange_weak(current, next, std::memory_order_release,
                                              std::memory_order_relaxed));
}

} // namespace LobReplay
