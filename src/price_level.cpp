#include "price_level.hpp"
#include <algorithm>

namespace LobReplay {

PriceLevel::PriceLevel(Price price) noexcept
    : price_(price), total_quantity_(0), order_count_(0), hidden_quantity_(0),
      base_quantity_(0), base_count_(0) {}

void PriceLevel::publish_totals(Quantity quantity, uint64_t count, Quantity hidden) noexcept {
    SeqLock::WriteGuard guard(counters_lock_);
    total_quantity_.store(quantity, std::memory_order_relaxed);
    order_count_.store(count, std::memory_order_relaxed);
    hidden_quantity_.store(hidden, std::memory_order_relaxed);
}

void PriceLevel::add_order(const Order& order) {
    orders_.push_back(order);

    publish_totals(total_quantity_.load(std::memory_order_relaxed) + order.quantity,
                   order_count_.load(std::memory_order_relaxed) + 1,
                   hidden_quantity_.load(std::memory_order_relaxed) + order.hidden_quantity());
}

std::optional<Order> PriceLevel::remove_order(OrderId order_id) noexcept {
    auto it = std::find_if(orders_.begin(), orders_.end(),
                           [order_id](const Order& o) { return o.order_id == order_id; });
    if (it == orders_.end()) {
        return std::nullopt;
    }

    Order removed = *it;
    // Order within a level carries no priority here, so swap-and-pop
    *it = orders_.back();
    orders_.pop_back();

    publish_totals(total_quantity_.load(std::memory_order_relaxed) - removed.quantity,
                   order_count_.load(std::memory_order_relaxed) - 1,
                   hidden_quantity_.load(std::memory_order_relaxed) - removed.hidden_quantity());
    return removed;
}

std::vector<OrderId> PriceLevel::set_aggregate(Quantity quantity, uint64_t order_count) {
    std::vector<OrderId> dropped;
    dropped.reserve(orders_.size());
    for (const Order& order : orders_) {
        dropped.push_back(order.order_id);
    }
    orders_.clear();

    if (quantity > 0 && order_count == 0) {
        order_count = 1;
    }
    if (order_count == 0) {
        quantity = 0;
    }

    base_quantity_ = quantity;
    base_count_ = order_count;
    publish_totals(base_quantity_, base_count_, 0);
    return dropped;
}

Quantity PriceLevel::get_quantity() const noexcept {
    return get_totals().quantity;
}

uint64_t PriceLevel::get_order_count() const noexcept {
    return get_totals().order_count;
}

Quantity PriceLevel::get_hidden_quantity() const noexcept {
    return get_totals().hidden_quantity;
}

LevelTotals PriceLevel::get_totals() const noexcept {
    return counters_lock_.read([this]() noexcept {
        return LevelTotals{
            total_quantity_.load(std::memory_order_relaxed),
            order_count_.load(std::memory_order_relaxed),
            hidden_quantity_.load(std::memory_order_relaxed)
        };
    });
}

bool PriceLevel::empty() const noexcept {
    return get_order_count() == 0;
}

bool PriceLevel::contains(OrderId order_id) const noexcept {
    return std::any_of(orders_.begin(), orders_.end(),
                       [order_id](const Order& o) { return o.order_id == order_id; });
}

} // namespace LobReplay
