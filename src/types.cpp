#include "types.hpp"
#include <algorithm>

namespace LobReplay {

Order::Order() noexcept
    : order_id(0), side(Side::BUY), price(0), quantity(0), original_quantity(0),
      is_iceberg(false), visible_quantity(0), timestamp(0) {}

Order::Order(OrderId id, Side s, Price p, Quantity q) noexcept
    : order_id(id), side(s), price(p), quantity(q), original_quantity(q),
      is_iceberg(false), visible_quantity(q), timestamp(0) {}

Quantity Order::displayed_quantity() const noexcept {
    if (!is_iceberg) {
        return quantity;
    }
    return std::min(visible_quantity, quantity);
}

} // namespace LobReplay
