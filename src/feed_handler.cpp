#include "feed_handler.hpp"
#include "order_book.hpp"
#include <algorithm>
#include <optional>
#include <random>
#include <thread>
#include <utility>
#include <vector>

namespace LobReplay {

namespace {

struct LiveOrder {
    OrderId order_id;
    Side side;
    Price price;
};

constexpr size_t OPENING_LEVELS = 10;

} // namespace

FeedHandler::FeedHandler(const FeedProfile& profile)
    : profile_(profile), finished_(false) {}

void FeedHandler::run(SPSCRingBuffer* ring_buffer) {
    std::mt19937_64 gen(profile_.seed);

    std::uniform_int_distribution<Price> offset_dist(1, std::max<Price>(profile_.price_range, 1));
    std::uniform_int_distribution<Quantity> quantity_dist(1, 1000);
    std::uniform_real_distribution<double> action_dist(0.0, 1.0);
    std::uniform_int_distribution<int> side_dist(0, 1);

    EventBuilder builder(profile_.symbol, profile_.feed_latency_ns);
    OrderBook shadow(profile_.symbol);  // What a correct replay of this feed holds
    std::vector<LiveOrder> live_orders;
    OrderId next_order_id = 1;
    uint64_t next_trade_id = 1;
    Price current_mid = profile_.mid_price;
    std::optional<OrderBookEvent> held;

    auto push = [&](OrderBookEvent event, bool duplicate) {
        if (duplicate) {
            OrderBookEvent copy = event;
            while (!ring_buffer->enqueue(std::move(copy))) {
                std::this_thread::yield();
            }
            stats_.events_enqueued.fetch_add(1, std::memory_order_relaxed);
            stats_.duplicated.fetch_add(1, std::memory_order_relaxed);
        }
        // Enqueue with backpressure handling
        while (!ring_buffer->enqueue(std::move(event))) {
            std::this_thread::yield();
        }
        stats_.events_enqueued.fetch_add(1, std::memory_order_relaxed);
    };

    auto flush_held = [&]() {
        if (held) {
            push(std::move(*held), false);
            held.reset();
        }
    };

    auto deliver = [&](OrderBookEvent event) {
        if (action_dist(gen) < profile_.drop_rate) {
            stats_.dropped.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        if (!held && action_dist(gen) < profile_.reorder_rate) {
            held = std::move(event);
            stats_.reordered.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        push(std::move(event), action_dist(gen) < profile_.duplicate_rate);
        flush_held();
    };

    auto publish_snapshot = [&]() {
        const size_t depth = std::max(shadow.level_count(Side::BUY), shadow.level_count(Side::SELL));
        auto [bids, asks] = shadow.get_depth(depth);
        flush_held();
        push(builder.snapshot(std::move(bids), std::move(asks)), false);
        stats_.snapshots.fetch_add(1, std::memory_order_relaxed);
    };

    // Opening book
    {
        std::vector<LevelUpdate> bids;
        std::vector<LevelUpdate> asks;
        for (size_t i = 1; i <= OPENING_LEVELS; ++i) {
            const Price offset = static_cast<Price>(i);
            bids.emplace_back(current_mid - offset, quantity_dist(gen), 1);
            asks.emplace_back(current_mid + offset, quantity_dist(gen), 1);
        }
        shadow.load_snapshot(bids, asks);
        publish_snapshot();
    }

    const double trade_cut = profile_.trade_rate;
    const double cancel_cut = trade_cut + profile_.cancel_rate;
    const double modify_cut = cancel_cut + profile_.modify_rate;

    uint64_t generated = 0;
    while (generated < profile_.total_events) {
        const double action = action_dist(gen);
        const Side side = (side_dist(gen) == 0) ? Side::BUY : Side::SELL;

        if (action < trade_cut) {
            const Price price = (side == Side::BUY) ? current_mid + 1 : current_mid - 1;
            deliver(builder.trade(next_trade_id++, price, quantity_dist(gen), side));
        } else if (action < modify_cut && !live_orders.empty()) {
            std::uniform_int_distribution<size_t> pick(0, live_orders.size() - 1);
            const size_t index = pick(gen);
            const LiveOrder target = live_orders[index];

            if (action < cancel_cut) {
                shadow.cancel_order(target.order_id);
                live_orders[index] = live_orders.back();
                live_orders.pop_back();
                deliver(builder.order_delete(target.order_id, target.price, target.side));
            } else {
                const Quantity new_quantity = quantity_dist(gen);
                shadow.add_order(Order(target.order_id, target.side, target.price, new_quantity));
                deliver(builder.order_modify(target.order_id, target.price, new_quantity, target.side));
            }
        } else {
            // Passive order away from mid
            const Price price = (side == Side::BUY) ? current_mid - offset_dist(gen)
                                                    : current_mid + offset_dist(gen);
            const Quantity quantity = quantity_dist(gen);
            const OrderId order_id = next_order_id++;

            Order order(order_id, side, price, quantity);
            OrderUpdate update;
            if (action_dist(gen) < profile_.iceberg_rate) {
                const Quantity visible = std::max<Quantity>(quantity / 10, 1);
                order.is_iceberg = true;
                order.visible_quantity = visible;
                update = builder.iceberg_add(order_id, price, quantity, visible, side);
            } else {
                update = builder.order_add(order_id, price, quantity, side);
            }
            shadow.add_order(order);
            live_orders.push_back(LiveOrder{order_id, side, price});
            deliver(std::move(update));
        }

        ++generated;
        stats_.events_generated.fetch_add(1, std::memory_order_relaxed);

        if (profile_.snapshot_every > 0 && generated % profile_.snapshot_every == 0) {
            publish_snapshot();
        }

        // Occasionally move the simulated mid to create market movement
        if (generated % 10000 == 0) {
            current_mid += static_cast<Price>(gen() % 21) - 10;  // Random walk +/-10
            current_mid = std::max<Price>(current_mid, profile_.price_range + 1);
        }
    }

    flush_held();
    finished_.store(true, std::memory_order_release);
}

} // namespace LobReplay
