#include "book_registry.hpp"
#include <algorithm>
#include <iostream>

namespace LobReplay {

BookRegistry::BookRegistry(const ReplayConfig& config)
    : config_(config),
      market_data_(nullptr),
      depth_levels_(10),
      events_routed_(0),
      unrouted_events_(0) {}

bool BookRegistry::add_symbol(const Instrument& instrument, int numa_node) {
    if (engines_.find(instrument.symbol) != engines_.end()) {
        return false; // Symbol already registered
    }

    const int node = allocator_.resolve_node(numa_node);
    EnginePtr engine(allocator_.create_on_node<ReplayEngine>(node, instrument, config_),
                     EngineDeleter{&allocator_, node});
    engines_.emplace(instrument.symbol, Entry{std::move(engine), node});

    if (config_.verbose) {
        std::cout << "[" << instrument.symbol << "] registered on NUMA node " << node << "\n";
    }
    return true;
}

bool BookRegistry::remove_symbol(const std::string& symbol) {
    return engines_.erase(symbol) > 0;
}

ReplayEngine* BookRegistry::get_engine(const std::string& symbol) noexcept {
    auto it = engines_.find(symbol);
    return (it != engines_.end()) ? it->second.engine.get() : nullptr;
}

const ReplayEngine* BookRegistry::get_engine(const std::string& symbol) const noexcept {
    auto it = engines_.find(symbol);
    return (it != engines_.end()) ? it->second.engine.get() : nullptr;
}

const OrderBook* BookRegistry::get_book(const std::string& symbol) const noexcept {
    const ReplayEngine* engine = get_engine(symbol);
    return engine ? &engine->order_book() : nullptr;
}

int BookRegistry::numa_node_of(const std::string& symbol) const noexcept {
    auto it = engines_.find(symbol);
    return (it != engines_.end()) ? it->second.numa_node : -1;
}

std::vector<std::string> BookRegistry::symbols() const {
    std::vector<std::string> result;
    result.reserve(engines_.size());
    for (const auto& [symbol, entry] : engines_) {
        result.push_back(symbol);
    }
    std::sort(result.begin(), result.end());
    return result;
}

ReplayError BookRegistry::route(const OrderBookEvent& event) {
    const std::optional<std::string> symbol = event_symbol(event);

    if (!symbol) {
        ReplayError first_error = ReplayError::NONE;
        for (auto& [name, entry] : engines_) {
            const ReplayError result = entry.engine->process_event(event);
            if (first_error == ReplayError::NONE) {
                first_error = result;
            }
        }
        ++events_routed_;
        return first_error;
    }

    auto it = engines_.find(*symbol);
    if (it == engines_.end()) {
        ++unrouted_events_;
        return ReplayError::NONE;
    }

    ReplayEngine& engine = *it->second.engine;
    const ReplayError result = engine.process_event(event);
    ++events_routed_;

    if (market_data_ && market_data_->is_enabled()) {
        publish(engine, event, result);
    }
    return result;
}

void BookRegistry::publish(const ReplayEngine& engine, const OrderBookEvent& event, ReplayError result) {
    if (result != ReplayError::NONE) {
        return;
    }

    if (const auto* trade = std::get_if<TradeEvent>(&event)) {
        market_data_->publish_trade(engine.symbol(), *trade);
        return;
    }
    if (!std::holds_alternative<MarketEvent>(event)) {
        market_data_->publish_depth(Level2Snapshot::from_engine(engine, depth_levels_));
    }
}

void BookRegistry::set_market_data(MarketDataManager* manager, size_t depth_levels) noexcept {
    market_data_ = manager;
    depth_levels_ = depth_levels;
}

void BookRegistry::publish_stats() {
    if (!market_data_) {
        return;
    }
    for (const std::string& symbol : symbols()) {
        const ReplayEngine* engine = get_engine(symbol);
        market_data_->publish_replay_stats(symbol, engine->get_stats());
        market_data_->publish_metrics(engine->metrics().get_snapshot());
    }
}

} // namespace LobReplay
