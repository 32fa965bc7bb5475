#pragma once

#include "types.hpp"
#include "events.hpp"
#include "instrument.hpp"
#include "replay_engine.hpp"
#include "market_data.hpp"
#include "numa_allocator.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace LobReplay {

/**
 * Multi-symbol front end that owns one ReplayEngine (and so one OrderBook)
 * per instrument and routes events to them by symbol.
 *
 * Symbols are added and removed from the setup thread; route() is called from
 * a single replay thread. Each engine's readers may run concurrently with it.
 */
class BookRegistry {
private:
    struct EngineDeleter {
        NumaAllocator* allocator;
        int numa_node;

        void operator()(ReplayEngine* engine) const noexcept {
            allocator->destroy(engine, numa_node);
        }
    };

    using EnginePtr = std::unique_ptr<ReplayEngine, EngineDeleter>;

    struct Entry {
        EnginePtr engine;
        int numa_node;
    };

    ReplayConfig config_;
    NumaAllocator allocator_;  // Declared before engines_: outlives every engine
    std::unordered_map<std::string, Entry> engines_;

    MarketDataManager* market_data_;
    size_t depth_levels_;

    uint64_t events_routed_;
    uint64_t unrouted_events_;

    void publish(const ReplayEngine& engine, const OrderBookEvent& event, ReplayError result);

public:
    explicit BookRegistry(const ReplayConfig& config = ReplayConfig());

    BookRegistry(const BookRegistry&) = delete;
    BookRegistry& operator=(const BookRegistry&) = delete;

    /**
     * Create the engine for an instrument on the given NUMA node
     * (-1 places it on the calling thread's node).
     * Returns false if the symbol is already registered.
     */
    bool add_symbol(const Instrument& instrument, int numa_node = -1);

    bool remove_symbol(const std::string& symbol);

    ReplayEngine* get_engine(const std::string& symbol) noexcept;
    const ReplayEngine* get_engine(const std::string& symbol) const noexcept;
    const OrderBook* get_book(const std::string& symbol) const noexcept;

    /**
     * NUMA node an engine was placed on, -1 if the symbol is unknown
     */
    int numa_node_of(const std::string& symbol) const noexcept;

    /**
     * Registered symbols in lexicographic order
     */
    std::vector<std::string> symbols() const;
    size_t size() const noexcept { return engines_.size(); }

    /**
     * Dispatch an event to the engine named by its symbol. Book-wide market
     * events go to every engine. Events for unknown symbols are counted and
     * dropped. Returns the engine's result (the first error for fan-out).
     */
    ReplayError route(const OrderBookEvent& event);

    /**
     * Publish trades and post-event depth to a manager owned by the caller.
     * nullptr detaches.
     */
    void set_market_data(MarketDataManager* manager, size_t depth_levels = 10) noexcept;

    /**
     * Publish current ReplayStats and book metrics for every symbol through
     * the attached manager
     */
    void publish_stats();

    uint64_t events_routed() const noexcept { return events_routed_; }
    uint64_t unrouted_events() const noexcept { return unrouted_events_; }
    const ReplayConfig& config() const noexcept { return config_; }
    const NumaAllocator& allocator() const noexcept { return allocator_; }
};

} // namespace LobReplay
