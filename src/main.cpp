#include "book_registry.hpp"
#include "feed_handler.hpp"
#include "spsc_ring_buffer.hpp"
#include <iostream>
#include <thread>
#include <chrono>
#include <cstdlib>

using namespace LobReplay;

int main(int argc, char** argv) {
    std::cout << "C++20 Limit Order Book Replay\n";
    std::cout << "=============================\n\n";

    FeedProfile profile;
    profile.symbol = "SIM";
    profile.reorder_rate = 0.01;
    profile.duplicate_rate = 0.005;
    profile.drop_rate = 0.0001;
    if (argc > 1) {
        const long long requested = std::atoll(argv[1]);
        if (requested <= 0) {
            std::cerr << "ERROR: event count must be positive, got '" << argv[1] << "'\n";
            return 1;
        }
        profile.total_events = static_cast<uint64_t>(requested);
    }

    // Initialize components
    SPSCRingBuffer ring_buffer;
    BookRegistry registry;
    registry.add_symbol(Instrument(profile.symbol));
    FeedHandler feed_handler(profile);

    std::cout << "Replaying " << profile.total_events << " events (reorder="
              << profile.reorder_rate << " duplicate=" << profile.duplicate_rate
              << " drop=" << profile.drop_rate << ")...\n\n";

    const auto start_time = std::chrono::high_resolution_clock::now();

    // Launch producer and consumer threads
    uint64_t events_replayed = 0;
    uint64_t replay_errors = 0;
    std::thread producer_thread(&FeedHandler::run, &feed_handler, &ring_buffer);
    std::thread consumer_thread([&]() {
        OrderBookEvent event;
        while (!feed_handler.finished() || !ring_buffer.empty()) {
            if (ring_buffer.dequeue(event)) {
                if (registry.route(event) != ReplayError::NONE) {
                    ++replay_errors;
                }
                ++events_replayed;
            } else {
                std::this_thread::yield();
            }
        }
    });

    // Wait for completion
    producer_thread.join();
    consumer_thread.join();

    const auto end_time = std::chrono::high_resolution_clock::now();
    const auto total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    const double events_per_second = total_duration.count() > 0
        ? (events_replayed * 1000.0) / total_duration.count() : 0.0;

    const ReplayEngine* engine = registry.get_engine(profile.symbol);
    const ReplayStats stats = engine->get_stats();
    const FeedStats& feed_stats = feed_handler.stats();

    // Print results
    std::cout << "\n=== BENCHMARK RESULTS ===\n";
    std::cout << "Total run time: " << total_duration.count() << " ms\n";
    std::cout << "Events replayed: " << events_replayed << "\n";
    std::cout << "Events per second: " << static_cast<uint64_t>(events_per_second) << "\n";
    std::cout << "Replay errors: " << replay_errors << "\n";

    std::cout << "\n=== REPLAY STATISTICS ===\n";
    std::cout << "Orders processed: " << stats.orders_processed << "\n";
    std::cout << "Trades processed: " << stats.trades_processed << "\n";
    std::cout << "Snapshots processed: " << stats.snapshots_processed << "\n";
    std::cout << "Deltas processed: " << stats.deltas_processed << "\n";
    std::cout << "Events buffered: " << stats.events_buffered << "\n";
    std::cout << "Duplicates ignored: " << stats.duplicates_ignored << "\n";
    std::cout << "Sequence gaps: " << stats.sequence_gaps << "\n";
    std::cout << "Buffer overflows: " << stats.buffer_overflows << "\n";
    std::cout << "Checksum errors: " << stats.checksum_errors << "\n";
    std::cout << "Still buffered: " << engine->buffered_count() << "\n";

    const LatencyPercentiles latency = engine->latency_tracker().get_percentiles();
    if (latency.count > 0) {
        std::cout << "\n=== LATENCY STATISTICS ===\n";
        std::cout << "P50 latency: " << latency.p50 << " ns\n";
        std::cout << "P95 latency: " << latency.p95 << " ns\n";
        std::cout << "P99 latency: " << latency.p99 << " ns\n";
        std::cout << "P99.9 latency: " << latency.p999 << " ns\n";
    }

    std::cout << "\n" << engine->metrics().get_snapshot().format_report();

    const OrderBook& book = engine->order_book();
    const auto [best_bid, best_ask] = book.get_bbo();
    std::cout << "\n=== FINAL BOOK ===\n";
    std::cout << "Bid levels: " << book.level_count(Side::BUY)
              << " Ask levels: " << book.level_count(Side::SELL) << "\n";
    if (best_bid && best_ask) {
        std::cout << "BBO: " << *best_bid << " / " << *best_ask << "\n";
    }

    // Correctness check
    std::cout << "\n=== CORRECTNESS CHECK ===\n";
    const bool snapshots_ok = stats.snapshots_processed == feed_stats.snapshots.load();
    const bool checksums_ok = stats.checksum_errors == 0;
    std::cout << "Snapshots delivered/applied: " << feed_stats.snapshots.load()
              << "/" << stats.snapshots_processed << " " << (snapshots_ok ? "PASS" : "FAIL") << "\n";
    std::cout << "Snapshot checksums: " << (checksums_ok ? "PASS" : "FAIL") << "\n";

    return (snapshots_ok && checksums_ok) ? 0 : 1;
}
