#include "numa_allocator.hpp"
#include <cstdlib>
#include <iostream>
#include <numa.h>
#include <sched.h>

namespace LobReplay {

thread_local int NumaAllocator::thread_numa_node_ = -1;

namespace {

size_t round_up(size_t size, size_t alignment) noexcept {
    return (size + alignment - 1) / alignment * alignment;
}

} // namespace

NumaAllocator::NumaAllocator()
    : numa_available_(numa_available() >= 0), max_numa_nodes_(1) {
    if (numa_available_) {
        max_numa_nodes_ = numa_max_node() + 1;
    }

    for (int node = 0; node < max_numa_nodes_; ++node) {
        numa_nodes_.push_back(std::make_unique<NumaNode>(node));
    }
}

void NumaAllocator::set_thread_affinity(int numa_node) noexcept {
    if (numa_node >= 0 && numa_node < max_numa_nodes_) {
        thread_numa_node_ = numa_node;
    }
}

int NumaAllocator::get_thread_numa_node() const noexcept {
    if (thread_numa_node_ >= 0 && thread_numa_node_ < max_numa_nodes_) {
        return thread_numa_node_;
    }

    if (numa_available_) {
        // Auto-detect based on current CPU
        const int cpu = sched_getcpu();
        if (cpu >= 0) {
            const int node = numa_node_of_cpu(cpu);
            if (node >= 0 && node < max_numa_nodes_) {
                return node;
            }
        }
    }

    return 0;  // Default to node 0
}

int NumaAllocator::resolve_node(int node) const noexcept {
    if (node < 0) {
        return get_thread_numa_node();
    }
    return node < max_numa_nodes_ ? node : 0;
}

void* NumaAllocator::allocate(size_t size, size_t alignment) noexcept {
    return allocate_on_node(size, get_thread_numa_node(), alignment);
}

void* NumaAllocator::allocate_on_node(size_t size, int node, size_t alignment) noexcept {
    if (size == 0) {
        return nullptr;
    }
    if (node < 0 || node >= max_numa_nodes_) {
        node = 0;
    }

    // numa_alloc_onnode hands out whole pages, which covers any object alignment
    void* ptr = numa_available_
        ? numa_alloc_onnode(size, node)
        : std::aligned_alloc(alignment, round_up(size, alignment));

    if (ptr) {
        NumaNode* numa_node = numa_nodes_[node].get();
        numa_node->allocated_bytes.fetch_add(size, std::memory_order_relaxed);
        numa_node->allocation_count.fetch_add(1, std::memory_order_relaxed);
    }

    return ptr;
}

void NumaAllocator::deallocate(void* ptr, size_t size, int node) noexcept {
    if (!ptr) return;

    if (node >= 0 && node < max_numa_nodes_) {
        NumaNode* numa_node = numa_nodes_[node].get();
        numa_node->allocated_bytes.fetch_sub(size, std::memory_order_relaxed);
        numa_node->allocation_count.fetch_sub(1, std::memory_order_relaxed);
    }

    if (numa_available_) {
        numa_free(ptr, size);
    } else {
        std::free(ptr);
    }
}

std::vector<NumaAllocator::NumaStats> NumaAllocator::get_numa_statistics() const {
    std::vector<NumaStats> stats;
    stats.reserve(numa_nodes_.size());

    for (const auto& node : numa_nodes_) {
        stats.push_back({
            node->node_id,
            node->allocated_bytes.load(std::memory_order_relaxed),
            node->allocation_count.load(std::memory_order_relaxed)
        });
    }

    return stats;
}

void NumaAllocator::print_numa_statistics() const {
    std::cout << "\n=== NUMA MEMORY STATISTICS ===\n";
    std::cout << "NUMA Available: " << (numa_available_ ? "YES" : "NO") << "\n";
    std::cout << "NUMA Nodes: " << max_numa_nodes_ << "\n";

    for (const auto& stat : get_numa_statistics()) {
        std::cout << "Node " << stat.node_id << ":\n";
        std::cout << "  Allocated: " << stat.allocated_bytes / 1024 << " KB\n";
        std::cout << "  Allocations: " << stat.allocation_count << "\n";
    }
    std::cout << "\n";
}

} // namespace LobReplay
