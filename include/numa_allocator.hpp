#pragma once

#include <cstddef>
#include <memory>
#include <new>
#include <vector>
#include <atomic>
#include <utility>

namespace LobReplay {

/**
 * NUMA-aware memory allocator for per-symbol replay state
 *
 * Key concepts:
 * - Each symbol's engine and book can be placed on the node of the CPU that replays it
 * - Thread-local node affinity, falling back to the node of the current CPU
 * - Per-node allocation accounting
 *
 * Without kernel NUMA support every allocation comes from a single node 0
 * served by aligned heap allocation.
 */
class NumaAllocator {
private:
    struct NumaNode {
        int node_id;
        std::atomic<size_t> allocated_bytes{0};
        std::atomic<size_t> allocation_count{0};

        explicit NumaNode(int id) : node_id(id) {}
    };

    std::vector<std::unique_ptr<NumaNode>> numa_nodes_;
    bool numa_available_;
    int max_numa_nodes_;

    // Thread-local storage for NUMA node affinity
    static thread_local int thread_numa_node_;

public:
    NumaAllocator();

    NumaAllocator(const NumaAllocator&) = delete;
    NumaAllocator& operator=(const NumaAllocator&) = delete;

    /**
     * Pin the calling thread's default allocations to a NUMA node
     */
    void set_thread_affinity(int numa_node) noexcept;

    /**
     * Current thread's NUMA node (manually set or auto-detected)
     */
    int get_thread_numa_node() const noexcept;

    /**
     * Node an allocation request lands on: the thread's node for -1,
     * node 0 for out-of-range nodes
     */
    int resolve_node(int node) const noexcept;

    /**
     * Allocate on the current thread's node. Returns nullptr on failure.
     */
    void* allocate(size_t size, size_t alignment = alignof(std::max_align_t)) noexcept;

    /**
     * Allocate on a specific node; out-of-range nodes map to node 0.
     * Returns nullptr on failure.
     */
    void* allocate_on_node(size_t size, int node, size_t alignment = alignof(std::max_align_t)) noexcept;

    /**
     * Free memory returned by allocate/allocate_on_node. node must be the
     * node the memory was allocated on.
     */
    void deallocate(void* ptr, size_t size, int node) noexcept;

    /**
     * Construct a T on a resolved node.
     * Throws std::bad_alloc if the node has no memory.
     */
    template<typename T, typename... Args>
    T* create_on_node(int node, Args&&... args) {
        const int target = resolve_node(node);
        void* memory = allocate_on_node(sizeof(T), target, alignof(T));
        if (!memory) {
            throw std::bad_alloc();
        }
        try {
            return new (memory) T(std::forward<Args>(args)...);
        } catch (...) {
            deallocate(memory, sizeof(T), target);
            throw;
        }
    }

    /**
     * Destroy an object made by create_on_node; node is the resolved node
     * it was created on
     */
    template<typename T>
    void destroy(T* object, int node) noexcept {
        if (!object) return;
        object->~T();
        deallocate(object, sizeof(T), node);
    }

    /**
     * NUMA topology information
     */
    bool is_numa_available() const noexcept { return numa_available_; }
    int get_numa_node_count() const noexcept { return max_numa_nodes_; }

    /**
     * Memory statistics per NUMA node
     */
    struct NumaStats {
        int node_id;
        size_t allocated_bytes;
        size_t allocation_count;
    };

    std::vector<NumaStats> get_numa_statistics() const;
    void print_numa_statistics() const;
};

} // namespace LobReplay
