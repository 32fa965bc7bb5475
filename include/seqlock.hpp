#pragma once

#include <atomic>
#include <cstdint>
#include <thread>

namespace LobReplay {

/**
 * Sequence lock for "many readers, occasional writer" data.
 *
 * The writer bumps the version to an odd value, updates the protected fields
 * and bumps it back to even. Readers snapshot the version, copy the fields and
 * retry if the version was odd or changed underneath them. Readers never block
 * the writer and never observe a torn group of fields.
 *
 * Protected fields must themselves be std::atomic accessed with relaxed
 * ordering; the fences here provide the ordering. Concurrent writers must be
 * serialized by the caller.
 */
class SeqLock {
private:
    alignas(64) std::atomic<uint64_t> version_;

public:
    SeqLock() noexcept : version_(0) {}

    SeqLock(const SeqLock&) = delete;
    SeqLock& operator=(const SeqLock&) = delete;

    void write_begin() noexcept {
        version_.store(version_.load(std::memory_order_relaxed) + 1, std::memory_order_relaxed);
        std::atomic_thread_fence(std::memory_order_release);
    }

    void write_end() noexcept {
        version_.store(version_.load(std::memory_order_relaxed) + 1, std::memory_order_release);
    }

    uint64_t read_begin() const noexcept {
        uint64_t version = version_.load(std::memory_order_acquire);
        while (version & 1) {
            std::this_thread::yield();
            version = version_.load(std::memory_order_acquire);
        }
        return version;
    }

    bool read_retry(uint64_t start_version) const noexcept {
        std::atomic_thread_fence(std::memory_order_acquire);
        return version_.load(std::memory_order_relaxed) != start_version;
    }

    /**
     * Run `reader` until it completes without overlapping a write.
     * `reader` must only perform relaxed loads of the protected fields.
     */
    template<typename Reader>
    auto read(Reader&& reader) const noexcept(noexcept(reader())) {
        for (;;) {
            const uint64_t start = read_begin();
            auto value = reader();
            if (!read_retry(start)) {
                return value;
            }
        }
    }

    uint64_t version() const noexcept {
        return version_.load(std::memory_order_acquire);
    }

    class WriteGuard {
    private:
        SeqLock& lock_;

    public:
        explicit WriteGuard(SeqLock& lock) noexcept : lock_(lock) { lock_.write_begin(); }
        ~WriteGuard() { lock_.write_end(); }

        WriteGuard(const WriteGuard&) = delete;
        WriteGuard& operator=(const WriteGuard&) = delete;
    };
};

} // namespace LobReplay
