#pragma once

#include "cancellation.hpp"

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace batchdl {

// Counting gate bounding the number of transfers in flight.
class SlotPool {
public:
    explicit SlotPool(std::size_t capacity);

    SlotPool(const SlotPool&) = delete;
    SlotPool& operator=(const SlotPool&) = delete;

    // Blocks until a slot is free. Throws OperationCanceled if `token` is
    // canceled before a slot was taken; no slot is held in that case.
    void acquire(const CancellationToken& token);
    void release() noexcept;

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] std::size_t active() const;

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t active_{0};
};

class SlotGuard {
public:
    SlotGuard(SlotPool& pool, const CancellationToken& token) : pool_(pool) {
        pool_.acquire(token);
    }
    ~SlotGuard() { pool_.release(); }

    SlotGuard(const SlotGuard&) = delete;
    SlotGuard& operator=(const SlotGuard&) = delete;

private:
    SlotPool& pool_;
};

} // namespace batchdl
