#include "batchdl/slot_pool.hpp"
#include "batchdl/errors.hpp"

#include <stdexcept>

namespace batchdl {

SlotPool::SlotPool(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("slot pool capacity must be at least 1");
    }
}

void SlotPool::acquire(const CancellationToken& token) {
    token.throwIfCancellationRequested();

    // Declared before the lock so it is released after it: the callback
    // needs the mutex to deliver its wakeup.
    const auto wakeup = token.registerCallback([this] {
        std::lock_guard<std::mutex> lock(mutex_);
        cv_.notify_all();
    });

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this, &token] {
        return token.isCancellationRequested() || active_ < capacity_;
    });
    if (token.isCancellationRequested()) {
        throw OperationCanceled("canceled while waiting for a transfer slot");
    }
    ++active_;
}

void SlotPool::release() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_ > 0) {
            --active_;
        }
    }
    cv_.notify_one();
}

std::size_t SlotPool::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

} // namespace batchdl
