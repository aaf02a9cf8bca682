#include "batchdl/cancellation.hpp"
#include "batchdl/errors.hpp"

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace batchdl {

namespace detail {

class CancellationState {
public:
    [[nodiscard]] bool canceled() const noexcept {
        return canceled_.load(std::memory_order_acquire);
    }

    void cancel() {
        std::unique_lock<std::mutex> lock(mutex_);
        if (canceled_.load(std::memory_order_relaxed)) {
            return;
        }
        canceled_.store(true, std::memory_order_release);
        executing_thread_ = std::this_thread::get_id();
        cv_.notify_all();

        // Callbacks run one at a time with the lock released, so that a
        // callback may take locks of its own.
        while (!callbacks_.empty()) {
            auto it = callbacks_.begin();
            executing_id_ = it->first;
            auto callback = std::move(it->second);
            callbacks_.erase(it);

            lock.unlock();
            callback();
            lock.lock();

            executing_id_ = 0;
            cv_.notify_all();
        }
        executing_thread_ = std::thread::id{};
    }

    // Returns 0 when the callback already ran because the state was canceled.
    std::uint64_t add(std::function<void()> callback) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!canceled_.load(std::memory_order_relaxed)) {
                const std::uint64_t id = next_id_++;
                callbacks_.emplace(id, std::move(callback));
                return id;
            }
        }
        callback();
        return 0;
    }

    void remove(std::uint64_t id) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (callbacks_.erase(id) > 0) {
            return;
        }
        if (executing_thread_ == std::this_thread::get_id()) {
            return;
        }
        cv_.wait(lock, [this, id] { return executing_id_ != id; });
    }

    bool waitFor(std::chrono::milliseconds duration) {
        std::unique_lock<std::mutex> lock(mutex_);
        return !cv_.wait_for(lock, duration, [this] { return canceled(); });
    }

private:
    std::atomic<bool> canceled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::uint64_t, std::function<void()>> callbacks_;
    std::uint64_t next_id_{1};
    std::uint64_t executing_id_{0};
    std::thread::id executing_thread_;
};

} // namespace detail

CancellationRegistration::~CancellationRegistration() { reset(); }

CancellationRegistration::CancellationRegistration(CancellationRegistration&& other) noexcept
    : state_(std::move(other.state_)), id_(std::exchange(other.id_, 0)) {}

CancellationRegistration& CancellationRegistration::operator=(CancellationRegistration&& other) noexcept {
    if (this != &other) {
        reset();
        state_ = std::move(other.state_);
        id_ = std::exchange(other.id_, 0);
    }
    return *this;
}

void CancellationRegistration::reset() {
    if (state_ && id_ != 0) {
        state_->remove(id_);
    }
    state_.reset();
    id_ = 0;
}

bool CancellationToken::isCancellationRequested() const noexcept {
    return state_ && state_->canceled();
}

void CancellationToken::throwIfCancellationRequested() const {
    if (isCancellationRequested()) {
        throw OperationCanceled();
    }
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const {
    if (!state_) {
        std::this_thread::sleep_for(duration);
        return true;
    }
    return state_->waitFor(duration);
}

CancellationRegistration CancellationToken::registerCallback(std::function<void()> callback) const {
    if (!state_ || !callback) {
        return {};
    }
    const std::uint64_t id = state_->add(std::move(callback));
    if (id == 0) {
        return {};
    }
    return CancellationRegistration{state_, id};
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

bool CancellationSource::isCancellationRequested() const noexcept {
    return state_->canceled();
}

void CancellationSource::cancel() { state_->cancel(); }

void CancellationSource::linkTo(const CancellationToken& parent) {
    if (!parent.canBeCanceled()) {
        return;
    }
    std::weak_ptr<detail::CancellationState> weak = state_;
    auto registration = parent.registerCallback([weak] {
        if (auto state = weak.lock()) {
            state->cancel();
        }
    });
    links_.push_back(std::move(registration));
}

} // namespace batchdl
