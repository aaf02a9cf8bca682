#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace batchdl {

namespace detail {
class CancellationState;
} // namespace detail

// Unregisters its callback on destruction. If the callback is running on
// another thread at that moment, the destructor waits for it to return.
class CancellationRegistration {
public:
    CancellationRegistration() = default;
    ~CancellationRegistration();

    CancellationRegistration(CancellationRegistration&& other) noexcept;
    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept;
    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

    void reset();

private:
    friend class CancellationToken;
    CancellationRegistration(std::shared_ptr<detail::CancellationState> state, std::uint64_t id)
        : state_(std::move(state)), id_(id) {}

    std::shared_ptr<detail::CancellationState> state_;
    std::uint64_t id_{0};
};

// Read side of a cancellation switch. A default-constructed token can
// never be canceled.
class CancellationToken {
public:
    CancellationToken() = default;

    [[nodiscard]] bool isCancellationRequested() const noexcept;
    [[nodiscard]] bool canBeCanceled() const noexcept { return state_ != nullptr; }

    // Throws OperationCanceled once cancellation was requested.
    void throwIfCancellationRequested() const;

    // Sleeps for `duration` unless canceled first. Returns false when the
    // wait ended because of cancellation.
    bool waitFor(std::chrono::milliseconds duration) const;

    // Runs `callback` once when cancellation is requested, on the canceling
    // thread. Runs it immediately if already canceled. Callbacks must not
    // throw.
    [[nodiscard]] CancellationRegistration registerCallback(std::function<void()> callback) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

class CancellationSource {
public:
    CancellationSource();
    ~CancellationSource() = default;

    CancellationSource(CancellationSource&&) noexcept = default;
    CancellationSource& operator=(CancellationSource&&) noexcept = default;
    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;

    [[nodiscard]] CancellationToken token() const { return CancellationToken{state_}; }
    [[nodiscard]] bool isCancellationRequested() const noexcept;

    // Idempotent. Wakes every wait observing this source.
    void cancel();

    // Cancels this source whenever `parent` is canceled.
    void linkTo(const CancellationToken& parent);

private:
    std::shared_ptr<detail::CancellationState> state_;
    std::vector<CancellationRegistration> links_;
};

} // namespace batchdl
