#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace batchdl {

enum class DownloadStatus {
    Starting,
    Downloading,
    Completed,
    Failed,
    Canceled
};

[[nodiscard]] constexpr bool isTerminal(DownloadStatus status) noexcept {
    return status == DownloadStatus::Completed ||
           status == DownloadStatus::Failed ||
           status == DownloadStatus::Canceled;
}

[[nodiscard]] std::string_view toString(DownloadStatus status) noexcept;

struct ProgressEvent {
    std::string name;
    DownloadStatus status{DownloadStatus::Starting};
    std::uint64_t bytes_transferred{0};
    std::optional<std::uint64_t> total_bytes;
    std::size_t active_slots{0};
    // Set only on Failed.
    std::optional<std::string> error_detail;
};

// Receives events from worker threads. Calls for different tasks may run
// concurrently; calls for one task arrive in emission order.
// Implementations must not block indefinitely.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    virtual void onProgress(const ProgressEvent& event) = 0;
};

class CallbackProgressSink final : public ProgressSink {
public:
    using Callback = std::function<void(const ProgressEvent&)>;

    explicit CallbackProgressSink(Callback callback) : callback_(std::move(callback)) {}

    void onProgress(const ProgressEvent& event) override {
        if (callback_) {
            callback_(event);
        }
    }

private:
    Callback callback_;
};

} // namespace batchdl
