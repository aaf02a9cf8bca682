#pragma once

#include "progress.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace batchdl {

// Terminal progress display: keeps the latest event per task and redraws a
// panel from a background thread.
class ConsolePanel final : public ProgressSink {
public:
    explicit ConsolePanel(std::ostream& out,
                          std::chrono::milliseconds interval = std::chrono::milliseconds(200));
    ~ConsolePanel() override;

    ConsolePanel(const ConsolePanel&) = delete;
    ConsolePanel& operator=(const ConsolePanel&) = delete;

    void onProgress(const ProgressEvent& event) override;

    void start();
    // Stops the render thread and draws the final state.
    void stop();

    [[nodiscard]] std::string buildPanel() const;

    static std::string formatTaskLine(const ProgressEvent& event);
    static std::string formatSize(std::uint64_t bytes);

private:
    void renderLoop();
    void redraw(const std::string& panel);

    std::ostream& out_;
    const std::chrono::milliseconds interval_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool running_{false};
    std::vector<std::string> order_;
    std::unordered_map<std::string, ProgressEvent> latest_;
    std::size_t active_slots_{0};

    std::thread thread_;
    std::size_t previous_lines_{0};
};

} // namespace batchdl
