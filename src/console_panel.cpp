#include "batchdl/console_panel.hpp"

#include <algorithm>
#include <filesystem>
#include <ostream>

#include <fmt/format.h>

namespace batchdl {

namespace {

constexpr std::size_t kNameWidth = 20;
constexpr int kBarWidth = 30;

std::string displayName(const std::string& name) {
    std::string display;
    if (!name.empty()) {
        display = std::filesystem::path{name}.filename().string();
    }
    if (display.empty()) {
        display = name;
    }
    if (display.size() > kNameWidth) {
        display = display.substr(0, kNameWidth);
    }
    if (display.empty()) {
        display = "(unnamed)";
    }
    return display;
}

std::string progressBar(double ratio) {
    const int filled = static_cast<int>(std::clamp(ratio, 0.0, 1.0) * kBarWidth);
    std::string bar;
    bar.reserve(static_cast<std::size_t>(kBarWidth) * 3);
    for (int i = 0; i < kBarWidth; ++i) {
        bar += (i < filled) ? "█" : "░";
    }
    return bar;
}

} // namespace

ConsolePanel::ConsolePanel(std::ostream& out, std::chrono::milliseconds interval)
    : out_(out), interval_(interval) {}

ConsolePanel::~ConsolePanel() { stop(); }

void ConsolePanel::onProgress(const ProgressEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = latest_.find(event.name);
    if (it == latest_.end()) {
        order_.push_back(event.name);
        latest_.emplace(event.name, event);
    } else {
        it->second = event;
    }
    active_slots_ = event.active_slots;
}

void ConsolePanel::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return;
        }
        running_ = true;
    }
    thread_ = std::thread([this] { renderLoop(); });
}

void ConsolePanel::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
        redraw(buildPanel());
        out_ << std::flush;
    }
}

void ConsolePanel::renderLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        lock.unlock();
        redraw(buildPanel());
        lock.lock();
        cv_.wait_for(lock, interval_, [this] { return !running_; });
    }
}

std::string ConsolePanel::buildPanel() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string panel;
    panel.reserve(order_.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("Downloads ({} tasks)\n", order_.size());
    panel.append("--------------------------------------------------\n");

    std::uint64_t total_all = 0;
    std::uint64_t downloaded_all = 0;
    for (const auto& name : order_) {
        const auto& event = latest_.at(name);
        panel += formatTaskLine(event);
        panel.push_back('\n');

        if (event.total_bytes) {
            total_all += *event.total_bytes;
            downloaded_all += event.bytes_transferred;
        }
    }

    panel.append("--------------------------------------------------\n");
    panel += fmt::format("Active downloads: {}\n", active_slots_);
    if (total_all > 0) {
        const double ratio = static_cast<double>(downloaded_all) / static_cast<double>(total_all);
        panel += fmt::format("Overall: {:>3}%", static_cast<int>(ratio * 100.0));
    } else {
        panel.append("Overall: N/A");
    }
    panel.push_back('\n');
    panel.append("==================================================\n");
    return panel;
}

std::string ConsolePanel::formatTaskLine(const ProgressEvent& event) {
    const std::string name = displayName(event.name);

    switch (event.status) {
        case DownloadStatus::Starting:
            return fmt::format("{:<20} [Starting...]", name);
        case DownloadStatus::Completed:
            return fmt::format("{:<20} [{}] 100% ({})  ✅ Done", name, progressBar(1.0),
                               formatSize(event.total_bytes.value_or(event.bytes_transferred)));
        case DownloadStatus::Failed:
            return fmt::format("{:<20} ❌ {}", name, event.error_detail.value_or("failed"));
        case DownloadStatus::Canceled:
            return fmt::format("{:<20} ↻ Canceled after {}", name, formatSize(event.bytes_transferred));
        case DownloadStatus::Downloading:
            break;
    }

    if (event.total_bytes && *event.total_bytes > 0) {
        const double ratio = static_cast<double>(event.bytes_transferred) /
                             static_cast<double>(*event.total_bytes);
        return fmt::format("{:<20} [{}] {:>3}% ({}/{})", name, progressBar(ratio),
                           static_cast<int>(ratio * 100.0),
                           formatSize(event.bytes_transferred), formatSize(*event.total_bytes));
    }
    return fmt::format("{:<20} {} downloaded", name, formatSize(event.bytes_transferred));
}

std::string ConsolePanel::formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

void ConsolePanel::redraw(const std::string& panel) {
    const auto current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines_ > 0) {
        out_ << "\033[" << previous_lines_ << "F\033[J";
    }
    out_ << panel << std::flush;
    previous_lines_ = current_lines;
}

} // namespace batchdl
