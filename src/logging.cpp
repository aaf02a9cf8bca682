#include "batchdl/logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <iostream>
#include <mutex>
#include <vector>

namespace batchdl {

namespace {

constexpr const char* kLoggerName = "batchdl";
constexpr const char* kConsolePattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
constexpr const char* kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";

std::mutex logger_mutex;
std::shared_ptr<spdlog::logger> current_logger;

std::shared_ptr<spdlog::logger> makeLogger(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern(kConsolePattern);
    sinks.push_back(console);

    if (!config.file_path.empty()) {
        try {
            const std::filesystem::path path{config.file_path};
            if (path.has_parent_path()) {
                std::filesystem::create_directories(path.parent_path());
            }
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file_path, config.max_file_size, config.max_files);
            file->set_pattern(kFilePattern);
            file->set_level(spdlog::level::trace);
            sinks.push_back(file);
        } catch (const std::exception& ex) {
            std::cerr << "Failed to open log file " << config.file_path << ": " << ex.what() << std::endl;
        }
    }

    auto result = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    result->set_level(config.level);
    result->flush_on(spdlog::level::warn);
    return result;
}

} // namespace

void configureLogging(const LogConfig& config) {
    auto fresh = makeLogger(config);
    std::lock_guard<std::mutex> lock(logger_mutex);
    current_logger = std::move(fresh);
}

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    if (!current_logger) {
        current_logger = makeLogger(LogConfig{});
    }
    return current_logger;
}

} // namespace batchdl
