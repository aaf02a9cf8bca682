#pragma once

#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <string>

namespace batchdl {

struct LogConfig {
    spdlog::level::level_enum level{spdlog::level::info};
    // Empty keeps console output only.
    std::string file_path;
    std::size_t max_file_size{10 * 1024 * 1024};
    std::size_t max_files{3};
};

// Replaces the `batchdl` logger. Safe to call more than once.
void configureLogging(const LogConfig& config = LogConfig{});

// Shared library logger; created with console output on first use.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

} // namespace batchdl
