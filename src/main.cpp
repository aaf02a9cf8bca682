#include "batchdl/console_panel.hpp"
#include "batchdl/curl_remote_source.hpp"
#include "batchdl/detail/curl_utils.hpp"
#include "batchdl/download_manager.hpp"
#include "batchdl/errors.hpp"
#include "batchdl/file_destination.hpp"
#include "batchdl/logging.hpp"

#include <atomic>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <pthread.h>

namespace {

constexpr int kExitCanceled = 130;

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName
              << " [options] <url1> <name1> [<url2> <name2> ...]"
              << std::endl;
    std::cerr << "Options:\n"
              << "  -d <directory>      Download directory (default: current directory)\n"
              << "  -c <count>          Maximum simultaneous downloads (default: 3)\n"
              << "  -r <bytes/sec>      Aggregate rate limit, 0 for unlimited (default: 0)\n"
              << "  --min-free <bytes>  Refuse to start a file when free space is at or below this\n"
              << "  --log-file <path>   Also write logs to a rotating file\n"
              << "  -v                  Verbose logging\n"
              << "  -q                  Only log warnings and errors\n"
              << "  -h, --help          Show this message" << std::endl;
}

std::int64_t parseNumber(const std::string& option, const std::string& value) {
    std::size_t consumed = 0;
    std::int64_t parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + option + ": " + value);
    }
    if (consumed != value.size() || parsed < 0) {
        throw std::runtime_error("Invalid value for " + option + ": " + value);
    }
    return parsed;
}

// Turns SIGINT/SIGTERM into DownloadManager::cancel(). The signals are
// blocked in every thread and consumed by a dedicated sigwait thread, so the
// cancel runs in normal thread context.
class SignalCanceler {
public:
    SignalCanceler() {
        sigemptyset(&signals_);
        sigaddset(&signals_, SIGINT);
        sigaddset(&signals_, SIGTERM);
        if (pthread_sigmask(SIG_BLOCK, &signals_, nullptr) != 0) {
            throw std::runtime_error("Failed to block termination signals");
        }
    }

    ~SignalCanceler() { stop(); }

    SignalCanceler(const SignalCanceler&) = delete;
    SignalCanceler& operator=(const SignalCanceler&) = delete;

    void watch(batchdl::DownloadManager& manager) {
        thread_ = std::thread([this, &manager] {
            int signal = 0;
            while (sigwait(&signals_, &signal) == 0) {
                if (finished_.load()) {
                    return;
                }
                batchdl::logger()->warn("received signal {}, canceling downloads", signal);
                manager.cancel();
            }
        });
    }

    void stop() {
        if (!thread_.joinable()) {
            return;
        }
        finished_.store(true);
        pthread_kill(thread_.native_handle(), SIGTERM);
        thread_.join();
    }

private:
    sigset_t signals_{};
    std::atomic<bool> finished_{false};
    std::thread thread_;
};

} // namespace

int main(int argc, char** argv) {
    try {
        batchdl::LogConfig log_config;
        batchdl::DownloadOptions options;
        batchdl::FileDestinationOptions destination_options;
        std::filesystem::path download_dir = std::filesystem::current_path();
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            }
            if (option == "-v") {
                log_config.level = spdlog::level::debug;
                ++arg_index;
                continue;
            }
            if (option == "-q") {
                log_config.level = spdlog::level::warn;
                ++arg_index;
                continue;
            }

            if (arg_index + 1 >= argc) {
                printUsage(argv[0]);
                return 1;
            }
            const std::string value = argv[arg_index + 1];

            if (option == "-d") {
                download_dir = value;
            } else if (option == "-c") {
                const auto count = parseNumber(option, value);
                if (count <= 0 || count > 64) {
                    throw std::runtime_error("Concurrency must be between 1 and 64.");
                }
                options.concurrency_limit = static_cast<std::size_t>(count);
            } else if (option == "-r") {
                options.rate_limit = parseNumber(option, value);
            } else if (option == "--min-free") {
                destination_options.min_free_bytes = static_cast<std::uint64_t>(parseNumber(option, value));
            } else if (option == "--log-file") {
                log_config.file_path = value;
            } else {
                printUsage(argv[0]);
                return 1;
            }
            arg_index += 2;
        }

        if (argc - arg_index < 2 || (argc - arg_index) % 2 != 0) {
            printUsage(argv[0]);
            return 1;
        }

        batchdl::configureLogging(log_config);
        batchdl::detail::ensureCurlInitialized();

        destination_options.base_directory = download_dir.string();

        std::vector<batchdl::DownloadTask> tasks;
        for (int i = arg_index; i < argc; i += 2) {
            batchdl::DownloadTask task;
            task.url = argv[i];
            task.name = argv[i + 1];
            task.destination = argv[i + 1];
            tasks.push_back(std::move(task));
        }

        batchdl::CurlRemoteSource source;
        batchdl::FileDestination destination(destination_options);
        batchdl::ConsolePanel panel(std::cout);
        batchdl::DownloadManager manager(options, source, destination, panel);

        // Must precede every other thread so they inherit the signal mask.
        SignalCanceler canceler;
        canceler.watch(manager);

        panel.start();
        batchdl::RunSummary summary;
        try {
            summary = manager.run(tasks);
        } catch (const batchdl::OperationCanceled&) {
            panel.stop();
            canceler.stop();
            std::cerr << "\nDownloads were canceled." << std::endl;
            return kExitCanceled;
        }
        panel.stop();
        canceler.stop();

        std::cout << fmt::format("\n{} completed, {} failed\n", summary.completed, summary.failed);
        return summary.failed == 0 ? 0 : 1;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
