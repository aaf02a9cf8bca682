#include "batchdl/download_manager.hpp"
#include "batchdl/errors.hpp"
#include "batchdl/logging.hpp"
#include "batchdl/rate_limiter.hpp"
#include "batchdl/slot_pool.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace batchdl {

namespace {

void joinAll(std::vector<std::thread>& threads) {
    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads.clear();
}

} // namespace

DownloadManager::DownloadManager(DownloadOptions options,
                                 RemoteSource& source,
                                 DestinationSink& destination,
                                 ProgressSink& sink)
    : options_(options), source_(source), destination_(destination), sink_(sink) {
    if (options_.concurrency_limit == 0) {
        throw std::invalid_argument("concurrency limit must be at least 1");
    }
    if (options_.chunk_size == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
}

RunSummary DownloadManager::run(const std::vector<DownloadTask>& tasks, const CancellationToken& token) {
    CancellationSource run_source;
    run_source.linkTo(cancel_source_.token());
    run_source.linkTo(token);
    const CancellationToken run_token = run_source.token();

    SlotPool slots(options_.concurrency_limit);
    RateLimiter limiter(options_.rate_limit);
    const TransferWorker worker(slots, limiter, source_, destination_, sink_, options_.chunk_size);

    logger()->info("starting {} downloads (concurrency {}, rate limit {})",
                   tasks.size(), options_.concurrency_limit,
                   limiter.unlimited() ? std::string{"none"} : std::to_string(options_.rate_limit) + " B/s");
    const auto started = std::chrono::steady_clock::now();

    std::vector<DownloadStatus> outcomes(tasks.size(), DownloadStatus::Canceled);
    std::vector<std::thread> threads;
    threads.reserve(tasks.size());
    try {
        for (std::size_t i = 0; i < tasks.size(); ++i) {
            threads.emplace_back([&worker, &tasks, &outcomes, &run_token, i]() {
                outcomes[i] = worker.run(tasks[i], run_token);
            });
        }
    } catch (const std::system_error& ex) {
        logger()->error("cannot start worker thread: {}", ex.what());
        run_source.cancel();
        joinAll(threads);
        throw;
    }
    joinAll(threads);

    RunSummary summary;
    for (const auto status : outcomes) {
        switch (status) {
            case DownloadStatus::Completed:
                ++summary.completed;
                break;
            case DownloadStatus::Failed:
                ++summary.failed;
                break;
            default:
                ++summary.canceled;
                break;
        }
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    logger()->info("run finished in {} ms: {} completed, {} failed, {} canceled",
                   elapsed.count(), summary.completed, summary.failed, summary.canceled);

    // A cancel arriving after the last task finished does not fail the run.
    if (summary.canceled > 0 && run_token.isCancellationRequested()) {
        throw OperationCanceled("download run canceled");
    }
    return summary;
}

void DownloadManager::cancel() {
    if (!cancel_source_.isCancellationRequested()) {
        logger()->info("cancel requested");
    }
    cancel_source_.cancel();
}

bool DownloadManager::isCanceled() const noexcept { return cancel_source_.isCancellationRequested(); }

RunSummary startRun(const std::vector<DownloadTask>& tasks,
                    std::size_t concurrency_limit,
                    std::int64_t rate_limit,
                    RemoteSource& source,
                    DestinationSink& destination,
                    ProgressSink& sink,
                    const CancellationToken& token) {
    DownloadOptions options;
    options.concurrency_limit = concurrency_limit;
    options.rate_limit = rate_limit;
    DownloadManager manager(options, source, destination, sink);
    return manager.run(tasks, token);
}

} // namespace batchdl
