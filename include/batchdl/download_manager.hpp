#pragma once

#include "cancellation.hpp"
#include "destination_sink.hpp"
#include "download_task.hpp"
#include "progress.hpp"
#include "remote_source.hpp"
#include "transfer_worker.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace batchdl {

struct DownloadOptions {
    std::size_t concurrency_limit{3};
    // Aggregate bytes per second across all transfers; <= 0 is unlimited.
    std::int64_t rate_limit{0};
    std::size_t chunk_size{kDefaultChunkSize};
};

struct RunSummary {
    std::size_t completed{0};
    std::size_t failed{0};
    std::size_t canceled{0};

    [[nodiscard]] std::size_t total() const noexcept { return completed + failed + canceled; }
};

// Downloads a batch of tasks with one thread per task, at most
// `concurrency_limit` of them transferring at a time.
class DownloadManager {
public:
    DownloadManager(DownloadOptions options,
                    RemoteSource& source,
                    DestinationSink& destination,
                    ProgressSink& sink);

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    // Returns once every task has emitted its terminal event. Throws
    // OperationCanceled if cancel() or `token` fired during the run; task
    // failures never throw.
    RunSummary run(const std::vector<DownloadTask>& tasks, const CancellationToken& token = {});

    // Idempotent and permanent: later runs are canceled immediately.
    void cancel();
    [[nodiscard]] bool isCanceled() const noexcept;

private:
    DownloadOptions options_;
    RemoteSource& source_;
    DestinationSink& destination_;
    ProgressSink& sink_;
    CancellationSource cancel_source_;
};

RunSummary startRun(const std::vector<DownloadTask>& tasks,
                    std::size_t concurrency_limit,
                    std::int64_t rate_limit,
                    RemoteSource& source,
                    DestinationSink& destination,
                    ProgressSink& sink,
                    const CancellationToken& token = {});

} // namespace batchdl
