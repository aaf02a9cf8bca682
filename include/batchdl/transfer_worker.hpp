#pragma once

#include "cancellation.hpp"
#include "destination_sink.hpp"
#include "download_task.hpp"
#include "progress.hpp"
#include "rate_limiter.hpp"
#include "remote_source.hpp"
#include "slot_pool.hpp"

#include <cstddef>

namespace batchdl {

inline constexpr std::size_t kDefaultChunkSize = 8 * 1024;

// Runs the pipeline of one task: slot, remote stream, destination, chunked
// copy through the rate limiter, progress events. Shared by all threads of
// a run; holds no per-task state.
class TransferWorker {
public:
    TransferWorker(SlotPool& slots,
                   RateLimiter& limiter,
                   RemoteSource& source,
                   DestinationSink& destination,
                   ProgressSink& sink,
                   std::size_t chunk_size = kDefaultChunkSize);

    // Emits exactly one terminal event and returns its status. Task errors
    // and cancellation are reported through the status, not thrown.
    DownloadStatus run(const DownloadTask& task, const CancellationToken& token) const;

private:
    void transfer(const DownloadTask& task, ProgressEvent& event, const CancellationToken& token) const;
    void emit(ProgressEvent& event, DownloadStatus status) const;

    SlotPool& slots_;
    RateLimiter& limiter_;
    RemoteSource& source_;
    DestinationSink& destination_;
    ProgressSink& sink_;
    std::size_t chunk_size_;
};

} // namespace batchdl
