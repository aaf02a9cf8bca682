#include "batchdl/transfer_worker.hpp"
#include "batchdl/errors.hpp"
#include "batchdl/logging.hpp"

#include <optional>
#include <stdexcept>
#include <vector>

#include <fmt/format.h>

namespace batchdl {

TransferWorker::TransferWorker(SlotPool& slots,
                               RateLimiter& limiter,
                               RemoteSource& source,
                               DestinationSink& destination,
                               ProgressSink& sink,
                               std::size_t chunk_size)
    : slots_(slots),
      limiter_(limiter),
      source_(source),
      destination_(destination),
      sink_(sink),
      chunk_size_(chunk_size) {
    if (chunk_size_ == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
}

DownloadStatus TransferWorker::run(const DownloadTask& task, const CancellationToken& token) const {
    ProgressEvent event;
    event.name = task.name;

    // Outlives the handlers below so terminal events still count this
    // worker's slot.
    std::optional<SlotGuard> slot;
    try {
        slot.emplace(slots_, token);
        emit(event, DownloadStatus::Starting);

        transfer(task, event, token);

        emit(event, DownloadStatus::Completed);
        logger()->info("{}: completed ({} bytes)", task.name, event.bytes_transferred);
        return DownloadStatus::Completed;
    } catch (const OperationCanceled&) {
        logger()->info("{}: canceled after {} bytes", task.name, event.bytes_transferred);
        emit(event, DownloadStatus::Canceled);
        return DownloadStatus::Canceled;
    } catch (const std::exception& ex) {
        std::string detail = ex.what();
        if (detail.empty()) {
            detail = "unknown error";
        }
        logger()->warn("{}: failed: {}", task.name, detail);
        event.error_detail = std::move(detail);
        emit(event, DownloadStatus::Failed);
        return DownloadStatus::Failed;
    }
}

void TransferWorker::transfer(const DownloadTask& task, ProgressEvent& event, const CancellationToken& token) const {
    token.throwIfCancellationRequested();
    RemoteStream remote = source_.open(task.url, token);
    if (!remote.stream) {
        throw TransportError(fmt::format("no stream returned for {}", task.url));
    }

    token.throwIfCancellationRequested();
    const auto output = destination_.openForWrite(task.destination);

    event.total_bytes = remote.size_hint;
    emit(event, DownloadStatus::Downloading);

    std::vector<char> buffer(chunk_size_);
    while (true) {
        token.throwIfCancellationRequested();
        const std::size_t count = remote.stream->read(buffer.data(), buffer.size(), token);
        if (count == 0) {
            break;
        }

        token.throwIfCancellationRequested();
        output->write(buffer.data(), count);
        event.bytes_transferred += count;

        limiter_.throttle(count, token);
        emit(event, DownloadStatus::Downloading);
    }
    output->close();

    if (!event.total_bytes) {
        event.total_bytes = event.bytes_transferred;
    } else if (*event.total_bytes != event.bytes_transferred) {
        throw TransportError(fmt::format("incomplete transfer: received {} of {} bytes",
                                         event.bytes_transferred, *event.total_bytes));
    }
}

void TransferWorker::emit(ProgressEvent& event, DownloadStatus status) const {
    event.status = status;
    event.active_slots = slots_.active();
    try {
        sink_.onProgress(event);
    } catch (const std::exception& ex) {
        logger()->error("{}: progress sink threw on {} event: {}", event.name, toString(status), ex.what());
    }
}

} // namespace batchdl
