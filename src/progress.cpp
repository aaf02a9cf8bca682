#include "batchdl/progress.hpp"

namespace batchdl {

std::string_view toString(DownloadStatus status) noexcept {
    switch (status) {
        case DownloadStatus::Starting:
            return "starting";
        case DownloadStatus::Downloading:
            return "downloading";
        case DownloadStatus::Completed:
            return "completed";
        case DownloadStatus::Failed:
            return "failed";
        case DownloadStatus::Canceled:
            return "canceled";
    }
    return "unknown";
}

} // namespace batchdl
