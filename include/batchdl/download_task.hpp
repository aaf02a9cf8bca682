#pragma once

#include <string>

namespace batchdl {

// One unit of work. `name` keys the progress events and must be unique
// within a run; the engine does not deduplicate.
struct DownloadTask {
    std::string url;
    std::string name;
    std::string destination;
};

} // namespace batchdl
