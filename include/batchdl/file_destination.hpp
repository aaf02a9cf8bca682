#pragma once

#include "destination_sink.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace batchdl {

struct FileDestinationOptions {
    // Prefixed to relative identifiers; empty means the working directory.
    std::string base_directory;
    bool create_directories{true};
    // Refuse to open a file when the volume has this many bytes free or
    // fewer. 0 disables the check.
    std::uint64_t min_free_bytes{0};
};

// Writes each identifier as a file path, truncating existing files.
class FileDestination final : public DestinationSink {
public:
    explicit FileDestination(FileDestinationOptions options = FileDestinationOptions{});

    std::unique_ptr<WritableStream> openForWrite(const std::string& identifier) override;

    [[nodiscard]] std::string resolve(const std::string& identifier) const;

private:
    FileDestinationOptions options_;
};

} // namespace batchdl
