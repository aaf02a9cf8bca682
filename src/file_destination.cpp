#include "batchdl/file_destination.hpp"
#include "batchdl/errors.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>

#include <fmt/format.h>

namespace batchdl {

namespace {

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

class FileStream final : public WritableStream {
public:
    FileStream(std::string path, FILE* file) : path_(std::move(path)), file_(file) {}

    void write(const char* data, std::size_t size) override {
        if (!file_) {
            throw SinkError(fmt::format("write to closed file {}", path_));
        }
        const std::size_t written = std::fwrite(data, 1, size, file_.get());
        if (written != size) {
            throw SinkError(fmt::format("Failed to write {}: {}", path_, std::strerror(errno)));
        }
    }

    void close() override {
        if (!file_) {
            return;
        }
        const bool flushed = std::fflush(file_.get()) == 0;
        const int flush_errno = errno;
        const bool closed = std::fclose(file_.release()) == 0;
        if (!flushed || !closed) {
            throw SinkError(fmt::format("Failed to close {}: {}", path_,
                                        std::strerror(flushed ? errno : flush_errno)));
        }
    }

private:
    std::string path_;
    std::unique_ptr<FILE, FileDeleter> file_;
};

} // namespace

FileDestination::FileDestination(FileDestinationOptions options) : options_(std::move(options)) {}

std::string FileDestination::resolve(const std::string& identifier) const {
    std::filesystem::path path{identifier};
    if (!options_.base_directory.empty() && path.is_relative()) {
        path = std::filesystem::path{options_.base_directory} / path;
    }
    return path.string();
}

std::unique_ptr<WritableStream> FileDestination::openForWrite(const std::string& identifier) {
    if (identifier.empty()) {
        throw SinkError("empty destination path");
    }

    const std::filesystem::path path{resolve(identifier)};
    std::filesystem::path directory = path.parent_path();
    if (directory.empty()) {
        directory = std::filesystem::current_path();
    }

    std::error_code ec;
    if (options_.create_directories) {
        std::filesystem::create_directories(directory, ec);
        if (ec) {
            throw SinkError(fmt::format("Failed to create directory {}: {}", directory.string(), ec.message()));
        }
    }

    if (options_.min_free_bytes > 0) {
        const auto info = std::filesystem::space(directory, ec);
        if (ec) {
            throw SinkError(fmt::format("Cannot query free space of {}: {}", directory.string(), ec.message()));
        }
        if (info.available <= options_.min_free_bytes) {
            throw ResourceExhaustedError(fmt::format("Insufficient disk space on {}: {} bytes available, more than {} required",
                                                     directory.string(), info.available, options_.min_free_bytes));
        }
    }

    FILE* file = std::fopen(path.c_str(), "wb");
    if (!file) {
        throw SinkError(fmt::format("Cannot create destination file {}: {}", path.string(), std::strerror(errno)));
    }
    return std::make_unique<FileStream>(path.string(), file);
}

} // namespace batchdl
