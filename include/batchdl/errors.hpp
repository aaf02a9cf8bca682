#pragma once

#include <stdexcept>
#include <string>

namespace batchdl {

class DownloadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Remote open/read failure, including non-success responses.
class TransportError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

// Destination open/write failure.
class SinkError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

class ResourceExhaustedError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

class OperationCanceled : public std::runtime_error {
public:
    OperationCanceled() : std::runtime_error("operation canceled") {}
    explicit OperationCanceled(const std::string& what) : std::runtime_error(what) {}
};

} // namespace batchdl
