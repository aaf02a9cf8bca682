#pragma once

#include <cstddef>
#include <memory>
#include <string>

namespace batchdl {

class WritableStream {
public:
    virtual ~WritableStream() = default;

    // Writes all `size` bytes or throws SinkError.
    virtual void write(const char* data, std::size_t size) = 0;

    // Flushes and closes; throws SinkError if buffered data cannot be
    // written. Destruction without close() discards such errors.
    virtual void close() {}
};

class DestinationSink {
public:
    virtual ~DestinationSink() = default;

    // Creates or truncates the target. Throws SinkError, or
    // ResourceExhaustedError when the target has no room.
    virtual std::unique_ptr<WritableStream> openForWrite(const std::string& identifier) = 0;
};

} // namespace batchdl
