#pragma once

#include "cancellation.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace batchdl {

class ByteStream {
public:
    virtual ~ByteStream() = default;

    // Reads at most `size` bytes. Returns 0 once the stream is exhausted.
    // Throws TransportError on failure and OperationCanceled when `token`
    // fires while waiting for data.
    virtual std::size_t read(char* buffer, std::size_t size, const CancellationToken& token) = 0;
};

struct RemoteStream {
    std::unique_ptr<ByteStream> stream;
    std::optional<std::uint64_t> size_hint;
};

class RemoteSource {
public:
    virtual ~RemoteSource() = default;

    // Throws TransportError when the address is unreachable or answers with
    // a non-success status.
    virtual RemoteStream open(const std::string& address, const CancellationToken& token) = 0;
};

} // namespace batchdl
