#pragma once

#include "remote_source.hpp"

#include <chrono>
#include <string>

namespace batchdl {

struct CurlSourceOptions {
    bool follow_redirects{true};
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(30)};
    std::string user_agent{"batchdl/1.0"};
};

// RemoteSource over libcurl's multi interface. Works with any protocol the
// installed libcurl supports, including file:// URLs.
class CurlRemoteSource final : public RemoteSource {
public:
    explicit CurlRemoteSource(CurlSourceOptions options = CurlSourceOptions{});

    RemoteStream open(const std::string& address, const CancellationToken& token) override;

private:
    CurlSourceOptions options_;
};

} // namespace batchdl
