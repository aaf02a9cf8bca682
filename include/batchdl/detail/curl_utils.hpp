#pragma once

#include <curl/curl.h>

#include <memory>
#include <string>

namespace batchdl::detail {

using CurlEasyHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlMultiHandle = std::unique_ptr<CURLM, decltype(&curl_multi_cleanup)>;

// Runs curl_global_init once per process. Throws std::runtime_error on failure.
void ensureCurlInitialized();

[[nodiscard]] CurlEasyHandle makeEasyHandle();
[[nodiscard]] CurlMultiHandle makeMultiHandle();

// Prefers the detailed CURLOPT_ERRORBUFFER text over the generic code message.
[[nodiscard]] std::string describeCurlError(CURLcode code, const char* error_buffer);

} // namespace batchdl::detail
