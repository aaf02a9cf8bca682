#include "batchdl/detail/curl_utils.hpp"

#include <cstdlib>
#include <mutex>
#include <stdexcept>

namespace batchdl::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

CurlEasyHandle makeEasyHandle() {
    CurlEasyHandle handle{curl_easy_init(), &curl_easy_cleanup};
    if (!handle) {
        throw std::runtime_error("Failed to allocate curl easy handle");
    }
    return handle;
}

CurlMultiHandle makeMultiHandle() {
    CurlMultiHandle handle{curl_multi_init(), &curl_multi_cleanup};
    if (!handle) {
        throw std::runtime_error("Failed to allocate curl multi handle");
    }
    return handle;
}

std::string describeCurlError(CURLcode code, const char* error_buffer) {
    if (error_buffer && error_buffer[0] != '\0') {
        return error_buffer;
    }
    return curl_easy_strerror(code);
}

} // namespace batchdl::detail
