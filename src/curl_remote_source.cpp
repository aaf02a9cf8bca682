#include "batchdl/curl_remote_source.hpp"
#include "batchdl/detail/curl_utils.hpp"
#include "batchdl/errors.hpp"

#include <algorithm>
#include <cstring>
#include <exception>
#include <utility>
#include <vector>

#include <curl/curl.h>
#include <fmt/format.h>

namespace batchdl {

namespace {

// Upper bound for one curl_multi_poll; cancellation interrupts it earlier
// through curl_multi_wakeup.
constexpr int kPollTimeoutMs = 1000;

// Pull-style stream over one easy handle driven by a private multi handle.
// curl_multi_perform only runs once the local buffer is drained, so socket
// reads follow the consumer's pace and the buffer holds at most what one
// perform call delivered.
class CurlByteStream final : public ByteStream {
public:
    CurlByteStream(std::string url, const CurlSourceOptions& options)
        : url_(std::move(url)),
          easy_(detail::makeEasyHandle()),
          multi_(detail::makeMultiHandle()) {
        CURL* easy = easy_.get();
        curl_easy_setopt(easy, CURLOPT_URL, url_.c_str());
        curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, &CurlByteStream::onWrite);
        curl_easy_setopt(easy, CURLOPT_WRITEDATA, this);
        curl_easy_setopt(easy, CURLOPT_ERRORBUFFER, error_buffer_);
        curl_easy_setopt(easy, CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(easy, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(easy, CURLOPT_FOLLOWLOCATION, options.follow_redirects ? 1L : 0L);
        curl_easy_setopt(easy, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(options.connect_timeout.count()));
        if (!options.user_agent.empty()) {
            curl_easy_setopt(easy, CURLOPT_USERAGENT, options.user_agent.c_str());
        }

        const CURLMcode rc = curl_multi_add_handle(multi_.get(), easy);
        if (rc != CURLM_OK) {
            throw TransportError(fmt::format("curl_multi_add_handle failed: {}", curl_multi_strerror(rc)));
        }
        attached_ = true;
    }

    ~CurlByteStream() override {
        if (attached_) {
            curl_multi_remove_handle(multi_.get(), easy_.get());
        }
    }

    CurlByteStream(const CurlByteStream&) = delete;
    CurlByteStream& operator=(const CurlByteStream&) = delete;

    // Drives the transfer until the first body bytes arrive or it ends, so
    // that connection and status errors surface at open time.
    void start(const CancellationToken& token) {
        waitForData(token);
        if (done_ && result_ != CURLE_OK) {
            throwTransportError();
        }
    }

    [[nodiscard]] std::optional<std::uint64_t> sizeHint() const {
        curl_off_t length = -1;
        if (curl_easy_getinfo(easy_.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) != CURLE_OK ||
            length < 0) {
            return std::nullopt;
        }
        return static_cast<std::uint64_t>(length);
    }

    std::size_t read(char* buffer, std::size_t size, const CancellationToken& token) override {
        if (available() == 0 && !done_) {
            waitForData(token);
        }

        if (available() > 0) {
            const std::size_t count = std::min(size, available());
            std::memcpy(buffer, pending_.data() + offset_, count);
            offset_ += count;
            if (available() == 0) {
                pending_.clear();
                offset_ = 0;
            }
            return count;
        }

        if (result_ != CURLE_OK) {
            throwTransportError();
        }
        return 0;
    }

private:
    static std::size_t onWrite(char* data, std::size_t size, std::size_t nmemb, void* userdata) {
        auto* self = static_cast<CurlByteStream*>(userdata);
        const std::size_t total = size * nmemb;
        // Must not unwind through libcurl; returning short aborts the
        // transfer with CURLE_WRITE_ERROR.
        try {
            self->pending_.insert(self->pending_.end(), data, data + total);
        } catch (const std::exception&) {
            self->write_failed_ = true;
            return 0;
        }
        return total;
    }

    [[nodiscard]] std::size_t available() const noexcept { return pending_.size() - offset_; }

    void waitForData(const CancellationToken& token) {
        const auto wakeup = token.registerCallback([multi = multi_.get()] { curl_multi_wakeup(multi); });

        while (available() == 0 && !done_) {
            token.throwIfCancellationRequested();
            perform();
            if (available() > 0 || done_) {
                break;
            }

            const CURLMcode rc = curl_multi_poll(multi_.get(), nullptr, 0, kPollTimeoutMs, nullptr);
            if (rc != CURLM_OK) {
                throw TransportError(fmt::format("curl_multi_poll failed: {}", curl_multi_strerror(rc)));
            }
        }
    }

    void perform() {
        int running = 0;
        const CURLMcode rc = curl_multi_perform(multi_.get(), &running);
        if (rc != CURLM_OK) {
            throw TransportError(fmt::format("curl_multi_perform failed: {}", curl_multi_strerror(rc)));
        }

        int queued = 0;
        while (CURLMsg* message = curl_multi_info_read(multi_.get(), &queued)) {
            if (message->msg == CURLMSG_DONE) {
                done_ = true;
                result_ = message->data.result;
            }
        }
    }

    [[noreturn]] void throwTransportError() const {
        long status = 0;
        curl_easy_getinfo(easy_.get(), CURLINFO_RESPONSE_CODE, &status);
        if (write_failed_) {
            throw TransportError(fmt::format("{}: out of memory buffering the response", url_));
        }
        if (result_ == CURLE_HTTP_RETURNED_ERROR && status >= 400) {
            throw TransportError(fmt::format("HTTP {} for {}", status, url_));
        }
        throw TransportError(fmt::format("{}: {}", url_, detail::describeCurlError(result_, error_buffer_)));
    }

    std::string url_;
    detail::CurlEasyHandle easy_;
    detail::CurlMultiHandle multi_;
    bool attached_{false};

    std::vector<char> pending_;
    bool write_failed_{false};
    std::size_t offset_{0};
    bool done_{false};
    CURLcode result_{CURLE_OK};
    char error_buffer_[CURL_ERROR_SIZE]{};
};

} // namespace

CurlRemoteSource::CurlRemoteSource(CurlSourceOptions options) : options_(std::move(options)) {}

RemoteStream CurlRemoteSource::open(const std::string& address, const CancellationToken& token) {
    detail::ensureCurlInitialized();
    if (address.empty()) {
        throw TransportError("empty source address");
    }

    auto stream = std::make_unique<CurlByteStream>(address, options_);
    stream->start(token);

    RemoteStream remote;
    remote.size_hint = stream->sizeHint();
    remote.stream = std::move(stream);
    return remote;
}

} // namespace batchdl
